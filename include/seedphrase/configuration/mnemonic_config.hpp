#pragma once

#include "seedphrase/core/constants.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>

namespace seedphrase::configuration {

/// Which entropy sizes and word counts the codec accepts
enum class LengthPolicy : uint8_t {
    /// Only the five standard sizes: 128/160/192/224/256 bits,
    /// 12/15/18/21/24 words
    Standard = 0,

    /// Any multiple of 32 entropy bits from 32 to 256, i.e. any
    /// positive multiple of 3 words up to 24. The checksum is still
    /// entropy_bits / 32 bits long.
    Relaxed = 1
};

/// Codec configuration bound to a Mnemonic handle
///
/// @example
/// ```cpp
/// // Wallet recovery: only phrases a wallet could have produced
/// auto config = MnemonicConfig::Standard();
///
/// // Legacy tooling that produced short test phrases
/// auto config = MnemonicConfig::Relaxed();
/// ```
class MnemonicConfig {
public:
    // =========================================================================
    // Factory Methods
    // =========================================================================

    [[nodiscard]] static constexpr MnemonicConfig Standard() noexcept {
        return MnemonicConfig(LengthPolicy::Standard);
    }

    [[nodiscard]] static constexpr MnemonicConfig Relaxed() noexcept {
        return MnemonicConfig(LengthPolicy::Relaxed);
    }

    /// Default configuration (Standard)
    [[nodiscard]] static constexpr MnemonicConfig Default() noexcept {
        return Standard();
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] constexpr LengthPolicy GetLengthPolicy() const noexcept {
        return policy_;
    }

    [[nodiscard]] constexpr bool IsEntropyLengthAllowed(const size_t entropy_bytes) const noexcept {
        switch (policy_) {
            case LengthPolicy::Standard:
                return std::find(Constants::STANDARD_ENTROPY_BYTES.begin(),
                                 Constants::STANDARD_ENTROPY_BYTES.end(),
                                 entropy_bytes) != Constants::STANDARD_ENTROPY_BYTES.end();
            case LengthPolicy::Relaxed:
                return entropy_bytes >= Constants::MIN_RELAXED_ENTROPY_BYTES &&
                       entropy_bytes <= Constants::MAX_ENTROPY_BYTES &&
                       entropy_bytes % Constants::MIN_RELAXED_ENTROPY_BYTES == 0;
        }
        return false;
    }

    [[nodiscard]] constexpr bool IsWordCountAllowed(const size_t word_count) const noexcept {
        switch (policy_) {
            case LengthPolicy::Standard:
                return std::find(Constants::STANDARD_WORD_COUNTS.begin(),
                                 Constants::STANDARD_WORD_COUNTS.end(),
                                 word_count) != Constants::STANDARD_WORD_COUNTS.end();
            case LengthPolicy::Relaxed:
                return word_count > 0 &&
                       word_count <= Constants::STANDARD_WORD_COUNTS.back() &&
                       word_count % Constants::WORDS_PER_CHECKSUM_GROUP == 0;
        }
        return false;
    }

    [[nodiscard]] constexpr bool operator==(const MnemonicConfig& other) const noexcept {
        return policy_ == other.policy_;
    }

    [[nodiscard]] constexpr bool operator!=(const MnemonicConfig& other) const noexcept {
        return policy_ != other.policy_;
    }

private:
    explicit constexpr MnemonicConfig(const LengthPolicy policy) noexcept
        : policy_(policy) {}

    LengthPolicy policy_;
};

} // namespace seedphrase::configuration
