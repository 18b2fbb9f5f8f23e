#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/configuration/mnemonic_config.hpp"
#include "seedphrase/wordlist/wordlist.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seedphrase::mnemonic {

/**
 * @brief Converts entropy to words and back against one wordlist
 *
 * The checksum is the first entropy_bits / 32 bits of SHA-256(entropy).
 * Entropy followed by checksum is cut into 11-bit big-endian groups, each
 * group being an index into the wordlist.
 *
 * The codec keeps no copy of the entropy it processes; scratch buffers
 * holding entropy bits are wiped before returning.
 */
class EntropyCodec {
public:
    EntropyCodec(std::shared_ptr<const wordlist::Wordlist> wordlist,
                 configuration::MnemonicConfig config);

    /**
     * @brief Encode entropy as a space-separated sentence
     *
     * @return InvalidEntropyLength if the byte count is not allowed by the
     *         length policy
     */
    [[nodiscard]] Result<std::string, MnemonicFailure> ToMnemonic(
        std::span<const uint8_t> entropy) const;

    /**
     * @brief Decode words back into entropy, verifying the checksum
     *
     * Each word is NFKD-normalized before lookup. Errors, in the order they
     * are checked: InvalidMnemonicLength, UnknownWord (naming the 1-based
     * position and the word), ChecksumMismatch.
     */
    [[nodiscard]] Result<std::vector<uint8_t>, MnemonicFailure> ToEntropy(
        const std::vector<std::string>& words) const;

    /**
     * @brief Normalize and split a sentence, then decode it
     */
    [[nodiscard]] Result<std::vector<uint8_t>, MnemonicFailure> SentenceToEntropy(
        std::string_view sentence) const;

    [[nodiscard]] const wordlist::Wordlist& GetWordlist() const noexcept { return *wordlist_; }

    [[nodiscard]] const configuration::MnemonicConfig& GetConfig() const noexcept { return config_; }

    /// Checksum length in bits for an entropy of @p entropy_bytes
    [[nodiscard]] static constexpr size_t ChecksumBits(const size_t entropy_bytes) noexcept {
        return entropy_bytes * Constants::BITS_PER_BYTE / Constants::ENTROPY_BITS_PER_CHECKSUM_BIT;
    }

    /// Word count produced for an entropy of @p entropy_bytes
    [[nodiscard]] static constexpr size_t WordCount(const size_t entropy_bytes) noexcept {
        return (entropy_bytes * Constants::BITS_PER_BYTE + ChecksumBits(entropy_bytes)) /
               Constants::BITS_PER_WORD;
    }

private:
    std::shared_ptr<const wordlist::Wordlist> wordlist_;
    configuration::MnemonicConfig config_;
};

} // namespace seedphrase::mnemonic
