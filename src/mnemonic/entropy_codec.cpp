#include "seedphrase/mnemonic/entropy_codec.hpp"
#include "seedphrase/crypto/sodium_interop.hpp"
#include "seedphrase/core/format.hpp"
#include "seedphrase/debug/trace_logger.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace seedphrase::mnemonic {

namespace {

using crypto::SodiumInterop;

bool GetBit(const std::span<const uint8_t> data, const size_t bit) noexcept {
    return (data[bit / Constants::BITS_PER_BYTE] >> (7 - bit % Constants::BITS_PER_BYTE)) & 1;
}

void SetBit(const std::span<uint8_t> data, const size_t bit) noexcept {
    data[bit / Constants::BITS_PER_BYTE] |= static_cast<uint8_t>(1u << (7 - bit % Constants::BITS_PER_BYTE));
}

uint8_t ChecksumMask(const size_t checksum_bits) noexcept {
    return static_cast<uint8_t>(0xFFu << (Constants::BITS_PER_BYTE - checksum_bits));
}

Result<Unit, MnemonicFailure> EnsureSodium() {
    auto result = SodiumInterop::Initialize();
    if (result.IsErr()) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    return Result<Unit, MnemonicFailure>::Ok(unit);
}

Result<Unit, MnemonicFailure> Wipe(const std::span<uint8_t> buffer) {
    auto result = SodiumInterop::SecureWipe(buffer);
    if (result.IsErr()) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::FromSodiumFailure(result.UnwrapErr()));
    }
    return Result<Unit, MnemonicFailure>::Ok(unit);
}

} // namespace

EntropyCodec::EntropyCodec(std::shared_ptr<const wordlist::Wordlist> wordlist,
                           const configuration::MnemonicConfig config)
    : wordlist_(std::move(wordlist))
    , config_(config) {
    if (!wordlist_) {
        throw std::invalid_argument("EntropyCodec requires a wordlist");
    }
}

Result<std::string, MnemonicFailure> EntropyCodec::ToMnemonic(
    const std::span<const uint8_t> entropy) const {

    using StringResult = Result<std::string, MnemonicFailure>;

    if (auto init = EnsureSodium(); init.IsErr()) {
        return StringResult::Err(std::move(init).UnwrapErr());
    }

    if (!config_.IsEntropyLengthAllowed(entropy.size())) {
        debug::LogFailure(debug::Component::Codec, "ENCODE", "InvalidEntropyLength");
        return StringResult::Err(MnemonicFailure::InvalidEntropyLength(compat::format(
            "Entropy of {} bits is not allowed; expected 128, 160, 192, 224 or 256 bits{}",
            entropy.size() * Constants::BITS_PER_BYTE,
            config_.GetLengthPolicy() == configuration::LengthPolicy::Relaxed
                ? " (or a multiple of 32 from 32 to 256 under the relaxed policy)" : "")));
    }

    auto digest_result = SodiumInterop::Sha256(entropy);
    if (digest_result.IsErr()) {
        return StringResult::Err(MnemonicFailure::FromSodiumFailure(digest_result.UnwrapErr()));
    }
    crypto::Sha256Digest digest = std::move(digest_result).Unwrap();

    const size_t checksum_bits = ChecksumBits(entropy.size());
    const size_t word_count = WordCount(entropy.size());

    // Entropy bits are byte aligned, so the checksum fills the top bits of the last byte.
    std::vector<uint8_t> bits(entropy.size() + 1, 0);
    std::copy(entropy.begin(), entropy.end(), bits.begin());
    bits[entropy.size()] = static_cast<uint8_t>(digest[0] & ChecksumMask(checksum_bits));

    std::vector<std::string> words;
    words.reserve(word_count);
    for (size_t i = 0; i < word_count; ++i) {
        uint16_t index = 0;
        for (size_t j = 0; j < Constants::BITS_PER_WORD; ++j) {
            index = static_cast<uint16_t>((index << 1) | (GetBit(bits, i * Constants::BITS_PER_WORD + j) ? 1 : 0));
        }
        words.push_back(wordlist_->WordAt(static_cast<uint16_t>(index & Constants::WORD_INDEX_MASK)));
    }

    if (auto wiped = Wipe(bits); wiped.IsErr()) {
        return StringResult::Err(std::move(wiped).UnwrapErr());
    }
    if (auto wiped = Wipe(digest); wiped.IsErr()) {
        return StringResult::Err(std::move(wiped).UnwrapErr());
    }

    std::string sentence = unicode::Normalizer::JoinWords(words);
    for (std::string& word : words) {
        if (auto wiped = SodiumInterop::SecureWipeString(word); wiped.IsErr()) {
            return StringResult::Err(MnemonicFailure::FromSodiumFailure(wiped.UnwrapErr()));
        }
    }

    return StringResult::Ok(std::move(sentence));
}

Result<std::vector<uint8_t>, MnemonicFailure> EntropyCodec::ToEntropy(
    const std::vector<std::string>& words) const {

    using BytesResult = Result<std::vector<uint8_t>, MnemonicFailure>;

    if (auto init = EnsureSodium(); init.IsErr()) {
        return BytesResult::Err(std::move(init).UnwrapErr());
    }

    const size_t word_count = words.size();
    if (!config_.IsWordCountAllowed(word_count)) {
        debug::LogFailure(debug::Component::Codec, "DECODE", "InvalidMnemonicLength");
        return BytesResult::Err(MnemonicFailure::InvalidMnemonicLength(compat::format(
            "Mnemonic has {} words; expected 12, 15, 18, 21 or 24{}",
            word_count,
            config_.GetLengthPolicy() == configuration::LengthPolicy::Relaxed
                ? " (or a multiple of 3 up to 24 under the relaxed policy)" : "")));
    }

    const size_t total_bits = word_count * Constants::BITS_PER_WORD;
    const size_t checksum_bits = total_bits / (Constants::ENTROPY_BITS_PER_CHECKSUM_BIT + 1);
    const size_t entropy_bytes = (total_bits - checksum_bits) / Constants::BITS_PER_BYTE;

    std::vector<uint8_t> bits(entropy_bytes + 1, 0);

    for (size_t i = 0; i < word_count; ++i) {
        auto normalized = unicode::Normalizer::TryNormalize(words[i]);
        if (normalized.IsErr()) {
            if (auto wiped = Wipe(bits); wiped.IsErr()) {
                return BytesResult::Err(std::move(wiped).UnwrapErr());
            }
            return BytesResult::Err(std::move(normalized).UnwrapErr());
        }

        const auto index = wordlist_->IndexOfNormalized(normalized.Unwrap());
        if (!index.has_value()) {
            if (auto wiped = Wipe(bits); wiped.IsErr()) {
                return BytesResult::Err(std::move(wiped).UnwrapErr());
            }
            debug::LogFailure(debug::Component::Codec, "DECODE", "UnknownWord");
            return BytesResult::Err(MnemonicFailure::UnknownWord(compat::format(
                "Word {} '{}' is not in the {} wordlist",
                i + 1, words[i], wordlist::ToString(wordlist_->GetLanguage()))));
        }

        for (size_t j = 0; j < Constants::BITS_PER_WORD; ++j) {
            if ((*index >> (Constants::BITS_PER_WORD - 1 - j)) & 1) {
                SetBit(bits, i * Constants::BITS_PER_WORD + j);
            }
        }
    }

    std::vector<uint8_t> entropy(bits.begin(), bits.begin() + static_cast<std::ptrdiff_t>(entropy_bytes));
    const uint8_t mask = ChecksumMask(checksum_bits);
    const uint8_t claimed = static_cast<uint8_t>(bits[entropy_bytes] & mask);

    if (auto wiped = Wipe(bits); wiped.IsErr()) {
        return BytesResult::Err(std::move(wiped).UnwrapErr());
    }

    auto digest_result = SodiumInterop::Sha256(entropy);
    if (digest_result.IsErr()) {
        return BytesResult::Err(MnemonicFailure::FromSodiumFailure(digest_result.UnwrapErr()));
    }
    crypto::Sha256Digest digest = std::move(digest_result).Unwrap();
    const uint8_t expected = static_cast<uint8_t>(digest[0] & mask);

    if (auto wiped = Wipe(digest); wiped.IsErr()) {
        return BytesResult::Err(std::move(wiped).UnwrapErr());
    }

    auto compare_result = SodiumInterop::ConstantTimeEquals(
        std::span<const uint8_t>(&claimed, 1),
        std::span<const uint8_t>(&expected, 1));
    if (compare_result.IsErr()) {
        return BytesResult::Err(MnemonicFailure::FromSodiumFailure(compare_result.UnwrapErr()));
    }

    if (!compare_result.Unwrap()) {
        if (auto wiped = Wipe(entropy); wiped.IsErr()) {
            return BytesResult::Err(std::move(wiped).UnwrapErr());
        }
        debug::LogFailure(debug::Component::Codec, "DECODE", "ChecksumMismatch");
        return BytesResult::Err(MnemonicFailure::ChecksumMismatch(compat::format(
            "Checksum of {}-word mnemonic does not match its entropy", word_count)));
    }

    return BytesResult::Ok(std::move(entropy));
}

Result<std::vector<uint8_t>, MnemonicFailure> EntropyCodec::SentenceToEntropy(
    const std::string_view sentence) const {

    auto normalized = unicode::Normalizer::TryNormalize(sentence);
    if (normalized.IsErr()) {
        return Result<std::vector<uint8_t>, MnemonicFailure>::Err(std::move(normalized).UnwrapErr());
    }
    return ToEntropy(unicode::Normalizer::SplitWords(normalized.Unwrap()));
}

} // namespace seedphrase::mnemonic
