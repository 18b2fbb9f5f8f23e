#include "seedphrase/mnemonic/mnemonic.hpp"
#include "seedphrase/crypto/sodium_interop.hpp"
#include "seedphrase/core/format.hpp"
#include "seedphrase/debug/trace_logger.hpp"
#include "seedphrase/mnemonic/language_detector.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <exception>

namespace seedphrase::mnemonic {

using crypto::SodiumInterop;
using wordlist::Language;

Mnemonic::Mnemonic(std::shared_ptr<const wordlist::Wordlist> wordlist,
                   const configuration::MnemonicConfig config)
    : codec_(wordlist, config)
    , checker_(wordlist, configuration::MnemonicConfig::Relaxed())
    , expander_(std::move(wordlist)) {}

Result<Mnemonic, MnemonicFailure> Mnemonic::Bind(
    std::shared_ptr<const wordlist::Wordlist> wordlist,
    const configuration::MnemonicConfig config) {

    if (auto init = SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Mnemonic, MnemonicFailure>::Err(
            MnemonicFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    return Result<Mnemonic, MnemonicFailure>::Ok(Mnemonic(std::move(wordlist), config));
}

Result<Mnemonic, MnemonicFailure> Mnemonic::Create(
    const Language language,
    const interfaces::IWordlistSource& source,
    const configuration::MnemonicConfig config) {

    auto loaded = wordlist::Wordlist::Load(language, source);
    if (loaded.IsErr()) {
        return Result<Mnemonic, MnemonicFailure>::Err(std::move(loaded).UnwrapErr());
    }
    return Bind(std::move(loaded).Unwrap(), config);
}

Result<Mnemonic, MnemonicFailure> Mnemonic::Create(
    const Language language,
    const wordlist::WordlistRegistry& registry,
    const configuration::MnemonicConfig config) {

    auto list = registry.Get(language);
    if (!list) {
        return Result<Mnemonic, MnemonicFailure>::Err(MnemonicFailure::WordlistNotFound(
            compat::format("Wordlist '{}' is not loaded in the registry", wordlist::ToString(language))));
    }
    return Bind(std::move(list), config);
}

Result<std::string, MnemonicFailure> Mnemonic::ToMnemonic(const std::span<const uint8_t> entropy) const {
    return codec_.ToMnemonic(entropy);
}

Result<std::vector<uint8_t>, MnemonicFailure> Mnemonic::ToEntropy(
    const std::vector<std::string>& words) const {
    return codec_.ToEntropy(words);
}

Result<std::vector<uint8_t>, MnemonicFailure> Mnemonic::ToEntropy(const std::string_view sentence) const {
    return codec_.SentenceToEntropy(sentence);
}

bool Mnemonic::Check(const std::string_view mnemonic) const noexcept {
    try {
        auto decoded = checker_.SentenceToEntropy(mnemonic);
        if (decoded.IsErr()) {
            SEEDPHRASE_LOG_MSG(debug::Component::Codec, "CHECK", ToString(decoded.UnwrapErr().type));
            return false;
        }
        std::vector<uint8_t> entropy = std::move(decoded).Unwrap();
        return SodiumInterop::SecureWipe(entropy).IsOk();
    } catch (const std::exception& ex) {
        debug::LogFailure(debug::Component::Codec, "CHECK", ex.what());
        return false;
    }
}

std::string Mnemonic::ExpandWord(const std::string_view prefix) const {
    return expander_.ExpandWord(prefix);
}

std::string Mnemonic::Expand(const std::string_view sentence) const {
    return expander_.Expand(sentence);
}

std::vector<std::string> Mnemonic::Candidates(const std::string_view prefix) const {
    return expander_.Candidates(prefix);
}

Language Mnemonic::GetLanguage() const noexcept {
    return codec_.GetWordlist().GetLanguage();
}

const wordlist::Wordlist& Mnemonic::GetWordlist() const noexcept {
    return codec_.GetWordlist();
}

const configuration::MnemonicConfig& Mnemonic::GetConfig() const noexcept {
    return codec_.GetConfig();
}

Result<Seed, MnemonicFailure> Mnemonic::ToSeed(
    const std::string_view mnemonic,
    const std::string_view passphrase) {
    return SeedDeriver::ToSeed(mnemonic, passphrase);
}

std::string Mnemonic::NormalizeString(const std::string_view text) {
    return unicode::Normalizer::NormalizeString(text);
}

const std::array<Language, wordlist::LANGUAGE_COUNT>& Mnemonic::ListLanguages() noexcept {
    return wordlist::ListLanguages();
}

Result<Language, MnemonicFailure> Mnemonic::DetectLanguage(
    const std::string_view word,
    const std::shared_ptr<const wordlist::WordlistRegistry>& registry) {

    if (!registry) {
        return Result<Language, MnemonicFailure>::Err(
            MnemonicFailure::AmbiguousOrUnknownWord("No wordlist registry to detect against"));
    }
    return LanguageDetector(registry).Detect(word);
}

} // namespace seedphrase::mnemonic
