#include "seedphrase/mnemonic/language_detector.hpp"
#include "seedphrase/core/format.hpp"
#include "seedphrase/debug/trace_logger.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace seedphrase::mnemonic {

using wordlist::Language;

LanguageDetector::LanguageDetector(std::shared_ptr<const wordlist::WordlistRegistry> registry)
    : registry_(std::move(registry)) {
    if (!registry_) {
        throw std::invalid_argument("LanguageDetector requires a wordlist registry");
    }
}

Result<std::vector<Language>, MnemonicFailure> LanguageDetector::Candidates(
    const std::string_view word) const {

    auto normalized = unicode::Normalizer::TryNormalize(word);
    if (normalized.IsErr()) {
        return Result<std::vector<Language>, MnemonicFailure>::Err(std::move(normalized).UnwrapErr());
    }

    std::vector<Language> languages;
    for (const auto& list : registry_->All()) {
        if (list->IndexOfNormalized(normalized.Unwrap()).has_value()) {
            languages.push_back(list->GetLanguage());
        }
    }
    return Result<std::vector<Language>, MnemonicFailure>::Ok(std::move(languages));
}

Result<Language, MnemonicFailure> LanguageDetector::Detect(const std::string_view word) const {
    auto candidates = Candidates(word);
    if (candidates.IsErr()) {
        return Result<Language, MnemonicFailure>::Err(std::move(candidates).UnwrapErr());
    }

    const std::vector<Language>& languages = candidates.Unwrap();
    if (languages.size() != 1) {
        debug::LogFailure(debug::Component::Detector, "DETECT",
                          languages.empty() ? "unknown word" : "ambiguous word");
        return Result<Language, MnemonicFailure>::Err(MnemonicFailure::AmbiguousOrUnknownWord(
            compat::format("Word '{}' found in {} wordlists, expected exactly one",
                           word, languages.size())));
    }

    SEEDPHRASE_LOG_MSG(debug::Component::Detector, "DETECT", wordlist::ToString(languages.front()));
    return Result<Language, MnemonicFailure>::Ok(languages.front());
}

Result<Language, MnemonicFailure> LanguageDetector::DetectFromMnemonic(
    const std::string_view sentence) const {

    auto normalized = unicode::Normalizer::TryNormalize(sentence);
    if (normalized.IsErr()) {
        return Result<Language, MnemonicFailure>::Err(std::move(normalized).UnwrapErr());
    }

    const std::vector<std::string> words = unicode::Normalizer::SplitWords(normalized.Unwrap());
    if (words.empty()) {
        return Result<Language, MnemonicFailure>::Err(
            MnemonicFailure::AmbiguousOrUnknownWord("Mnemonic contains no words"));
    }

    std::vector<Language> remaining = registry_->AvailableLanguages();
    for (const std::string& word : words) {
        std::erase_if(remaining, [this, &word](const Language language) {
            return !registry_->Get(language)->IndexOfNormalized(word).has_value();
        });
        if (remaining.empty()) {
            break;
        }
    }

    if (remaining.size() != 1) {
        debug::LogFailure(debug::Component::Detector, "DETECT_SENTENCE",
                          remaining.empty() ? "no common language" : "ambiguous sentence");
        return Result<Language, MnemonicFailure>::Err(MnemonicFailure::AmbiguousOrUnknownWord(
            compat::format("{} wordlists contain every word of the mnemonic, expected exactly one",
                           remaining.size())));
    }

    return Result<Language, MnemonicFailure>::Ok(remaining.front());
}

} // namespace seedphrase::mnemonic
