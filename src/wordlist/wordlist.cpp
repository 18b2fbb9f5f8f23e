#include "seedphrase/wordlist/wordlist.hpp"
#include "seedphrase/core/constants.hpp"
#include "seedphrase/core/format.hpp"
#include "seedphrase/debug/trace_logger.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <stdexcept>

namespace seedphrase::wordlist {

namespace {

using WordlistResult = Result<std::shared_ptr<const Wordlist>, MnemonicFailure>;

WordlistResult LoadFailure(const Language language, const std::string& detail) {
    debug::LogFailure(debug::Component::Wordlist, "LOAD", detail);
    return WordlistResult::Err(MnemonicFailure::WordlistLoadError(
        compat::format("Wordlist '{}': {}", ToString(language), detail)));
}

bool IsLowercaseAscii(const std::string_view word) noexcept {
    for (const char c : word) {
        if (c < 'a' || c > 'z') {
            return false;
        }
    }
    return true;
}

} // namespace

Wordlist::Wordlist(const Language language,
                   std::vector<std::string> words,
                   std::unordered_map<std::string, uint16_t> index)
    : language_(language)
    , words_(std::move(words))
    , index_(std::move(index)) {}

WordlistResult Wordlist::Load(const Language language,
                              const interfaces::IWordlistSource& source) {
    SEEDPHRASE_LOG_MSG(debug::Component::Wordlist, "LOAD", ToString(language));

    auto read_result = source.ReadWords(language);
    if (read_result.IsErr()) {
        return WordlistResult::Err(std::move(read_result).UnwrapErr());
    }
    return FromWords(language, std::move(read_result).Unwrap());
}

WordlistResult Wordlist::FromWords(const Language language, std::vector<std::string> words) {
    if (words.size() != Constants::WORDLIST_SIZE) {
        return LoadFailure(language, compat::format(
            "expected {} entries, found {}", Constants::WORDLIST_SIZE, words.size()));
    }

    const WordPolicy policy = PolicyFor(language);
    std::unordered_map<std::string, uint16_t> index;
    index.reserve(words.size());

    for (size_t i = 0; i < words.size(); ++i) {
        const std::string& word = words[i];
        const size_t line = i + 1;

        if (word.empty()) {
            return LoadFailure(language, compat::format("empty entry on line {}", line));
        }
        if (word.starts_with(UnicodeConstants::UTF_8_BOM)) {
            return LoadFailure(language, compat::format("byte-order mark on line {}", line));
        }

        if (policy.validated) {
            const size_t code_points = unicode::Normalizer::CodePointLength(word);
            if (code_points < policy.min_code_points || code_points > policy.max_code_points) {
                return LoadFailure(language, compat::format(
                    "entry on line {} has {} code points, allowed {}..{}",
                    line, code_points, policy.min_code_points, policy.max_code_points));
            }
            if (policy.lowercase_ascii_only && !IsLowercaseAscii(word)) {
                return LoadFailure(language, compat::format(
                    "entry on line {} is outside the a-z alphabet", line));
            }
        }

        auto normalized = unicode::Normalizer::TryNormalize(word);
        if (normalized.IsErr()) {
            return WordlistResult::Err(std::move(normalized).UnwrapErr());
        }

        const auto [_, inserted] = index.emplace(
            std::move(normalized).Unwrap(), static_cast<uint16_t>(i));
        if (!inserted) {
            return LoadFailure(language, compat::format("duplicate entry on line {}", line));
        }
    }

    debug::LogWordlistLoaded(ToString(language), words.size());

    return WordlistResult::Ok(std::shared_ptr<const Wordlist>(
        new Wordlist(language, std::move(words), std::move(index))));
}

Option<uint16_t> Wordlist::IndexOf(const std::string_view word) const {
    return IndexOfNormalized(unicode::Normalizer::NormalizeString(word));
}

Option<uint16_t> Wordlist::IndexOfNormalized(const std::string_view normalized_word) const {
    const auto it = index_.find(std::string(normalized_word));
    if (it == index_.end()) {
        return None<uint16_t>();
    }
    return Some(it->second);
}

const std::string& Wordlist::WordAt(const uint16_t index) const {
    if (index >= words_.size()) {
        throw std::out_of_range(compat::format(
            "Word index {} out of range for wordlist of {} entries", index, words_.size()));
    }
    return words_[index];
}

bool Wordlist::Contains(const std::string_view word) const {
    return IndexOf(word).has_value();
}

} // namespace seedphrase::wordlist
