#include "seedphrase/wordlist/wordlist_diagnostics.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <unicode/utf8.h>

#include <algorithm>
#include <array>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace seedphrase::wordlist {

namespace {

// Ordered pairs (smaller letter first).
constexpr std::array<std::pair<char32_t, char32_t>, 63> SIMILAR_LETTERS = {{
    {U'a', U'c'}, {U'a', U'e'}, {U'a', U'o'},
    {U'b', U'd'}, {U'b', U'h'}, {U'b', U'p'}, {U'b', U'q'}, {U'b', U'r'},
    {U'c', U'e'}, {U'c', U'g'}, {U'c', U'n'}, {U'c', U'o'}, {U'c', U'q'}, {U'c', U'u'},
    {U'd', U'g'}, {U'd', U'h'}, {U'd', U'o'}, {U'd', U'p'}, {U'd', U'q'},
    {U'e', U'f'}, {U'e', U'o'},
    {U'f', U'i'}, {U'f', U'j'}, {U'f', U'l'}, {U'f', U'p'}, {U'f', U't'},
    {U'g', U'j'}, {U'g', U'o'}, {U'g', U'p'}, {U'g', U'q'}, {U'g', U'y'},
    {U'h', U'k'}, {U'h', U'l'}, {U'h', U'm'}, {U'h', U'n'}, {U'h', U'r'},
    {U'i', U'j'}, {U'i', U'l'}, {U'i', U't'}, {U'i', U'y'},
    {U'j', U'l'}, {U'j', U'p'}, {U'j', U'q'}, {U'j', U'y'},
    {U'k', U'x'},
    {U'l', U't'},
    {U'm', U'n'}, {U'm', U'w'},
    {U'n', U'u'}, {U'n', U'z'},
    {U'o', U'p'}, {U'o', U'q'}, {U'o', U'u'}, {U'o', U'v'},
    {U'p', U'q'}, {U'p', U'r'},
    {U'q', U'y'},
    {U's', U'z'},
    {U'u', U'v'}, {U'u', U'w'}, {U'u', U'y'},
    {U'v', U'w'}, {U'v', U'y'}
}};

std::u32string DecodeUtf8(const std::string_view text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    std::u32string out;
    out.reserve(text.size());
    int32_t offset = 0;
    while (offset < length) {
        UChar32 c;
        U8_NEXT(bytes, offset, length, c);
        out.push_back(c < 0 ? U'\uFFFD' : static_cast<char32_t>(c));
    }
    return out;
}

} // namespace

bool WordlistDiagnostics::AreSimilarLetters(char32_t a, char32_t b) noexcept {
    if (a > b) {
        std::swap(a, b);
    }
    const std::pair<char32_t, char32_t> pair{a, b};
    return std::find(SIMILAR_LETTERS.begin(), SIMILAR_LETTERS.end(), pair) != SIMILAR_LETTERS.end();
}

Result<size_t, MnemonicFailure> WordlistDiagnostics::CountDuplicatePrefixes(
    const Wordlist& wordlist,
    const size_t prefix_code_points) {

    std::unordered_set<std::string> seen;
    size_t duplicates = 0;

    for (const std::string& word : wordlist.Words()) {
        auto normalized = unicode::Normalizer::TryNormalizeNfkc(word);
        if (normalized.IsErr()) {
            return Result<size_t, MnemonicFailure>::Err(std::move(normalized).UnwrapErr());
        }
        std::string prefix = unicode::Normalizer::CodePointPrefix(normalized.Unwrap(), prefix_code_points);
        if (!seen.insert(std::move(prefix)).second) {
            ++duplicates;
        }
    }

    return Result<size_t, MnemonicFailure>::Ok(duplicates);
}

std::vector<SimilarWordPair> WordlistDiagnostics::FindSimilarWords(const Wordlist& wordlist) {
    std::vector<std::u32string> decoded;
    decoded.reserve(wordlist.Size());
    for (const std::string& word : wordlist.Words()) {
        decoded.push_back(DecodeUtf8(word));
    }

    std::vector<SimilarWordPair> pairs;
    for (size_t i = 0; i < decoded.size(); ++i) {
        for (size_t j = i + 1; j < decoded.size(); ++j) {
            const std::u32string& a = decoded[i];
            const std::u32string& b = decoded[j];
            if (a.size() != b.size()) {
                continue;
            }

            size_t differences = 0;
            size_t position = 0;
            for (size_t k = 0; k < a.size() && differences < 2; ++k) {
                if (a[k] != b[k]) {
                    ++differences;
                    position = k;
                }
            }

            if (differences == 1 && AreSimilarLetters(a[position], b[position])) {
                pairs.push_back(SimilarWordPair{
                    .first = wordlist.Words()[i],
                    .second = wordlist.Words()[j]
                });
            }
        }
    }
    return pairs;
}

std::vector<PolicyViolation> WordlistDiagnostics::FindLengthViolations(
    const Wordlist& wordlist, const WordPolicy& policy) {

    std::vector<PolicyViolation> violations;
    if (!policy.validated) {
        return violations;
    }
    const auto& words = wordlist.Words();
    for (size_t i = 0; i < words.size(); ++i) {
        const size_t length = unicode::Normalizer::CodePointLength(words[i]);
        if (length < policy.min_code_points || length > policy.max_code_points) {
            violations.push_back(PolicyViolation{
                .index = static_cast<uint16_t>(i),
                .word = words[i]
            });
        }
    }
    return violations;
}

std::vector<PolicyViolation> WordlistDiagnostics::FindAlphabetViolations(
    const Wordlist& wordlist, const WordPolicy& policy) {

    std::vector<PolicyViolation> violations;
    if (!policy.validated || !policy.lowercase_ascii_only) {
        return violations;
    }
    const auto& words = wordlist.Words();
    for (size_t i = 0; i < words.size(); ++i) {
        const bool in_alphabet = std::all_of(words[i].begin(), words[i].end(),
            [](const char c) { return c >= 'a' && c <= 'z'; });
        if (!in_alphabet) {
            violations.push_back(PolicyViolation{
                .index = static_cast<uint16_t>(i),
                .word = words[i]
            });
        }
    }
    return violations;
}

std::vector<WordCollision> WordlistDiagnostics::FindCollisions(
    const std::vector<std::shared_ptr<const Wordlist>>& wordlists) {

    std::unordered_map<std::string, Language> owners;
    std::vector<WordCollision> collisions;

    for (const auto& wordlist : wordlists) {
        if (!wordlist) {
            continue;
        }
        for (const std::string& word : wordlist->Words()) {
            std::string normalized = unicode::Normalizer::NormalizeString(word);
            const auto [it, inserted] = owners.emplace(normalized, wordlist->GetLanguage());
            if (!inserted && it->second != wordlist->GetLanguage()) {
                collisions.push_back(WordCollision{
                    .word = std::move(normalized),
                    .first = it->second,
                    .second = wordlist->GetLanguage()
                });
            }
        }
    }
    return collisions;
}

} // namespace seedphrase::wordlist
