#pragma once

#include "seedphrase/core/constants.hpp"
#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/wordlist/language.hpp"
#include "seedphrase/wordlist/wordlist.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace seedphrase::wordlist {

/// A word present in two different languages' lists
struct WordCollision {
    std::string word;
    Language first;
    Language second;
};

/// Two same-length words that differ in exactly one easily confused letter
struct SimilarWordPair {
    std::string first;
    std::string second;
};

/// An entry that violates a language's WordPolicy
struct PolicyViolation {
    uint16_t index;
    std::string word;
};

/**
 * @brief Quality checks over loaded wordlists
 *
 * Wordlist::Load() already rejects lists that break hard invariants. These
 * checks cover the softer properties a published list is expected to have
 * and are what the wordlist quality tests run.
 */
class WordlistDiagnostics {
public:
    /**
     * @brief Number of entries whose first @p prefix_code_points NFKC code
     *        points repeat an earlier entry's prefix
     */
    [[nodiscard]] static Result<size_t, MnemonicFailure> CountDuplicatePrefixes(
        const Wordlist& wordlist,
        size_t prefix_code_points = Constants::PREFIX_CODE_POINTS);

    [[nodiscard]] static std::vector<SimilarWordPair> FindSimilarWords(const Wordlist& wordlist);

    [[nodiscard]] static std::vector<PolicyViolation> FindLengthViolations(
        const Wordlist& wordlist, const WordPolicy& policy);

    [[nodiscard]] static std::vector<PolicyViolation> FindAlphabetViolations(
        const Wordlist& wordlist, const WordPolicy& policy);

    /**
     * @brief Words (compared in NFKD form) that appear in more than one list
     */
    [[nodiscard]] static std::vector<WordCollision> FindCollisions(
        const std::vector<std::shared_ptr<const Wordlist>>& wordlists);

    /// Whether two letters are in the visually similar pair table
    [[nodiscard]] static bool AreSimilarLetters(char32_t a, char32_t b) noexcept;

private:
    WordlistDiagnostics() = delete;
};

} // namespace seedphrase::wordlist
