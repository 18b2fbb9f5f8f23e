#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/wordlist/language.hpp"
#include "seedphrase/wordlist/wordlist_registry.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace seedphrase::mnemonic {

/**
 * @brief Finds the language a word or sentence belongs to
 */
class LanguageDetector {
public:
    explicit LanguageDetector(std::shared_ptr<const wordlist::WordlistRegistry> registry);

    /**
     * @brief Language of a single word
     *
     * @return AmbiguousOrUnknownWord unless exactly one loaded wordlist
     *         contains the NFKD form of @p word
     */
    [[nodiscard]] Result<wordlist::Language, MnemonicFailure> Detect(std::string_view word) const;

    /**
     * @brief Language whose wordlist contains every word of @p sentence
     */
    [[nodiscard]] Result<wordlist::Language, MnemonicFailure> DetectFromMnemonic(
        std::string_view sentence) const;

    /// Languages whose wordlist contains the NFKD form of @p word
    [[nodiscard]] Result<std::vector<wordlist::Language>, MnemonicFailure> Candidates(
        std::string_view word) const;

private:
    std::shared_ptr<const wordlist::WordlistRegistry> registry_;
};

} // namespace seedphrase::mnemonic
