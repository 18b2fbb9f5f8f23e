#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/core/option.hpp"
#include "seedphrase/interfaces/i_wordlist_source.hpp"
#include "seedphrase/wordlist/language.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace seedphrase::wordlist {

/**
 * @brief Validated, immutable list of 2048 words for one language
 *
 * Instances only exist behind std::shared_ptr<const Wordlist> and are never
 * modified after Load() returns, so they can be shared across threads and
 * Mnemonic handles without locking.
 */
class Wordlist {
public:
    /**
     * @brief Read and validate a language's wordlist from a source
     *
     * Fails with WordlistNotFound when the source has no data for the
     * language, and with WordlistLoadError when the entry count is not
     * 2048, an entry is empty, duplicated or carries a byte-order mark, or
     * an entry violates the language's WordPolicy.
     */
    [[nodiscard]] static Result<std::shared_ptr<const Wordlist>, MnemonicFailure> Load(
        Language language,
        const interfaces::IWordlistSource& source);

    /**
     * @brief Validate an in-memory list of entries
     */
    [[nodiscard]] static Result<std::shared_ptr<const Wordlist>, MnemonicFailure> FromWords(
        Language language,
        std::vector<std::string> words);

    /**
     * @brief Index of @p word, compared in NFKD form
     */
    [[nodiscard]] Option<uint16_t> IndexOf(std::string_view word) const;

    /**
     * @brief Index lookup for text that is already NFKD-normalized
     */
    [[nodiscard]] Option<uint16_t> IndexOfNormalized(std::string_view normalized_word) const;

    [[nodiscard]] const std::string& WordAt(uint16_t index) const;

    [[nodiscard]] bool Contains(std::string_view word) const;

    [[nodiscard]] const std::vector<std::string>& Words() const noexcept { return words_; }

    [[nodiscard]] size_t Size() const noexcept { return words_.size(); }

    [[nodiscard]] Language GetLanguage() const noexcept { return language_; }

    Wordlist(const Wordlist&) = delete;
    Wordlist& operator=(const Wordlist&) = delete;
    Wordlist(Wordlist&&) = delete;
    Wordlist& operator=(Wordlist&&) = delete;
    ~Wordlist() = default;

private:
    Wordlist(Language language,
             std::vector<std::string> words,
             std::unordered_map<std::string, uint16_t> index);

    Language language_;
    std::vector<std::string> words_;
    std::unordered_map<std::string, uint16_t> index_;
};

} // namespace seedphrase::wordlist
