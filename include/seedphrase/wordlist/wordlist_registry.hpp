#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/interfaces/i_wordlist_source.hpp"
#include "seedphrase/wordlist/language.hpp"
#include "seedphrase/wordlist/wordlist.hpp"
#include "seedphrase/wordlist/wordlist_diagnostics.hpp"

#include <memory>
#include <vector>

namespace seedphrase::wordlist {

/**
 * @brief Every wordlist a source can provide, loaded once
 *
 * Words found in more than one list are recorded rather than rejected, so
 * lists that share entries can still be loaded side by side. Language
 * detection reports those words as ambiguous.
 */
class WordlistRegistry {
public:
    /**
     * @brief Load every supported language the source has data for
     *
     * Languages reported as WordlistNotFound are skipped. Any other load
     * error is returned unchanged.
     */
    [[nodiscard]] static Result<std::shared_ptr<const WordlistRegistry>, MnemonicFailure> LoadAvailable(
        const interfaces::IWordlistSource& source);

    /**
     * @brief Build a registry from already loaded wordlists
     */
    [[nodiscard]] static Result<std::shared_ptr<const WordlistRegistry>, MnemonicFailure> FromWordlists(
        std::vector<std::shared_ptr<const Wordlist>> wordlists);

    /// Wordlist for @p language, or nullptr when it was not loaded
    [[nodiscard]] std::shared_ptr<const Wordlist> Get(Language language) const;

    [[nodiscard]] bool Has(Language language) const;

    [[nodiscard]] std::vector<Language> AvailableLanguages() const;

    /// Loaded wordlists in canonical language order
    [[nodiscard]] const std::vector<std::shared_ptr<const Wordlist>>& All() const noexcept {
        return wordlists_;
    }

    [[nodiscard]] bool Empty() const noexcept { return wordlists_.empty(); }

    /// Words present in more than one loaded list, found at construction
    [[nodiscard]] const std::vector<WordCollision>& Collisions() const noexcept {
        return collisions_;
    }

private:
    WordlistRegistry(std::vector<std::shared_ptr<const Wordlist>> wordlists,
                     std::vector<WordCollision> collisions);

    std::vector<std::shared_ptr<const Wordlist>> wordlists_;
    std::vector<WordCollision> collisions_;
};

} // namespace seedphrase::wordlist
