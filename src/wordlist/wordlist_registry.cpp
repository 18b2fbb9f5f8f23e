#include "seedphrase/wordlist/wordlist_registry.hpp"
#include "seedphrase/wordlist/wordlist_diagnostics.hpp"
#include "seedphrase/core/format.hpp"
#include "seedphrase/debug/trace_logger.hpp"

#include <algorithm>

namespace seedphrase::wordlist {

namespace {

using RegistryResult = Result<std::shared_ptr<const WordlistRegistry>, MnemonicFailure>;

} // namespace

WordlistRegistry::WordlistRegistry(std::vector<std::shared_ptr<const Wordlist>> wordlists,
                                   std::vector<WordCollision> collisions)
    : wordlists_(std::move(wordlists))
    , collisions_(std::move(collisions)) {}

RegistryResult WordlistRegistry::LoadAvailable(const interfaces::IWordlistSource& source) {
    SEEDPHRASE_LOG_SECTION(debug::Component::Registry, "LOAD AVAILABLE");

    std::vector<std::shared_ptr<const Wordlist>> loaded;
    for (const Language language : ListLanguages()) {
        auto result = Wordlist::Load(language, source);
        if (result.IsErr()) {
            if (result.UnwrapErr().type == MnemonicFailureType::WordlistNotFound) {
                SEEDPHRASE_LOG_MSG(debug::Component::Registry, "SKIP", ToString(language));
                continue;
            }
            return RegistryResult::Err(std::move(result).UnwrapErr());
        }
        loaded.push_back(std::move(result).Unwrap());
    }

    return FromWordlists(std::move(loaded));
}

RegistryResult WordlistRegistry::FromWordlists(std::vector<std::shared_ptr<const Wordlist>> wordlists) {
    for (const auto& wordlist : wordlists) {
        if (!wordlist) {
            return RegistryResult::Err(
                MnemonicFailure::WordlistLoadError("Registry given a null wordlist"));
        }
    }

    std::sort(wordlists.begin(), wordlists.end(),
        [](const auto& a, const auto& b) {
            return static_cast<uint8_t>(a->GetLanguage()) < static_cast<uint8_t>(b->GetLanguage());
        });

    const auto repeated = std::adjacent_find(wordlists.begin(), wordlists.end(),
        [](const auto& a, const auto& b) { return a->GetLanguage() == b->GetLanguage(); });
    if (repeated != wordlists.end()) {
        return RegistryResult::Err(MnemonicFailure::WordlistLoadError(
            compat::format("Wordlist '{}' given more than once", ToString((*repeated)->GetLanguage()))));
    }

    std::vector<WordCollision> collisions = WordlistDiagnostics::FindCollisions(wordlists);
    if (!collisions.empty()) {
        SEEDPHRASE_LOG_MSG(debug::Component::Registry, "VERIFY", compat::format(
            "{} word(s) shared between wordlists, first '{}' in '{}' and '{}'",
            collisions.size(), collisions.front().word,
            ToString(collisions.front().first), ToString(collisions.front().second)));
    }

    SEEDPHRASE_LOG_VALUE(debug::Component::Registry, "LOAD", "languages", wordlists.size());
    return RegistryResult::Ok(std::shared_ptr<const WordlistRegistry>(
        new WordlistRegistry(std::move(wordlists), std::move(collisions))));
}

std::shared_ptr<const Wordlist> WordlistRegistry::Get(const Language language) const {
    for (const auto& wordlist : wordlists_) {
        if (wordlist->GetLanguage() == language) {
            return wordlist;
        }
    }
    return nullptr;
}

bool WordlistRegistry::Has(const Language language) const {
    return Get(language) != nullptr;
}

std::vector<Language> WordlistRegistry::AvailableLanguages() const {
    std::vector<Language> languages;
    languages.reserve(wordlists_.size());
    for (const auto& wordlist : wordlists_) {
        languages.push_back(wordlist->GetLanguage());
    }
    return languages;
}

} // namespace seedphrase::wordlist
