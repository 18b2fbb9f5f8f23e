#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/wordlist/language.hpp"

#include <string>
#include <vector>

namespace seedphrase::interfaces {

/**
 * @brief Supplies raw wordlist entries for a language
 *
 * Implementations return the entries in file order without validating
 * them. A language the source has no data for is reported as
 * WordlistNotFound; unreadable or malformed data as WordlistLoadError.
 */
class IWordlistSource {
public:
    virtual ~IWordlistSource() = default;

    [[nodiscard]] virtual Result<std::vector<std::string>, MnemonicFailure> ReadWords(
        wordlist::Language language) const = 0;
};

} // namespace seedphrase::interfaces
