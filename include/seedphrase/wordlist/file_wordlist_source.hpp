#pragma once

#include "seedphrase/interfaces/i_wordlist_source.hpp"

#include <filesystem>

namespace seedphrase::wordlist {

/**
 * @brief Reads `<directory>/<language>.txt`, one word per line
 *
 * Accepts `\n` and `\r\n` line endings; the trailing newline is optional.
 */
class FileWordlistSource final : public interfaces::IWordlistSource {
public:
    explicit FileWordlistSource(std::filesystem::path directory);

    /**
     * @brief Source rooted at $SEEDPHRASE_WORDLIST_DIR, or the build-time
     *        default directory when the variable is unset or empty
     */
    [[nodiscard]] static FileWordlistSource FromEnvironment();

    [[nodiscard]] Result<std::vector<std::string>, MnemonicFailure> ReadWords(
        Language language) const override;

    [[nodiscard]] const std::filesystem::path& Directory() const noexcept {
        return directory_;
    }

    [[nodiscard]] std::filesystem::path PathFor(Language language) const;

    static constexpr const char* ENVIRONMENT_VARIABLE = "SEEDPHRASE_WORDLIST_DIR";

private:
    std::filesystem::path directory_;
};

} // namespace seedphrase::wordlist
