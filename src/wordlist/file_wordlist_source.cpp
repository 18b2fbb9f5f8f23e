#include "seedphrase/wordlist/file_wordlist_source.hpp"
#include "seedphrase/core/format.hpp"
#include "seedphrase/debug/trace_logger.hpp"

#include <cstdlib>
#include <fstream>
#include <system_error>

#ifndef SEEDPHRASE_DEFAULT_WORDLIST_DIR
#define SEEDPHRASE_DEFAULT_WORDLIST_DIR "wordlists"
#endif

namespace seedphrase::wordlist {

FileWordlistSource::FileWordlistSource(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

FileWordlistSource FileWordlistSource::FromEnvironment() {
    const char* configured = std::getenv(ENVIRONMENT_VARIABLE);
    if (configured != nullptr && *configured != '\0') {
        return FileWordlistSource(std::filesystem::path(configured));
    }
    return FileWordlistSource(std::filesystem::path(SEEDPHRASE_DEFAULT_WORDLIST_DIR));
}

std::filesystem::path FileWordlistSource::PathFor(const Language language) const {
    return directory_ / (std::string(ToString(language)) + ".txt");
}

Result<std::vector<std::string>, MnemonicFailure> FileWordlistSource::ReadWords(
    const Language language) const {

    const std::filesystem::path path = PathFor(language);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        debug::LogFailure(debug::Component::Wordlist, "READ", "not found");
        return Result<std::vector<std::string>, MnemonicFailure>::Err(
            MnemonicFailure::WordlistNotFound(
                compat::format("No wordlist for '{}' at {}", ToString(language), path.string())));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Result<std::vector<std::string>, MnemonicFailure>::Err(
            MnemonicFailure::WordlistLoadError(
                compat::format("Cannot open wordlist file {}", path.string())));
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(input, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        words.push_back(std::move(line));
        line.clear();
    }

    if (input.bad()) {
        return Result<std::vector<std::string>, MnemonicFailure>::Err(
            MnemonicFailure::WordlistLoadError(
                compat::format("I/O error while reading {}", path.string())));
    }

    SEEDPHRASE_LOG_VALUE(debug::Component::Wordlist, "READ", "lines", words.size());
    return Result<std::vector<std::string>, MnemonicFailure>::Ok(std::move(words));
}

} // namespace seedphrase::wordlist
