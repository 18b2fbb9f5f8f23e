#pragma once

#include "seedphrase/core/constants.hpp"
#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/configuration/mnemonic_config.hpp"
#include "seedphrase/interfaces/i_wordlist_source.hpp"
#include "seedphrase/mnemonic/entropy_codec.hpp"
#include "seedphrase/mnemonic/prefix_expander.hpp"
#include "seedphrase/mnemonic/seed_deriver.hpp"
#include "seedphrase/wordlist/language.hpp"
#include "seedphrase/wordlist/wordlist.hpp"
#include "seedphrase/wordlist/wordlist_registry.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace seedphrase::mnemonic {

/**
 * @brief Mnemonic operations bound to one language
 *
 * @example
 * ```cpp
 * auto source = wordlist::FileWordlistSource::FromEnvironment();
 * auto handle = Mnemonic::Create(wordlist::Language::English, source).Unwrap();
 *
 * auto words = handle.ToMnemonic(entropy).Unwrap();
 * if (handle.Check(words)) {
 *     auto seed = Mnemonic::ToSeed(words, "passphrase").Unwrap();
 * }
 * ```
 */
class Mnemonic {
public:
    /**
     * @brief Load the language's wordlist from @p source and bind to it
     *
     * Initializes libsodium on first use.
     *
     * @return WordlistNotFound or WordlistLoadError when the wordlist
     *         cannot be loaded, CryptoFailure if libsodium cannot start
     */
    [[nodiscard]] static Result<Mnemonic, MnemonicFailure> Create(
        wordlist::Language language,
        const interfaces::IWordlistSource& source,
        configuration::MnemonicConfig config = configuration::MnemonicConfig::Default());

    /**
     * @brief Bind to a wordlist already held by @p registry
     */
    [[nodiscard]] static Result<Mnemonic, MnemonicFailure> Create(
        wordlist::Language language,
        const wordlist::WordlistRegistry& registry,
        configuration::MnemonicConfig config = configuration::MnemonicConfig::Default());

    [[nodiscard]] Result<std::string, MnemonicFailure> ToMnemonic(
        std::span<const uint8_t> entropy) const;

    [[nodiscard]] Result<std::vector<uint8_t>, MnemonicFailure> ToEntropy(
        const std::vector<std::string>& words) const;

    [[nodiscard]] Result<std::vector<uint8_t>, MnemonicFailure> ToEntropy(
        std::string_view sentence) const;

    /**
     * @brief Whether @p mnemonic decodes with a matching checksum
     *
     * Accepts any positive multiple of 3 words up to 24 regardless of the
     * handle's length policy. Never throws. Any decoding failure yields false.
     */
    [[nodiscard]] bool Check(std::string_view mnemonic) const noexcept;

    [[nodiscard]] std::string ExpandWord(std::string_view prefix) const;

    [[nodiscard]] std::string Expand(std::string_view sentence) const;

    [[nodiscard]] std::vector<std::string> Candidates(std::string_view prefix) const;

    [[nodiscard]] wordlist::Language GetLanguage() const noexcept;

    [[nodiscard]] const wordlist::Wordlist& GetWordlist() const noexcept;

    [[nodiscard]] const configuration::MnemonicConfig& GetConfig() const noexcept;

    // ========================================================================
    // Language-independent operations
    // ========================================================================

    [[nodiscard]] static Result<Seed, MnemonicFailure> ToSeed(
        std::string_view mnemonic,
        std::string_view passphrase = {});

    [[nodiscard]] static std::string NormalizeString(std::string_view text);

    [[nodiscard]] static const std::array<wordlist::Language, wordlist::LANGUAGE_COUNT>& ListLanguages() noexcept;

    [[nodiscard]] static Result<wordlist::Language, MnemonicFailure> DetectLanguage(
        std::string_view word,
        const std::shared_ptr<const wordlist::WordlistRegistry>& registry);

    static constexpr std::string_view IDEOGRAPHIC_SPACE = UnicodeConstants::IDEOGRAPHIC_SPACE;

private:
    Mnemonic(std::shared_ptr<const wordlist::Wordlist> wordlist,
             configuration::MnemonicConfig config);

    static Result<Mnemonic, MnemonicFailure> Bind(
        std::shared_ptr<const wordlist::Wordlist> wordlist,
        configuration::MnemonicConfig config);

    EntropyCodec codec_;
    EntropyCodec checker_;
    PrefixExpander expander_;
};

} // namespace seedphrase::mnemonic
