#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace seedphrase::unicode {

/**
 * @brief Unicode canonicalization shared by every mnemonic operation
 *
 * Backed by ICU's Normalizer2. Mnemonic sentences, passphrases and single
 * words all pass through NormalizeString() before they are compared, split
 * or hashed, so text produced in NFC, NFD, NFKC or NFKD form yields the
 * same bytes.
 */
class Normalizer {
public:
    /**
     * @brief NFKD-normalize UTF-8 text and map U+3000 to U+0020
     *
     * Ill-formed UTF-8 sequences are decoded as U+FFFD.
     *
     * @throws std::runtime_error only if the ICU data set is unusable
     */
    static std::string NormalizeString(std::string_view text);

    /**
     * @brief NFKD-normalize, reporting ICU failures as a value
     */
    static Result<std::string, MnemonicFailure> TryNormalize(std::string_view text);

    /**
     * @brief NFKC-normalize UTF-8 text (used for prefix diagnostics)
     */
    static Result<std::string, MnemonicFailure> TryNormalizeNfkc(std::string_view text);

    /**
     * @brief Split on runs of ASCII whitespace or U+3000, dropping empty tokens
     */
    static std::vector<std::string> SplitWords(std::string_view text);

    static std::string JoinWords(const std::vector<std::string>& words);

    /**
     * @brief Number of Unicode code points in well-formed UTF-8 text
     */
    static size_t CodePointLength(std::string_view text);

    /**
     * @brief First @p count code points of UTF-8 text
     */
    static std::string CodePointPrefix(std::string_view text, size_t count);

    static bool IsBlank(std::string_view text);

private:
    Normalizer() = delete;
};

} // namespace seedphrase::unicode
