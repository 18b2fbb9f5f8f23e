#pragma once

#include "seedphrase/core/option.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace seedphrase::wordlist {

/// Supported wordlist languages, in canonical order
enum class Language : uint8_t {
    English = 0,
    Japanese,
    Korean,
    Spanish,
    ChineseSimplified,
    ChineseTraditional,
    French,
    Italian,
    Czech,
    Portuguese
};

inline constexpr size_t LANGUAGE_COUNT = 10;

/// Per-language content rules checked when a wordlist is loaded
struct WordPolicy {
    bool validated;
    size_t min_code_points;
    size_t max_code_points;
    bool lowercase_ascii_only;
};

/**
 * @brief All supported languages in canonical order
 *
 * The set is closed at build time. A language is listed even when no
 * wordlist file for it is shipped.
 */
[[nodiscard]] const std::array<Language, LANGUAGE_COUNT>& ListLanguages() noexcept;

/// Short ASCII identifier, also the wordlist file stem ("english", "chinese_simplified")
[[nodiscard]] std::string_view ToString(Language language) noexcept;

[[nodiscard]] Option<Language> ParseLanguage(std::string_view name);

[[nodiscard]] WordPolicy PolicyFor(Language language) noexcept;

} // namespace seedphrase::wordlist
