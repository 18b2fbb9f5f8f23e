#include "seedphrase/wordlist/language.hpp"

namespace seedphrase::wordlist {

namespace {

constexpr std::array<Language, LANGUAGE_COUNT> ALL_LANGUAGES = {
    Language::English,
    Language::Japanese,
    Language::Korean,
    Language::Spanish,
    Language::ChineseSimplified,
    Language::ChineseTraditional,
    Language::French,
    Language::Italian,
    Language::Czech,
    Language::Portuguese
};

constexpr size_t ENGLISH_MIN_CODE_POINTS = 3;
constexpr size_t ENGLISH_MAX_CODE_POINTS = 8;

} // namespace

const std::array<Language, LANGUAGE_COUNT>& ListLanguages() noexcept {
    return ALL_LANGUAGES;
}

std::string_view ToString(const Language language) noexcept {
    switch (language) {
        case Language::English: return "english";
        case Language::Japanese: return "japanese";
        case Language::Korean: return "korean";
        case Language::Spanish: return "spanish";
        case Language::ChineseSimplified: return "chinese_simplified";
        case Language::ChineseTraditional: return "chinese_traditional";
        case Language::French: return "french";
        case Language::Italian: return "italian";
        case Language::Czech: return "czech";
        case Language::Portuguese: return "portuguese";
    }
    return "unknown";
}

Option<Language> ParseLanguage(const std::string_view name) {
    for (const Language language : ALL_LANGUAGES) {
        if (ToString(language) == name) {
            return Some(language);
        }
    }
    return None<Language>();
}

WordPolicy PolicyFor(const Language language) noexcept {
    if (language == Language::English) {
        return WordPolicy{
            .validated = true,
            .min_code_points = ENGLISH_MIN_CODE_POINTS,
            .max_code_points = ENGLISH_MAX_CODE_POINTS,
            .lowercase_ascii_only = true
        };
    }
    return WordPolicy{
        .validated = false,
        .min_code_points = 0,
        .max_code_points = 0,
        .lowercase_ascii_only = false
    };
}

} // namespace seedphrase::wordlist
