#include "seedphrase/unicode/normalizer.hpp"
#include "seedphrase/core/constants.hpp"

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/utf8.h>

#include <cstdint>
#include <stdexcept>

namespace seedphrase::unicode {

namespace {

using NormalizerGetter = const icu::Normalizer2* (*)(UErrorCode&);

bool IsAsciiWhitespace(const char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

// Length in bytes of the separator starting at pos, or 0.
size_t SeparatorLengthAt(const std::string_view text, const size_t pos) noexcept {
    if (IsAsciiWhitespace(text[pos])) {
        return 1;
    }
    if (text.substr(pos, UnicodeConstants::IDEOGRAPHIC_SPACE.size()) ==
        UnicodeConstants::IDEOGRAPHIC_SPACE) {
        return UnicodeConstants::IDEOGRAPHIC_SPACE.size();
    }
    return 0;
}

Result<std::string, MnemonicFailure> NormalizeWith(
    const NormalizerGetter getter,
    const std::string_view text,
    const std::string_view unavailable_message) {

    UErrorCode status = U_ZERO_ERROR;
    const icu::Normalizer2* normalizer = getter(status);
    if (U_FAILURE(status) || normalizer == nullptr) {
        return Result<std::string, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure(
                std::string(unavailable_message) + ": " + u_errorName(status)));
    }

    icu::UnicodeString source = icu::UnicodeString::fromUTF8(
        icu::StringPiece(text.data(), static_cast<int32_t>(text.size())));
    source.findAndReplace(
        icu::UnicodeString(static_cast<UChar32>(UnicodeConstants::IDEOGRAPHIC_SPACE_CODE_POINT)),
        icu::UnicodeString(static_cast<UChar32>(U' ')));

    const icu::UnicodeString normalized = normalizer->normalize(source, status);
    if (U_FAILURE(status)) {
        return Result<std::string, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure(
                std::string("ICU normalization failed: ") + u_errorName(status)));
    }

    std::string out;
    out.reserve(text.size());
    normalized.toUTF8String(out);
    return Result<std::string, MnemonicFailure>::Ok(std::move(out));
}

} // namespace

std::string Normalizer::NormalizeString(const std::string_view text) {
    auto result = TryNormalize(text);
    if (result.IsErr()) {
        throw std::runtime_error(result.UnwrapErr().message);
    }
    return std::move(result).Unwrap();
}

Result<std::string, MnemonicFailure> Normalizer::TryNormalize(const std::string_view text) {
    return NormalizeWith(&icu::Normalizer2::getNFKDInstance, text,
                         ErrorMessages::ICU_NORMALIZER_UNAVAILABLE);
}

Result<std::string, MnemonicFailure> Normalizer::TryNormalizeNfkc(const std::string_view text) {
    return NormalizeWith(&icu::Normalizer2::getNFKCInstance, text,
                         ErrorMessages::ICU_NFKC_NORMALIZER_UNAVAILABLE);
}

std::vector<std::string> Normalizer::SplitWords(const std::string_view text) {
    std::vector<std::string> words;
    size_t pos = 0;
    while (pos < text.size()) {
        while (pos < text.size()) {
            const size_t separator = SeparatorLengthAt(text, pos);
            if (separator == 0) {
                break;
            }
            pos += separator;
        }
        const size_t start = pos;
        while (pos < text.size() && SeparatorLengthAt(text, pos) == 0) {
            ++pos;
        }
        if (pos > start) {
            words.emplace_back(text.substr(start, pos - start));
        }
    }
    return words;
}

std::string Normalizer::JoinWords(const std::vector<std::string>& words) {
    std::string sentence;
    for (size_t i = 0; i < words.size(); ++i) {
        if (i > 0) {
            sentence.append(UnicodeConstants::ASCII_SPACE);
        }
        sentence.append(words[i]);
    }
    return sentence;
}

size_t Normalizer::CodePointLength(const std::string_view text) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t offset = 0;
    size_t count = 0;
    while (offset < length) {
        UChar32 c;
        U8_NEXT(bytes, offset, length, c);
        (void)c;
        ++count;
    }
    return count;
}

std::string Normalizer::CodePointPrefix(const std::string_view text, const size_t count) {
    const auto* bytes = reinterpret_cast<const uint8_t*>(text.data());
    const auto length = static_cast<int32_t>(text.size());
    int32_t offset = 0;
    for (size_t taken = 0; taken < count && offset < length; ++taken) {
        UChar32 c;
        U8_NEXT(bytes, offset, length, c);
        (void)c;
    }
    return std::string(text.substr(0, static_cast<size_t>(offset)));
}

bool Normalizer::IsBlank(const std::string_view text) {
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t separator = SeparatorLengthAt(text, pos);
        if (separator == 0) {
            return false;
        }
        pos += separator;
    }
    return true;
}

} // namespace seedphrase::unicode
