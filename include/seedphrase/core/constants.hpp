#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
namespace seedphrase {
struct Constants {
    static constexpr size_t WORDLIST_SIZE = 2048;
    static constexpr size_t BITS_PER_WORD = 11;
    static constexpr uint16_t WORD_INDEX_MASK = 0x07FF;
    static constexpr size_t BITS_PER_BYTE = 8;
    static constexpr size_t ENTROPY_BITS_PER_CHECKSUM_BIT = 32;
    static constexpr size_t WORDS_PER_CHECKSUM_GROUP = 3;
    static constexpr size_t MIN_RELAXED_ENTROPY_BYTES = 4;
    static constexpr size_t MAX_ENTROPY_BYTES = 32;
    static constexpr std::array<size_t, 5> STANDARD_ENTROPY_BYTES = {16, 20, 24, 28, 32};
    static constexpr std::array<size_t, 5> STANDARD_WORD_COUNTS = {12, 15, 18, 21, 24};
    static constexpr size_t SHA_256_DIGEST_SIZE = 32;
    static constexpr size_t SEED_SIZE = 64;
    static constexpr size_t SMALL_BUFFER_THRESHOLD = 1024;
    static constexpr size_t PREFIX_CODE_POINTS = 4;
};
struct UnicodeConstants {
    // U+3000 IDEOGRAPHIC SPACE encoded as UTF-8.
    static constexpr std::string_view IDEOGRAPHIC_SPACE = "\xE3\x80\x80";
    static constexpr char32_t IDEOGRAPHIC_SPACE_CODE_POINT = 0x3000;
    static constexpr std::string_view ASCII_SPACE = " ";
    static constexpr std::string_view UTF_8_BOM = "\xEF\xBB\xBF";
};
struct Pbkdf2Constants {
    static constexpr uint32_t ITERATIONS = 2048;
    static constexpr std::string_view SALT_PREFIX = "mnemonic";
};
struct OpenSSLConstants {
    static constexpr int SUCCESS = 1;
    static constexpr int DISABLE_SP800_132_CHECKS = 1;
    static constexpr std::string_view ALGORITHM_PBKDF2 = "PBKDF2";
    static constexpr std::string_view ALGORITHM_SHA512 = "SHA512";
    static constexpr std::string_view PARAM_DIGEST = "digest";
    static constexpr std::string_view PARAM_PASSWORD = "pass";
    static constexpr std::string_view PARAM_SALT = "salt";
    static constexpr std::string_view PARAM_ITERATIONS = "iter";
    static constexpr std::string_view PARAM_PKCS5 = "pkcs5";
};
struct SodiumConstants {
    static constexpr int SUCCESS = 0;
    static constexpr int FAILURE = -1;
};
struct ErrorMessages {
    static constexpr std::string_view SODIUM_INIT_FAILED = "Failed to initialize libsodium";
    static constexpr std::string_view NOT_INITIALIZED = "Libsodium not initialized";
    static constexpr std::string_view CONSTANT_TIME_COMPARISON_FAILED = "Constant-time comparison failed";
    static constexpr std::string_view ICU_NORMALIZER_UNAVAILABLE = "ICU NFKD normalizer is unavailable";
    static constexpr std::string_view ICU_NFKC_NORMALIZER_UNAVAILABLE = "ICU NFKC normalizer is unavailable";
    static constexpr std::string_view PBKDF2_FETCH_FAILED = "Failed to fetch PBKDF2 algorithm";
    static constexpr std::string_view PBKDF2_CONTEXT_FAILED = "Failed to create PBKDF2 context";
    static constexpr std::string_view PBKDF2_DERIVE_FAILED = "PBKDF2 key derivation failed";
};
}
