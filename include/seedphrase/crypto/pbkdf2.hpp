#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace seedphrase::crypto {

/**
 * @brief PBKDF2 (RFC 8018) wrapper using HMAC-SHA512
 *
 * Backed by OpenSSL's EVP_KDF "PBKDF2" implementation. SP 800-132 lower
 * bound checks are disabled: the mnemonic salt prefix is only 8 bytes.
 */
class Pbkdf2 {
public:
    /**
     * @brief Derive key material into @p output
     *
     * @param password Password bytes (may be empty)
     * @param salt Salt bytes
     * @param iterations Iteration count, at least 1
     * @param output Output buffer to fill
     */
    static Result<Unit, MnemonicFailure> DeriveHmacSha512(
        std::span<const uint8_t> password,
        std::span<const uint8_t> salt,
        uint32_t iterations,
        std::span<uint8_t> output);

private:
    Pbkdf2() = delete;
};

} // namespace seedphrase::crypto
