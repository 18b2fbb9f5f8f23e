#pragma once

#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"
#include "seedphrase/core/constants.hpp"

#include <sodium.h>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>

namespace seedphrase::crypto {

using Sha256Digest = std::array<uint8_t, Constants::SHA_256_DIGEST_SIZE>;

/**
 * @brief Interop layer for the libsodium primitives the codec relies on
 *
 * Checksum hashing, wiping of buffers that held entropy bits, and the
 * constant-time checksum comparison all go through this class.
 */
class SodiumInterop {
public:
    // ========================================================================
    // Initialization
    // ========================================================================

    /**
     * @brief Initialize libsodium library
     *
     * Must be called before any other sodium operations.
     * Thread-safe and idempotent.
     */
    static Result<Unit, SodiumFailure> Initialize();

    static bool IsInitialized() noexcept;

    // ========================================================================
    // Secure Memory Operations
    // ========================================================================

    /**
     * @brief Securely wipe a buffer
     *
     * Uses sodium_memzero for large buffers, a volatile loop for small ones.
     */
    static Result<Unit, SodiumFailure> SecureWipe(std::span<uint8_t> buffer);

    /// Wipe the characters of a string that held a mnemonic or passphrase
    static Result<Unit, SodiumFailure> SecureWipeString(std::string& text);

    /**
     * @brief Constant-time comparison of two buffers
     *
     * @return Ok(true) if equal, Ok(false) if different, Err on failure
     */
    static Result<bool, SodiumFailure> ConstantTimeEquals(
        std::span<const uint8_t> a,
        std::span<const uint8_t> b);

    // ========================================================================
    // Hashing
    // ========================================================================

    /**
     * @brief SHA-256 digest (crypto_hash_sha256)
     */
    static Result<Sha256Digest, SodiumFailure> Sha256(std::span<const uint8_t> data);

    static constexpr size_t MAX_BUFFER_SIZE = 1'000'000'000;

private:
    static inline std::atomic<bool> initialized_{false};
    static inline std::once_flag init_flag_;

    static Result<Unit, SodiumFailure> WipeSmallBuffer(std::span<uint8_t> buffer);
    static Result<Unit, SodiumFailure> WipeLargeBuffer(std::span<uint8_t> buffer);

    SodiumInterop() = delete;
    ~SodiumInterop() = delete;
    SodiumInterop(const SodiumInterop&) = delete;
    SodiumInterop& operator=(const SodiumInterop&) = delete;
};

} // namespace seedphrase::crypto
