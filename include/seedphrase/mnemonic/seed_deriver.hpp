#pragma once

#include "seedphrase/core/constants.hpp"
#include "seedphrase/core/result.hpp"
#include "seedphrase/core/failures.hpp"

#include <array>
#include <cstdint>
#include <string_view>

namespace seedphrase::mnemonic {

using Seed = std::array<uint8_t, Constants::SEED_SIZE>;

/**
 * @brief Derives the 64-byte seed from a mnemonic sentence and passphrase
 *
 * PBKDF2-HMAC-SHA512 with password NFKD(mnemonic), salt
 * "mnemonic" + NFKD(passphrase) and 2048 iterations. No wordlist is
 * consulted, so any sentence yields a seed, valid or not.
 */
class SeedDeriver {
public:
    /**
     * @return CryptoFailure only if ICU or the OpenSSL KDF is unusable
     */
    [[nodiscard]] static Result<Seed, MnemonicFailure> ToSeed(
        std::string_view mnemonic,
        std::string_view passphrase = {});

private:
    SeedDeriver() = delete;
};

} // namespace seedphrase::mnemonic
