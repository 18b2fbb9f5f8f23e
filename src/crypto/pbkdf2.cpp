#include "seedphrase/crypto/pbkdf2.hpp"
#include "seedphrase/core/constants.hpp"

#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <string>

namespace seedphrase::crypto {

Result<Unit, MnemonicFailure> Pbkdf2::DeriveHmacSha512(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    const uint32_t iterations,
    std::span<uint8_t> output) {

    if (iterations == 0) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure("PBKDF2 iteration count must be at least 1"));
    }

    if (output.empty()) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure("PBKDF2 output size must be non-zero"));
    }

    EVP_KDF* kdf = EVP_KDF_fetch(nullptr, OpenSSLConstants::ALGORITHM_PBKDF2.data(), nullptr);
    if (!kdf) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure(std::string(ErrorMessages::PBKDF2_FETCH_FAILED)));
    }

    EVP_KDF_CTX* kctx = EVP_KDF_CTX_new(kdf);
    EVP_KDF_free(kdf);

    if (!kctx) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure(std::string(ErrorMessages::PBKDF2_CONTEXT_FAILED)));
    }

    // An empty password still needs a non-null pointer for OSSL_PARAM.
    static const uint8_t empty_password = 0;
    const uint8_t* password_data = password.empty() ? &empty_password : password.data();

    uint64_t iteration_count = iterations;
    int pkcs5_mode = OpenSSLConstants::DISABLE_SP800_132_CHECKS;

    OSSL_PARAM params[6];
    int param_idx = 0;

    params[param_idx++] = OSSL_PARAM_construct_utf8_string(
        OpenSSLConstants::PARAM_DIGEST.data(),
        const_cast<char*>(OpenSSLConstants::ALGORITHM_SHA512.data()), 0);

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_PASSWORD.data(),
        const_cast<uint8_t*>(password_data), password.size());

    params[param_idx++] = OSSL_PARAM_construct_octet_string(
        OpenSSLConstants::PARAM_SALT.data(),
        const_cast<uint8_t*>(salt.data()), salt.size());

    params[param_idx++] = OSSL_PARAM_construct_uint64(
        OpenSSLConstants::PARAM_ITERATIONS.data(), &iteration_count);

    params[param_idx++] = OSSL_PARAM_construct_int(
        OpenSSLConstants::PARAM_PKCS5.data(), &pkcs5_mode);

    params[param_idx] = OSSL_PARAM_construct_end();

    const int result = EVP_KDF_derive(kctx, output.data(), output.size(), params);
    EVP_KDF_CTX_free(kctx);

    if (result != OpenSSLConstants::SUCCESS) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::CryptoFailure(std::string(ErrorMessages::PBKDF2_DERIVE_FAILED)));
    }

    return Result<Unit, MnemonicFailure>::Ok(unit);
}

} // namespace seedphrase::crypto
