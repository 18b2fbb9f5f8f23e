#include "seedphrase/mnemonic/seed_deriver.hpp"
#include "seedphrase/crypto/pbkdf2.hpp"
#include "seedphrase/crypto/sodium_interop.hpp"
#include "seedphrase/debug/trace_logger.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <initializer_list>
#include <span>
#include <string>

namespace seedphrase::mnemonic {

namespace {

std::span<const uint8_t> AsBytes(const std::string& text) noexcept {
    return {reinterpret_cast<const uint8_t*>(text.data()), text.size()};
}

Result<Unit, MnemonicFailure> WipeStrings(std::initializer_list<std::string*> secrets) {
    if (auto init = crypto::SodiumInterop::Initialize(); init.IsErr()) {
        return Result<Unit, MnemonicFailure>::Err(
            MnemonicFailure::FromSodiumFailure(init.UnwrapErr()));
    }
    for (std::string* secret : secrets) {
        auto wiped = crypto::SodiumInterop::SecureWipeString(*secret);
        if (wiped.IsErr()) {
            return Result<Unit, MnemonicFailure>::Err(
                MnemonicFailure::FromSodiumFailure(wiped.UnwrapErr()));
        }
    }
    return Result<Unit, MnemonicFailure>::Ok(unit);
}

} // namespace

Result<Seed, MnemonicFailure> SeedDeriver::ToSeed(
    const std::string_view mnemonic,
    const std::string_view passphrase) {

    auto password = unicode::Normalizer::TryNormalize(mnemonic);
    if (password.IsErr()) {
        return Result<Seed, MnemonicFailure>::Err(std::move(password).UnwrapErr());
    }

    auto normalized_passphrase = unicode::Normalizer::TryNormalize(passphrase);
    if (normalized_passphrase.IsErr()) {
        if (auto wiped = WipeStrings({&password.Unwrap()}); wiped.IsErr()) {
            return Result<Seed, MnemonicFailure>::Err(std::move(wiped).UnwrapErr());
        }
        return Result<Seed, MnemonicFailure>::Err(std::move(normalized_passphrase).UnwrapErr());
    }

    std::string salt(Pbkdf2Constants::SALT_PREFIX);
    salt.append(normalized_passphrase.Unwrap());

    Seed seed{};
    auto derived = crypto::Pbkdf2::DeriveHmacSha512(
        AsBytes(password.Unwrap()),
        AsBytes(salt),
        Pbkdf2Constants::ITERATIONS,
        seed);

    auto wiped = WipeStrings({&password.Unwrap(), &normalized_passphrase.Unwrap(), &salt});
    if (wiped.IsErr()) {
        return Result<Seed, MnemonicFailure>::Err(std::move(wiped).UnwrapErr());
    }

    if (derived.IsErr()) {
        debug::LogFailure(debug::Component::Seed, "DERIVE", "CryptoFailure");
        return Result<Seed, MnemonicFailure>::Err(std::move(derived).UnwrapErr());
    }

    return Result<Seed, MnemonicFailure>::Ok(seed);
}

} // namespace seedphrase::mnemonic
