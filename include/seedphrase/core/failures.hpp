#pragma once
#include <string>
#include <string_view>
namespace seedphrase {
enum class SodiumFailureType {
    InitializationFailed,
    BufferTooLarge,
    ComparisonFailed,
    HashFailed
};
enum class MnemonicFailureType {
    InvalidEntropyLength,
    InvalidMnemonicLength,
    UnknownWord,
    ChecksumMismatch,
    AmbiguousOrUnknownWord,
    WordlistLoadError,
    WordlistNotFound,
    CryptoFailure
};
class SodiumFailure {
public:
    SodiumFailureType type;
    std::string message;
    SodiumFailure(const SodiumFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static SodiumFailure InitializationFailed(std::string msg) {
        return {SodiumFailureType::InitializationFailed, std::move(msg)};
    }
    static SodiumFailure BufferTooLarge(std::string msg) {
        return {SodiumFailureType::BufferTooLarge, std::move(msg)};
    }
    static SodiumFailure ComparisonFailed(std::string msg) {
        return {SodiumFailureType::ComparisonFailed, std::move(msg)};
    }
    static SodiumFailure HashFailed(std::string msg) {
        return {SodiumFailureType::HashFailed, std::move(msg)};
    }
};
class MnemonicFailure {
public:
    MnemonicFailureType type;
    std::string message;
    MnemonicFailure(const MnemonicFailureType t, std::string msg)
        : type(t), message(std::move(msg)) {}
    static MnemonicFailure InvalidEntropyLength(std::string msg) {
        return {MnemonicFailureType::InvalidEntropyLength, std::move(msg)};
    }
    static MnemonicFailure InvalidMnemonicLength(std::string msg) {
        return {MnemonicFailureType::InvalidMnemonicLength, std::move(msg)};
    }
    static MnemonicFailure UnknownWord(std::string msg) {
        return {MnemonicFailureType::UnknownWord, std::move(msg)};
    }
    static MnemonicFailure ChecksumMismatch(std::string msg) {
        return {MnemonicFailureType::ChecksumMismatch, std::move(msg)};
    }
    static MnemonicFailure AmbiguousOrUnknownWord(std::string msg) {
        return {MnemonicFailureType::AmbiguousOrUnknownWord, std::move(msg)};
    }
    static MnemonicFailure WordlistLoadError(std::string msg) {
        return {MnemonicFailureType::WordlistLoadError, std::move(msg)};
    }
    static MnemonicFailure WordlistNotFound(std::string msg) {
        return {MnemonicFailureType::WordlistNotFound, std::move(msg)};
    }
    static MnemonicFailure CryptoFailure(std::string msg) {
        return {MnemonicFailureType::CryptoFailure, std::move(msg)};
    }
    static MnemonicFailure FromSodiumFailure(const SodiumFailure& sf) {
        return CryptoFailure(sf.message);
    }
    // A missing wordlist is reported to construction callers as a load error.
    [[nodiscard]] bool IsWordlistLoadError() const noexcept {
        return type == MnemonicFailureType::WordlistLoadError ||
               type == MnemonicFailureType::WordlistNotFound;
    }
};
[[nodiscard]] constexpr std::string_view ToString(const MnemonicFailureType type) noexcept {
    switch (type) {
        case MnemonicFailureType::InvalidEntropyLength: return "InvalidEntropyLength";
        case MnemonicFailureType::InvalidMnemonicLength: return "InvalidMnemonicLength";
        case MnemonicFailureType::UnknownWord: return "UnknownWord";
        case MnemonicFailureType::ChecksumMismatch: return "ChecksumMismatch";
        case MnemonicFailureType::AmbiguousOrUnknownWord: return "AmbiguousOrUnknownWord";
        case MnemonicFailureType::WordlistLoadError: return "WordlistLoadError";
        case MnemonicFailureType::WordlistNotFound: return "WordlistNotFound";
        case MnemonicFailureType::CryptoFailure: return "CryptoFailure";
    }
    return "Unknown";
}
}
