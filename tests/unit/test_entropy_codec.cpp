#include <catch2/catch_test_macros.hpp>
#include "seedphrase/mnemonic/entropy_codec.hpp"
#include "seedphrase/unicode/normalizer.hpp"
#include "helpers/mock_wordlist_source.hpp"
#include "helpers/hex.hpp"
#include <string>
#include <vector>
using namespace seedphrase;
using namespace seedphrase::mnemonic;
using namespace seedphrase::configuration;
using seedphrase::test_helpers::FromHex;
using seedphrase::test_helpers::ShippedWordlists;
using seedphrase::wordlist::Language;
using seedphrase::wordlist::Wordlist;

namespace {

std::shared_ptr<const Wordlist> English() {
    auto result = Wordlist::Load(Language::English, ShippedWordlists());
    REQUIRE(result.IsOk());
    return std::move(result).Unwrap();
}

}

TEST_CASE("EntropyCodec - Length Arithmetic", "[codec]") {
    static_assert(EntropyCodec::ChecksumBits(16) == 4);
    static_assert(EntropyCodec::ChecksumBits(32) == 8);
    static_assert(EntropyCodec::WordCount(16) == 12);
    static_assert(EntropyCodec::WordCount(20) == 15);
    static_assert(EntropyCodec::WordCount(24) == 18);
    static_assert(EntropyCodec::WordCount(28) == 21);
    static_assert(EntropyCodec::WordCount(32) == 24);
    static_assert(EntropyCodec::WordCount(4) == 3);
    SUCCEED();
}

TEST_CASE("EntropyCodec - Encoding", "[codec]") {
    const EntropyCodec codec(English(), MnemonicConfig::Standard());

    SECTION("All-zero 128-bit entropy") {
        const std::vector<uint8_t> entropy(16, 0x00);
        auto result = codec.ToMnemonic(entropy);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() ==
                "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about");
    }
    SECTION("Sequential bytes") {
        auto result = codec.ToMnemonic(FromHex("000102030405060708090a0b0c0d0e0f"));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() ==
                "abandon amount liar amount expire adjust cage candy arch gather drum buyer");
    }
    SECTION("Every standard length produces the matching word count") {
        for (size_t bytes : {16, 20, 24, 28, 32}) {
            const std::vector<uint8_t> entropy(bytes, 0x5A);
            auto result = codec.ToMnemonic(entropy);
            REQUIRE(result.IsOk());
            REQUIRE(unicode::Normalizer::SplitWords(result.Unwrap()).size() == EntropyCodec::WordCount(bytes));
        }
    }
    SECTION("Words are joined by single ASCII spaces") {
        auto result = codec.ToMnemonic(std::vector<uint8_t>(32, 0xFF));
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().find("  ") == std::string::npos);
        REQUIRE(result.Unwrap().find('\t') == std::string::npos);
    }
    SECTION("Invalid entropy lengths") {
        for (size_t bytes : {0, 4, 15, 17, 33, 64}) {
            auto result = codec.ToMnemonic(std::vector<uint8_t>(bytes, 0x01));
            REQUIRE(result.IsErr());
            REQUIRE(result.UnwrapErr().type == MnemonicFailureType::InvalidEntropyLength);
        }
    }
    SECTION("Input entropy is left untouched") {
        const std::vector<uint8_t> entropy(20, 0x42);
        const auto copy = entropy;
        REQUIRE(codec.ToMnemonic(entropy).IsOk());
        REQUIRE(entropy == copy);
    }
}

TEST_CASE("EntropyCodec - Decoding", "[codec]") {
    const EntropyCodec codec(English(), MnemonicConfig::Standard());

    SECTION("Round trip for every standard length") {
        for (size_t bytes : {16, 20, 24, 28, 32}) {
            std::vector<uint8_t> entropy(bytes);
            for (size_t i = 0; i < bytes; ++i) {
                entropy[i] = static_cast<uint8_t>(i * 37 + bytes);
            }
            auto words = codec.ToMnemonic(entropy);
            REQUIRE(words.IsOk());
            auto decoded = codec.SentenceToEntropy(words.Unwrap());
            REQUIRE(decoded.IsOk());
            REQUIRE(decoded.Unwrap() == entropy);
        }
    }
    SECTION("A malformed word stops decoding and leaves the codec usable") {
        std::vector<std::string> words(12, "abandon");
        words[3] = "ab\xFF";
        auto failed = codec.ToEntropy(words);
        REQUIRE(failed.IsErr());
        REQUIRE(failed.UnwrapErr().type == MnemonicFailureType::UnknownWord);
        words[3] = "abandon";
        words[11] = "about";
        auto decoded = codec.ToEntropy(words);
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == std::vector<uint8_t>(16, 0x00));
    }
    SECTION("Lorem ipsum entropy") {
        const std::string text = "Lorem ipsum dolor sit amet amet.";
        const std::vector<uint8_t> entropy(text.begin(), text.end());
        auto words = codec.ToMnemonic(entropy);
        REQUIRE(words.IsOk());
        REQUIRE(words.Unwrap() ==
                "erase knee off surge alley return soccer pumpkin call casino swallow ten "
                "capital defy place lottery gesture hen fringe dolphin bitter razor spawn small");
        auto decoded = codec.ToEntropy(unicode::Normalizer::SplitWords(words.Unwrap()));
        REQUIRE(decoded.IsOk());
        REQUIRE(decoded.Unwrap() == entropy);
    }
    SECTION("Wrong word count") {
        auto result = codec.SentenceToEntropy("abandon abandon abandon");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::InvalidMnemonicLength);
        auto empty = codec.ToEntropy({});
        REQUIRE(empty.IsErr());
        REQUIRE(empty.UnwrapErr().type == MnemonicFailureType::InvalidMnemonicLength);
    }
    SECTION("Unknown word names its position") {
        auto result = codec.SentenceToEntropy(
            "abandon abandon abandon abandon abandon xyzzy abandon abandon abandon abandon abandon about");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::UnknownWord);
        REQUIRE(result.UnwrapErr().message.find("xyzzy") != std::string::npos);
        REQUIRE(result.UnwrapErr().message.find('6') != std::string::npos);
    }
    SECTION("Length is checked before words") {
        auto result = codec.SentenceToEntropy("xyzzy xyzzy");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::InvalidMnemonicLength);
    }
    SECTION("Bad checksum") {
        auto result = codec.SentenceToEntropy(
            "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::ChecksumMismatch);
    }
    SECTION("Words are normalized before lookup") {
        auto result = codec.ToEntropy({"abandon", "abandon", "abandon", "abandon", "abandon", "abandon",
                                       "abandon", "abandon", "abandon", "abandon", "abandon",
                                       "\uff41\uff42\uff4f\uff55\uff54"});
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == std::vector<uint8_t>(16, 0x00));
    }
}

TEST_CASE("EntropyCodec - Relaxed Policy", "[codec][config]") {
    const EntropyCodec relaxed(English(), MnemonicConfig::Relaxed());
    const EntropyCodec standard(English(), MnemonicConfig::Standard());

    SECTION("32-bit entropy encodes to three words") {
        auto zeros = relaxed.ToMnemonic(std::vector<uint8_t>(4, 0x00));
        REQUIRE(zeros.IsOk());
        REQUIRE(zeros.Unwrap() == "abandon abandon ability");
        auto beef = relaxed.ToMnemonic(FromHex("deadbeef"));
        REQUIRE(beef.IsOk());
        REQUIRE(beef.Unwrap() == "team hospital rookie");
    }
    SECTION("Three-word phrases decode") {
        auto result = relaxed.SentenceToEntropy("error fragile gadget");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex("4ccb8d7a"));
    }
    SECTION("Ideographic space separates words") {
        auto result = relaxed.SentenceToEntropy("error\u3000fragile\u3000gadget");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == FromHex("4ccb8d7a"));
    }
    SECTION("Standard policy rejects the same phrase") {
        auto result = standard.SentenceToEntropy("error fragile gadget");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::InvalidMnemonicLength);
        REQUIRE(standard.ToMnemonic(std::vector<uint8_t>(4, 0x00)).IsErr());
    }
    SECTION("Relaxed policy still enforces the checksum") {
        auto result = relaxed.SentenceToEntropy("abandon abandon abandon");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::ChecksumMismatch);
    }
    SECTION("Relaxed policy still bounds length") {
        REQUIRE(relaxed.ToMnemonic(std::vector<uint8_t>(36, 0x00)).IsErr());
        REQUIRE(relaxed.ToMnemonic(std::vector<uint8_t>(6, 0x00)).IsErr());
        auto result = relaxed.SentenceToEntropy("abandon abandon");
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::InvalidMnemonicLength);
    }
}

TEST_CASE("EntropyCodec - Construction", "[codec]") {
    REQUIRE_THROWS_AS(EntropyCodec(nullptr, MnemonicConfig::Standard()), std::invalid_argument);
}
