#include <catch2/catch_test_macros.hpp>
#include "seedphrase/mnemonic/mnemonic.hpp"
#include "helpers/mock_wordlist_source.hpp"
#include <string>
#include <vector>
using namespace seedphrase;
using namespace seedphrase::mnemonic;
using namespace seedphrase::wordlist;
using seedphrase::test_helpers::AccentedWords;
using seedphrase::test_helpers::EnglishWords;

namespace {

std::shared_ptr<const WordlistRegistry> EnglishAndFrench() {
    auto english = Wordlist::FromWords(Language::English, EnglishWords());
    auto french = Wordlist::FromWords(Language::French, AccentedWords());
    REQUIRE(english.IsOk());
    REQUIRE(french.IsOk());
    auto registry = WordlistRegistry::FromWordlists({english.Unwrap(), french.Unwrap()});
    REQUIRE(registry.IsOk());
    return std::move(registry).Unwrap();
}

std::vector<uint8_t> PatternEntropy(const size_t length) {
    std::vector<uint8_t> entropy(length);
    for (size_t i = 0; i < length; ++i) {
        entropy[i] = static_cast<uint8_t>(i * 37 + length);
    }
    return entropy;
}

}

TEST_CASE("Mnemonic - Accented Wordlist", "[mnemonic][unicode]") {
    const auto registry = EnglishAndFrench();
    auto created = Mnemonic::Create(Language::French, *registry);
    REQUIRE(created.IsOk());
    const Mnemonic& handle = created.Unwrap();
    REQUIRE(handle.GetLanguage() == Language::French);

    SECTION("Entries stay composed and match their decomposed form") {
        REQUIRE(handle.GetWordlist().WordAt(0) == "\u00e0l\u00e0\u00e0");
        const auto index = handle.GetWordlist().IndexOf("a\u0300la\u0300a\u0300");
        REQUIRE(index.has_value());
        REQUIRE(*index == 0);
        REQUIRE(handle.GetWordlist().IndexOf("al\u00e0\u00e0") == None<uint16_t>());
    }

    SECTION("Every entropy length round trips in both normalization forms") {
        for (const size_t length : {16u, 20u, 24u, 28u, 32u}) {
            const std::vector<uint8_t> entropy = PatternEntropy(length);
            auto encoded = handle.ToMnemonic(entropy);
            REQUIRE(encoded.IsOk());
            const std::string composed = encoded.Unwrap();
            const std::string decomposed = Mnemonic::NormalizeString(composed);
            REQUIRE(decomposed != composed);

            REQUIRE(handle.Check(composed));
            REQUIRE(handle.Check(decomposed));

            auto from_composed = handle.ToEntropy(std::string_view(composed));
            REQUIRE(from_composed.IsOk());
            REQUIRE(from_composed.Unwrap() == entropy);
            auto from_decomposed = handle.ToEntropy(std::string_view(decomposed));
            REQUIRE(from_decomposed.IsOk());
            REQUIRE(from_decomposed.Unwrap() == entropy);
        }
    }

    SECTION("Decomposed words are detected as French") {
        auto detected = Mnemonic::DetectLanguage("a\u0300la\u0300a\u0300", registry);
        REQUIRE(detected.IsOk());
        REQUIRE(detected.Unwrap() == Language::French);
    }

    SECTION("An English phrase does not decode against the French list") {
        auto decoded = handle.ToEntropy(std::string_view(
            "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about"));
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == MnemonicFailureType::UnknownWord);
    }
}
