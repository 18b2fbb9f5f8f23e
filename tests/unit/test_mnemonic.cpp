#include <catch2/catch_test_macros.hpp>
#include "seedphrase/mnemonic/mnemonic.hpp"
#include "helpers/mock_wordlist_source.hpp"
#include "helpers/hex.hpp"
using namespace seedphrase;
using namespace seedphrase::mnemonic;
using namespace seedphrase::configuration;
using seedphrase::test_helpers::FromHex;
using seedphrase::test_helpers::MockWordlistSource;
using seedphrase::test_helpers::ShippedWordlists;
using seedphrase::test_helpers::ToHex;
using seedphrase::wordlist::Language;
using seedphrase::wordlist::WordlistRegistry;

TEST_CASE("Mnemonic - Construction", "[mnemonic]") {
    SECTION("From a wordlist source") {
        auto result = Mnemonic::Create(Language::English, ShippedWordlists());
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().GetLanguage() == Language::English);
        REQUIRE(result.Unwrap().GetWordlist().Size() == 2048);
        REQUIRE(result.Unwrap().GetConfig().GetLengthPolicy() == LengthPolicy::Standard);
    }
    SECTION("From a registry") {
        auto registry = WordlistRegistry::LoadAvailable(ShippedWordlists());
        REQUIRE(registry.IsOk());
        auto result = Mnemonic::Create(Language::English, *registry.Unwrap());
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap().GetLanguage() == Language::English);
    }
    SECTION("Language missing from the source") {
        MockWordlistSource empty;
        auto result = Mnemonic::Create(Language::Japanese, empty);
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().type == MnemonicFailureType::WordlistNotFound);
        REQUIRE(result.UnwrapErr().IsWordlistLoadError());
    }
    SECTION("Language missing from the registry") {
        auto registry = WordlistRegistry::LoadAvailable(ShippedWordlists());
        REQUIRE(registry.IsOk());
        auto result = Mnemonic::Create(Language::Korean, *registry.Unwrap());
        REQUIRE(result.IsErr());
        REQUIRE(result.UnwrapErr().IsWordlistLoadError());
    }
}

TEST_CASE("Mnemonic - Encode, Decode and Check", "[mnemonic]") {
    auto created = Mnemonic::Create(Language::English, ShippedWordlists());
    REQUIRE(created.IsOk());
    const Mnemonic handle = std::move(created).Unwrap();

    SECTION("Round trip through the facade") {
        const auto entropy = FromHex("7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f7f");
        auto words = handle.ToMnemonic(entropy);
        REQUIRE(words.IsOk());
        REQUIRE(words.Unwrap() ==
                "legal winner thank year wave sausage worth useful legal winner thank yellow");
        REQUIRE(handle.Check(words.Unwrap()));
        auto back = handle.ToEntropy(std::string_view(words.Unwrap()));
        REQUIRE(back.IsOk());
        REQUIRE(back.Unwrap() == entropy);
    }
    SECTION("Word vector overload") {
        auto back = handle.ToEntropy(std::vector<std::string>{
            "zoo", "zoo", "zoo", "zoo", "zoo", "zoo", "zoo", "zoo", "zoo", "zoo", "zoo", "wrong"});
        REQUIRE(back.IsOk());
        REQUIRE(back.Unwrap() == std::vector<uint8_t>(16, 0xFF));
    }
    SECTION("Check rejects invalid phrases") {
        REQUIRE_FALSE(handle.Check("bless cloud wheel regular tiny venue bird web grief security dignity zoo"));
        REQUIRE_FALSE(handle.Check("abandon abandon abandon"));
        REQUIRE_FALSE(handle.Check(""));
        REQUIRE_FALSE(handle.Check("not a mnemonic at all"));
        REQUIRE_FALSE(handle.Check("a\xFF\xFE"));
    }
    SECTION("Check accepts separator variants") {
        REQUIRE(handle.Check(
            "  abandon abandon abandon abandon abandon abandon\tabandon abandon abandon abandon abandon about\n"));
        REQUIRE(handle.Check(
            "abandon\u3000abandon\u3000abandon\u3000abandon\u3000abandon\u3000abandon\u3000"
            "abandon\u3000abandon\u3000abandon\u3000abandon\u3000abandon\u3000about"));
    }
    SECTION("Prefix helpers are bound to the wordlist") {
        REQUIRE(handle.ExpandWord("acce") == "access");
        REQUIRE(handle.Expand("aban acce") == "abandon access");
        REQUIRE(handle.Candidates("acc").size() == 4);
    }
}

TEST_CASE("Mnemonic - Relaxed Policy", "[mnemonic][config]") {
    auto relaxed = Mnemonic::Create(Language::English, ShippedWordlists(), MnemonicConfig::Relaxed());
    auto standard = Mnemonic::Create(Language::English, ShippedWordlists(), MnemonicConfig::Standard());
    REQUIRE(relaxed.IsOk());
    REQUIRE(standard.IsOk());

    SECTION("Three-word phrase") {
        REQUIRE(relaxed.Unwrap().Check("error fragile gadget"));
        REQUIRE(standard.Unwrap().Check("error fragile gadget"));
        REQUIRE(standard.Unwrap().Check("error\u3000fragile gadget"));
    }
    SECTION("Standard handles still encode and decode only the five lengths") {
        auto decoded = standard.Unwrap().ToEntropy(std::string_view("error fragile gadget"));
        REQUIRE(decoded.IsErr());
        REQUIRE(decoded.UnwrapErr().type == MnemonicFailureType::InvalidMnemonicLength);
        const std::vector<uint8_t> short_entropy = {0x4c, 0xcb, 0x8d, 0x7a};
        auto encoded = standard.Unwrap().ToMnemonic(short_entropy);
        REQUIRE(encoded.IsErr());
        REQUIRE(encoded.UnwrapErr().type == MnemonicFailureType::InvalidEntropyLength);
    }
    SECTION("Check on any handle rejects word counts outside multiples of 3 up to 24") {
        REQUIRE_FALSE(standard.Unwrap().Check("error fragile"));
        REQUIRE_FALSE(standard.Unwrap().Check(
            "abandon abandon abandon abandon abandon abandon abandon abandon abandon "
            "abandon abandon abandon abandon abandon abandon abandon abandon abandon "
            "abandon abandon abandon abandon abandon abandon abandon abandon art"));
    }
    SECTION("Default handles use the standard policy") {
        auto handle = Mnemonic::Create(Language::English, ShippedWordlists());
        REQUIRE(handle.IsOk());
        REQUIRE(handle.Unwrap().GetConfig().GetLengthPolicy() == LengthPolicy::Standard);
        REQUIRE(handle.Unwrap().Check("error fragile gadget"));
    }
    SECTION("Ideographic space") {
        const std::string sentence = std::string("error") + std::string(Mnemonic::IDEOGRAPHIC_SPACE) +
                                     "fragile" + std::string(Mnemonic::IDEOGRAPHIC_SPACE) + "gadget";
        REQUIRE(relaxed.Unwrap().Check(sentence));
        auto entropy = relaxed.Unwrap().ToEntropy(std::string_view(sentence));
        REQUIRE(entropy.IsOk());
        REQUIRE(ToHex(entropy.Unwrap()) == "4ccb8d7a");
    }
}

TEST_CASE("Mnemonic - Language-Independent Operations", "[mnemonic]") {
    SECTION("IDEOGRAPHIC_SPACE is U+3000") {
        REQUIRE(Mnemonic::IDEOGRAPHIC_SPACE == "\xE3\x80\x80");
    }
    SECTION("NormalizeString maps the ideographic space") {
        REQUIRE(Mnemonic::NormalizeString("a\u3000b") == "a b");
        REQUIRE(Mnemonic::NormalizeString("\u00e9") == "e\u0301");
    }
    SECTION("ListLanguages") {
        const auto& languages = Mnemonic::ListLanguages();
        REQUIRE(languages.size() == 10);
        REQUIRE(languages.front() == Language::English);
    }
    SECTION("DetectLanguage") {
        auto registry = WordlistRegistry::LoadAvailable(ShippedWordlists());
        REQUIRE(registry.IsOk());
        const auto shared = std::move(registry).Unwrap();
        auto english = Mnemonic::DetectLanguage("security", shared);
        REQUIRE(english.IsOk());
        REQUIRE(english.Unwrap() == Language::English);
        auto unknown = Mnemonic::DetectLanguage("xxxxxxx", shared);
        REQUIRE(unknown.IsErr());
        REQUIRE(unknown.UnwrapErr().type == MnemonicFailureType::AmbiguousOrUnknownWord);
        REQUIRE(Mnemonic::DetectLanguage("security", nullptr).IsErr());
    }
    SECTION("ToSeed with the empty passphrase") {
        auto seed = Mnemonic::ToSeed(
            "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon about");
        REQUIRE(seed.IsOk());
        REQUIRE(ToHex(seed.Unwrap()) ==
                "5eb00bbddcf069084889a8ab9155568165f5c453ccb85e70811aaed6f6da5fc1"
                "9a5ac40b389cd370d086206dec8aa6c43daea6690f20ad3d8d48b2d2ce9e38e4");
    }
    SECTION("ToSeed does not validate the phrase") {
        auto seed = Mnemonic::ToSeed("not a mnemonic", "pass");
        REQUIRE(seed.IsOk());
        REQUIRE(seed.Unwrap().size() == 64);
    }
}
