#include <catch2/catch_test_macros.hpp>
#include "seedphrase/unicode/normalizer.hpp"
#include "seedphrase/core/constants.hpp"
#include <string>
#include <vector>
using namespace seedphrase;
using namespace seedphrase::unicode;

TEST_CASE("Normalizer - NFKD", "[unicode][normalizer]") {
    SECTION("ASCII is unchanged") {
        REQUIRE(Normalizer::NormalizeString("abandon about") == "abandon about");
    }
    SECTION("Empty input") {
        REQUIRE(Normalizer::NormalizeString("").empty());
    }
    SECTION("Precomposed letters are decomposed") {
        REQUIRE(Normalizer::NormalizeString("\u00e9") == "e\u0301");
        REQUIRE(Normalizer::NormalizeString("\u0159") == "r\u030c");
    }
    SECTION("Compatibility characters are folded") {
        REQUIRE(Normalizer::NormalizeString("\ufb01") == "fi");
        REQUIRE(Normalizer::NormalizeString("\uff41") == "a");
    }
    SECTION("Ideographic space becomes an ASCII space") {
        REQUIRE(Normalizer::NormalizeString("a\u3000b") == "a b");
        REQUIRE(Normalizer::NormalizeString(std::string("a") + std::string(UnicodeConstants::IDEOGRAPHIC_SPACE) + "b") == "a b");
    }
    SECTION("Ill-formed UTF-8 decodes to the replacement character") {
        REQUIRE(Normalizer::NormalizeString("a\xFF") == "a\xEF\xBF\xBD");
    }
    SECTION("Equivalent forms normalize identically") {
        const std::string nfc = "\u017elu\u0165ou\u010dk\u00fd";
        const std::string nfd = "z\u030clut\u030couc\u030cky\u0301";
        REQUIRE(Normalizer::NormalizeString(nfc) == Normalizer::NormalizeString(nfd));
    }
    SECTION("TryNormalize agrees with NormalizeString") {
        auto result = Normalizer::TryNormalize("\u00e9");
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == "e\u0301");
    }
}

TEST_CASE("Normalizer - NFKC", "[unicode][normalizer]") {
    auto result = Normalizer::TryNormalizeNfkc("e\u0301");
    REQUIRE(result.IsOk());
    REQUIRE(result.Unwrap() == "\u00e9");
}

TEST_CASE("Normalizer - Word Splitting", "[unicode][normalizer]") {
    SECTION("Runs of mixed whitespace collapse") {
        const auto words = Normalizer::SplitWords("  zoo\t wrong\u3000\u3000abandon \n");
        REQUIRE(words == std::vector<std::string>{"zoo", "wrong", "abandon"});
    }
    SECTION("Blank input yields no words") {
        REQUIRE(Normalizer::SplitWords("").empty());
        REQUIRE(Normalizer::SplitWords(" \t\u3000 ").empty());
    }
    SECTION("Join uses single ASCII spaces") {
        REQUIRE(Normalizer::JoinWords({"error", "fragile", "gadget"}) == "error fragile gadget");
        REQUIRE(Normalizer::JoinWords({}).empty());
    }
    SECTION("IsBlank") {
        REQUIRE(Normalizer::IsBlank(""));
        REQUIRE(Normalizer::IsBlank(" \t\u3000"));
        REQUIRE_FALSE(Normalizer::IsBlank(" a "));
    }
}

TEST_CASE("Normalizer - Code Points", "[unicode][normalizer]") {
    SECTION("Length counts code points, not bytes") {
        REQUIRE(Normalizer::CodePointLength("abc") == 3);
        REQUIRE(Normalizer::CodePointLength("\u00e1bc") == 3);
        REQUIRE(Normalizer::CodePointLength("\u3042\u3044") == 2);
        REQUIRE(Normalizer::CodePointLength("") == 0);
    }
    SECTION("Prefix never splits a code point") {
        REQUIRE(Normalizer::CodePointPrefix("abandon", 4) == "aban");
        REQUIRE(Normalizer::CodePointPrefix("\u00e1baco", 2) == "\u00e1b");
        REQUIRE(Normalizer::CodePointPrefix("act", 4) == "act");
    }
}
