/**
 * @file basic_mnemonic_example.cpp
 * @brief Basic example demonstrating entropy encoding, validation and seed derivation
 */

#include "seedphrase/mnemonic/mnemonic.hpp"
#include "seedphrase/wordlist/file_wordlist_source.hpp"
#include "seedphrase/wordlist/wordlist_registry.hpp"
#include "seedphrase/core/result.hpp"

#include <iostream>
#include <iomanip>

using namespace seedphrase;
using namespace seedphrase::mnemonic;
using namespace seedphrase::wordlist;

template<typename Bytes>
void print_hex(const std::string& label, const Bytes& data) {
    std::cout << label << ": ";
    for (auto byte : data) {
        std::cout << std::hex << std::setw(2) << std::setfill('0')
                  << static_cast<int>(byte);
    }
    std::cout << std::dec << std::endl;
}

int main() {
    std::cout << "=== seedphrase - Basic Mnemonic Example ===" << std::endl;
    std::cout << std::endl;

    // Load the English wordlist
    const auto source = FileWordlistSource::FromEnvironment();
    std::cout << "1. Loading wordlist from " << source.Directory() << "..." << std::endl;
    auto handle_result = Mnemonic::Create(Language::English, source);
    if (handle_result.IsErr()) {
        std::cerr << "Failed to load wordlist: "
                  << handle_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const auto handle = std::move(handle_result).Unwrap();
    std::cout << "   ✓ Loaded " << handle.GetWordlist().Size() << " words" << std::endl;
    std::cout << std::endl;

    // Encode entropy
    std::cout << "2. Encoding 128 bits of entropy..." << std::endl;
    const std::vector<uint8_t> entropy(16, 0x7f);
    auto words_result = handle.ToMnemonic(entropy);
    if (words_result.IsErr()) {
        std::cerr << "Failed to encode: " << words_result.UnwrapErr().message << std::endl;
        return 1;
    }
    const std::string words = std::move(words_result).Unwrap();
    print_hex("   Entropy", entropy);
    std::cout << "   Mnemonic: " << words << std::endl;
    std::cout << std::endl;

    // Validate
    std::cout << "3. Validating mnemonics..." << std::endl;
    std::cout << "   generated phrase: " << (handle.Check(words) ? "valid" : "invalid") << std::endl;
    const std::string tampered = "legal winner thank year wave sausage worth useful legal winner thank thank";
    std::cout << "   tampered phrase:  " << (handle.Check(tampered) ? "valid" : "invalid") << std::endl;

    auto decode_result = handle.ToEntropy(tampered);
    if (decode_result.IsErr()) {
        std::cout << "   decode error: " << ToString(decode_result.UnwrapErr().type)
                  << " (" << decode_result.UnwrapErr().message << ")" << std::endl;
    }
    std::cout << std::endl;

    // Prefix expansion
    std::cout << "4. Expanding abbreviated words..." << std::endl;
    std::cout << "   \"lega winn than year wave saus wort usef lega winn than yell\" -> \""
              << handle.Expand("lega winn than year wave saus wort usef lega winn than yell")
              << "\"" << std::endl;
    std::cout << std::endl;

    // Seed derivation
    std::cout << "5. Deriving seed with passphrase \"TREZOR\"..." << std::endl;
    auto seed_result = Mnemonic::ToSeed(words, "TREZOR");
    if (seed_result.IsErr()) {
        std::cerr << "Failed to derive seed: " << seed_result.UnwrapErr().message << std::endl;
        return 1;
    }
    print_hex("   Seed", seed_result.Unwrap());
    std::cout << std::endl;

    // Language detection
    std::cout << "6. Detecting language of \"security\"..." << std::endl;
    auto registry_result = WordlistRegistry::LoadAvailable(source);
    if (registry_result.IsErr()) {
        std::cerr << "Failed to load wordlists: " << registry_result.UnwrapErr().message << std::endl;
        return 1;
    }
    auto detected = Mnemonic::DetectLanguage("security", registry_result.Unwrap());
    if (detected.IsOk()) {
        std::cout << "   ✓ " << wordlist::ToString(detected.Unwrap()) << std::endl;
    }
    std::cout << std::endl;

    std::cout << "=== Example completed successfully ===" << std::endl;

    return 0;
}
