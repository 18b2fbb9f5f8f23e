#include "seedphrase/mnemonic/prefix_expander.hpp"
#include "seedphrase/unicode/normalizer.hpp"

#include <algorithm>
#include <stdexcept>

namespace seedphrase::mnemonic {

PrefixExpander::PrefixExpander(std::shared_ptr<const wordlist::Wordlist> wordlist)
    : wordlist_(std::move(wordlist)) {
    if (!wordlist_) {
        throw std::invalid_argument("PrefixExpander requires a wordlist");
    }
}

std::string PrefixExpander::ExpandWord(const std::string_view prefix) const {
    if (unicode::Normalizer::IsBlank(prefix)) {
        return std::string(prefix);
    }

    const auto& words = wordlist_->Words();
    if (std::find(words.begin(), words.end(), prefix) != words.end()) {
        return std::string(prefix);
    }

    const std::string* match = nullptr;
    for (const std::string& word : words) {
        if (word.starts_with(prefix)) {
            if (match != nullptr) {
                return std::string(prefix);
            }
            match = &word;
        }
    }

    return match != nullptr ? *match : std::string(prefix);
}

std::string PrefixExpander::Expand(const std::string_view sentence) const {
    std::vector<std::string> tokens = unicode::Normalizer::SplitWords(sentence);
    for (std::string& token : tokens) {
        token = ExpandWord(token);
    }
    return unicode::Normalizer::JoinWords(tokens);
}

std::vector<std::string> PrefixExpander::Candidates(const std::string_view prefix) const {
    std::vector<std::string> matches;
    if (unicode::Normalizer::IsBlank(prefix)) {
        return matches;
    }
    for (const std::string& word : wordlist_->Words()) {
        if (word.starts_with(prefix)) {
            matches.push_back(word);
        }
    }
    return matches;
}

} // namespace seedphrase::mnemonic
