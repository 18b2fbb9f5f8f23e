#pragma once

#include "seedphrase/wordlist/wordlist.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace seedphrase::mnemonic {

/**
 * @brief Completes truncated words against one wordlist
 *
 * A token is only ever replaced by the single wordlist entry it is a prefix
 * of. Exact members, unknown prefixes and ambiguous prefixes come back
 * unchanged.
 */
class PrefixExpander {
public:
    explicit PrefixExpander(std::shared_ptr<const wordlist::Wordlist> wordlist);

    [[nodiscard]] std::string ExpandWord(std::string_view prefix) const;

    /**
     * @brief Expand every token of a sentence and rejoin with single spaces
     *
     * Tokens are split on ASCII whitespace and U+3000 and are neither
     * normalized nor reordered.
     */
    [[nodiscard]] std::string Expand(std::string_view sentence) const;

    /// Entries starting with @p prefix, in wordlist order
    [[nodiscard]] std::vector<std::string> Candidates(std::string_view prefix) const;

private:
    std::shared_ptr<const wordlist::Wordlist> wordlist_;
};

} // namespace seedphrase::mnemonic
