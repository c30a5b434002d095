/**
 * @file tokenizer.hpp
 * @brief Hierarchical tokenization of hostnames into levels and lexical tokens
 *
 * A hostname's subdomain is split on '.' into levels (level 0 is the leftmost
 * label). Each level is split on '-' (every segment after the first keeps a
 * leading '-') and then into maximal digit / non-digit runs. A bare '-' that
 * precedes a digit run is merged into it:
 *
 *   foo-12.example.com      -> [["foo", "-12"]]
 *   api-dev01.eu.example.com -> [["api", "-dev", "01"], ["eu"]]
 */

#pragma once

#include <dns/domain_splitter.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Regulator {

using TokenLevel = std::vector<std::string>;

struct TokenizedHost {
    std::string host;
    std::vector<TokenLevel> levels;

    const std::string& first_token() const { return levels.front().front(); }
};

class REGULATOR_API Tokenizer {
public:
    explicit Tokenizer(const DomainSplitter& splitter) : splitter_(splitter) {}

    /**
     * @brief Tokenize a hostname relative to the target domain.
     * @return std::nullopt for malformed input: not under the target, empty
     *         subdomain, or no first token in level 0
     */
    std::optional<TokenizedHost> tokenize(const std::string& hostname) const;

    static std::vector<TokenLevel> tokenize_subdomain(std::string_view subdomain);
    static TokenLevel tokenize_label(std::string_view label);

private:
    const DomainSplitter& splitter_;
};

} // namespace Regulator
