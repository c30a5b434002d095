/**
 * @file pattern_synthesizer.hpp
 * @brief Positional alignment of a closure into one generalized pattern
 *
 * Members are aligned by (level, position) index only, never by content, so
 * the caller must hand in structurally similar hosts (an edit-distance
 * closure or a shared prefix).
 *
 * Level 0 renders its positions back to back; position 0 is a bare
 * alternation, later positions carry '?' when some member lacks them.
 * Every deeper level is wrapped as "(." ... ")" and carries '?' when some
 * member lacks it or when the members that have it disagree on its content.
 * The target domain is appended last.
 *
 *   {dev1, dev2, dev3}.example.com  ->  (dev)(1|2|3).example.com
 *   {www.eu, www.us}.example.com    ->  (www)(.(eu|us))?.example.com
 *   {mail}.example.com              ->  (mail).example.com
 */

#pragma once

#include <dns/tokenizer.hpp>
#include <pattern/pattern.hpp>
#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Regulator {

class REGULATOR_API PatternSynthesizer {
public:
    /**
     * @brief Synthesize from pre-tokenized members.
     * @throws std::invalid_argument if no members are given
     */
    static Pattern synthesize(std::string_view target, const std::vector<const TokenizedHost*>& members);

    /**
     * @brief Tokenize raw hostnames and synthesize; malformed members are ignored.
     * @throws std::invalid_argument if no member tokenizes
     */
    static Pattern synthesize(const Tokenizer& tokenizer, std::string_view target,
                              const std::vector<std::string>& members);
};

} // namespace Regulator
