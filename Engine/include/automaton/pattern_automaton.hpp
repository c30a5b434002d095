/**
 * @file pattern_automaton.hpp
 * @brief Cardinality and enumeration oracle for rule patterns
 *
 * A pattern is compiled to a Thompson NFA and determinized by subset
 * construction. Rule patterns have no repetition, so the DFA is acyclic and
 * every accepted word corresponds to exactly one path: counting paths counts
 * distinct words, and a depth-first walk over sorted transitions enumerates
 * them once each in lexicographic order.
 */

#pragma once

#include <pattern/pattern.hpp>
#include <export.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Regulator {

class REGULATOR_API PatternAutomaton {
public:
    explicit PatternAutomaton(const Pattern& pattern);

    /**
     * @throws std::invalid_argument if the text is not a valid pattern
     */
    explicit PatternAutomaton(std::string_view pattern_text);

    /**
     * @brief Number of distinct matched words with length in [min_length, max_length].
     *
     * Saturates at UINT64_MAX.
     */
    uint64_t count_words(size_t min_length, size_t max_length) const;

    /**
     * @brief Visit every non-empty matched word in lexicographic order.
     */
    void for_each_word(const std::function<void(const std::string&)>& visit) const;

    std::vector<std::string> words() const;

    bool matches(std::string_view word) const;

    size_t state_count() const { return states_.size(); }

private:
    struct State {
        std::vector<std::pair<char, uint32_t>> next;  // sorted by character
        bool accepting = false;
    };

    void build(const Pattern& pattern);
    void walk(uint32_t state, std::string& prefix, const std::function<void(const std::string&)>& visit) const;

    std::vector<State> states_;  // states_[0] is the start state
};

} // namespace Regulator
