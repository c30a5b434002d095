/**
 * @file pattern.hpp
 * @brief Syntax tree for the restricted rule dialect
 *
 * The dialect has three constructs:
 *   - literal text (the '.' label separator is an ordinary literal character)
 *   - character ranges "[0-9]", or a single character, optionally followed by '?'
 *   - alternation groups "(a|b|...)", optionally followed by '?'
 *
 * There is no repetition, so every pattern denotes a finite language.
 * Patterns are built and rewritten as trees and rendered to text only at the
 * boundary (rules files, logs, rule-set keys).
 */

#pragma once

#include <export.hpp>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Regulator {

struct PatternNode;
using Sequence = std::vector<PatternNode>;

struct REGULATOR_API PatternNode {
    enum class Kind { Literal, Range, Group };

    Kind kind = Kind::Literal;
    std::string text;                    // Literal
    char lo = 0;                         // Range
    char hi = 0;                         // Range
    std::vector<Sequence> alternatives;  // Group
    bool optional = false;               // Range, Group

    static PatternNode literal(std::string text);
    static PatternNode range(char lo, char hi, bool optional = false);
    static PatternNode group(std::vector<Sequence> alternatives, bool optional = false);

    bool operator==(const PatternNode& other) const;
    bool operator!=(const PatternNode& other) const { return !(*this == other); }
};

/**
 * @brief Append literal text, merging with a trailing literal node.
 */
REGULATOR_API void append_literal(Sequence& seq, std::string_view text);

REGULATOR_API std::string render(const Sequence& seq);
REGULATOR_API std::string render(const PatternNode& node);

class REGULATOR_API Pattern {
public:
    Pattern() = default;
    explicit Pattern(Sequence nodes) : nodes_(std::move(nodes)) {}

    /**
     * @brief Parse pattern text.
     * @throws std::invalid_argument on unbalanced groups, malformed ranges or a dangling '?'
     */
    static Pattern parse(std::string_view text);

    std::string to_string() const { return render(nodes_); }

    const Sequence& nodes() const { return nodes_; }
    Sequence& nodes() { return nodes_; }

    bool operator==(const Pattern& other) const { return nodes_ == other.nodes_; }

private:
    Sequence nodes_;
};

} // namespace Regulator
