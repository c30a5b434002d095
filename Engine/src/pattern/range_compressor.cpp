#include <pattern/range_compressor.hpp>
#include <algorithm>
#include <set>
#include <string_view>
#include <utility>

namespace Regulator {

namespace {

bool is_number(std::string_view s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

bool is_hyphen_number(std::string_view s) {
    return s.size() > 1 && s[0] == '-' && is_number(s.substr(1));
}

// Alternative text when it is a single literal (or empty), otherwise nullopt.
std::optional<std::string> primitive_text(const Sequence& alternative) {
    if (alternative.empty()) return std::string();
    if (alternative.size() == 1 && alternative.front().kind == PatternNode::Kind::Literal)
        return alternative.front().text;
    return std::nullopt;
}

} // namespace

Sequence RangeCompressor::digit_ranges(const std::vector<std::string>& numbers) {
    size_t shortest = numbers.front().size(), longest = 0;
    for (const auto& n : numbers) {
        shortest = std::min(shortest, n.size());
        longest = std::max(longest, n.size());
    }

    // Position p counts from the least significant digit.
    std::vector<std::set<char>> digits(longest);
    for (const auto& n : numbers) {
        for (size_t p = 0; p < n.size(); ++p) digits[p].insert(n[n.size() - 1 - p]);
    }

    Sequence seq;
    for (size_t p = longest; p-- > 0;) {
        const auto& observed = digits[p];
        seq.push_back(PatternNode::range(*observed.begin(), *observed.rbegin(), p >= shortest));
    }
    return seq;
}

std::optional<PatternNode> RangeCompressor::compress_group(const PatternNode& group) {
    if (group.kind != PatternNode::Kind::Group) return std::nullopt;

    std::vector<std::string> numbers, hyphenated, others;
    for (const auto& alternative : group.alternatives) {
        auto text = primitive_text(alternative);
        if (!text) return std::nullopt;
        if (is_number(*text)) {
            numbers.push_back(*text);
        } else if (is_hyphen_number(*text)) {
            hyphenated.push_back(text->substr(1));
        } else {
            others.push_back(*text);
        }
    }

    // One numeric form per group.
    if (!numbers.empty() && !hyphenated.empty()) return std::nullopt;

    bool hyphen = false;
    const std::vector<std::string>* source = nullptr;
    if (numbers.size() > 1) {
        source = &numbers;
    } else if (hyphenated.size() > 1) {
        source = &hyphenated;
        hyphen = true;
    } else {
        return std::nullopt;
    }

    Sequence body;
    if (hyphen) append_literal(body, "-");
    for (auto& node : digit_ranges(*source)) body.push_back(std::move(node));
    PatternNode numeric = PatternNode::group({std::move(body)});

    if (others.empty()) {
        numeric.optional = group.optional;
        return numeric;
    }

    std::vector<Sequence> leftovers;
    for (const auto& text : others) {
        Sequence alt;
        append_literal(alt, text);
        leftovers.push_back(std::move(alt));
    }
    return PatternNode::group({Sequence{std::move(numeric)}, Sequence{PatternNode::group(std::move(leftovers))}},
                              group.optional);
}

void RangeCompressor::compress_in_place(Sequence& seq) {
    for (auto& node : seq) {
        if (node.kind != PatternNode::Kind::Group) continue;
        if (auto replacement = compress_group(node)) {
            node = std::move(*replacement);
            continue;
        }
        for (auto& alternative : node.alternatives) compress_in_place(alternative);
    }
}

Pattern RangeCompressor::compress(const Pattern& pattern) {
    Pattern out = pattern;
    compress_in_place(out.nodes());
    return out;
}

} // namespace Regulator
