#include <pattern/pattern.hpp>
#include <stdexcept>
#include <utility>

namespace Regulator {

PatternNode PatternNode::literal(std::string text) {
    PatternNode n;
    n.kind = Kind::Literal;
    n.text = std::move(text);
    return n;
}

PatternNode PatternNode::range(char lo, char hi, bool optional) {
    PatternNode n;
    n.kind = Kind::Range;
    n.lo = lo;
    n.hi = hi;
    n.optional = optional;
    return n;
}

PatternNode PatternNode::group(std::vector<Sequence> alternatives, bool optional) {
    PatternNode n;
    n.kind = Kind::Group;
    n.alternatives = std::move(alternatives);
    n.optional = optional;
    return n;
}

bool PatternNode::operator==(const PatternNode& other) const {
    if (kind != other.kind) return false;
    switch (kind) {
        case Kind::Literal: return text == other.text;
        case Kind::Range:   return lo == other.lo && hi == other.hi && optional == other.optional;
        case Kind::Group:   return optional == other.optional && alternatives == other.alternatives;
    }
    return false;
}

void append_literal(Sequence& seq, std::string_view text) {
    if (text.empty()) return;
    if (!seq.empty() && seq.back().kind == PatternNode::Kind::Literal) {
        seq.back().text.append(text);
    } else {
        seq.push_back(PatternNode::literal(std::string(text)));
    }
}

std::string render(const PatternNode& node) {
    std::string out;
    switch (node.kind) {
        case PatternNode::Kind::Literal:
            return node.text;
        case PatternNode::Kind::Range:
            if (node.lo == node.hi) {
                out.push_back(node.lo);
            } else {
                out = {'[', node.lo, '-', node.hi, ']'};
            }
            break;
        case PatternNode::Kind::Group:
            out.push_back('(');
            for (size_t i = 0; i < node.alternatives.size(); ++i) {
                if (i) out.push_back('|');
                out += render(node.alternatives[i]);
            }
            out.push_back(')');
            break;
    }
    if (node.optional) out.push_back('?');
    return out;
}

std::string render(const Sequence& seq) {
    std::string out;
    for (const auto& node : seq) out += render(node);
    return out;
}

// ============================================================================
// Parser
// ============================================================================

namespace {

class Parser {
public:
    explicit Parser(std::string_view text) : text_(text) {}

    Sequence parse() {
        Sequence seq = parse_sequence();
        if (pos_ != text_.size()) fail("unexpected '" + std::string(1, text_[pos_]) + "'");
        return seq;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw std::invalid_argument("Pattern syntax error at offset " + std::to_string(pos_) +
                                    ": " + what + " in '" + std::string(text_) + "'");
    }

    bool at_end() const { return pos_ >= text_.size(); }
    char peek() const { return text_[pos_]; }

    bool take_optional() {
        if (!at_end() && peek() == '?') {
            ++pos_;
            return true;
        }
        return false;
    }

    Sequence parse_sequence() {
        Sequence seq;
        while (!at_end()) {
            char c = peek();
            if (c == ')' || c == '|') break;
            if (c == '(') {
                seq.push_back(parse_group());
            } else if (c == '[') {
                seq.push_back(parse_range());
            } else if (c == '?') {
                fail("dangling '?'");
            } else if (c == ']') {
                fail("unmatched ']'");
            } else {
                ++pos_;
                if (take_optional()) {
                    seq.push_back(PatternNode::range(c, c, true));
                } else {
                    append_literal(seq, std::string_view(&c, 1));
                }
            }
        }
        return seq;
    }

    PatternNode parse_group() {
        ++pos_; // '('
        std::vector<Sequence> alternatives;
        alternatives.push_back(parse_sequence());
        while (!at_end() && peek() == '|') {
            ++pos_;
            alternatives.push_back(parse_sequence());
        }
        if (at_end() || peek() != ')') fail("missing ')'");
        ++pos_;
        return PatternNode::group(std::move(alternatives), take_optional());
    }

    PatternNode parse_range() {
        if (pos_ + 4 >= text_.size()) fail("truncated range");
        char lo = text_[pos_ + 1];
        char hi = text_[pos_ + 3];
        if (text_[pos_ + 2] != '-' || text_[pos_ + 4] != ']') fail("malformed range");
        if (lo > hi) fail("empty range");
        pos_ += 5;
        return PatternNode::range(lo, hi, take_optional());
    }

    std::string_view text_;
    size_t pos_ = 0;
};

} // namespace

Pattern Pattern::parse(std::string_view text) {
    return Pattern(Parser(text).parse());
}

} // namespace Regulator
