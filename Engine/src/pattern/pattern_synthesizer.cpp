#include <pattern/pattern_synthesizer.hpp>
#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

namespace Regulator {

namespace {

struct PositionSlot {
    std::set<std::string> tokens;
    size_t present = 0;  // members with a token at this position
};

struct LevelSlot {
    std::vector<PositionSlot> positions;
    std::set<std::string> contents;  // joined level text of members that have the level
    size_t present = 0;              // members with at least one token in the level
};

std::vector<Sequence> as_alternatives(const std::set<std::string>& tokens) {
    std::vector<Sequence> alternatives;
    alternatives.reserve(tokens.size());
    for (const auto& t : tokens) alternatives.push_back(Sequence{PatternNode::literal(t)});
    return alternatives;
}

std::string join(const TokenLevel& level) {
    std::string out;
    for (const auto& t : level) out += t;
    return out;
}

} // namespace

Pattern PatternSynthesizer::synthesize(std::string_view target, const std::vector<const TokenizedHost*>& members) {
    if (members.empty()) throw std::invalid_argument("Pattern synthesis needs at least one member");

    std::vector<LevelSlot> levels;
    for (const auto* member : members) {
        if (member->levels.size() > levels.size()) levels.resize(member->levels.size());
        for (size_t i = 0; i < member->levels.size(); ++i) {
            const auto& tokens = member->levels[i];
            auto& level = levels[i];
            if (tokens.size() > level.positions.size()) level.positions.resize(tokens.size());
            for (size_t j = 0; j < tokens.size(); ++j) {
                level.positions[j].tokens.insert(tokens[j]);
                level.positions[j].present++;
            }
            if (!tokens.empty()) {
                level.present++;
                level.contents.insert(join(tokens));
            }
        }
    }

    const size_t n = members.size();
    Sequence out;

    for (size_t i = 0; i < levels.size(); ++i) {
        const auto& level = levels[i];

        if (i == 0) {
            for (size_t j = 0; j < level.positions.size(); ++j) {
                const auto& slot = level.positions[j];
                bool optional = j != 0 && slot.present != n;
                out.push_back(PatternNode::group(as_alternatives(slot.tokens), optional));
            }
            continue;
        }

        Sequence content;
        append_literal(content, ".");
        for (size_t j = 0; j < level.positions.size(); ++j) {
            const auto& slot = level.positions[j];
            if (j == 0 && slot.tokens.size() == 1) {
                append_literal(content, *slot.tokens.begin());
            } else {
                content.push_back(PatternNode::group(as_alternatives(slot.tokens), slot.present != n));
            }
        }
        bool optional = level.present != n || level.contents.size() != 1;
        out.push_back(PatternNode::group({std::move(content)}, optional));
    }

    append_literal(out, "." + std::string(target));
    return Pattern(std::move(out));
}

Pattern PatternSynthesizer::synthesize(const Tokenizer& tokenizer, std::string_view target,
                                       const std::vector<std::string>& members) {
    std::vector<TokenizedHost> tokenized;
    tokenized.reserve(members.size());
    for (const auto& host : members) {
        if (auto t = tokenizer.tokenize(host)) tokenized.push_back(std::move(*t));
    }
    std::vector<const TokenizedHost*> refs;
    refs.reserve(tokenized.size());
    for (const auto& t : tokenized) refs.push_back(&t);
    return synthesize(target, refs);
}

} // namespace Regulator
