#include <automaton/pattern_automaton.hpp>
#include <algorithm>
#include <limits>
#include <map>
#include <queue>
#include <utility>

namespace Regulator {

namespace {

struct NfaEdge {
    char lo;
    char hi;
    uint32_t to;
};

struct NfaState {
    std::vector<uint32_t> eps;
    std::vector<NfaEdge> edges;
};

class NfaBuilder {
public:
    uint32_t add() {
        states.emplace_back();
        return static_cast<uint32_t>(states.size() - 1);
    }

    uint32_t build(const Sequence& seq, uint32_t from) {
        for (const auto& node : seq) from = build(node, from);
        return from;
    }

    uint32_t build(const PatternNode& node, uint32_t from) {
        switch (node.kind) {
            case PatternNode::Kind::Literal:
                for (char c : node.text) {
                    uint32_t to = add();
                    states[from].edges.push_back({c, c, to});
                    from = to;
                }
                return from;
            case PatternNode::Kind::Range: {
                uint32_t to = add();
                states[from].edges.push_back({node.lo, node.hi, to});
                if (node.optional) states[from].eps.push_back(to);
                return to;
            }
            case PatternNode::Kind::Group: {
                uint32_t join = add();
                for (const auto& alternative : node.alternatives) {
                    uint32_t entry = add();
                    states[from].eps.push_back(entry);
                    uint32_t exit = build(alternative, entry);
                    states[exit].eps.push_back(join);
                }
                if (node.optional) states[from].eps.push_back(join);
                return join;
            }
        }
        return from;
    }

    // Epsilon closure; visit marks are generation-stamped so no per-call reset is needed.
    std::vector<uint32_t> closure(std::vector<uint32_t> seeds) {
        if (marks_.size() != states.size()) marks_.assign(states.size(), 0);
        ++generation_;
        std::vector<uint32_t> out;
        while (!seeds.empty()) {
            uint32_t s = seeds.back();
            seeds.pop_back();
            if (marks_[s] == generation_) continue;
            marks_[s] = generation_;
            out.push_back(s);
            for (uint32_t e : states[s].eps) {
                if (marks_[e] != generation_) seeds.push_back(e);
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    std::vector<NfaState> states;

private:
    std::vector<uint32_t> marks_;
    uint32_t generation_ = 0;
};

uint64_t saturating_add(uint64_t a, uint64_t b) {
    return a > std::numeric_limits<uint64_t>::max() - b ? std::numeric_limits<uint64_t>::max() : a + b;
}

} // namespace

PatternAutomaton::PatternAutomaton(const Pattern& pattern) {
    build(pattern);
}

PatternAutomaton::PatternAutomaton(std::string_view pattern_text) {
    build(Pattern::parse(pattern_text));
}

void PatternAutomaton::build(const Pattern& pattern) {
    NfaBuilder nfa;
    uint32_t start = nfa.add();
    uint32_t accept = nfa.build(pattern.nodes(), start);

    std::map<std::vector<uint32_t>, uint32_t> ids;
    std::vector<std::vector<uint32_t>> subsets;
    std::queue<uint32_t> pending;

    auto intern = [&](std::vector<uint32_t> subset) -> uint32_t {
        auto it = ids.find(subset);
        if (it != ids.end()) return it->second;
        uint32_t id = static_cast<uint32_t>(subsets.size());
        State state;
        state.accepting = std::binary_search(subset.begin(), subset.end(), accept);
        states_.push_back(std::move(state));
        ids.emplace(subset, id);
        subsets.push_back(std::move(subset));
        pending.push(id);
        return id;
    };

    intern(nfa.closure({start}));

    while (!pending.empty()) {
        uint32_t id = pending.front();
        pending.pop();

        std::map<char, std::vector<uint32_t>> moves;
        for (uint32_t s : subsets[id]) {
            for (const auto& edge : nfa.states[s].edges) {
                for (int c = edge.lo; c <= edge.hi; ++c) moves[static_cast<char>(c)].push_back(edge.to);
            }
        }

        std::vector<std::pair<char, uint32_t>> next;
        next.reserve(moves.size());
        for (auto& [c, targets] : moves) next.emplace_back(c, intern(nfa.closure(std::move(targets))));
        states_[id].next = std::move(next);
    }
}

uint64_t PatternAutomaton::count_words(size_t min_length, size_t max_length) const {
    std::vector<uint64_t> paths(states_.size(), 0), advanced(states_.size(), 0);
    paths[0] = 1;
    uint64_t total = 0;

    for (size_t length = 0; length <= max_length; ++length) {
        if (length >= min_length) {
            for (size_t s = 0; s < states_.size(); ++s) {
                if (states_[s].accepting) total = saturating_add(total, paths[s]);
            }
        }
        if (length == max_length) break;

        std::fill(advanced.begin(), advanced.end(), 0);
        bool any = false;
        for (size_t s = 0; s < states_.size(); ++s) {
            if (paths[s] == 0) continue;
            for (const auto& [c, to] : states_[s].next) {
                advanced[to] = saturating_add(advanced[to], paths[s]);
                any = true;
            }
        }
        if (!any) break;
        paths.swap(advanced);
    }
    return total;
}

void PatternAutomaton::walk(uint32_t state, std::string& prefix,
                            const std::function<void(const std::string&)>& visit) const {
    if (states_[state].accepting && !prefix.empty()) visit(prefix);
    for (const auto& [c, to] : states_[state].next) {
        prefix.push_back(c);
        walk(to, prefix, visit);
        prefix.pop_back();
    }
}

void PatternAutomaton::for_each_word(const std::function<void(const std::string&)>& visit) const {
    std::string prefix;
    walk(0, prefix, visit);
}

std::vector<std::string> PatternAutomaton::words() const {
    std::vector<std::string> out;
    for_each_word([&out](const std::string& w) { out.push_back(w); });
    return out;
}

bool PatternAutomaton::matches(std::string_view word) const {
    uint32_t state = 0;
    for (char c : word) {
        const auto& next = states_[state].next;
        auto it = std::lower_bound(next.begin(), next.end(), c,
            [](const std::pair<char, uint32_t>& edge, char ch) { return edge.first < ch; });
        if (it == next.end() || it->first != c) return false;
        state = it->second;
    }
    return states_[state].accepting;
}

} // namespace Regulator
