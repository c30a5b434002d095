#include <induction/search_orchestrator.hpp>
#include <automaton/pattern_automaton.hpp>
#include <dns/hostname.hpp>
#include <pattern/pattern_synthesizer.hpp>
#include <pattern/range_compressor.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <numeric>
#include <set>
#include <unordered_set>
#include <utility>

namespace Regulator {

SearchOrchestrator::SearchOrchestrator(std::string target, const InductionConfig& config)
    : splitter_(std::move(target)), tokenizer_(splitter_), config_(config), filter_(config.acceptance) {}

size_t SearchOrchestrator::load_hosts(const std::vector<std::string>& raw_hosts) {
    std::vector<std::string> normalized;
    normalized.reserve(raw_hosts.size());
    for (const auto& raw : raw_hosts) {
        if (auto host = normalize_hostname(raw)) {
            normalized.push_back(std::move(*host));
        } else {
            Logger::warn("Rejecting malformed input: " + raw);
            stats_.hosts_rejected++;
        }
    }
    std::sort(normalized.begin(), normalized.end());
    normalized.erase(std::unique(normalized.begin(), normalized.end()), normalized.end());

    names_.clear();
    hosts_.clear();
    for (auto& host : normalized) {
        auto tokenized = tokenizer_.tokenize(host);
        if (!tokenized) {
            Logger::warn("Rejecting malformed input: " + host);
            stats_.hosts_rejected++;
            continue;
        }
        names_.push_back(std::move(host));
        hosts_.push_back(std::move(*tokenized));
    }
    stats_.hosts_loaded = names_.size();
    Logger::info("Loaded " + std::to_string(names_.size()) + " observations");

    {
        PhaseTimer phase("Building table of all pairwise distances", &stats_.table_ms);
        table_ = DistanceTable(names_);
    }
    index_ = PrefixIndex(names_);
    return names_.size();
}

void SearchOrchestrator::run() {
    global_sweep();
    ngram_sweep();
    stats_.rule_count = rules_.size();
    Logger::success("Induced " + std::to_string(stats_.rule_count) + " rules");
}

void SearchOrchestrator::global_sweep() {
    PhaseTimer phase("Global edit-distance sweep", &stats_.global_ms);
    ClosureBuilder builder(table_);
    for (uint32_t delta = config_.dist_low; delta < config_.dist_high; ++delta) {
        auto closures = builder.closures(0, names_.size(), delta);
        Logger::info("k=" + std::to_string(delta) + ": " + std::to_string(closures.size()) + " closures");
        evaluate_closures(closures, stats_.global, true, false);
    }
}

void SearchOrchestrator::ngram_sweep() {
    PhaseTimer phase("N-gram anchored sweep", &stats_.ngram_ms);

    for (const auto& ngram : anchor_ngrams()) {
        auto keys = ranks(index_.range(ngram));
        if (keys.empty()) continue;

        // First chance: every host under the n-gram
        stats_.ngram.closures_evaluated++;
        try_accept(synthesize(keys), stats_.ngram);

        std::set<std::string> prefixes;
        for (size_t r : keys) prefixes.insert(hosts_[r].first_token());

        std::string last;
        bool have_last = false;
        for (const auto& prefix : prefixes) {
            Logger::debug("Prefix=" + prefix);
            auto prefix_keys = ranks(index_.range(prefix));

            // Second chance: hosts sharing a first token
            stats_.ngram.closures_evaluated++;
            Candidate candidate = synthesize(prefix_keys);
            if (rules_.contains(candidate.rule)) {
                stats_.ngram.duplicates++;
            } else if (!filter_.is_acceptable(candidate.pattern, candidate.evidence)) {
                stats_.ngram.rejected++;
            } else {
                if (have_last && prefix.compare(0, last.size(), last) == 0) {
                    Logger::warn("Rejecting redundant prefix: " + prefix);
                    stats_.ngram.redundant_prefixes++;
                    continue;
                }
                last = prefix;
                have_last = true;
                if (rules_.insert(candidate.rule)) {
                    stats_.ngram.accepted++;
                } else {
                    stats_.ngram.duplicates++;
                }
            }

            if (prefix.size() > 1) prefix_sweep(prefix);
        }
    }
}

void SearchOrchestrator::prefix_sweep(const std::string& prefix) {
    auto range = index_.range(prefix);
    if (range.first == range.second) return;

    // Third chance: deconstruct the prefix group by edit distance
    ClosureBuilder builder(table_);
    for (uint32_t delta = config_.dist_low; delta < config_.dist_high; ++delta) {
        evaluate_closures(builder.closures(range.first, range.second, delta), stats_.prefix, false, true);
    }
}

SearchOrchestrator::Candidate SearchOrchestrator::synthesize(const Closure& members) const {
    std::vector<const TokenizedHost*> refs;
    refs.reserve(members.size());
    for (size_t r : members) refs.push_back(&hosts_[r]);

    Candidate candidate;
    candidate.pattern = RangeCompressor::compress(PatternSynthesizer::synthesize(target(), refs));
    candidate.rule = candidate.pattern.to_string();
    candidate.evidence = members.size();
    return candidate;
}

void SearchOrchestrator::evaluate_closures(const std::vector<Closure>& closures, PassStats& stats,
                                           bool global, bool report_unrecoverable) {
    // The global sweep only generalizes real clusters; later passes keep singletons.
    std::vector<const Closure*> work;
    for (const auto& closure : closures) {
        if (!global || closure.size() > 1) work.push_back(&closure);
    }
    stats.closures_evaluated += work.size();

    std::vector<Candidate> candidates(work.size());
    #pragma omp parallel for schedule(dynamic, 8)
    for (long long i = 0; i < static_cast<long long>(work.size()); ++i) {
        candidates[i] = synthesize(*work[i]);
    }

    // Serial: drop over-long and already seen patterns, in closure order
    std::vector<size_t> pending;
    std::unordered_set<std::string> batch;
    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& candidate = candidates[i];
        if (global && candidate.rule.size() > config_.max_length) {
            stats.skipped_length++;
            continue;
        }
        if (rules_.contains(candidate.rule) || !batch.insert(candidate.rule).second) {
            stats.duplicates++;
            continue;
        }
        pending.push_back(i);
    }

    std::vector<char> verdicts(pending.size(), 0);
    #pragma omp parallel for schedule(dynamic, 4)
    for (long long j = 0; j < static_cast<long long>(pending.size()); ++j) {
        const auto& candidate = candidates[pending[j]];
        verdicts[j] = filter_.is_acceptable(candidate.pattern, candidate.evidence) ? 1 : 0;
    }

    for (size_t j = 0; j < pending.size(); ++j) {
        const auto& candidate = candidates[pending[j]];
        if (verdicts[j]) {
            if (rules_.insert(candidate.rule)) {
                stats.accepted++;
            } else {
                stats.duplicates++;
            }
        } else {
            stats.rejected++;
            if (report_unrecoverable) {
                stats.unrecoverable++;
                Logger::error("Rule cannot be processed: " + candidate.rule);
            }
        }
    }
}

bool SearchOrchestrator::try_accept(const Candidate& candidate, PassStats& stats) {
    if (rules_.contains(candidate.rule)) {
        stats.duplicates++;
        return false;
    }
    if (!filter_.is_acceptable(candidate.pattern, candidate.evidence)) {
        stats.rejected++;
        return false;
    }
    if (!rules_.insert(candidate.rule)) {
        stats.duplicates++;
        return false;
    }
    stats.accepted++;
    return true;
}

std::vector<size_t> SearchOrchestrator::ranks(const PrefixIndex::Range& range) const {
    std::vector<size_t> out(range.second - range.first);
    std::iota(out.begin(), out.end(), range.first);
    return out;
}

std::vector<std::string> SearchOrchestrator::expand() {
    std::vector<std::string> candidates;
    {
        PhaseTimer phase("Expanding rules", &stats_.expand_ms);
        candidates = expand_rules(rules_.sorted());
    }
    stats_.rule_count = rules_.size();
    stats_.candidate_count = candidates.size();
    Logger::info("Generated " + std::to_string(candidates.size()) + " candidate hostnames");
    return candidates;
}

std::vector<std::string> SearchOrchestrator::expand_rules(const std::vector<std::string>& rules) {
    std::set<std::string> out;
    for (const auto& rule : rules) {
        PatternAutomaton automaton(rule);
        automaton.for_each_word([&out](const std::string& word) { out.insert(collapse_dot_runs(word)); });
    }
    return std::vector<std::string>(out.begin(), out.end());
}

std::vector<std::string> SearchOrchestrator::anchor_ngrams() {
    std::set<std::string> grams;
    for (size_t i = 0; i < k_dns_alphabet_size; ++i) {
        grams.insert(std::string(1, k_dns_alphabet[i]));
        for (size_t j = 0; j < k_dns_alphabet_size; ++j) {
            grams.insert(std::string{k_dns_alphabet[i], k_dns_alphabet[j]});
        }
    }
    return std::vector<std::string>(grams.begin(), grams.end());
}

} // namespace Regulator
