/**
 * @file search_orchestrator.hpp
 * @brief Three-pass rule induction over observed hostnames
 *
 * Pipeline:
 *   Hosts → normalize/tokenize → DistanceTable + PrefixIndex
 *     Pass 1: global edit-distance sweep (delta in [dist_low, dist_high))
 *     Pass 2: n-gram anchored prefixes (first and second chance)
 *     Pass 3: edit-distance sweep restricted to each pass 2 prefix (third chance)
 *   Rules → expand → candidate hostnames
 *
 * All passes feed one grow-only RuleSet. A candidate pattern is synthesized,
 * range-compressed and then ratio-tested; a pattern already in the set is
 * never tested again.
 */

#pragma once

#include <dns/domain_splitter.hpp>
#include <dns/tokenizer.hpp>
#include <distance/distance_table.hpp>
#include <index/prefix_index.hpp>
#include <induction/acceptance_filter.hpp>
#include <induction/closure_builder.hpp>
#include <induction/rule_set.hpp>
#include <pattern/pattern.hpp>
#include <export.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Regulator {

/**
 * @brief Induction parameters
 */
struct InductionConfig {
    uint32_t dist_low = 2;     // First delta of the sweeps
    uint32_t dist_high = 10;   // Exclusive upper delta
    size_t max_length = 1000;  // Longest pattern tested in the global sweep
    AcceptanceCriteria acceptance;
};

/**
 * @brief Per-pass counters
 */
struct PassStats {
    size_t closures_evaluated = 0;
    size_t accepted = 0;
    size_t duplicates = 0;
    size_t rejected = 0;
    size_t skipped_length = 0;
    size_t redundant_prefixes = 0;
    size_t unrecoverable = 0;
};

/**
 * @brief Run statistics
 */
struct InductionStats {
    size_t hosts_loaded = 0;
    size_t hosts_rejected = 0;

    PassStats global;
    PassStats ngram;
    PassStats prefix;

    size_t rule_count = 0;
    size_t candidate_count = 0;

    // Phase timings (milliseconds)
    double table_ms = 0.0;
    double global_ms = 0.0;
    double ngram_ms = 0.0;
    double expand_ms = 0.0;
};

class REGULATOR_API SearchOrchestrator {
public:
    explicit SearchOrchestrator(std::string target, const InductionConfig& config = InductionConfig());

    SearchOrchestrator(const SearchOrchestrator&) = delete;
    SearchOrchestrator& operator=(const SearchOrchestrator&) = delete;

    /**
     * @brief Normalize, deduplicate, sort and tokenize the observed hosts,
     *        then build the distance table and prefix index.
     *
     * Malformed hosts are logged and left out.
     * @return Number of hosts kept
     */
    size_t load_hosts(const std::vector<std::string>& raw_hosts);

    /**
     * @brief Run all passes over the loaded hosts.
     */
    void run();

    void global_sweep();

    /**
     * @brief N-gram anchored sweep; the prefix-restricted sweep runs for each
     *        surviving prefix as it is reached.
     */
    void ngram_sweep();

    /**
     * @brief Prefix-restricted edit-distance sweep over one prefix's hosts.
     */
    void prefix_sweep(const std::string& prefix);

    /**
     * @brief Enumerate every accepted rule into sorted, deduplicated
     *        candidate hostnames with dot runs collapsed.
     */
    std::vector<std::string> expand();

    /**
     * @brief Expand arbitrary rule texts.
     * @throws std::invalid_argument if a rule does not parse
     */
    static std::vector<std::string> expand_rules(const std::vector<std::string>& rules);

    /**
     * @brief Sorted 1- and 2-character strings over the DNS alphabet.
     */
    static std::vector<std::string> anchor_ngrams();

    std::vector<std::string> rules() const { return rules_.sorted(); }
    const std::vector<std::string>& hosts() const { return names_; }
    const InductionStats& stats() const { return stats_; }
    const InductionConfig& config() const { return config_; }
    const std::string& target() const { return splitter_.target(); }

private:
    struct Candidate {
        Pattern pattern;
        std::string rule;
        size_t evidence = 0;
    };

    Candidate synthesize(const Closure& members) const;

    /**
     * @brief Synthesize and test a batch of closures, accepting into the rule set.
     *
     * Synthesis and testing run in parallel; classification and insertion run
     * serially in closure order. The global sweep drops single-member closures
     * and over-long patterns.
     */
    void evaluate_closures(const std::vector<Closure>& closures, PassStats& stats,
                           bool global, bool report_unrecoverable);

    /**
     * @brief Test one candidate against the rule set and filter; insert on success.
     * @return true if accepted
     */
    bool try_accept(const Candidate& candidate, PassStats& stats);

    std::vector<size_t> ranks(const PrefixIndex::Range& range) const;

    DomainSplitter splitter_;
    Tokenizer tokenizer_;
    InductionConfig config_;
    AcceptanceFilter filter_;

    std::vector<std::string> names_;     // sorted, rank = index
    std::vector<TokenizedHost> hosts_;   // parallel to names_
    DistanceTable table_;
    PrefixIndex index_;
    RuleSet rules_;
    InductionStats stats_;
};

} // namespace Regulator
