/**
 * @file test_induction_pipeline.cpp
 * @brief End-to-end tests: hosts → rules → candidates
 */

#include <gtest/gtest.h>
#include <induction/search_orchestrator.hpp>
#include <io/host_file.hpp>
#include <io/run_report.hpp>
#include <pattern/range_compressor.hpp>
#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Regulator;

using Strings = std::vector<std::string>;

static bool contains(const Strings& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

// ============================================================================
// Induction
// ============================================================================

TEST(InductionPipelineTest, NumberedHosts) {
    SearchOrchestrator orchestrator("example.com");
    orchestrator.load_hosts({"dev1.example.com", "dev2.example.com", "dev3.example.com"});
    orchestrator.run();

    EXPECT_EQ(orchestrator.rules(), (Strings{"(dev)([1-3]).example.com"}));
    EXPECT_EQ(orchestrator.expand(), (Strings{"dev1.example.com", "dev2.example.com", "dev3.example.com"}));
    EXPECT_EQ(orchestrator.stats().rule_count, 1u);
    EXPECT_EQ(orchestrator.stats().candidate_count, 3u);
    EXPECT_EQ(orchestrator.stats().global.accepted, 1u);
}

TEST(InductionPipelineTest, MalformedHostsAreSkipped) {
    SearchOrchestrator orchestrator("example.com");
    size_t kept = orchestrator.load_hosts({
        "dev1.example.com", "DEV2.example.com.", "example.com", "mail.other.org",
        "bad host.example.com", "dev1.example.com",
    });
    EXPECT_EQ(kept, 2u);
    EXPECT_EQ(orchestrator.hosts(), (Strings{"dev1.example.com", "dev2.example.com"}));
    EXPECT_EQ(orchestrator.stats().hosts_loaded, 2u);
    EXPECT_EQ(orchestrator.stats().hosts_rejected, 3u);
}

TEST(InductionPipelineTest, MixedHosts) {
    SearchOrchestrator orchestrator("example.com");
    orchestrator.load_hosts({
        "api.example.com", "api-dev.example.com", "www.eu.example.com", "www.us.example.com",
        "dev1.example.com", "dev2.example.com", "dev3.example.com", "mail.example.com",
    });
    orchestrator.run();

    Strings rules = orchestrator.rules();
    EXPECT_TRUE(contains(rules, "(dev)([1-3]).example.com"));
    EXPECT_TRUE(contains(rules, "(www)(.(eu|us))?.example.com"));
    for (const auto& rule : rules) EXPECT_NO_THROW(Pattern::parse(rule)) << rule;

    Strings candidates = orchestrator.expand();
    EXPECT_TRUE(std::is_sorted(candidates.begin(), candidates.end()));
    EXPECT_EQ(std::adjacent_find(candidates.begin(), candidates.end()), candidates.end());
    for (const auto& c : candidates) {
        EXPECT_EQ(c.find(".."), std::string::npos) << c;
        ASSERT_GT(c.size(), 12u);
        EXPECT_EQ(c.substr(c.size() - 12), ".example.com") << c;
    }
    EXPECT_TRUE(contains(candidates, "dev2.example.com"));
    EXPECT_TRUE(contains(candidates, "www.example.com"));
}

TEST(InductionPipelineTest, RedundantPrefixRejected) {
    InductionConfig config;
    config.dist_low = 1;  // singleton closures only: the global sweep contributes nothing
    config.dist_high = 2;
    SearchOrchestrator orchestrator("example.com", config);
    orchestrator.load_hosts({"ab1.example.com", "ab2.example.com", "abc1.example.com", "abc2.example.com", "ax.example.com"});
    orchestrator.run();

    EXPECT_EQ(orchestrator.stats().global.accepted, 0u);
    EXPECT_EQ(orchestrator.stats().ngram.redundant_prefixes, 1u);
    EXPECT_EQ(orchestrator.rules(), (Strings{
        "(ab)(1).example.com",
        "(ab)(2).example.com",
        "(abc)(1).example.com",
        "(abc)(2).example.com",
        "(abc)([1-2]).example.com",
        "(ab|abc)([1-2]).example.com",
        "(ab|abc|ax)([1-2])?.example.com",
        "(ax).example.com",
    }));
}

TEST(InductionPipelineTest, IsolatedHostKeepsExactRule) {
    SearchOrchestrator orchestrator("example.com");
    orchestrator.load_hosts({
        "dev1.example.com", "dev2.example.com", "dev3.example.com", "qwertyuiopasdfgh.example.com",
    });
    orchestrator.run();

    EXPECT_EQ(orchestrator.rules(), (Strings{"(dev)([1-3]).example.com", "(qwertyuiopasdfgh).example.com"}));
    EXPECT_EQ(orchestrator.stats().global.accepted, 1u);
    EXPECT_EQ(orchestrator.stats().ngram.accepted, 1u);
    EXPECT_EQ(orchestrator.expand(), (Strings{
        "dev1.example.com", "dev2.example.com", "dev3.example.com", "qwertyuiopasdfgh.example.com",
    }));
}

TEST(InductionPipelineTest, RejectedRulesAreUnrecoverable) {
    InductionConfig config;
    config.acceptance.threshold = 1;
    config.acceptance.max_ratio = 0.5;
    SearchOrchestrator orchestrator("example.com", config);
    orchestrator.load_hosts({"dev1.example.com", "dev2.example.com", "dev3.example.com"});
    orchestrator.run();

    EXPECT_TRUE(orchestrator.rules().empty());
    EXPECT_GT(orchestrator.stats().global.rejected, 0u);
    EXPECT_GT(orchestrator.stats().prefix.unrecoverable, 0u);
    EXPECT_TRUE(orchestrator.expand().empty());
}

TEST(InductionPipelineTest, GlobalSweepLengthLimit) {
    InductionConfig config;
    config.max_length = 10;
    SearchOrchestrator orchestrator("example.com", config);
    orchestrator.load_hosts({"dev1.example.com", "dev2.example.com", "dev3.example.com"});
    orchestrator.global_sweep();

    EXPECT_TRUE(orchestrator.rules().empty());
    EXPECT_GT(orchestrator.stats().global.skipped_length, 0u);
}

TEST(InductionPipelineTest, AnchorNgrams) {
    Strings grams = SearchOrchestrator::anchor_ngrams();
    EXPECT_EQ(grams.size(), 39u + 39u * 39u);
    EXPECT_TRUE(std::is_sorted(grams.begin(), grams.end()));
    EXPECT_EQ(grams.front(), "-");
}

// ============================================================================
// Persistence
// ============================================================================

TEST(InductionPipelineTest, PersistedRulesAreStable) {
    SearchOrchestrator orchestrator("example.com");
    orchestrator.load_hosts({
        "dev1.example.com", "dev2.example.com", "dev10.example.com", "web-01.example.com", "web-02.example.com",
    });
    orchestrator.run();

    std::string path = ::testing::TempDir() + "regulator_pipeline_test.rules";
    write_lines(path, orchestrator.rules());
    Strings reloaded = read_lines(path);
    EXPECT_EQ(reloaded, orchestrator.rules());

    // Compression is a no-op over persisted rules
    for (const auto& rule : reloaded) {
        EXPECT_EQ(RangeCompressor::compress(Pattern::parse(rule)).to_string(), rule);
    }
    EXPECT_EQ(SearchOrchestrator::expand_rules(reloaded), orchestrator.expand());
}

TEST(InductionPipelineTest, HostFileSkipsCommentsAndBlanks) {
    std::string path = ::testing::TempDir() + "regulator_pipeline_hosts.txt";
    {
        std::ofstream file(path);
        file << "# observed\n\ndev1.example.com\n  dev2.example.com  \r\n\n";
    }
    EXPECT_EQ(read_lines(path), (Strings{"dev1.example.com", "dev2.example.com"}));
    EXPECT_THROW(read_lines(path + ".missing"), std::runtime_error);
}

TEST(InductionPipelineTest, RunReport) {
    SearchOrchestrator orchestrator("example.com");
    orchestrator.load_hosts({"dev1.example.com", "dev2.example.com", "dev3.example.com", "bad host"});
    orchestrator.run();
    orchestrator.expand();

    RegulatorConfig config;
    config.target = "example.com";
    config.hosts = "hosts.txt";
    nlohmann::json report = build_report(config, orchestrator.stats());

    EXPECT_EQ(report["parameters"]["target"], "example.com");
    EXPECT_EQ(report["hosts"]["loaded"], 3);
    EXPECT_EQ(report["hosts"]["rejected"], 1);
    EXPECT_EQ(report["passes"]["global"]["accepted"], 1);
    EXPECT_EQ(report["rule_count"], 1);
    EXPECT_EQ(report["candidate_count"], 3);
    EXPECT_TRUE(report["timings_ms"].contains("distance_table"));
}
