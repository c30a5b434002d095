/**
 * @file test_regulator_config.cpp
 * @brief Unit tests for configuration defaults, JSON overlay, flags and validation
 */

#include <gtest/gtest.h>
#include <config/regulator_config.hpp>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Regulator;

static RegulatorConfig valid_config() {
    RegulatorConfig config;
    config.target = "example.com";
    config.hosts = "hosts.txt";
    return config;
}

// ============================================================================
// Defaults and JSON
// ============================================================================

TEST(RegulatorConfigTest, Defaults) {
    RegulatorConfig config;
    EXPECT_EQ(config.threshold, 500u);
    EXPECT_DOUBLE_EQ(config.max_ratio, 25.0);
    EXPECT_EQ(config.max_length, 1000u);
    EXPECT_EQ(config.dist_low, 2u);
    EXPECT_EQ(config.dist_high, 10u);
    EXPECT_EQ(config.output, "output");
    EXPECT_EQ(config.max_word_length, 256u);
    EXPECT_TRUE(config.log_file.empty());
    EXPECT_TRUE(config.report.empty());
    EXPECT_FALSE(config.verbose);
}

TEST(RegulatorConfigTest, MergeJson) {
    RegulatorConfig config;
    config.merge_json(nlohmann::json{{"target", "example.com"}, {"threshold", 100}, {"max_ratio", 10.5}});
    EXPECT_EQ(config.target, "example.com");
    EXPECT_EQ(config.threshold, 100u);
    EXPECT_DOUBLE_EQ(config.max_ratio, 10.5);
    EXPECT_EQ(config.dist_high, 10u);  // untouched
}

TEST(RegulatorConfigTest, MergeJsonRejectsBadTypes) {
    RegulatorConfig config;
    EXPECT_THROW(config.merge_json(nlohmann::json{{"threshold", "many"}}), std::invalid_argument);
    EXPECT_THROW(config.merge_json(nlohmann::json::array({1, 2})), std::invalid_argument);
}

TEST(RegulatorConfigTest, MergeJsonRejectsOutOfRangeCounts) {
    RegulatorConfig config;
    EXPECT_THROW(config.merge_json(nlohmann::json{{"threshold", -1}}), std::invalid_argument);
    EXPECT_THROW(config.merge_json(nlohmann::json::parse(R"({"max_length": -5})")), std::invalid_argument);
    EXPECT_THROW(config.merge_json(nlohmann::json{{"dist_high", 4294967298ull}}), std::invalid_argument);
    EXPECT_THROW(config.merge_json(nlohmann::json{{"dist_low", 2.5}}), std::invalid_argument);
    EXPECT_EQ(config.threshold, 500u);
    EXPECT_EQ(config.max_length, 1000u);
    EXPECT_EQ(config.dist_high, 10u);

    config.merge_json(nlohmann::json::parse(R"({"threshold": 0, "dist_low": 3})"));
    EXPECT_EQ(config.threshold, 0u);
    EXPECT_EQ(config.dist_low, 3u);
}

TEST(RegulatorConfigTest, JsonRoundTrip) {
    RegulatorConfig config = valid_config();
    config.dist_low = 3;
    config.report = "report.json";

    RegulatorConfig copy;
    copy.merge_json(config.to_json());
    EXPECT_EQ(copy.to_json(), config.to_json());
}

TEST(RegulatorConfigTest, InductionParameters) {
    RegulatorConfig config = valid_config();
    config.threshold = 42;
    config.max_ratio = 3.0;
    config.dist_low = 4;
    config.dist_high = 6;
    config.max_length = 80;
    config.max_word_length = 64;

    InductionConfig induction = config.induction();
    EXPECT_EQ(induction.acceptance.threshold, 42u);
    EXPECT_DOUBLE_EQ(induction.acceptance.max_ratio, 3.0);
    EXPECT_EQ(induction.acceptance.max_word_length, 64u);
    EXPECT_EQ(induction.dist_low, 4u);
    EXPECT_EQ(induction.dist_high, 6u);
    EXPECT_EQ(induction.max_length, 80u);
}

// ============================================================================
// Validation
// ============================================================================

TEST(RegulatorConfigTest, Validate) {
    EXPECT_NO_THROW(valid_config().validate());

    RegulatorConfig config = valid_config();
    config.target.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = valid_config();
    config.hosts.clear();
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = valid_config();
    config.threshold = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = valid_config();
    config.max_ratio = 0.0;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = valid_config();
    config.dist_low = 10;
    config.dist_high = 10;
    EXPECT_THROW(config.validate(), std::invalid_argument);

    config = valid_config();
    config.dist_low = 0;
    EXPECT_THROW(config.validate(), std::invalid_argument);
}

// ============================================================================
// Command line
// ============================================================================

TEST(CommandLineTest, ShortAndLongFlags) {
    CommandLine cli = parse_command_line({"-t", "example.com", "-f", "hosts.txt", "-th", "50",
                                          "--max-ratio", "3.5", "-dl", "3", "--dist-high", "6",
                                          "-o", "words.txt", "--report", "run.json"});
    EXPECT_FALSE(cli.help);
    EXPECT_EQ(cli.config.target, "example.com");
    EXPECT_EQ(cli.config.hosts, "hosts.txt");
    EXPECT_EQ(cli.config.threshold, 50u);
    EXPECT_DOUBLE_EQ(cli.config.max_ratio, 3.5);
    EXPECT_EQ(cli.config.dist_low, 3u);
    EXPECT_EQ(cli.config.dist_high, 6u);
    EXPECT_EQ(cli.config.output, "words.txt");
    EXPECT_EQ(cli.config.report, "run.json");
    EXPECT_NO_THROW(cli.config.validate());
}

TEST(CommandLineTest, Help) {
    EXPECT_TRUE(parse_command_line({"--help"}).help);
    EXPECT_TRUE(parse_command_line({"-v", "-t", "example.com"}).config.verbose);
    EXPECT_FALSE(parse_command_line({"-t", "example.com"}).config.verbose);
    EXPECT_NE(usage("regulator").find("--target"), std::string::npos);
}

TEST(CommandLineTest, RejectsBadArguments) {
    EXPECT_THROW(parse_command_line({"--bogus", "1"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"-t"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"-th", "abc"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"-th", "-5"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"-mr", "2.5x"}), std::invalid_argument);
}

TEST(CommandLineTest, RejectsDistanceOverflow) {
    EXPECT_THROW(parse_command_line({"-dl", "4294967298"}), std::invalid_argument);
    EXPECT_THROW(parse_command_line({"--dist-high", "4294967296"}), std::invalid_argument);
    EXPECT_EQ(parse_command_line({"-dh", "4294967295"}).config.dist_high, 4294967295u);
}

TEST(CommandLineTest, FlagsOverrideConfigFile) {
    std::string path = ::testing::TempDir() + "regulator_config_test.json";
    {
        std::ofstream file(path);
        file << R"({"target": "example.com", "hosts": "from-file.txt", "threshold": 42})";
    }

    CommandLine cli = parse_command_line({"-th", "7", "-c", path});
    EXPECT_EQ(cli.config.target, "example.com");
    EXPECT_EQ(cli.config.hosts, "from-file.txt");
    EXPECT_EQ(cli.config.threshold, 7u);

    EXPECT_THROW(parse_command_line({"-c", path + ".missing"}), std::runtime_error);
}
