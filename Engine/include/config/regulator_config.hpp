/**
 * @file regulator_config.hpp
 * @brief Run configuration: defaults, JSON config file, command-line flags
 *
 * Precedence, lowest first: built-in defaults, the JSON file named by
 * -c/--config, individual flags.
 *
 *   {
 *     "target": "example.com",
 *     "hosts": "hosts.txt",
 *     "threshold": 500,
 *     "max_ratio": 25.0,
 *     "dist_low": 2,
 *     "dist_high": 10
 *   }
 */

#pragma once

#include <induction/search_orchestrator.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Regulator {

struct REGULATOR_API RegulatorConfig {
    std::string target;
    std::string hosts;
    uint64_t threshold = 500;
    double max_ratio = 25.0;
    size_t max_length = 1000;
    uint32_t dist_low = 2;
    uint32_t dist_high = 10;
    std::string output = "output";
    size_t max_word_length = 256;
    std::string log_file;  // empty: console only
    std::string report;    // empty: no report
    bool verbose = false;  // log debug messages

    /**
     * @brief Overlay the keys present in a JSON object; unknown keys are logged and ignored.
     * @throws std::invalid_argument if a value has the wrong type or the document is not an object
     */
    void merge_json(const nlohmann::json& json);

    /**
     * @throws std::runtime_error if the file cannot be opened
     * @throws std::invalid_argument if it is not valid config JSON
     */
    void merge_json_file(const std::string& path);

    nlohmann::json to_json() const;

    /**
     * @throws std::invalid_argument naming the first offending setting
     */
    void validate() const;

    InductionConfig induction() const;
};

struct CommandLine {
    RegulatorConfig config;
    bool help = false;
};

/**
 * @brief Parse the regulator flags (argv[0] excluded). The result is not validated.
 * @throws std::invalid_argument on unknown flags, missing or malformed values
 */
REGULATOR_API CommandLine parse_command_line(const std::vector<std::string>& args);

REGULATOR_API std::string usage(const std::string& program);

} // namespace Regulator
