/**
 * @file regulator_expand.cpp
 * @brief Expand a persisted rules file into candidate hostnames
 *
 * Usage: regulator-expand <rules-file> <output>
 */

#include <induction/search_orchestrator.hpp>
#include <pattern/pattern.hpp>
#include <io/host_file.hpp>
#include <utils/logger.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    if (argc != 3) { std::cerr << "Usage: " << argv[0] << " <rules-file> <output>" << std::endl; return 1; }
    using namespace Regulator;
    const std::string rules_file = argv[1], output = argv[2];

    try {
        std::vector<std::string> valid;
        for (const auto& rule : read_lines(rules_file)) {
            try {
                Pattern::parse(rule);
                valid.push_back(rule);
            } catch (const std::invalid_argument& ex) {
                Logger::warn("Skipping invalid rule '" + rule + "': " + ex.what());
            }
        }

        std::vector<std::string> candidates = SearchOrchestrator::expand_rules(valid);
        write_lines(output, candidates);
        Logger::success("Expanded " + std::to_string(valid.size()) + " rules into " +
                        std::to_string(candidates.size()) + " candidates");
    } catch (const std::exception& ex) { Logger::error(std::string("[FATAL] ") + ex.what()); return 1; }
    return 0;
}
