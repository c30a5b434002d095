/**
 * @file regulator.cpp
 * @brief Induce hostname rules from observed hosts and expand them into candidates
 *
 * Writes "<target>.rules" (one rule per line) and the candidate wordlist.
 */

#include <config/regulator_config.hpp>
#include <induction/search_orchestrator.hpp>
#include <io/host_file.hpp>
#include <io/run_report.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    using namespace Regulator;
    const std::string program = argv[0];

    RegulatorConfig config;
    try {
        CommandLine cli = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        if (cli.help) {
            std::cout << usage(program);
            return 0;
        }
        config = cli.config;
        config.validate();
    } catch (const std::exception& ex) {
        std::cerr << "[FATAL] " << ex.what() << "\n" << usage(program);
        return 1;
    }

    Timer total_timer;
    try {
        if (config.verbose) Logger::set_min_level(Logger::Level::Debug);
        if (!config.log_file.empty()) Logger::open_file(config.log_file);

        std::ostringstream banner;
        banner << "REGULATOR starting: MAX_RATIO=" << config.max_ratio << ", THRESHOLD=" << config.threshold;
        Logger::info(banner.str());

        SearchOrchestrator orchestrator(config.target, config.induction());
        orchestrator.load_hosts(read_lines(config.hosts));
        orchestrator.run();

        std::vector<std::string> rules = orchestrator.rules();
        write_lines(rules_path(config.target), rules);
        Logger::info("Wrote " + std::to_string(rules.size()) + " rules to " + rules_path(config.target));

        std::vector<std::string> candidates = orchestrator.expand();
        write_lines(config.output, candidates);
        Logger::info("Wrote " + std::to_string(candidates.size()) + " candidates to " + config.output);

        if (!config.report.empty()) {
            write_report(config.report, build_report(config, orchestrator.stats()));
            Logger::info("Wrote run report to " + config.report);
        }

        std::ostringstream done;
        done << "Regulator complete in " << total_timer.elapsed_sec() << "s";
        Logger::success(done.str());
    } catch (const std::exception& ex) {
        Logger::error(std::string("[FATAL] ") + ex.what());
        Logger::close_file();
        return 1;
    }
    Logger::close_file();
    return 0;
}
