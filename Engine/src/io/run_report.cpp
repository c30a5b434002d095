#include <io/run_report.hpp>
#include <fstream>
#include <stdexcept>

namespace Regulator {

nlohmann::json pass_to_json(const PassStats& stats) {
    return {
        {"closures_evaluated", stats.closures_evaluated},
        {"accepted", stats.accepted},
        {"duplicates", stats.duplicates},
        {"rejected", stats.rejected},
        {"skipped_length", stats.skipped_length},
        {"redundant_prefixes", stats.redundant_prefixes},
        {"unrecoverable", stats.unrecoverable},
    };
}

nlohmann::json build_report(const RegulatorConfig& config, const InductionStats& stats) {
    nlohmann::json report;
    report["parameters"] = config.to_json();
    report["hosts"] = {
        {"loaded", stats.hosts_loaded},
        {"rejected", stats.hosts_rejected},
    };
    report["passes"] = {
        {"global", pass_to_json(stats.global)},
        {"ngram", pass_to_json(stats.ngram)},
        {"prefix", pass_to_json(stats.prefix)},
    };
    report["rule_count"] = stats.rule_count;
    report["candidate_count"] = stats.candidate_count;
    report["timings_ms"] = {
        {"distance_table", stats.table_ms},
        {"global_sweep", stats.global_ms},
        {"ngram_sweep", stats.ngram_ms},
        {"expand", stats.expand_ms},
    };
    return report;
}

void write_report(const std::string& path, const nlohmann::json& report) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) throw std::runtime_error("Cannot open report for writing: " + path);
    file << report.dump(2) << '\n';
    if (!file) throw std::runtime_error("Failed writing report: " + path);
}

} // namespace Regulator
