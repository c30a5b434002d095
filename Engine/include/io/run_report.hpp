/**
 * @file run_report.hpp
 * @brief JSON summary of one induction run
 */

#pragma once

#include <config/regulator_config.hpp>
#include <induction/search_orchestrator.hpp>
#include <export.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace Regulator {

REGULATOR_API nlohmann::json pass_to_json(const PassStats& stats);

/**
 * @brief Parameters, host counts, per-pass counters, totals and phase timings.
 */
REGULATOR_API nlohmann::json build_report(const RegulatorConfig& config, const InductionStats& stats);

/**
 * @throws std::runtime_error if the file cannot be written
 */
REGULATOR_API void write_report(const std::string& path, const nlohmann::json& report);

} // namespace Regulator
