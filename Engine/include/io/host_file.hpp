/**
 * @file host_file.hpp
 * @brief Line-oriented host, rule and wordlist files
 */

#pragma once

#include <export.hpp>
#include <string>
#include <vector>

namespace Regulator {

/**
 * @brief Read one trimmed entry per line; blank lines and '#' comments are skipped.
 * @throws std::runtime_error if the file cannot be opened
 */
REGULATOR_API std::vector<std::string> read_lines(const std::string& path);

/**
 * @brief Write one entry per line, replacing the file.
 * @throws std::runtime_error if the file cannot be written
 */
REGULATOR_API void write_lines(const std::string& path, const std::vector<std::string>& lines);

/**
 * @brief Rules are persisted in the working directory as "<target>.rules".
 */
inline std::string rules_path(const std::string& target) { return target + ".rules"; }

} // namespace Regulator
