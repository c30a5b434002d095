#include <io/host_file.hpp>
#include <fstream>
#include <stdexcept>

namespace Regulator {

std::vector<std::string> read_lines(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open file: " + path);

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '#') continue;
        size_t last = line.find_last_not_of(" \t\r");
        lines.push_back(line.substr(first, last - first + 1));
    }
    if (file.bad()) throw std::runtime_error("Failed reading file: " + path);
    return lines;
}

void write_lines(const std::string& path, const std::vector<std::string>& lines) {
    std::ofstream file(path, std::ios::trunc);
    if (!file) throw std::runtime_error("Cannot open file for writing: " + path);
    for (const auto& line : lines) file << line << '\n';
    file.flush();
    if (!file) throw std::runtime_error("Failed writing file: " + path);
}

} // namespace Regulator
