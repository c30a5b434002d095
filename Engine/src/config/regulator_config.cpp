#include <config/regulator_config.hpp>
#include <utils/logger.hpp>
#include <fstream>
#include <functional>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

namespace Regulator {

namespace {

template <typename T>
void read_key(const nlohmann::json& json, const char* key, T& value) {
    if (!json.contains(key)) return;
    try {
        value = json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Config key '") + key + "': " + e.what());
    }
}

// get<uint64_t>() wraps negative integers, so unsigned keys are checked first.
template <typename T>
void read_unsigned_key(const nlohmann::json& json, const char* key, T& value) {
    if (!json.contains(key)) return;
    const auto& item = json.at(key);
    bool negative = item.is_number_integer() && !item.is_number_unsigned() && item.get<int64_t>() < 0;
    if (!item.is_number_integer() || negative || item.get<uint64_t>() > std::numeric_limits<T>::max()) {
        throw std::invalid_argument(std::string("Config key '") + key + "' must be an unsigned integer in range");
    }
    value = item.get<T>();
}

uint64_t parse_unsigned(const std::string& flag, const std::string& text) {
    size_t used = 0;
    long long value = 0;
    try {
        value = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    }
    if (used != text.size() || value < 0) throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    return static_cast<uint64_t>(value);
}

uint32_t parse_uint32(const std::string& flag, const std::string& text) {
    uint64_t value = parse_unsigned(flag, text);
    if (value > std::numeric_limits<uint32_t>::max()) throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    return static_cast<uint32_t>(value);
}

double parse_double(const std::string& flag, const std::string& text) {
    size_t used = 0;
    double value = 0.0;
    try {
        value = std::stod(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    }
    if (used != text.size()) throw std::invalid_argument("Invalid value for " + flag + ": " + text);
    return value;
}

} // namespace

void RegulatorConfig::merge_json(const nlohmann::json& json) {
    if (!json.is_object()) throw std::invalid_argument("Config must be a JSON object");

    static const char* known[] = {"target", "hosts", "threshold", "max_ratio", "max_length", "dist_low",
                                  "dist_high", "output", "max_word_length", "log_file", "report", "verbose"};
    for (const auto& item : json.items()) {
        bool found = false;
        for (const char* k : known) found = found || item.key() == k;
        if (!found) Logger::warn("Ignoring unknown config key: " + item.key());
    }

    read_key(json, "target", target);
    read_key(json, "hosts", hosts);
    read_unsigned_key(json, "threshold", threshold);
    read_key(json, "max_ratio", max_ratio);
    read_unsigned_key(json, "max_length", max_length);
    read_unsigned_key(json, "dist_low", dist_low);
    read_unsigned_key(json, "dist_high", dist_high);
    read_key(json, "output", output);
    read_unsigned_key(json, "max_word_length", max_word_length);
    read_key(json, "log_file", log_file);
    read_key(json, "report", report);
    read_key(json, "verbose", verbose);
}

void RegulatorConfig::merge_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) throw std::runtime_error("Cannot open config file: " + path);

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument("Invalid config file " + path + ": " + e.what());
    }
    merge_json(json);
}

nlohmann::json RegulatorConfig::to_json() const {
    return {
        {"target", target},
        {"hosts", hosts},
        {"threshold", threshold},
        {"max_ratio", max_ratio},
        {"max_length", max_length},
        {"dist_low", dist_low},
        {"dist_high", dist_high},
        {"output", output},
        {"max_word_length", max_word_length},
        {"log_file", log_file},
        {"report", report},
        {"verbose", verbose},
    };
}

void RegulatorConfig::validate() const {
    if (target.empty()) throw std::invalid_argument("target is required");
    if (hosts.empty()) throw std::invalid_argument("hosts file is required");
    if (output.empty()) throw std::invalid_argument("output path must not be empty");
    if (threshold == 0) throw std::invalid_argument("threshold must be positive");
    if (!(max_ratio > 0.0)) throw std::invalid_argument("max_ratio must be positive");
    if (max_length == 0) throw std::invalid_argument("max_length must be positive");
    if (max_word_length == 0) throw std::invalid_argument("max_word_length must be positive");
    if (dist_low < 1) throw std::invalid_argument("dist_low must be at least 1");
    if (dist_low >= dist_high) throw std::invalid_argument("dist_low must be below dist_high");
}

InductionConfig RegulatorConfig::induction() const {
    InductionConfig config;
    config.dist_low = dist_low;
    config.dist_high = dist_high;
    config.max_length = max_length;
    config.acceptance.threshold = threshold;
    config.acceptance.max_ratio = max_ratio;
    config.acceptance.max_word_length = max_word_length;
    return config;
}

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine cli;
    RegulatorConfig& c = cli.config;

    // Apply the config file first so flags override it wherever -c appears.
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "-c" || args[i] == "--config") {
            if (i + 1 >= args.size()) throw std::invalid_argument("Missing value for " + args[i]);
            c.merge_json_file(args[i + 1]);
        }
    }

    using Setter = std::function<void(const std::string&, const std::string&)>;
    const std::map<std::string, Setter> setters = {
        {"-t", [&](const std::string&, const std::string& v) { c.target = v; }},
        {"-f", [&](const std::string&, const std::string& v) { c.hosts = v; }},
        {"-th", [&](const std::string& f, const std::string& v) { c.threshold = parse_unsigned(f, v); }},
        {"-mr", [&](const std::string& f, const std::string& v) { c.max_ratio = parse_double(f, v); }},
        {"-ml", [&](const std::string& f, const std::string& v) { c.max_length = parse_unsigned(f, v); }},
        {"-dl", [&](const std::string& f, const std::string& v) { c.dist_low = parse_uint32(f, v); }},
        {"-dh", [&](const std::string& f, const std::string& v) { c.dist_high = parse_uint32(f, v); }},
        {"-o", [&](const std::string&, const std::string& v) { c.output = v; }},
        {"--max-word-length", [&](const std::string& f, const std::string& v) { c.max_word_length = parse_unsigned(f, v); }},
        {"--log-file", [&](const std::string&, const std::string& v) { c.log_file = v; }},
        {"--report", [&](const std::string&, const std::string& v) { c.report = v; }},
        {"-c", [](const std::string&, const std::string&) {}},
    };
    const std::map<std::string, std::string> aliases = {
        {"--target", "-t"}, {"--hosts", "-f"}, {"--threshold", "-th"}, {"--max-ratio", "-mr"},
        {"--max-length", "-ml"}, {"--dist-low", "-dl"}, {"--dist-high", "-dh"}, {"--output", "-o"},
        {"--config", "-c"},
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (flag == "-h" || flag == "--help") {
            cli.help = true;
            continue;
        }
        if (flag == "-v" || flag == "--verbose") {
            c.verbose = true;
            continue;
        }
        auto alias = aliases.find(flag);
        auto setter = setters.find(alias != aliases.end() ? alias->second : flag);
        if (setter == setters.end()) throw std::invalid_argument("Unknown argument: " + flag);
        if (i + 1 >= args.size()) throw std::invalid_argument("Missing value for " + flag);
        setter->second(flag, args[++i]);
    }
    return cli;
}

std::string usage(const std::string& program) {
    std::ostringstream ss;
    ss << "Usage: " << program << " -t <target> -f <hosts-file> [options]\n"
       << "  -t,  --target <domain>       Domain to target\n"
       << "  -f,  --hosts <file>          Observed hosts, one per line\n"
       << "  -th, --threshold <n>         Word count below which rules are always accepted (500)\n"
       << "  -mr, --max-ratio <r>         Ratio test bound: words / evidence < r (25.0)\n"
       << "  -ml, --max-length <n>        Longest rule tested in the global sweep (1000)\n"
       << "  -dl, --dist-low <n>          Lower edit-distance bound (2)\n"
       << "  -dh, --dist-high <n>         Exclusive upper edit-distance bound (10)\n"
       << "  -o,  --output <file>         Candidate wordlist (output)\n"
       << "       --max-word-length <n>   Longest word counted by the ratio test (256)\n"
       << "       --log-file <file>       Append log lines to a file\n"
       << "       --report <file>         Write a JSON run report\n"
       << "  -c,  --config <file>         JSON config file\n"
       << "  -v,  --verbose               Log per-prefix progress\n"
       << "  -h,  --help                  Show this message\n";
    return ss.str();
}

} // namespace Regulator
