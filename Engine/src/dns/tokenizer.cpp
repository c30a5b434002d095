#include <dns/tokenizer.hpp>
#include <utility>

namespace Regulator {

namespace {

bool is_digit(char c) { return c >= '0' && c <= '9'; }

bool all_digits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!is_digit(c)) return false;
    }
    return true;
}

// Maximal alternating digit / non-digit runs, empty runs dropped.
std::vector<std::string> split_digit_runs(std::string_view segment) {
    std::vector<std::string> runs;
    size_t start = 0;
    while (start < segment.size()) {
        bool digit = is_digit(segment[start]);
        size_t end = start + 1;
        while (end < segment.size() && is_digit(segment[end]) == digit) ++end;
        runs.emplace_back(segment.substr(start, end - start));
        start = end;
    }
    return runs;
}

} // namespace

TokenLevel Tokenizer::tokenize_label(std::string_view label) {
    TokenLevel tokens;
    size_t start = 0;
    bool first_segment = true;
    while (true) {
        size_t dash = label.find('-', start);
        std::string_view piece = label.substr(start, dash == std::string_view::npos ? std::string_view::npos : dash - start);

        std::string segment = first_segment ? std::string(piece) : "-" + std::string(piece);
        auto runs = split_digit_runs(segment);
        for (size_t i = 0; i < runs.size(); ++i) {
            if (runs[i] == "-" && i + 1 < runs.size() && all_digits(runs[i + 1])) {
                runs[i + 1].insert(0, 1, '-');
                continue;
            }
            tokens.push_back(std::move(runs[i]));
        }

        if (dash == std::string_view::npos) break;
        start = dash + 1;
        first_segment = false;
    }
    return tokens;
}

std::vector<TokenLevel> Tokenizer::tokenize_subdomain(std::string_view subdomain) {
    std::vector<TokenLevel> levels;
    if (subdomain.empty()) return levels;
    size_t start = 0;
    while (true) {
        size_t dot = subdomain.find('.', start);
        levels.push_back(tokenize_label(subdomain.substr(start, dot == std::string_view::npos ? std::string_view::npos : dot - start)));
        if (dot == std::string_view::npos) break;
        start = dot + 1;
    }
    return levels;
}

std::optional<TokenizedHost> Tokenizer::tokenize(const std::string& hostname) const {
    auto parts = splitter_.split(hostname);
    if (!parts || parts->subdomain.empty()) return std::nullopt;

    TokenizedHost result{hostname, tokenize_subdomain(parts->subdomain)};
    if (result.levels.empty() || result.levels.front().empty() || result.levels.front().front().empty())
        return std::nullopt;
    return result;
}

} // namespace Regulator
