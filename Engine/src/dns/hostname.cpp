#include <dns/hostname.hpp>
#include <cctype>

namespace Regulator {

bool is_dns_char(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

std::optional<std::string> normalize_hostname(std::string_view raw) {
    size_t begin = 0, end = raw.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

    std::string host;
    host.reserve(end - begin);
    for (size_t i = begin; i < end; ++i)
        host.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(raw[i]))));

    if (host.compare(0, 2, "*.") == 0) host.erase(0, 2);
    if (!host.empty() && host.back() == '.') host.pop_back();

    if (host.empty() || host.size() > k_max_hostname_length) return std::nullopt;
    for (char c : host) {
        if (!is_dns_char(c)) return std::nullopt;
    }
    return host;
}

std::string collapse_dot_runs(std::string_view name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (c == '.' && !out.empty() && out.back() == '.') continue;
        out.push_back(c);
    }
    return out;
}

} // namespace Regulator
