#include <dns/domain_splitter.hpp>
#include <dns/hostname.hpp>
#include <stdexcept>
#include <utility>

namespace Regulator {

DomainSplitter::DomainSplitter(std::string target) {
    auto normalized = normalize_hostname(target);
    if (!normalized) throw std::invalid_argument("Invalid target domain: '" + target + "'");
    target_ = std::move(*normalized);
    auto dot = target_.find('.');
    suffix_ = (dot == std::string::npos) ? std::string() : target_.substr(dot + 1);
}

std::optional<DomainParts> DomainSplitter::split(std::string_view hostname) const {
    if (hostname == target_) return DomainParts{"", target_, suffix_};

    if (hostname.size() <= target_.size() + 1) return std::nullopt;
    size_t cut = hostname.size() - target_.size();
    if (hostname[cut - 1] != '.' || hostname.substr(cut) != target_) return std::nullopt;

    return DomainParts{std::string(hostname.substr(0, cut - 1)), target_, suffix_};
}

} // namespace Regulator
