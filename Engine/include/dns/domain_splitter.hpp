/**
 * @file domain_splitter.hpp
 * @brief Splits hostnames into subdomain, registrable domain and public suffix
 *
 * The registrable domain is fixed by the run's target, so the split is
 * relative to it: everything left of ".<target>" is the subdomain, and the
 * public suffix is the target with its first label removed.
 */

#pragma once

#include <export.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace Regulator {

struct DomainParts {
    std::string subdomain;           // "api.eu" for api.eu.example.com
    std::string registrable_domain;  // "example.com"
    std::string suffix;              // "com"
};

class REGULATOR_API DomainSplitter {
public:
    explicit DomainSplitter(std::string target);

    /**
     * @brief Split a normalized hostname.
     * @return std::nullopt if the hostname is not the target or one of its subdomains
     */
    std::optional<DomainParts> split(std::string_view hostname) const;

    const std::string& target() const { return target_; }

private:
    std::string target_;
    std::string suffix_;
};

} // namespace Regulator
