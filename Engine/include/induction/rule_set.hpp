/**
 * @file rule_set.hpp
 * @brief Grow-only set of accepted rule patterns
 *
 * Shared by every pass of a run. Insertions are serialized, so concurrent
 * workers may accept colliding patterns and each string is kept once.
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace Regulator {

class REGULATOR_API RuleSet {
public:
    bool contains(const std::string& rule) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rules_.count(rule) != 0;
    }

    /**
     * @return false if the rule was already present
     */
    bool insert(const std::string& rule) {
        std::lock_guard<std::mutex> lock(mutex_);
        return rules_.insert(rule).second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rules_.size();
    }

    std::vector<std::string> sorted() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::string>(rules_.begin(), rules_.end());
    }

private:
    mutable std::mutex mutex_;
    std::set<std::string> rules_;
};

} // namespace Regulator
