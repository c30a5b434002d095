/**
 * @file prefix_index.hpp
 * @brief Ordered string index answering prefix queries
 *
 * Keys are held sorted and unique, so all keys sharing a prefix form one
 * contiguous rank range. When built over the run's sorted host list the
 * ranks coincide with DistanceTable rows.
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Regulator {

class REGULATOR_API PrefixIndex {
public:
    using Range = std::pair<size_t, size_t>; // [first, last)

    PrefixIndex() = default;
    explicit PrefixIndex(std::vector<std::string> keys);

    void insert(const std::string& key);

    Range range(std::string_view prefix) const;

    std::vector<std::string> keys_with_prefix(std::string_view prefix) const;

    bool contains_prefix(std::string_view prefix) const {
        auto r = range(prefix);
        return r.first < r.second;
    }

    const std::vector<std::string>& keys() const { return keys_; }
    size_t size() const { return keys_.size(); }

private:
    std::vector<std::string> keys_;
};

} // namespace Regulator
