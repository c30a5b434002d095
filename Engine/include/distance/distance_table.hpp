/**
 * @file distance_table.hpp
 * @brief Precomputed pairwise edit distances over the sorted host list
 *
 * Hosts are identified by their rank in the sorted list. Distances are kept
 * in a lower-triangular array (self pairs included), so lookups are
 * symmetric by construction. Built once, read-only afterwards.
 */

#pragma once

#include <export.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Regulator {

class REGULATOR_API DistanceTable {
public:
    // Hostnames are at most 253 characters, so every distance fits.
    using Distance = uint8_t;

    DistanceTable() = default;

    /**
     * @brief Compute all pairwise distances (rows in parallel).
     */
    explicit DistanceTable(const std::vector<std::string>& hosts);

    Distance at(size_t i, size_t j) const noexcept {
        return cells_[i >= j ? cell(i, j) : cell(j, i)];
    }

    size_t size() const noexcept { return n_; }
    size_t pair_count() const noexcept { return cells_.size(); }

private:
    static size_t cell(size_t row, size_t col) noexcept { return row * (row + 1) / 2 + col; }

    size_t n_ = 0;
    std::vector<Distance> cells_;
};

} // namespace Regulator
