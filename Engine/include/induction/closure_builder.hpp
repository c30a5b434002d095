/**
 * @file closure_builder.hpp
 * @brief Edit-distance neighbourhoods over a host subset
 *
 * For every pivot of the subset (in subset order) the closure holds each
 * subset member within distance < delta of the pivot. The pivot is always
 * a member. Closures identical to one produced earlier in the same call are
 * dropped; the remaining closures keep first-seen order. Singletons are
 * returned as well, callers decide what to do with them.
 */

#pragma once

#include <distance/distance_table.hpp>
#include <export.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

namespace Regulator {

// Host ranks, in subset order.
using Closure = std::vector<size_t>;

class REGULATOR_API ClosureBuilder {
public:
    explicit ClosureBuilder(const DistanceTable& table) : table_(table) {}

    std::vector<Closure> closures(const std::vector<size_t>& subset, uint32_t delta) const;

    /**
     * @brief Closures over the contiguous rank range [first, last).
     */
    std::vector<Closure> closures(size_t first, size_t last, uint32_t delta) const;

private:
    Closure neighbourhood(const std::vector<size_t>& subset, size_t pivot, uint32_t delta) const;

    const DistanceTable& table_;
};

} // namespace Regulator
