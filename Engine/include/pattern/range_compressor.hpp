/**
 * @file range_compressor.hpp
 * @brief Collapses numeric alternations into per-digit ranges
 *
 * Only primitive groups are rewritten: every alternative must be a single
 * literal. Numbers are aligned from the least significant digit, so
 * (1|2|10) becomes (1?[0-2]): the tens digit is optional because some
 * alternatives are shorter. Ranges always span [min-max] of the observed
 * digits, which over-approximates sparse sets.
 *
 *   (1|2|3)           ->  ([1-3])
 *   (-01|-02)         ->  (-0[1-2])
 *   (7|8|www)         ->  (([7-8])|(www))
 *
 * Rewritten groups are no longer primitive, so compress() is idempotent.
 */

#pragma once

#include <pattern/pattern.hpp>
#include <export.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Regulator {

class REGULATOR_API RangeCompressor {
public:
    static Pattern compress(const Pattern& pattern);

    static void compress_in_place(Sequence& seq);

    /**
     * @brief Compressed replacement for one group, or std::nullopt if the
     *        group is not primitive or has fewer than two numeric alternatives.
     */
    static std::optional<PatternNode> compress_group(const PatternNode& group);

    /**
     * @brief Per-digit range sequence covering every number given.
     */
    static Sequence digit_ranges(const std::vector<std::string>& numbers);
};

} // namespace Regulator
