/**
 * @file acceptance_filter.hpp
 * @brief Ratio test bounding how far a rule generalizes past its evidence
 */

#pragma once

#include <pattern/pattern.hpp>
#include <export.hpp>
#include <cstddef>
#include <cstdint>

namespace Regulator {

struct AcceptanceCriteria {
    uint64_t threshold = 500;      // Below this many words a rule is always accepted
    double max_ratio = 25.0;       // Otherwise words / evidence must stay below this
    size_t max_word_length = 256;  // Longest word counted
};

class REGULATOR_API AcceptanceFilter {
public:
    explicit AcceptanceFilter(const AcceptanceCriteria& criteria = AcceptanceCriteria()) : criteria_(criteria) {}

    /**
     * @brief Accept when count < threshold, or count / evidence < max_ratio.
     *
     * A count equal to the threshold falls through to the ratio test.
     * Zero evidence never passes the ratio test.
     */
    static bool passes_ratio_test(uint64_t count, size_t evidence, uint64_t threshold, double max_ratio);

    /**
     * @brief Distinct words of length 1..max_word_length matched by the pattern.
     */
    uint64_t cardinality(const Pattern& pattern) const;

    bool is_acceptable(const Pattern& pattern, size_t evidence) const;

    const AcceptanceCriteria& criteria() const { return criteria_; }

private:
    AcceptanceCriteria criteria_;
};

} // namespace Regulator
