#include <induction/acceptance_filter.hpp>
#include <automaton/pattern_automaton.hpp>

namespace Regulator {

bool AcceptanceFilter::passes_ratio_test(uint64_t count, size_t evidence, uint64_t threshold, double max_ratio) {
    if (count < threshold) return true;
    if (evidence == 0) return false;
    return static_cast<double>(count) / static_cast<double>(evidence) < max_ratio;
}

uint64_t AcceptanceFilter::cardinality(const Pattern& pattern) const {
    return PatternAutomaton(pattern).count_words(1, criteria_.max_word_length);
}

bool AcceptanceFilter::is_acceptable(const Pattern& pattern, size_t evidence) const {
    return passes_ratio_test(cardinality(pattern), evidence, criteria_.threshold, criteria_.max_ratio);
}

} // namespace Regulator
