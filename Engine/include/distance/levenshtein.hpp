#pragma once

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace Regulator {

/**
 * @brief Unit-cost Levenshtein distance over raw bytes.
 *
 * Single-row DP; O(|a|·|b|) time, O(min(|a|,|b|)) space.
 */
inline uint32_t levenshtein(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    if (b.empty()) return static_cast<uint32_t>(a.size());

    std::vector<uint32_t> row(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) row[j] = static_cast<uint32_t>(j);

    for (size_t i = 1; i <= a.size(); ++i) {
        uint32_t diag = row[0];
        row[0] = static_cast<uint32_t>(i);
        for (size_t j = 1; j <= b.size(); ++j) {
            uint32_t above = row[j];
            if (a[i - 1] == b[j - 1]) {
                row[j] = diag;
            } else {
                row[j] = 1 + std::min({diag, above, row[j - 1]});
            }
            diag = above;
        }
    }
    return row[b.size()];
}

} // namespace Regulator
