#include <distance/distance_table.hpp>
#include <distance/levenshtein.hpp>
#include <algorithm>
#include <limits>

namespace Regulator {

DistanceTable::DistanceTable(const std::vector<std::string>& hosts)
    : n_(hosts.size()), cells_(hosts.size() * (hosts.size() + 1) / 2, 0) {
    constexpr uint32_t cap = std::numeric_limits<Distance>::max();
    const long long rows = static_cast<long long>(n_);

    #pragma omp parallel for schedule(dynamic, 16)
    for (long long r = 0; r < rows; ++r) {
        const size_t i = static_cast<size_t>(r);
        for (size_t j = 0; j < i; ++j) {
            uint32_t d = levenshtein(hosts[i], hosts[j]);
            cells_[cell(i, j)] = static_cast<Distance>(std::min(d, cap));
        }
    }
}

} // namespace Regulator
