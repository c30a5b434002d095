#include <induction/closure_builder.hpp>
#include <algorithm>
#include <functional>
#include <numeric>
#include <unordered_map>
#include <utility>

namespace Regulator {

namespace {

// Pivots are processed in blocks so the per-pivot buffers stay bounded.
constexpr size_t k_pivot_block = 1024;

struct ClosureHash {
    size_t operator()(const Closure& c) const noexcept {
        size_t h = c.size();
        for (size_t v : c) h ^= std::hash<size_t>{}(v) + 0x9e3779b9 + (h << 6) + (h >> 2);
        return h;
    }
};

} // namespace

Closure ClosureBuilder::neighbourhood(const std::vector<size_t>& subset, size_t pivot, uint32_t delta) const {
    Closure members;
    for (size_t b : subset) {
        if (b == pivot || table_.at(pivot, b) < delta) members.push_back(b);
    }
    return members;
}

std::vector<Closure> ClosureBuilder::closures(const std::vector<size_t>& subset, uint32_t delta) const {
    std::vector<Closure> out;
    std::unordered_map<size_t, std::vector<size_t>> seen;  // hash -> indices into out
    ClosureHash hasher;

    std::vector<Closure> block;
    for (size_t base = 0; base < subset.size(); base += k_pivot_block) {
        size_t count = std::min(k_pivot_block, subset.size() - base);
        block.assign(count, Closure());

        #pragma omp parallel for schedule(dynamic, 16)
        for (long long i = 0; i < static_cast<long long>(count); ++i) {
            block[i] = neighbourhood(subset, subset[base + i], delta);
        }

        for (auto& closure : block) {
            auto& bucket = seen[hasher(closure)];
            bool duplicate = std::any_of(bucket.begin(), bucket.end(),
                                         [&](size_t k) { return out[k] == closure; });
            if (duplicate) continue;
            bucket.push_back(out.size());
            out.push_back(std::move(closure));
        }
    }
    return out;
}

std::vector<Closure> ClosureBuilder::closures(size_t first, size_t last, uint32_t delta) const {
    std::vector<size_t> subset(last > first ? last - first : 0);
    std::iota(subset.begin(), subset.end(), first);
    return closures(subset, delta);
}

} // namespace Regulator
