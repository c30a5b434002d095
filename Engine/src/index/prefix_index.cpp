#include <index/prefix_index.hpp>
#include <algorithm>
#include <utility>

namespace Regulator {

namespace {

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

PrefixIndex::PrefixIndex(std::vector<std::string> keys) : keys_(std::move(keys)) {
    std::sort(keys_.begin(), keys_.end());
    keys_.erase(std::unique(keys_.begin(), keys_.end()), keys_.end());
}

void PrefixIndex::insert(const std::string& key) {
    auto it = std::lower_bound(keys_.begin(), keys_.end(), key);
    if (it == keys_.end() || *it != key) keys_.insert(it, key);
}

PrefixIndex::Range PrefixIndex::range(std::string_view prefix) const {
    auto first = std::lower_bound(keys_.begin(), keys_.end(), prefix,
        [](const std::string& key, std::string_view p) { return std::string_view(key) < p; });
    auto last = std::partition_point(first, keys_.end(),
        [prefix](const std::string& key) { return starts_with(key, prefix); });
    return {static_cast<size_t>(first - keys_.begin()), static_cast<size_t>(last - keys_.begin())};
}

std::vector<std::string> PrefixIndex::keys_with_prefix(std::string_view prefix) const {
    auto [first, last] = range(prefix);
    return std::vector<std::string>(keys_.begin() + first, keys_.begin() + last);
}

} // namespace Regulator
