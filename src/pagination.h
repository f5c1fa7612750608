#pragma once

#include <algorithm>
#include <cstddef>
#include <optional>
#include <vector>

namespace claimscan::api {

inline auto HasMore(int limit, int offset, int returned, std::optional<long> total) -> bool { // NOLINT(bugprone-easily-swappable-parameters)
    if (total.has_value()) {
        return offset + returned < total.value();
    }
    return returned >= limit;
}

// Clamped [offset, offset + limit) window of `items`; out-of-range offsets give an empty page.
template <typename T>
auto PageOf(const std::vector<T>& items, int limit, int offset) -> std::vector<T> {
    if (limit <= 0 || offset < 0 || static_cast<size_t>(offset) >= items.size()) {
        return {};
    }
    auto first = items.begin() + offset;
    auto last = first + std::min<size_t>(static_cast<size_t>(limit), items.size() - static_cast<size_t>(offset));
    return std::vector<T>(first, last);
}

}  // namespace claimscan::api
