#pragma once

/// @file ordering.hpp
/// @brief Topological ordering of subscribers by before/after constraints

#include "fwd.hpp"

#include <compare>
#include <cstdint>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sim_event {

// =============================================================================
// SubscriptionId
// =============================================================================

/// Unique identifier for a subscription (0 = invalid)
struct SubscriptionId {
    std::uint64_t id = 0;

    constexpr SubscriptionId() = default;
    constexpr explicit SubscriptionId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriptionId&) const noexcept = default;
    constexpr bool operator==(const SubscriptionId&) const noexcept = default;
};

// =============================================================================
// SubscriptionInfo
// =============================================================================

/// Identity and ordering constraints shared by every orderable handler
struct SubscriptionInfo {
    SubscriptionId id;
    std::string name;
    std::vector<std::string> before;
    std::vector<std::string> after;
    bool active = true;

    [[nodiscard]] bool has_constraints() const noexcept {
        return !before.empty() || !after.empty();
    }
};

/// Sort handlers so every before/after constraint holds
///
/// Kahn's algorithm; among ready handlers the lowest subscription id goes
/// first, so unconstrained handlers keep subscription order. Constraints
/// naming no known subscriber are ignored.
/// @return false (handlers untouched) if the constraints form a cycle
template<typename H>
[[nodiscard]] bool order_subscriptions(std::vector<std::shared_ptr<H>>& handlers) {
    const std::size_t count = handlers.size();
    if (count < 2) {
        return true;
    }

    std::multimap<std::string, std::size_t> by_name;
    for (std::size_t i = 0; i < count; ++i) {
        if (!handlers[i]->info.name.empty()) {
            by_name.emplace(handlers[i]->info.name, i);
        }
    }

    // Build dependency graph (edge a -> b: a runs before b)
    std::vector<std::set<std::size_t>> graph(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& info = handlers[i]->info;
        for (const auto& name : info.before) {
            auto [first, last] = by_name.equal_range(name);
            for (auto it = first; it != last; ++it) {
                if (it->second != i) {
                    graph[i].insert(it->second);
                }
            }
        }
        for (const auto& name : info.after) {
            auto [first, last] = by_name.equal_range(name);
            for (auto it = first; it != last; ++it) {
                if (it->second != i) {
                    graph[it->second].insert(i);
                }
            }
        }
    }

    std::vector<int> in_degree(count, 0);
    for (const auto& edges : graph) {
        for (std::size_t next : edges) {
            in_degree[next]++;
        }
    }

    // Kahn's algorithm; ready set keyed by subscription id
    std::set<std::pair<std::uint64_t, std::size_t>> ready;
    for (std::size_t i = 0; i < count; ++i) {
        if (in_degree[i] == 0) {
            ready.emplace(handlers[i]->info.id.id, i);
        }
    }

    std::vector<std::size_t> order;
    order.reserve(count);
    while (!ready.empty()) {
        std::size_t current = ready.begin()->second;
        ready.erase(ready.begin());
        order.push_back(current);

        for (std::size_t next : graph[current]) {
            if (--in_degree[next] == 0) {
                ready.emplace(handlers[next]->info.id.id, next);
            }
        }
    }

    // Check for cycles
    if (order.size() != count) {
        return false;
    }

    std::vector<std::shared_ptr<H>> sorted;
    sorted.reserve(count);
    for (std::size_t index : order) {
        sorted.push_back(handlers[index]);
    }
    handlers = std::move(sorted);
    return true;
}

} // namespace sim_event
