/// @file topo_sort.cpp
/// @brief Deterministic topological sort implementation

#include <plughost/plugin/topo_sort.hpp>

namespace plughost_plugin {

SortOutcome stable_topological_sort(const OrderingGraph& graph, CyclePolicy policy) {
    SortOutcome outcome;
    outcome.order.reserve(graph.size());

    // Pending predecessor count per node
    std::map<std::size_t, std::size_t> pending;
    for (const auto& [node, _] : graph) {
        pending[node] = 0;
    }
    for (const auto& [node, successors] : graph) {
        for (std::size_t succ : successors) {
            auto it = pending.find(succ);
            if (it != pending.end() && succ != node) {
                ++it->second;
            }
        }
    }

    std::set<std::size_t> remaining;
    std::set<std::size_t> ready;
    for (const auto& [node, count] : pending) {
        remaining.insert(node);
        if (count == 0) {
            ready.insert(node);
        }
    }

    while (!remaining.empty()) {
        if (ready.empty()) {
            if (policy == CyclePolicy::Reject) {
                outcome.stalled.assign(remaining.begin(), remaining.end());
                return outcome;
            }
            std::size_t breaker = *remaining.begin();
            outcome.forced.push_back(breaker);
            ready.insert(breaker);
        }

        std::size_t node = *ready.begin();
        ready.erase(ready.begin());
        remaining.erase(node);
        outcome.order.push_back(node);

        for (std::size_t succ : graph.at(node)) {
            if (succ == node || !remaining.count(succ)) {
                continue;
            }
            auto& count = pending[succ];
            if (count > 0 && --count == 0) {
                ready.insert(succ);
            }
        }
    }

    return outcome;
}

} // namespace plughost_plugin
