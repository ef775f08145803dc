#pragma once

/// @file topo_sort.hpp
/// @brief Deterministic topological sort over input positions
///
/// Nodes are input positions, so "smaller node" means "earlier in the
/// input". Among the nodes whose predecessors have all been emitted the
/// smallest is emitted first, which makes the output a pure function of the
/// input sequence.

#include "fwd.hpp"
#include "config.hpp"

#include <cstddef>
#include <map>
#include <set>
#include <vector>

namespace plughost_plugin {

/// Directed graph: node -> nodes that must be ordered after it
using OrderingGraph = std::map<std::size_t, std::set<std::size_t>>;

/// Result of a stable topological sort
struct SortOutcome {
    std::vector<std::size_t> order;    ///< Emitted nodes
    std::vector<std::size_t> forced;   ///< Nodes emitted while predecessors were pending (cycle breaks)
    std::vector<std::size_t> stalled;  ///< Nodes left when a cycle stopped a Reject sort

    /// True if every node was emitted
    [[nodiscard]] bool complete() const noexcept { return stalled.empty(); }
};

/// Sort all keys of @p graph
///
/// Edges pointing at nodes that are not keys of the graph are ignored.
/// Under CyclePolicy::BestEffort a stall is broken by emitting the smallest
/// remaining node; under CyclePolicy::Reject the sort stops and reports the
/// remaining nodes in SortOutcome::stalled.
[[nodiscard]] SortOutcome stable_topological_sort(const OrderingGraph& graph, CyclePolicy policy);

} // namespace plughost_plugin
