#pragma once

/// @file context.hpp
/// @brief Per-call resolution state
///
/// A ResolutionContext is built fresh for every resolution call and never
/// shared, which keeps DescriptorResolver stateless. It holds:
/// - the input snapshot (non-owning pointers, input order)
/// - the identity index of surviving descriptors
/// - the ordering graph (node -> nodes ordered after it)
/// - the Duplicates, DependencyDisabled and ConflictDisabled sets
///
/// Every node is named by its input position, so ties can be broken by
/// input order without extra bookkeeping.
///
/// The context borrows the descriptors; it must not outlive the input.

#include "fwd.hpp"
#include "descriptor.hpp"
#include "topo_sort.hpp"
#include <plughost/core/error.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace plughost_plugin {

// =============================================================================
// ResolutionContext
// =============================================================================

class ResolutionContext {
public:
    using Position = std::size_t;

    // =========================================================================
    // Construction
    // =========================================================================

    /// Deduplicate, index and seed the graph
    ///
    /// The first occurrence of a descriptor id wins; later ones land in
    /// duplicates(). A null pointer in the input is an InvalidArgument error.
    [[nodiscard]] static plughost_core::Result<ResolutionContext> build(
        std::vector<const Descriptor*> input);

    ResolutionContext(const ResolutionContext&) = delete;
    ResolutionContext& operator=(const ResolutionContext&) = delete;
    ResolutionContext(ResolutionContext&&) = default;
    ResolutionContext& operator=(ResolutionContext&&) = default;

    // =========================================================================
    // Input and Index
    // =========================================================================

    /// Number of input descriptors, duplicates included
    [[nodiscard]] std::size_t input_size() const noexcept { return m_input.size(); }

    /// Descriptor at an input position
    [[nodiscard]] const Descriptor& at(Position pos) const { return *m_input.at(pos); }

    /// Input positions of the deduplicated descriptors, in input order
    [[nodiscard]] const std::vector<Position>& survivors() const noexcept { return m_survivors; }

    /// Look up a surviving descriptor by id
    ///
    /// Ok(nullopt) when the id is unknown. An index entry that does not
    /// point back at a descriptor with the same id is an IndexCorrupted
    /// error: it means the context itself is broken.
    [[nodiscard]] plughost_core::Result<std::optional<Position>> find(const Uuid& descriptor_id) const;

    /// Number of index entries
    [[nodiscard]] std::size_t index_size() const noexcept { return m_index.size(); }

    // =========================================================================
    // Exclusion Sets
    // =========================================================================

    [[nodiscard]] const std::set<Position>& duplicates() const noexcept { return m_duplicates; }
    [[nodiscard]] const std::set<Position>& dependency_disabled() const noexcept { return m_dependency_disabled; }
    [[nodiscard]] const std::set<Position>& conflict_disabled() const noexcept { return m_conflict_disabled; }

    /// In DependencyDisabled or ConflictDisabled
    [[nodiscard]] bool is_disabled(Position pos) const {
        return m_dependency_disabled.count(pos) > 0 || m_conflict_disabled.count(pos) > 0;
    }

    /// In any exclusion set
    [[nodiscard]] bool is_excluded(Position pos) const {
        return m_duplicates.count(pos) > 0 || is_disabled(pos);
    }

    /// Add @p pos to DependencyDisabled and record why
    ///
    /// May be called once per unmet constraint; every reason is kept.
    void disable_for_dependency(Position pos, std::string reason);
    void disable_for_conflict(Position pos, std::string reason);

    /// Every recorded exclusion reason, in the order they were found
    [[nodiscard]] std::vector<std::string> exclusion_reasons(Position pos) const;

    /// Exclusion reasons joined with "; ", empty if none
    [[nodiscard]] std::string exclusion_reason(Position pos) const;

    // =========================================================================
    // Ordering Graph
    // =========================================================================

    [[nodiscard]] const OrderingGraph& graph() const noexcept { return m_graph; }

    [[nodiscard]] bool in_graph(Position pos) const { return m_graph.count(pos) > 0; }

    /// Record that @p before must be ordered ahead of @p after
    ///
    /// Returns false (and adds nothing) if either node is not in the graph
    /// or both are the same node.
    bool add_ordering(Position before, Position after);

    /// Remove every disabled descriptor from the graph, with its edges
    void prune();

    /// Stable topological order of the graph
    [[nodiscard]] SortOutcome sort(CyclePolicy policy) const;

    /// Sorted descriptors; an ordering cycle fails only under CyclePolicy::Reject
    [[nodiscard]] plughost_core::Result<std::vector<const Descriptor*>> sorted(
        CyclePolicy policy = CyclePolicy::BestEffort) const;

    // =========================================================================
    // Debugging
    // =========================================================================

    /// GraphViz DOT rendering of the current graph
    [[nodiscard]] std::string to_dot_graph() const;

    /// "a -> b -> c" listing of positions by label
    [[nodiscard]] std::string format_positions(const std::vector<Position>& positions) const;

private:
    friend struct ResolutionContextAccess;

    explicit ResolutionContext(std::vector<const Descriptor*> input);

    std::vector<const Descriptor*> m_input;
    std::vector<Position> m_survivors;
    std::unordered_map<Uuid, Position> m_index;
    OrderingGraph m_graph;

    std::set<Position> m_duplicates;
    std::set<Position> m_dependency_disabled;
    std::set<Position> m_conflict_disabled;
    std::map<Position, std::vector<std::string>> m_reasons;
};

} // namespace plughost_plugin
