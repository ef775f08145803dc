#pragma once

/// @file resolver.hpp
/// @brief Descriptor resolution engine
///
/// DescriptorResolver turns an unordered batch of descriptors into a
/// deterministic, conflict-free, dependency-valid order:
/// - Deduplicate by descriptor id (first occurrence wins)
/// - Exclude descriptors whose dependencies are missing or out of range
/// - Exclude descriptors that declare a conflict with another survivor
/// - Order survivors by load_before/load_after hints, ties by input order
///
/// Exclusions are never errors: each one is logged on the
/// "plughost.resolver" logger and the descriptor is left out of the
/// result. Only a corrupted context (or a rejected cycle, when configured)
/// fails the call.
///
/// Conflicts are one-directional. If A declares a conflict with B, A is
/// removed and B stays unless B also declares a conflict with A.
///
/// Thread-safety: a resolver holds only its immutable configuration, so
/// one instance may be used from several threads at once.

#include "fwd.hpp"
#include "config.hpp"
#include "context.hpp"
#include "descriptor.hpp"
#include <plughost/core/error.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace plughost_plugin {

class ManifestStore;

// =============================================================================
// ResolutionReport
// =============================================================================

/// Final state of one input descriptor
enum class DescriptorStatus : std::uint8_t {
    Resolved,
    Duplicate,
    DependencyDisabled,
    ConflictDisabled,
    ManifestDisabled,
};

[[nodiscard]] const char* descriptor_status_name(DescriptorStatus status) noexcept;

/// One row per input descriptor, in input order
struct ReportRow {
    std::size_t input_position = 0;
    Uuid owner_id;
    Uuid descriptor_id;
    std::string label;
    std::string version;
    DescriptorStatus status = DescriptorStatus::Resolved;
    std::optional<std::size_t> sort_index;  ///< Position in the resolved order
    std::string message;                    ///< Why the descriptor was excluded
};

/// Outcome of a resolution, for settings pages and tooling
struct ResolutionReport {
    std::vector<ReportRow> rows;

    [[nodiscard]] std::size_t count(DescriptorStatus status) const;

    /// Row for a descriptor id (first input occurrence), or nullptr
    [[nodiscard]] const ReportRow* find(const Uuid& descriptor_id) const;

    /// Plain-text table
    [[nodiscard]] std::string format() const;
};

// =============================================================================
// DescriptorResolver
// =============================================================================

class DescriptorResolver {
public:
    DescriptorResolver() = default;
    explicit DescriptorResolver(ResolverConfig config) : m_config(config) {}

    [[nodiscard]] const ResolverConfig& config() const noexcept { return m_config; }

    // =========================================================================
    // Resolution
    // =========================================================================

    /// Deduplicate, evaluate constraints and prune
    ///
    /// The returned context borrows from @p descriptors.
    [[nodiscard]] plughost_core::Result<ResolutionContext> resolve_context(
        std::vector<const Descriptor*> descriptors) const;

    /// Evaluate constraints on a freshly built context, then prune it
    ///
    /// An inconsistent identity index aborts evaluation with an
    /// InvalidState error, logged at critical level.
    [[nodiscard]] plughost_core::Result<void> evaluate(ResolutionContext& context) const;

    /// Ordered survivors as pointers into the input
    [[nodiscard]] plughost_core::Result<std::vector<const Descriptor*>> resolve_pointers(
        std::vector<const Descriptor*> descriptors) const;

    /// Ordered survivors, copied out of the input
    template<DescriptorType T>
    [[nodiscard]] plughost_core::Result<std::vector<T>> resolve(const std::vector<T>& descriptors) const {
        auto ordered = resolve_pointers(pointers_to(descriptors));
        if (!ordered) {
            return plughost_core::Err<std::vector<T>>(ordered.error());
        }

        std::vector<T> result;
        result.reserve(ordered->size());
        for (const Descriptor* d : *ordered) {
            result.push_back(static_cast<const T&>(*d));
        }
        return plughost_core::Ok(std::move(result));
    }

    // =========================================================================
    // Reporting
    // =========================================================================

    /// Resolve and describe what happened to every input descriptor
    ///
    /// When @p manifest is given, descriptors it marks disabled are left out
    /// of resolution and reported as ManifestDisabled.
    [[nodiscard]] plughost_core::Result<ResolutionReport> report(
        std::vector<const Descriptor*> descriptors,
        const ManifestStore* manifest = nullptr) const;

    template<DescriptorType T>
    [[nodiscard]] plughost_core::Result<ResolutionReport> report(
        const std::vector<T>& descriptors,
        const ManifestStore* manifest = nullptr) const {
        return report(pointers_to(descriptors), manifest);
    }

    /// Borrowed pointers to each element, in order
    template<DescriptorType T>
    [[nodiscard]] static std::vector<const Descriptor*> pointers_to(const std::vector<T>& descriptors) {
        std::vector<const Descriptor*> pointers;
        pointers.reserve(descriptors.size());
        for (const auto& d : descriptors) {
            pointers.push_back(&d);
        }
        return pointers;
    }

private:
    using Position = ResolutionContext::Position;

    /// Every depends_on reference must resolve to a matching descriptor
    ///
    /// Each unmet reference is logged and recorded, not only the first.
    [[nodiscard]] plughost_core::Result<void> process_dependencies(
        Position pos, ResolutionContext& context) const;

    /// First conflict_with match against another graph node disables the descriptor
    void process_conflicts(Position pos, ResolutionContext& context) const;

    /// load_before: the descriptor is ordered ahead of each matching target
    [[nodiscard]] plughost_core::Result<void> process_load_before(
        Position pos, ResolutionContext& context) const;

    /// load_after: each matching target is ordered ahead of the descriptor
    [[nodiscard]] plughost_core::Result<void> process_load_after(
        Position pos, ResolutionContext& context) const;

    /// Shared lookup for load hints; nullopt when the hint does not apply
    [[nodiscard]] plughost_core::Result<std::optional<Position>> hint_target(
        Position pos, const DescriptorReference& ref, const char* relation,
        const ResolutionContext& context) const;

    /// Sort the pruned graph, logging broken cycles
    [[nodiscard]] plughost_core::Result<std::vector<Position>> order(const ResolutionContext& context) const;

    ResolverConfig m_config;
};

} // namespace plughost_plugin
