#pragma once

/// @file reference.hpp
/// @brief References from one descriptor to another

#include "fwd.hpp"
#include "version.hpp"
#include <plughost/core/uuid.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace plughost_plugin {

using plughost_core::Uuid;

/// Outcome of testing a reference against a candidate descriptor
enum class ReferenceMatch : std::uint8_t {
    Matched,
    IdentityMismatch,  ///< owner id or descriptor id differ
    BelowMinimum,      ///< candidate version older than min_version
    AboveMaximum,      ///< candidate version newer than max_version
    Unparsable,        ///< a version string failed to parse
};

/// Get match outcome name
[[nodiscard]] const char* reference_match_name(ReferenceMatch match) noexcept;

// =============================================================================
// DescriptorReference
// =============================================================================

/// Points at another descriptor identity plus an inclusive version window
///
/// Used for all four relation lists (depends_on, conflicts_with,
/// load_before, load_after).
struct DescriptorReference {
    Uuid owner_id;        ///< Owning plugin of the target
    Uuid descriptor_id;   ///< Target descriptor
    std::string min_version;
    std::string max_version;

    DescriptorReference() = default;

    DescriptorReference(Uuid owner, Uuid descriptor, std::string min, std::string max)
        : owner_id(owner)
        , descriptor_id(descriptor)
        , min_version(std::move(min))
        , max_version(std::move(max)) {}

    /// Classify a candidate against this reference
    [[nodiscard]] ReferenceMatch check(
        const Uuid& owner, const Uuid& descriptor, std::string_view version) const;

    /// True iff identity is equal and version lies in [min_version, max_version]
    [[nodiscard]] bool matches(
        const Uuid& owner, const Uuid& descriptor, std::string_view version) const {
        return check(owner, descriptor, version) == ReferenceMatch::Matched;
    }

    /// Same identity, version older than the window
    [[nodiscard]] bool is_below(
        const Uuid& owner, const Uuid& descriptor, std::string_view version) const {
        return check(owner, descriptor, version) == ReferenceMatch::BelowMinimum;
    }

    /// Same identity, version newer than the window
    [[nodiscard]] bool is_above(
        const Uuid& owner, const Uuid& descriptor, std::string_view version) const {
        return check(owner, descriptor, version) == ReferenceMatch::AboveMaximum;
    }

    /// "owner/descriptor [min, max]"
    [[nodiscard]] std::string to_string() const;

    /// Identity and window equality (versions compared by precedence)
    [[nodiscard]] bool operator==(const DescriptorReference& other) const;
};

} // namespace plughost_plugin
