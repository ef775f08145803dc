#pragma once

/// @file version.hpp
/// @brief Semantic versions and version windows for descriptor references
///
/// Supports SemVer 2.0.0 precedence:
/// - Parse "1", "1.2", "1.2.3", "1.2.3-beta.1+build123"
/// - Compare versions (==, <, >, <=, >=)
/// - Inclusive [min, max] window checks on version strings

#include "fwd.hpp"
#include <plughost/core/error.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <compare>

namespace plughost_plugin {

// =============================================================================
// SemanticVersion
// =============================================================================

/// Full semantic version (major.minor.patch[-prerelease][+build])
///
/// - Prerelease has lower precedence than normal version
/// - Build metadata is ignored in comparisons
/// - Prerelease identifiers compared as numbers if numeric, else lexically
struct SemanticVersion {
    std::uint32_t major = 0;
    std::uint32_t minor = 0;
    std::uint32_t patch = 0;
    std::string prerelease;      ///< e.g., "alpha", "beta.1", "rc.2"
    std::string build_metadata;  ///< e.g., "build123", "sha.a1b2c3d"

    /// Default constructor - creates 0.0.0
    SemanticVersion() = default;

    /// Construct with major.minor.patch
    SemanticVersion(std::uint32_t maj, std::uint32_t min, std::uint32_t pat)
        : major(maj), minor(min), patch(pat) {}

    /// Construct with all fields
    SemanticVersion(std::uint32_t maj, std::uint32_t min, std::uint32_t pat,
                    std::string pre, std::string build = "")
        : major(maj), minor(min), patch(pat)
        , prerelease(std::move(pre))
        , build_metadata(std::move(build)) {}

    // =========================================================================
    // Parsing
    // =========================================================================

    /// Parse a version string
    ///
    /// Missing minor/patch default to 0 and a leading 'v' is skipped.
    /// A fourth numeric component, an empty component, or characters
    /// outside [0-9A-Za-z.-] in the tags are rejected.
    [[nodiscard]] static plughost_core::Result<SemanticVersion> parse(std::string_view str);

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Three-way comparison (SemVer precedence, build metadata ignored)
    [[nodiscard]] std::strong_ordering operator<=>(const SemanticVersion& other) const noexcept;

    /// Equality comparison (build metadata ignored)
    [[nodiscard]] bool operator==(const SemanticVersion& other) const noexcept;

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool is_prerelease() const noexcept {
        return !prerelease.empty();
    }

    /// Convert to string representation
    [[nodiscard]] std::string to_string() const;

private:
    /// Compare prerelease strings per SemVer rules
    [[nodiscard]] static std::strong_ordering compare_prerelease(
        std::string_view a, std::string_view b) noexcept;
};

// =============================================================================
// Version Windows
// =============================================================================

/// Where a version falls relative to an inclusive [min, max] window
enum class WindowPosition : std::uint8_t {
    Inside,
    Below,       ///< version < min
    Above,       ///< version > max
    Unparsable,  ///< version, min or max failed to parse
};

/// Locate a version string relative to an inclusive window
[[nodiscard]] WindowPosition locate_in_window(
    std::string_view version, std::string_view min, std::string_view max);

/// True iff version lies within [min, max]; unparsable input never matches
[[nodiscard]] inline bool version_in_window(
    std::string_view version, std::string_view min, std::string_view max) {
    return locate_in_window(version, min, max) == WindowPosition::Inside;
}

} // namespace plughost_plugin
