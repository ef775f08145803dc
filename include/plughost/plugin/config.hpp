#pragma once

/// @file config.hpp
/// @brief Resolver and host configuration
///
/// Host configuration is a JSON document:
/// ```json
/// {
///   "resolver": { "cycle_policy": "best_effort", "trace_graph": false },
///   "logging":  { "level": "info", "console": true, "file": false,
///                 "directory": "logs", "max_file_size": 10485760, "max_files": 5 },
///   "manifest": "plugins.manifest.json"
/// }
/// ```
/// Every key is optional; absent keys keep their defaults.

#include "fwd.hpp"
#include <plughost/core/error.hpp>
#include <plughost/core/log.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace plughost_plugin {

// =============================================================================
// ResolverConfig
// =============================================================================

/// What the sorter does when load-order hints form a cycle
enum class CyclePolicy : std::uint8_t {
    BestEffort,  ///< Break the cycle at the earliest input position and continue
    Reject,      ///< Fail resolution with CycleDetected
};

[[nodiscard]] const char* cycle_policy_name(CyclePolicy policy) noexcept;

[[nodiscard]] std::optional<CyclePolicy> parse_cycle_policy(std::string_view str) noexcept;

/// Settings for one DescriptorResolver
struct ResolverConfig {
    CyclePolicy cycle_policy = CyclePolicy::BestEffort;
    bool trace_graph = false;  ///< Log the pruned graph as DOT at debug level
};

// =============================================================================
// HostConfig
// =============================================================================

/// Top-level configuration of the plugin host
struct HostConfig {
    ResolverConfig resolver;
    plughost_core::LogConfig logging;
    std::filesystem::path manifest_path;  ///< Empty means no persisted manifest

    /// Parse from a JSON document
    [[nodiscard]] static plughost_core::Result<HostConfig> from_json_string(const std::string& json_str);

    /// Load from a JSON file
    [[nodiscard]] static plughost_core::Result<HostConfig> load(const std::filesystem::path& path);

    /// Apply the logging section
    void apply_logging() const;
};

} // namespace plughost_plugin
