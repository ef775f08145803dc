#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for plughost_plugin module

#include <cstdint>

namespace plughost_plugin {

// =============================================================================
// Versioning
// =============================================================================

struct SemanticVersion;

// =============================================================================
// Descriptors
// =============================================================================

struct DescriptorReference;
enum class ReferenceMatch : std::uint8_t;
struct Descriptor;

// =============================================================================
// Resolution
// =============================================================================

enum class CyclePolicy : std::uint8_t;
struct ResolverConfig;
struct HostConfig;
class ResolutionContext;
enum class DescriptorStatus : std::uint8_t;
struct ReportRow;
struct ResolutionReport;
class DescriptorResolver;

// =============================================================================
// Extension Points
// =============================================================================

enum class SortDirection : std::uint8_t;
struct ExtensionPointInfo;
class ExtensionRegistry;

// =============================================================================
// Manifest
// =============================================================================

struct DescriptorState;
class ManifestStore;
class MemoryManifestStore;
class JsonManifestStore;

} // namespace plughost_plugin
