#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for plughost_core module

#include <cstdint>

namespace plughost_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

struct ResolutionError;
struct ManifestError;

// =============================================================================
// Identity
// =============================================================================

struct Uuid;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace plughost_core
