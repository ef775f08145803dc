/// @file error.cpp
/// @brief Error handling implementation for plughost_core
///
/// The error system is primarily template-based and header-only.
/// This file provides error formatting and explicit instantiations
/// of the Result types the resolver returns.

#include <plughost/core/error.hpp>
#include <sstream>
#include <vector>

namespace plughost_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

const char* resolution_kind_name(ResolutionError::Kind kind) {
    switch (kind) {
        case ResolutionError::Kind::IndexCorrupted: return "IndexCorrupted";
        case ResolutionError::Kind::CycleDetected: return "CycleDetected";
        case ResolutionError::Kind::NullDescriptor: return "NullDescriptor";
    }
    return "Unknown";
}

/// Format resolution error with full context
std::string format_resolution_error(const ResolutionError& err) {
    std::ostringstream oss;
    oss << "[ResolutionError:" << resolution_kind_name(err.kind) << "] " << err.message;

    if (!err.descriptor_id.empty()) {
        oss << " (descriptor: " << err.descriptor_id << ")";
    }

    return oss.str();
}

/// Format manifest error with full context
std::string format_manifest_error(const ManifestError& err) {
    std::ostringstream oss;
    oss << "[ManifestError] " << err.message;

    if (!err.path.empty()) {
        oss << " (path: " << err.path << ")";
    }
    if (!err.descriptor_id.empty()) {
        oss << " (descriptor: " << err.descriptor_id << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ResolutionError>) {
            oss << detail::format_resolution_error(err);
        } else if constexpr (std::is_same_v<T, ManifestError>) {
            oss << detail::format_manifest_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << " " << key << "=" << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::size_t, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::size_t>, Error>;

} // namespace plughost_core
