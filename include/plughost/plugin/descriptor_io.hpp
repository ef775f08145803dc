#pragma once

/// @file descriptor_io.hpp
/// @brief Reading descriptor batches from JSON documents
///
/// Used by tools and tests to feed the resolver without a plugin loader:
/// ```json
/// [
///   { "owner": "...", "id": "...", "version": "1.2.0", "name": "Inspector",
///     "depends_on":     [ { "owner": "...", "id": "...", "min": "1.0.0", "max": "2.0.0" } ],
///     "conflicts_with": [],
///     "load_before":    [],
///     "load_after":     [] }
/// ]
/// ```

#include "fwd.hpp"
#include "descriptor.hpp"
#include <plughost/core/error.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace plughost_plugin {

/// Parse a JSON array of descriptors
[[nodiscard]] plughost_core::Result<std::vector<Descriptor>> parse_descriptors(const std::string& json_str);

/// Load a descriptor document from disk
[[nodiscard]] plughost_core::Result<std::vector<Descriptor>> load_descriptors(const std::filesystem::path& path);

/// Serialize descriptors to the same JSON format
[[nodiscard]] std::string descriptors_to_json(const std::vector<Descriptor>& descriptors);

} // namespace plughost_plugin
