#pragma once

/// @file plugin.hpp
/// @brief Main include file for plughost_plugin module
///
/// This header includes all public descriptor resolution headers.
///
/// # Overview
///
/// Plugins contribute descriptors to extension points (services, pages,
/// settings panels, config schemas). Before the host consumes an
/// extension point it resolves the merged batch:
///
/// | Relation | Effect |
/// |----------|--------|
/// | depends_on | Descriptor is dropped unless every target exists in range |
/// | conflicts_with | Declaring descriptor is dropped if a target is present |
/// | load_before | Descriptor is ordered ahead of the target |
/// | load_after | Descriptor is ordered behind the target |
///
/// Duplicated descriptor ids keep the first occurrence. Ties in the order
/// are broken by input position, so the result depends only on the input.
///
/// # Basic Usage
///
/// ```cpp
/// #include <plughost/plugin/plugin.hpp>
///
/// using namespace plughost_plugin;
///
/// DescriptorResolver resolver;
/// auto ordered = resolver.resolve(descriptors);
/// if (!ordered) {
///     spdlog::error("Resolution failed: {}", ordered.error().message());
/// }
/// for (const auto& d : *ordered) {
///     register_page(d);
/// }
/// ```
///
/// # Version Windows
///
/// Every reference carries an inclusive `[min, max]` window compared by
/// semantic-version precedence, so `1.10.0` is newer than `1.9.0` and
/// `1.0.0-rc.1` is older than `1.0.0`. A version that fails to parse never
/// matches.

#include "fwd.hpp"
#include "version.hpp"
#include "reference.hpp"
#include "descriptor.hpp"
#include "config.hpp"
#include "topo_sort.hpp"
#include "context.hpp"
#include "resolver.hpp"
#include "extension_point.hpp"
#include "manifest.hpp"
#include "descriptor_io.hpp"
