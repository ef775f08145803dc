#pragma once

/// @file descriptor.hpp
/// @brief Descriptor base record shared by every extension point
///
/// Extension points derive their own descriptor types from Descriptor and
/// add payload fields (a page title, a service factory, a config schema).
/// The resolver only reads the fields declared here.

#include "fwd.hpp"
#include "reference.hpp"

#include <concepts>
#include <string>
#include <vector>

namespace plughost_plugin {

// =============================================================================
// Descriptor
// =============================================================================

/// One plugin-contributed capability and its relation constraints
struct Descriptor {
    Uuid owner_id;        ///< Plugin that provides the descriptor
    Uuid descriptor_id;   ///< Unique within one resolution batch
    std::string version;  ///< Semantic version of the descriptor
    std::string name;     ///< Optional label used in diagnostics

    std::vector<DescriptorReference> load_before;     ///< Targets ordered after this one
    std::vector<DescriptorReference> load_after;      ///< Targets ordered before this one
    std::vector<DescriptorReference> depends_on;      ///< Required targets (all must match)
    std::vector<DescriptorReference> conflicts_with;  ///< Targets that exclude this one

    Descriptor() = default;

    Descriptor(Uuid owner, Uuid id, std::string ver, std::string label = {})
        : owner_id(owner)
        , descriptor_id(id)
        , version(std::move(ver))
        , name(std::move(label)) {}

    virtual ~Descriptor() = default;

    Descriptor(const Descriptor&) = default;
    Descriptor& operator=(const Descriptor&) = default;
    Descriptor(Descriptor&&) = default;
    Descriptor& operator=(Descriptor&&) = default;

    /// Name when present, otherwise the descriptor id
    [[nodiscard]] std::string label() const {
        return name.empty() ? descriptor_id.to_string() : name;
    }

    /// Reference that matches exactly this descriptor's identity and version
    [[nodiscard]] DescriptorReference reference() const {
        return DescriptorReference{owner_id, descriptor_id, version, version};
    }
};

/// Types the resolver accepts: Descriptor or anything derived from it
template<typename T>
concept DescriptorType = std::derived_from<T, Descriptor> && std::copy_constructible<T>;

} // namespace plughost_plugin
