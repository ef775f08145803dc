#pragma once

/// @file manifest.hpp
/// @brief Persisted enable/disable state per descriptor
///
/// The manifest belongs to the host's configuration layer, not to the
/// resolver. Callers filter descriptors through a ManifestStore before
/// resolving and write the resolved order back afterwards:
///
/// ```cpp
/// auto store = JsonManifestStore::open("plugins.manifest.json");
/// synchronize(*store, "panels", discovered);
/// auto filtered = filter_enabled(*store, discovered);
/// auto ordered = resolver.resolve(filtered.enabled);
/// record_load_order(*store, *ordered);
/// store->save();
/// ```
///
/// Manifest file format:
/// ```json
/// {
///   "descriptor_states": [
///     { "owner_id": "...", "descriptor_id": "...", "extension_point": "panels",
///       "name": "Inspector", "enabled": true, "system": false, "load_order": 3 }
///   ]
/// }
/// ```

#include "fwd.hpp"
#include "descriptor.hpp"
#include <plughost/core/error.hpp>
#include <plughost/core/uuid.hpp>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace plughost_plugin {

// =============================================================================
// DescriptorState
// =============================================================================

/// Persisted state of one descriptor
struct DescriptorState {
    Uuid owner_id;
    Uuid descriptor_id;
    std::string extension_point;
    std::string name;
    bool enabled = true;
    bool system = false;                    ///< System descriptors cannot be disabled
    std::optional<std::size_t> load_order;  ///< Unassigned until first resolved

    [[nodiscard]] bool same_identity(const Uuid& owner, const Uuid& descriptor) const noexcept {
        return owner_id == owner && descriptor_id == descriptor;
    }
};

// =============================================================================
// ManifestStore
// =============================================================================

/// Port to the enablement manifest
class ManifestStore {
public:
    virtual ~ManifestStore() = default;

    /// All known states, in insertion order
    [[nodiscard]] virtual const std::vector<DescriptorState>& states() const = 0;

    /// Insert a state or replace the one with the same identity
    virtual void upsert(DescriptorState state) = 0;

    /// Persist the current states
    [[nodiscard]] virtual plughost_core::Result<void> save() = 0;

    /// State for a descriptor identity
    [[nodiscard]] std::optional<DescriptorState> find(const Uuid& owner, const Uuid& descriptor) const;

    /// Unknown descriptors count as enabled
    [[nodiscard]] bool is_enabled(const Uuid& owner, const Uuid& descriptor) const;

    /// Change the enabled flag of a known descriptor
    ///
    /// Disabling a system descriptor is InvalidArgument; an unknown identity
    /// is NotFound.
    [[nodiscard]] plughost_core::Result<void> set_enabled(const Uuid& owner, const Uuid& descriptor, bool enabled);
};

/// In-memory manifest; save() is a no-op
class MemoryManifestStore : public ManifestStore {
public:
    MemoryManifestStore() = default;
    explicit MemoryManifestStore(std::vector<DescriptorState> states) : m_states(std::move(states)) {}

    [[nodiscard]] const std::vector<DescriptorState>& states() const override { return m_states; }
    void upsert(DescriptorState state) override;
    [[nodiscard]] plughost_core::Result<void> save() override { return plughost_core::Ok(); }

private:
    std::vector<DescriptorState> m_states;
};

/// Manifest persisted as a JSON file
class JsonManifestStore : public MemoryManifestStore {
public:
    /// Load a manifest; a missing file gives an empty store bound to @p path
    [[nodiscard]] static plughost_core::Result<JsonManifestStore> open(const std::filesystem::path& path);

    /// Parse manifest JSON text; the store is bound to @p path for save()
    [[nodiscard]] static plughost_core::Result<JsonManifestStore> from_json_string(
        const std::string& json_str, const std::filesystem::path& path = {});

    /// Serialize to JSON text
    [[nodiscard]] std::string to_json_string() const;

    /// Write through a temporary file and rename it over the target
    [[nodiscard]] plughost_core::Result<void> save() override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    explicit JsonManifestStore(std::filesystem::path path) : m_path(std::move(path)) {}

    std::filesystem::path m_path;
};

// =============================================================================
// Manifest Operations
// =============================================================================

/// Add an enabled state for each descriptor the store has not seen
///
/// Existing choices are kept. Returns the number of states added.
std::size_t synchronize(ManifestStore& store, const std::string& extension_point,
                        const std::vector<const Descriptor*>& descriptors);

template<DescriptorType T>
std::size_t synchronize(ManifestStore& store, const std::string& extension_point,
                        const std::vector<T>& descriptors) {
    std::vector<const Descriptor*> pointers;
    pointers.reserve(descriptors.size());
    for (const auto& d : descriptors) {
        pointers.push_back(&d);
    }
    return synchronize(store, extension_point, pointers);
}

/// Per-descriptor enabled flag, logging each disabled descriptor
[[nodiscard]] std::vector<bool> enabled_mask(const ManifestStore& store,
                                             const std::vector<const Descriptor*>& descriptors);

/// Descriptors split by their manifest state
template<DescriptorType T>
struct FilterResult {
    std::vector<T> enabled;
    std::vector<T> disabled;
};

/// Drop descriptors the manifest marks disabled
template<DescriptorType T>
[[nodiscard]] FilterResult<T> filter_enabled(const ManifestStore& store, const std::vector<T>& descriptors) {
    std::vector<const Descriptor*> pointers;
    pointers.reserve(descriptors.size());
    for (const auto& d : descriptors) {
        pointers.push_back(&d);
    }

    std::vector<bool> mask = enabled_mask(store, pointers);

    FilterResult<T> result;
    for (std::size_t i = 0; i < descriptors.size(); ++i) {
        (mask[i] ? result.enabled : result.disabled).push_back(descriptors[i]);
    }
    return result;
}

/// Store each resolved descriptor's index as its load order
///
/// Only descriptors with a manifest state are updated. Returns the number
/// of states changed.
std::size_t record_load_order(ManifestStore& store, const std::vector<const Descriptor*>& resolved);

template<DescriptorType T>
std::size_t record_load_order(ManifestStore& store, const std::vector<T>& resolved) {
    std::vector<const Descriptor*> pointers;
    pointers.reserve(resolved.size());
    for (const auto& d : resolved) {
        pointers.push_back(&d);
    }
    return record_load_order(store, pointers);
}

} // namespace plughost_plugin
