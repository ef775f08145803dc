#pragma once

/// @file extension_point.hpp
/// @brief Explicit registration of extension points
///
/// An extension point is a provider interface whose implementations each
/// contribute a batch of descriptors. Registering the interface records how
/// to obtain a provider's descriptors and which way the merged, resolved
/// result is consumed:
///
/// ```cpp
/// struct PanelProvider {
///     virtual ~PanelProvider() = default;
///     virtual std::vector<PanelDescriptor> panels() const = 0;
/// };
///
/// ExtensionRegistry registry;
/// registry.add<PanelProvider, PanelDescriptor>("panels", &PanelProvider::panels);
///
/// auto ordered = registry.resolve_and_order<PanelProvider, PanelDescriptor>(resolver, providers);
/// ```
///
/// SortDirection::Reverse hands back the resolved order reversed, for
/// teardown where resources are released opposite to acquisition.

#include "fwd.hpp"
#include "descriptor.hpp"
#include "resolver.hpp"
#include <plughost/core/error.hpp>

#include <algorithm>
#include <any>
#include <cstdint>
#include <functional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <vector>

namespace plughost_plugin {

/// Order in which a resolved extension point is consumed
enum class SortDirection : std::uint8_t {
    Forward,
    Reverse,
};

[[nodiscard]] inline const char* sort_direction_name(SortDirection direction) noexcept {
    switch (direction) {
        case SortDirection::Forward: return "forward";
        case SortDirection::Reverse: return "reverse";
    }
    return "unknown";
}

/// Registration metadata of one extension point
struct ExtensionPointInfo {
    std::string name;
    std::type_index provider_type;
    std::type_index descriptor_type;
    SortDirection direction = SortDirection::Forward;

    ExtensionPointInfo() : provider_type(typeid(void)), descriptor_type(typeid(void)) {}

    ExtensionPointInfo(std::string n, std::type_index provider, std::type_index descriptor, SortDirection dir)
        : name(std::move(n)), provider_type(provider), descriptor_type(descriptor), direction(dir) {}
};

// =============================================================================
// ExtensionRegistry
// =============================================================================

/// Static table: provider interface -> (accessor, direction)
class ExtensionRegistry {
public:
    template<typename TProvider, DescriptorType TDescriptor>
    using Accessor = std::function<std::vector<TDescriptor>(const TProvider&)>;

    ExtensionRegistry() = default;

    /// Register an extension point with an arbitrary accessor
    ///
    /// A provider type can be registered once; a second registration is
    /// AlreadyExists.
    template<typename TProvider, DescriptorType TDescriptor>
    plughost_core::Result<void> add(
        std::string name,
        Accessor<TProvider, TDescriptor> accessor,
        SortDirection direction = SortDirection::Forward) {

        if (!accessor) {
            return plughost_core::Err(plughost_core::Error(plughost_core::ErrorCode::InvalidArgument,
                "Extension point '" + name + "' has no accessor"));
        }

        auto type_id = std::type_index(typeid(TProvider));
        auto it = m_entries.find(type_id);
        if (it != m_entries.end()) {
            return plughost_core::Err(plughost_core::Error(plughost_core::ErrorCode::AlreadyExists,
                "Provider type is already registered as extension point '" + it->second.info.name + "'"));
        }

        Entry entry;
        entry.info = ExtensionPointInfo(std::move(name), type_id, std::type_index(typeid(TDescriptor)), direction);
        entry.accessor = std::move(accessor);
        m_entries.emplace(type_id, std::move(entry));
        return plughost_core::Ok();
    }

    /// Register an extension point whose accessor is a const member function
    template<typename TProvider, DescriptorType TDescriptor>
    plughost_core::Result<void> add(
        std::string name,
        std::vector<TDescriptor> (TProvider::*accessor)() const,
        SortDirection direction = SortDirection::Forward) {

        if (accessor == nullptr) {
            return add<TProvider, TDescriptor>(std::move(name), Accessor<TProvider, TDescriptor>{}, direction);
        }
        return add<TProvider, TDescriptor>(std::move(name),
            Accessor<TProvider, TDescriptor>([accessor](const TProvider& provider) {
                return (provider.*accessor)();
            }),
            direction);
    }

    /// Check if a provider type is registered
    template<typename TProvider>
    [[nodiscard]] bool contains() const {
        return m_entries.count(std::type_index(typeid(TProvider))) > 0;
    }

    /// Registration metadata for a provider type, or nullptr
    template<typename TProvider>
    [[nodiscard]] const ExtensionPointInfo* info() const {
        auto it = m_entries.find(std::type_index(typeid(TProvider)));
        return it != m_entries.end() ? &it->second.info : nullptr;
    }

    /// All registered extension points, sorted by name
    [[nodiscard]] std::vector<ExtensionPointInfo> points() const {
        std::vector<ExtensionPointInfo> result;
        result.reserve(m_entries.size());
        for (const auto& [_, entry] : m_entries) {
            result.push_back(entry.info);
        }
        std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
            return a.name < b.name;
        });
        return result;
    }

    [[nodiscard]] std::size_t size() const noexcept { return m_entries.size(); }

    /// Merge the descriptors of every provider, in provider order
    ///
    /// Null providers are skipped.
    template<typename TProvider, DescriptorType TDescriptor>
    [[nodiscard]] plughost_core::Result<std::vector<TDescriptor>> collect(
        const std::vector<const TProvider*>& providers) const {

        auto accessor = find_accessor<TProvider, TDescriptor>();
        if (!accessor) {
            return plughost_core::Err<std::vector<TDescriptor>>(accessor.error());
        }

        std::vector<TDescriptor> merged;
        for (const TProvider* provider : providers) {
            if (provider == nullptr) {
                continue;
            }
            auto batch = (**accessor)(*provider);
            merged.insert(merged.end(),
                std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
        }
        return plughost_core::Ok(std::move(merged));
    }

    /// Collect, resolve, then apply the registered direction
    template<typename TProvider, DescriptorType TDescriptor>
    [[nodiscard]] plughost_core::Result<std::vector<TDescriptor>> resolve_and_order(
        const DescriptorResolver& resolver,
        const std::vector<const TProvider*>& providers) const {

        auto merged = collect<TProvider, TDescriptor>(providers);
        if (!merged) {
            return merged;
        }

        auto resolved = resolver.resolve(*merged);
        if (!resolved) {
            return resolved;
        }

        if (info<TProvider>()->direction == SortDirection::Reverse) {
            std::reverse(resolved->begin(), resolved->end());
        }
        return resolved;
    }

private:
    struct Entry {
        ExtensionPointInfo info;
        std::any accessor;  ///< Accessor<TProvider, TDescriptor>
    };

    template<typename TProvider, DescriptorType TDescriptor>
    [[nodiscard]] plughost_core::Result<const Accessor<TProvider, TDescriptor>*> find_accessor() const {
        using Result = plughost_core::Result<const Accessor<TProvider, TDescriptor>*>;

        auto it = m_entries.find(std::type_index(typeid(TProvider)));
        if (it == m_entries.end()) {
            return Result(plughost_core::Error(plughost_core::ErrorCode::NotFound,
                std::string("Provider type is not a registered extension point: ") + typeid(TProvider).name()));
        }

        const auto* accessor = std::any_cast<Accessor<TProvider, TDescriptor>>(&it->second.accessor);
        if (accessor == nullptr) {
            return Result(plughost_core::Error(plughost_core::ErrorCode::InvalidArgument,
                "Extension point '" + it->second.info.name + "' does not produce the requested descriptor type"));
        }
        return Result(accessor);
    }

    std::unordered_map<std::type_index, Entry> m_entries;
};

} // namespace plughost_plugin
