/// @file manifest.cpp
/// @brief Enablement manifest stores and operations

#include <plughost/plugin/manifest.hpp>
#include <plughost/core/log.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace plughost_plugin {

using plughost_core::Err;
using plughost_core::Error;
using plughost_core::ErrorCode;
using plughost_core::ManifestError;
using plughost_core::Ok;
using plughost_core::Result;

namespace {

/// Parse a UUID field of a state entry
Result<Uuid> read_uuid(const nlohmann::json& j, const char* key, std::size_t index) {
    if (!j.contains(key) || !j[key].is_string()) {
        return Err<Uuid>(Error(ErrorCode::ParseError,
            "descriptor_states[" + std::to_string(index) + "] missing '" + key + "' field"));
    }
    auto id = Uuid::parse(j[key].get<std::string>());
    if (!id) {
        return Err<Uuid>(Error(ErrorCode::ParseError,
            "descriptor_states[" + std::to_string(index) + "]." + key + ": " + id.error().message()));
    }
    return id;
}

Result<DescriptorState> parse_state(const nlohmann::json& j, std::size_t index) {
    if (!j.is_object()) {
        return Err<DescriptorState>(Error(ErrorCode::ParseError,
            "descriptor_states[" + std::to_string(index) + "] must be an object"));
    }

    DescriptorState state;

    auto owner = read_uuid(j, "owner_id", index);
    if (!owner) return Err<DescriptorState>(owner.error());
    state.owner_id = *owner;

    auto descriptor = read_uuid(j, "descriptor_id", index);
    if (!descriptor) return Err<DescriptorState>(descriptor.error());
    state.descriptor_id = *descriptor;

    if (j.contains("extension_point") && j["extension_point"].is_string()) {
        state.extension_point = j["extension_point"].get<std::string>();
    }
    if (j.contains("name") && j["name"].is_string()) {
        state.name = j["name"].get<std::string>();
    }
    if (j.contains("enabled") && j["enabled"].is_boolean()) {
        state.enabled = j["enabled"].get<bool>();
    }
    if (j.contains("system") && j["system"].is_boolean()) {
        state.system = j["system"].get<bool>();
    }
    if (j.contains("load_order") && j["load_order"].is_number_unsigned()) {
        state.load_order = j["load_order"].get<std::size_t>();
    }

    return Ok(std::move(state));
}

} // anonymous namespace

// =============================================================================
// ManifestStore
// =============================================================================

std::optional<DescriptorState> ManifestStore::find(const Uuid& owner, const Uuid& descriptor) const {
    for (const auto& state : states()) {
        if (state.same_identity(owner, descriptor)) {
            return state;
        }
    }
    return std::nullopt;
}

bool ManifestStore::is_enabled(const Uuid& owner, const Uuid& descriptor) const {
    auto state = find(owner, descriptor);
    return !state || state->enabled;
}

Result<void> ManifestStore::set_enabled(const Uuid& owner, const Uuid& descriptor, bool enabled) {
    auto state = find(owner, descriptor);
    if (!state) {
        return Err(ManifestError::unknown_descriptor(descriptor.to_string()));
    }
    if (state->system && !enabled) {
        return Err(ManifestError::system_descriptor(descriptor.to_string()));
    }

    if (state->enabled != enabled) {
        plughost_core::log_structured(spdlog::level::info, "plughost.manifest",
            enabled ? "Descriptor enabled" : "Descriptor disabled",
            {{"descriptor", descriptor.to_string()},
             {"name", state->name},
             {"extension_point", state->extension_point}});
    }

    state->enabled = enabled;
    upsert(std::move(*state));
    return Ok();
}

// =============================================================================
// MemoryManifestStore
// =============================================================================

void MemoryManifestStore::upsert(DescriptorState state) {
    for (auto& existing : m_states) {
        if (existing.same_identity(state.owner_id, state.descriptor_id)) {
            existing = std::move(state);
            return;
        }
    }
    m_states.push_back(std::move(state));
}

// =============================================================================
// JsonManifestStore
// =============================================================================

Result<JsonManifestStore> JsonManifestStore::from_json_string(
    const std::string& json_str, const std::filesystem::path& path) {

    const std::string file = path.string();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<JsonManifestStore>(ManifestError::parse_failed(file, e.what()));
    }

    if (!j.is_object()) {
        return Err<JsonManifestStore>(ManifestError::parse_failed(file, "root must be an object"));
    }

    JsonManifestStore store(path);

    if (!j.contains("descriptor_states")) {
        return Ok(std::move(store));
    }
    if (!j["descriptor_states"].is_array()) {
        return Err<JsonManifestStore>(ManifestError::parse_failed(file, "'descriptor_states' must be an array"));
    }

    std::size_t index = 0;
    for (const auto& entry : j["descriptor_states"]) {
        auto state = parse_state(entry, index++);
        if (!state) {
            return Err<JsonManifestStore>(ManifestError::parse_failed(file, state.error().message()));
        }
        store.upsert(std::move(*state));
    }

    return Ok(std::move(store));
}

Result<JsonManifestStore> JsonManifestStore::open(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        plughost_core::manifest_logger()->info("No manifest at {}, starting empty", path.string());
        return Ok(JsonManifestStore(path));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<JsonManifestStore>(ManifestError::not_found(path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto store = from_json_string(buffer.str(), path);
    if (store) {
        plughost_core::manifest_logger()->debug("Loaded {} descriptor states from {}",
            store->states().size(), path.string());
    }
    return store;
}

std::string JsonManifestStore::to_json_string() const {
    nlohmann::json states = nlohmann::json::array();
    for (const auto& state : this->states()) {
        nlohmann::json entry;
        entry["owner_id"] = state.owner_id.to_string();
        entry["descriptor_id"] = state.descriptor_id.to_string();
        entry["extension_point"] = state.extension_point;
        entry["name"] = state.name;
        entry["enabled"] = state.enabled;
        entry["system"] = state.system;
        if (state.load_order) {
            entry["load_order"] = *state.load_order;
        } else {
            entry["load_order"] = nullptr;
        }
        states.push_back(std::move(entry));
    }

    nlohmann::json root;
    root["descriptor_states"] = std::move(states);
    return root.dump(2);
}

Result<void> JsonManifestStore::save() {
    if (m_path.empty()) {
        return Err(ManifestError::write_failed("", "manifest has no path"));
    }

    std::error_code ec;
    if (m_path.has_parent_path()) {
        std::filesystem::create_directories(m_path.parent_path(), ec);
        if (ec) {
            return Err(ManifestError::write_failed(m_path.string(), ec.message()));
        }
    }

    std::filesystem::path temp = m_path;
    temp += ".tmp";

    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            return Err(ManifestError::write_failed(m_path.string(), "cannot open " + temp.string()));
        }
        out << to_json_string() << "\n";
        out.flush();
        if (!out) {
            return Err(ManifestError::write_failed(m_path.string(), "write to " + temp.string() + " failed"));
        }
    }

    std::filesystem::rename(temp, m_path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        return Err(ManifestError::write_failed(m_path.string(), ec.message()));
    }

    plughost_core::manifest_logger()->debug("Saved {} descriptor states to {}", states().size(), m_path.string());
    return Ok();
}

// =============================================================================
// Manifest Operations
// =============================================================================

std::size_t synchronize(ManifestStore& store, const std::string& extension_point,
                        const std::vector<const Descriptor*>& descriptors) {
    std::size_t added = 0;

    for (const Descriptor* d : descriptors) {
        if (d == nullptr || store.find(d->owner_id, d->descriptor_id)) {
            continue;
        }

        DescriptorState state;
        state.owner_id = d->owner_id;
        state.descriptor_id = d->descriptor_id;
        state.extension_point = extension_point;
        state.name = d->name;
        store.upsert(std::move(state));
        ++added;

        plughost_core::manifest_logger()->info("Discovered descriptor '{}' for {}", d->label(), extension_point);
    }

    return added;
}

std::vector<bool> enabled_mask(const ManifestStore& store, const std::vector<const Descriptor*>& descriptors) {
    std::vector<bool> mask;
    mask.reserve(descriptors.size());

    for (const Descriptor* d : descriptors) {
        bool enabled = d != nullptr && store.is_enabled(d->owner_id, d->descriptor_id);
        if (d != nullptr && !enabled) {
            plughost_core::manifest_logger()->warn("Descriptor '{}' v{} is disabled in the manifest; skipping.",
                d->label(), d->version);
        }
        mask.push_back(enabled);
    }

    return mask;
}

std::size_t record_load_order(ManifestStore& store, const std::vector<const Descriptor*>& resolved) {
    std::size_t changed = 0;

    for (std::size_t i = 0; i < resolved.size(); ++i) {
        const Descriptor* d = resolved[i];
        if (d == nullptr) {
            continue;
        }

        auto state = store.find(d->owner_id, d->descriptor_id);
        if (!state || state->load_order == i) {
            continue;
        }

        state->load_order = i;
        store.upsert(std::move(*state));
        ++changed;
    }

    return changed;
}

} // namespace plughost_plugin
