/// @file descriptor_io.cpp
/// @brief Descriptor document parsing

#include <plughost/plugin/descriptor_io.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace plughost_plugin {

using plughost_core::Err;
using plughost_core::Error;
using plughost_core::ErrorCode;
using plughost_core::Ok;
using plughost_core::Result;

namespace {

Error parse_error(const std::string& where, const std::string& what) {
    return Error(ErrorCode::ParseError, where + ": " + what);
}

Result<Uuid> read_uuid(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_string()) {
        return Err<Uuid>(parse_error(where, std::string("missing '") + key + "' field"));
    }
    auto id = Uuid::parse(j[key].get<std::string>());
    if (!id) {
        return Err<Uuid>(parse_error(where + "." + key, id.error().message()));
    }
    return id;
}

Result<std::string> read_string(const nlohmann::json& j, const char* key, const std::string& where) {
    if (!j.contains(key) || !j[key].is_string()) {
        return Err<std::string>(parse_error(where, std::string("missing '") + key + "' field"));
    }
    return Ok(j[key].get<std::string>());
}

Result<DescriptorReference> parse_reference(const nlohmann::json& j, const std::string& where) {
    if (!j.is_object()) {
        return Err<DescriptorReference>(parse_error(where, "reference must be an object"));
    }

    auto owner = read_uuid(j, "owner", where);
    if (!owner) return Err<DescriptorReference>(owner.error());

    auto id = read_uuid(j, "id", where);
    if (!id) return Err<DescriptorReference>(id.error());

    auto min = read_string(j, "min", where);
    if (!min) return Err<DescriptorReference>(min.error());

    auto max = read_string(j, "max", where);
    if (!max) return Err<DescriptorReference>(max.error());

    return Ok(DescriptorReference(*owner, *id, std::move(*min), std::move(*max)));
}

/// Parse an optional relation list into @p out
Result<void> parse_relation(const nlohmann::json& j, const char* key, const std::string& where,
                            std::vector<DescriptorReference>& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_array()) {
        return Err(parse_error(where, std::string("'") + key + "' must be an array"));
    }

    std::size_t index = 0;
    for (const auto& item : j[key]) {
        auto ref = parse_reference(item, where + "." + key + "[" + std::to_string(index++) + "]");
        if (!ref) {
            return Err(ref.error());
        }
        out.push_back(std::move(*ref));
    }
    return Ok();
}

Result<Descriptor> parse_descriptor(const nlohmann::json& j, std::size_t index) {
    const std::string where = "descriptor[" + std::to_string(index) + "]";

    if (!j.is_object()) {
        return Err<Descriptor>(parse_error(where, "must be an object"));
    }

    auto owner = read_uuid(j, "owner", where);
    if (!owner) return Err<Descriptor>(owner.error());

    auto id = read_uuid(j, "id", where);
    if (!id) return Err<Descriptor>(id.error());

    auto version = read_string(j, "version", where);
    if (!version) return Err<Descriptor>(version.error());

    Descriptor d(*owner, *id, std::move(*version));

    if (j.contains("name")) {
        if (!j["name"].is_string()) {
            return Err<Descriptor>(parse_error(where, "'name' must be a string"));
        }
        d.name = j["name"].get<std::string>();
    }

    if (auto r = parse_relation(j, "depends_on", where, d.depends_on); !r) return Err<Descriptor>(r.error());
    if (auto r = parse_relation(j, "conflicts_with", where, d.conflicts_with); !r) return Err<Descriptor>(r.error());
    if (auto r = parse_relation(j, "load_before", where, d.load_before); !r) return Err<Descriptor>(r.error());
    if (auto r = parse_relation(j, "load_after", where, d.load_after); !r) return Err<Descriptor>(r.error());

    return Ok(std::move(d));
}

nlohmann::json references_to_json(const std::vector<DescriptorReference>& refs) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& ref : refs) {
        arr.push_back({
            {"owner", ref.owner_id.to_string()},
            {"id", ref.descriptor_id.to_string()},
            {"min", ref.min_version},
            {"max", ref.max_version},
        });
    }
    return arr;
}

} // anonymous namespace

Result<std::vector<Descriptor>> parse_descriptors(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<std::vector<Descriptor>>(Error(ErrorCode::ParseError,
            std::string("JSON parse error in descriptor document: ") + e.what()));
    }

    if (!j.is_array()) {
        return Err<std::vector<Descriptor>>(Error(ErrorCode::ParseError,
            "Descriptor document must be a JSON array"));
    }

    std::vector<Descriptor> descriptors;
    descriptors.reserve(j.size());

    std::size_t index = 0;
    for (const auto& item : j) {
        auto d = parse_descriptor(item, index++);
        if (!d) {
            return Err<std::vector<Descriptor>>(d.error());
        }
        descriptors.push_back(std::move(*d));
    }

    return Ok(std::move(descriptors));
}

Result<std::vector<Descriptor>> load_descriptors(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<std::vector<Descriptor>>(Error(ErrorCode::NotFound,
            "Descriptor document not found: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_descriptors(buffer.str());
    if (!result) {
        return Err<std::vector<Descriptor>>(Error(result.error()).with_context("path", path.string()));
    }
    return result;
}

std::string descriptors_to_json(const std::vector<Descriptor>& descriptors) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& d : descriptors) {
        nlohmann::json entry;
        entry["owner"] = d.owner_id.to_string();
        entry["id"] = d.descriptor_id.to_string();
        entry["version"] = d.version;
        if (!d.name.empty()) {
            entry["name"] = d.name;
        }
        entry["depends_on"] = references_to_json(d.depends_on);
        entry["conflicts_with"] = references_to_json(d.conflicts_with);
        entry["load_before"] = references_to_json(d.load_before);
        entry["load_after"] = references_to_json(d.load_after);
        arr.push_back(std::move(entry));
    }
    return arr.dump(2);
}

} // namespace plughost_plugin
