/// @file config.cpp
/// @brief Host configuration parsing

#include <plughost/plugin/config.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace plughost_plugin {

namespace {

using plughost_core::Err;
using plughost_core::Error;
using plughost_core::ErrorCode;
using plughost_core::Ok;
using plughost_core::Result;

Result<void> config_error(const std::string& message) {
    return Err(Error(ErrorCode::ParseError, message));
}

/// Read an optional bool field
Result<void> read_bool(const nlohmann::json& obj, const char* key, const char* section, bool& out) {
    if (!obj.contains(key)) {
        return Ok();
    }
    if (!obj[key].is_boolean()) {
        return config_error(std::string("'") + section + "." + key + "' must be a boolean");
    }
    out = obj[key].get<bool>();
    return Ok();
}

/// Read an optional unsigned size field
Result<void> read_size(const nlohmann::json& obj, const char* key, const char* section, std::size_t& out) {
    if (!obj.contains(key)) {
        return Ok();
    }
    if (!obj[key].is_number_unsigned()) {
        return config_error(std::string("'") + section + "." + key + "' must be a non-negative integer");
    }
    out = obj[key].get<std::size_t>();
    return Ok();
}

Result<void> parse_resolver_section(const nlohmann::json& section, ResolverConfig& config) {
    if (!section.is_object()) {
        return config_error("'resolver' must be an object");
    }

    if (section.contains("cycle_policy")) {
        if (!section["cycle_policy"].is_string()) {
            return config_error("'resolver.cycle_policy' must be a string");
        }
        auto text = section["cycle_policy"].get<std::string>();
        auto policy = parse_cycle_policy(text);
        if (!policy) {
            return config_error("Unknown cycle policy: " + text);
        }
        config.cycle_policy = *policy;
    }

    return read_bool(section, "trace_graph", "resolver", config.trace_graph);
}

Result<void> parse_logging_section(const nlohmann::json& section, plughost_core::LogConfig& config) {
    if (!section.is_object()) {
        return config_error("'logging' must be an object");
    }

    if (section.contains("level")) {
        if (!section["level"].is_string()) {
            return config_error("'logging.level' must be a string");
        }
        auto text = section["level"].get<std::string>();
        auto level = plughost_core::parse_log_level(text);
        if (!level) {
            return config_error("Unknown log level: " + text);
        }
        config.level = *level;
    }

    if (section.contains("directory")) {
        if (!section["directory"].is_string()) {
            return config_error("'logging.directory' must be a string");
        }
        config.log_directory = section["directory"].get<std::string>();
    }

    if (auto r = read_bool(section, "console", "logging", config.console_enabled); !r) return r;
    if (auto r = read_bool(section, "file", "logging", config.file_enabled); !r) return r;
    if (auto r = read_size(section, "max_file_size", "logging", config.max_file_size); !r) return r;
    return read_size(section, "max_files", "logging", config.max_files);
}

} // anonymous namespace

// =============================================================================
// CyclePolicy
// =============================================================================

const char* cycle_policy_name(CyclePolicy policy) noexcept {
    switch (policy) {
        case CyclePolicy::BestEffort: return "best_effort";
        case CyclePolicy::Reject: return "reject";
    }
    return "unknown";
}

std::optional<CyclePolicy> parse_cycle_policy(std::string_view str) noexcept {
    if (str == "best_effort") return CyclePolicy::BestEffort;
    if (str == "reject") return CyclePolicy::Reject;
    return std::nullopt;
}

// =============================================================================
// HostConfig
// =============================================================================

Result<HostConfig> HostConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<HostConfig>(Error(ErrorCode::ParseError,
            std::string("JSON parse error in host config: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<HostConfig>(Error(ErrorCode::ParseError, "Host config must be a JSON object"));
    }

    HostConfig config;

    if (j.contains("resolver")) {
        if (auto r = parse_resolver_section(j["resolver"], config.resolver); !r) {
            return Err<HostConfig>(r.error());
        }
    }

    if (j.contains("logging")) {
        if (auto r = parse_logging_section(j["logging"], config.logging); !r) {
            return Err<HostConfig>(r.error());
        }
    }

    if (j.contains("manifest")) {
        if (!j["manifest"].is_string()) {
            return Err<HostConfig>(Error(ErrorCode::ParseError, "'manifest' must be a string"));
        }
        config.manifest_path = j["manifest"].get<std::string>();
    }

    return Ok(std::move(config));
}

Result<HostConfig> HostConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Err<HostConfig>(Error(ErrorCode::NotFound,
            "Host config not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<HostConfig>(Error(ErrorCode::IOError,
            "Failed to open host config: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        return Err<HostConfig>(Error(result.error()).with_context("path", path.string()));
    }

    // Relative manifest paths are relative to the config file
    if (!result->manifest_path.empty() && result->manifest_path.is_relative()) {
        result->manifest_path = path.parent_path() / result->manifest_path;
    }

    return result;
}

void HostConfig::apply_logging() const {
    plughost_core::configure_logging(logging);
}

} // namespace plughost_plugin
