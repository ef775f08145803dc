/// @file main.cpp
/// @brief Descriptor resolution demo
///
/// Resolves a JSON descriptor document and prints what happened to every
/// descriptor, followed by the final load order.
///
/// Usage: resolve_demo <descriptors.json> [config.json]

#include <plughost/plugin/plugin.hpp>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

namespace {

/// Log a multi-line block one line at a time
void log_block(const std::string& text) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        spdlog::info("{}", line);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
    if (argc < 2 || argc > 3) {
        spdlog::error("Usage: {} <descriptors.json> [config.json]", argv[0]);
        return EXIT_FAILURE;
    }

    plughost_plugin::HostConfig config;
    if (argc == 3) {
        auto loaded = plughost_plugin::HostConfig::load(argv[2]);
        if (!loaded) {
            spdlog::error("{}", plughost_core::build_error_chain(loaded.error()));
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    config.apply_logging();

    spdlog::info("=== Descriptor Resolution Demo ===");
    spdlog::info("Cycle policy: {}", plughost_plugin::cycle_policy_name(config.resolver.cycle_policy));

    auto descriptors = plughost_plugin::load_descriptors(argv[1]);
    if (!descriptors) {
        spdlog::error("{}", plughost_core::build_error_chain(descriptors.error()));
        return EXIT_FAILURE;
    }
    spdlog::info("Loaded {} descriptors from {}", descriptors->size(), argv[1]);

    std::optional<plughost_plugin::JsonManifestStore> manifest;
    if (!config.manifest_path.empty()) {
        auto opened = plughost_plugin::JsonManifestStore::open(config.manifest_path);
        if (!opened) {
            spdlog::error("{}", plughost_core::build_error_chain(opened.error()));
            return EXIT_FAILURE;
        }
        manifest = std::move(*opened);

        std::size_t added = plughost_plugin::synchronize(*manifest, "demo", *descriptors);
        spdlog::info("Manifest {}: {} states, {} new", config.manifest_path.string(),
            manifest->states().size(), added);
    }

    plughost_plugin::DescriptorResolver resolver(config.resolver);

    auto report = resolver.report(*descriptors, manifest ? &*manifest : nullptr);
    if (!report) {
        spdlog::error("{}", plughost_core::build_error_chain(report.error()));
        return EXIT_FAILURE;
    }

    spdlog::info("=== Resolution Report ===");
    log_block(report->format());

    std::vector<const plughost_plugin::Descriptor*> ordered(descriptors->size(), nullptr);
    std::size_t resolved = 0;
    for (const auto& row : report->rows) {
        if (row.sort_index) {
            ordered[*row.sort_index] = &(*descriptors)[row.input_position];
            ++resolved;
        }
    }
    ordered.resize(resolved);

    spdlog::info("=== Load Order ===");
    for (std::size_t i = 0; i < ordered.size(); ++i) {
        spdlog::info("  {}. {} v{}", i + 1, ordered[i]->label(), ordered[i]->version);
    }

    if (manifest) {
        plughost_plugin::record_load_order(*manifest, ordered);
        if (auto saved = manifest->save(); !saved) {
            spdlog::error("{}", plughost_core::build_error_chain(saved.error()));
            return EXIT_FAILURE;
        }
    }

    plughost_core::shutdown_logging();
    return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        spdlog::critical("Unhandled exception: {}", e.what());
        return EXIT_FAILURE;
    }
}
