// plughost_plugin manifest store tests

#include <catch2/catch_test_macros.hpp>
#include <plughost/plugin/manifest.hpp>
#include <plughost/plugin/resolver.hpp>

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace plughost_plugin;
using plughost_core::ErrorCode;

namespace {

const Uuid OWNER = Uuid::from_name("manifest.plugin");

Descriptor make(const std::string& name) {
    return Descriptor(OWNER, Uuid::from_name(name), "1.0.0", name);
}

/// Scratch directory removed on scope exit
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : m_path(std::filesystem::temp_directory_path() / ("plughost_test_" + name)) {
        std::filesystem::remove_all(m_path);
        std::filesystem::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(m_path, ec);
    }

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
};

} // anonymous namespace

TEST_CASE("ManifestStore enablement", "[plugin][manifest]") {
    MemoryManifestStore store;
    std::vector<Descriptor> discovered{make("A"), make("B"), make("C")};

    SECTION("synchronize adds new descriptors once") {
        REQUIRE(synchronize(store, "panels", discovered) == 3);
        REQUIRE(synchronize(store, "panels", discovered) == 0);
        REQUIRE(store.states().size() == 3);

        auto state = store.find(OWNER, Uuid::from_name("B"));
        REQUIRE(state.has_value());
        REQUIRE(state->enabled);
        REQUIRE(state->extension_point == "panels");
        REQUIRE(state->name == "B");
        REQUIRE_FALSE(state->load_order.has_value());
    }

    SECTION("unknown descriptors are enabled") {
        REQUIRE(store.is_enabled(OWNER, Uuid::from_name("Unknown")));
    }

    SECTION("existing choices survive synchronize") {
        synchronize(store, "panels", discovered);
        REQUIRE(store.set_enabled(OWNER, Uuid::from_name("A"), false).is_ok());

        discovered.push_back(make("D"));
        REQUIRE(synchronize(store, "panels", discovered) == 1);
        REQUIRE_FALSE(store.is_enabled(OWNER, Uuid::from_name("A")));
        REQUIRE(store.is_enabled(OWNER, Uuid::from_name("D")));
    }

    SECTION("set_enabled on unknown descriptor") {
        auto r = store.set_enabled(OWNER, Uuid::from_name("Unknown"), false);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::NotFound);
    }

    SECTION("system descriptors cannot be disabled") {
        DescriptorState state;
        state.owner_id = OWNER;
        state.descriptor_id = Uuid::from_name("Core");
        state.system = true;
        store.upsert(state);

        auto r = store.set_enabled(OWNER, state.descriptor_id, false);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(store.is_enabled(OWNER, state.descriptor_id));
        REQUIRE(store.set_enabled(OWNER, state.descriptor_id, true).is_ok());
    }

    SECTION("filter_enabled splits by state") {
        synchronize(store, "panels", discovered);
        REQUIRE(store.set_enabled(OWNER, Uuid::from_name("B"), false).is_ok());

        auto filtered = filter_enabled(store, discovered);
        REQUIRE(filtered.enabled.size() == 2);
        REQUIRE(filtered.disabled.size() == 1);
        REQUIRE(filtered.disabled[0].name == "B");
        REQUIRE(filtered.enabled[0].name == "A");
        REQUIRE(filtered.enabled[1].name == "C");
    }

    SECTION("record_load_order stores the resolved index") {
        synchronize(store, "panels", discovered);
        discovered[0].load_after.push_back(DescriptorReference(OWNER, Uuid::from_name("C"), "1.0.0", "1.0.0"));

        DescriptorResolver resolver;
        auto ordered = resolver.resolve(discovered);
        REQUIRE(ordered.is_ok());

        REQUIRE(record_load_order(store, *ordered) == 3);
        REQUIRE(store.find(OWNER, Uuid::from_name("B"))->load_order == 0u);
        REQUIRE(store.find(OWNER, Uuid::from_name("C"))->load_order == 1u);
        REQUIRE(store.find(OWNER, Uuid::from_name("A"))->load_order == 2u);

        REQUIRE(record_load_order(store, *ordered) == 0);
    }
}

TEST_CASE("JsonManifestStore persistence", "[plugin][manifest]") {
    TempDir dir("manifest");
    auto path = dir.path() / "nested" / "plugins.manifest.json";

    SECTION("missing file opens empty") {
        auto store = JsonManifestStore::open(path);
        REQUIRE(store.is_ok());
        REQUIRE(store->states().empty());
        REQUIRE(store->path() == path);
    }

    SECTION("save then reopen") {
        {
            auto store = JsonManifestStore::open(path);
            REQUIRE(store.is_ok());
            synchronize(*store, "services", std::vector<Descriptor>{make("A"), make("B")});
            REQUIRE(store->set_enabled(OWNER, Uuid::from_name("B"), false).is_ok());
            record_load_order(*store, std::vector<Descriptor>{make("A")});
            REQUIRE(store->save().is_ok());
        }

        REQUIRE(std::filesystem::exists(path));
        REQUIRE_FALSE(std::filesystem::exists(path.string() + ".tmp"));

        auto reopened = JsonManifestStore::open(path);
        REQUIRE(reopened.is_ok());
        REQUIRE(reopened->states().size() == 2);
        REQUIRE(reopened->is_enabled(OWNER, Uuid::from_name("A")));
        REQUIRE_FALSE(reopened->is_enabled(OWNER, Uuid::from_name("B")));
        REQUIRE(reopened->find(OWNER, Uuid::from_name("A"))->load_order == 0u);
        REQUIRE_FALSE(reopened->find(OWNER, Uuid::from_name("B"))->load_order.has_value());
        REQUIRE(reopened->find(OWNER, Uuid::from_name("A"))->extension_point == "services");
    }

    SECTION("malformed file") {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream(path) << "{ not json";

        auto store = JsonManifestStore::open(path);
        REQUIRE(store.is_err());
        REQUIRE(store.error().code() == ErrorCode::ParseError);
        REQUIRE(store.error().is<plughost_core::ManifestError>());
    }

    SECTION("bad entry names its index") {
        auto store = JsonManifestStore::from_json_string(
            R"({"descriptor_states": [
                {"owner_id": ")" + OWNER.to_string() + R"(", "descriptor_id": ")" + OWNER.to_string() + R"("},
                {"owner_id": "nope", "descriptor_id": "nope"}
            ]})");
        REQUIRE(store.is_err());
        REQUIRE(store.error().message().find("descriptor_states[1]") != std::string::npos);
    }

    SECTION("store without a path cannot save") {
        auto store = JsonManifestStore::from_json_string("{}");
        REQUIRE(store.is_ok());
        auto saved = store->save();
        REQUIRE(saved.is_err());
        REQUIRE(saved.error().code() == ErrorCode::IOError);
    }
}
