// plughost_plugin ExtensionRegistry tests

#include <catch2/catch_test_macros.hpp>
#include <plughost/plugin/extension_point.hpp>

#include <string>
#include <vector>

using namespace plughost_plugin;
using plughost_core::ErrorCode;

namespace {

const Uuid OWNER = Uuid::from_name("ext.plugin");

struct ServiceDescriptor : Descriptor {
    ServiceDescriptor(const std::string& name, const std::string& version = "1.0.0")
        : Descriptor(OWNER, Uuid::from_name(name), version, name) {}
};

struct PageDescriptor : Descriptor {
    std::string route;

    PageDescriptor(const std::string& name, std::string r)
        : Descriptor(OWNER, Uuid::from_name(name), "1.0.0", name), route(std::move(r)) {}
};

/// Provider interface for services
class ServiceProvider {
public:
    virtual ~ServiceProvider() = default;
    virtual std::vector<ServiceDescriptor> services() const = 0;
};

/// Provider interface for pages
class PageProvider {
public:
    virtual ~PageProvider() = default;
    virtual std::vector<PageDescriptor> pages() const = 0;
};

class FixedServices : public ServiceProvider {
public:
    explicit FixedServices(std::vector<ServiceDescriptor> services) : m_services(std::move(services)) {}
    std::vector<ServiceDescriptor> services() const override { return m_services; }

private:
    std::vector<ServiceDescriptor> m_services;
};

class FixedPages : public PageProvider {
public:
    explicit FixedPages(std::vector<PageDescriptor> pages) : m_pages(std::move(pages)) {}
    std::vector<PageDescriptor> pages() const override { return m_pages; }

private:
    std::vector<PageDescriptor> m_pages;
};

DescriptorReference ref_to(const std::string& name) {
    return DescriptorReference(OWNER, Uuid::from_name(name), "0.0.0", "99.0.0");
}

template<typename T>
std::vector<std::string> names(const std::vector<T>& descriptors) {
    std::vector<std::string> result;
    for (const auto& d : descriptors) {
        result.push_back(d.name);
    }
    return result;
}

} // anonymous namespace

TEST_CASE("ExtensionRegistry registration", "[plugin][extension]") {
    ExtensionRegistry registry;

    SECTION("member function accessor") {
        auto r = registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services);
        REQUIRE(r.is_ok());
        REQUIRE(registry.contains<ServiceProvider>());
        REQUIRE_FALSE(registry.contains<PageProvider>());

        const ExtensionPointInfo* info = registry.info<ServiceProvider>();
        REQUIRE(info != nullptr);
        REQUIRE(info->name == "services");
        REQUIRE(info->direction == SortDirection::Forward);
        REQUIRE(info->descriptor_type == std::type_index(typeid(ServiceDescriptor)));
    }

    SECTION("registering a provider type twice fails") {
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services).is_ok());

        auto again = registry.add<ServiceProvider, ServiceDescriptor>(
            "services.teardown", &ServiceProvider::services, SortDirection::Reverse);
        REQUIRE(again.is_err());
        REQUIRE(again.error().code() == ErrorCode::AlreadyExists);
        REQUIRE(registry.info<ServiceProvider>()->direction == SortDirection::Forward);
    }

    SECTION("empty accessor is rejected") {
        auto r = registry.add<ServiceProvider, ServiceDescriptor>(
            "services", ExtensionRegistry::Accessor<ServiceProvider, ServiceDescriptor>{});
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(registry.size() == 0);
    }

    SECTION("points are listed by name") {
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services).is_ok());
        REQUIRE(registry.add<PageProvider, PageDescriptor>("pages", &PageProvider::pages).is_ok());

        auto points = registry.points();
        REQUIRE(points.size() == 2);
        REQUIRE(points[0].name == "pages");
        REQUIRE(points[1].name == "services");
    }
}

TEST_CASE("ExtensionRegistry resolution", "[plugin][extension]") {
    ServiceDescriptor logging("logging");
    ServiceDescriptor storage("storage");
    ServiceDescriptor sync("sync");
    storage.load_after.push_back(ref_to("logging"));
    sync.depends_on.push_back(ref_to("storage"));

    FixedServices core({storage, logging});
    FixedServices extras({sync});
    std::vector<const ServiceProvider*> providers{&core, nullptr, &extras};

    DescriptorResolver resolver;

    SECTION("collect merges in provider order") {
        ExtensionRegistry registry;
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services).is_ok());

        auto merged = registry.collect<ServiceProvider, ServiceDescriptor>(providers);
        REQUIRE(merged.is_ok());
        REQUIRE(names(*merged) == std::vector<std::string>{"storage", "logging", "sync"});
    }

    SECTION("forward direction") {
        ExtensionRegistry registry;
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services).is_ok());

        auto ordered = registry.resolve_and_order<ServiceProvider, ServiceDescriptor>(resolver, providers);
        REQUIRE(ordered.is_ok());
        REQUIRE(names(*ordered) == std::vector<std::string>{"logging", "storage", "sync"});
    }

    SECTION("reverse direction for teardown") {
        ExtensionRegistry registry;
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>(
            "services", &ServiceProvider::services, SortDirection::Reverse).is_ok());

        auto ordered = registry.resolve_and_order<ServiceProvider, ServiceDescriptor>(resolver, providers);
        REQUIRE(ordered.is_ok());
        REQUIRE(names(*ordered) == std::vector<std::string>{"sync", "storage", "logging"});
    }

    SECTION("lambda accessor") {
        ExtensionRegistry registry;
        auto r = registry.add<ServiceProvider, ServiceDescriptor>("services",
            [](const ServiceProvider& provider) {
                auto all = provider.services();
                all.erase(all.begin());
                return all;
            });
        REQUIRE(r.is_ok());

        auto ordered = registry.resolve_and_order<ServiceProvider, ServiceDescriptor>(resolver, providers);
        REQUIRE(ordered.is_ok());
        REQUIRE(names(*ordered) == std::vector<std::string>{"logging"});
    }

    SECTION("unregistered provider type") {
        ExtensionRegistry registry;
        auto ordered = registry.resolve_and_order<ServiceProvider, ServiceDescriptor>(resolver, providers);
        REQUIRE(ordered.is_err());
        REQUIRE(ordered.error().code() == ErrorCode::NotFound);
    }

    SECTION("mismatched descriptor type") {
        ExtensionRegistry registry;
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services).is_ok());

        auto wrong = registry.collect<ServiceProvider, Descriptor>(providers);
        REQUIRE(wrong.is_err());
        REQUIRE(wrong.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("several extension points side by side") {
        ExtensionRegistry registry;
        REQUIRE(registry.add<ServiceProvider, ServiceDescriptor>("services", &ServiceProvider::services).is_ok());
        REQUIRE(registry.add<PageProvider, PageDescriptor>("pages", &PageProvider::pages).is_ok());

        PageDescriptor home("home", "/");
        PageDescriptor settings("settings", "/settings");
        settings.load_before.push_back(ref_to("home"));
        FixedPages pages({home, settings});

        auto ordered = registry.resolve_and_order<PageProvider, PageDescriptor>(
            resolver, std::vector<const PageProvider*>{&pages});
        REQUIRE(ordered.is_ok());
        REQUIRE(ordered->size() == 2);
        REQUIRE((*ordered)[0].route == "/settings");
        REQUIRE((*ordered)[1].route == "/");
    }
}
