// plughost_plugin descriptor document tests

#include <catch2/catch_test_macros.hpp>
#include <plughost/plugin/descriptor_io.hpp>
#include <plughost/plugin/resolver.hpp>

#include <string>

using namespace plughost_plugin;
using plughost_core::ErrorCode;

namespace {

const std::string OWNER = "6f1c2a52-0d0e-4c1b-9d65-2f1a7e3b9c10";
const std::string ID_A = "0a5b3c7d-1111-4e2f-8a9b-000000000001";
const std::string ID_B = "0a5b3c7d-1111-4e2f-8a9b-000000000002";

} // anonymous namespace

TEST_CASE("Descriptor documents", "[plugin][io]") {
    SECTION("full document") {
        std::string doc = R"([
            { "owner": ")" + OWNER + R"(", "id": ")" + ID_A + R"(", "version": "1.2.0", "name": "A" },
            { "owner": ")" + OWNER + R"(", "id": ")" + ID_B + R"(", "version": "0.3.0",
              "depends_on":  [ { "owner": ")" + OWNER + R"(", "id": ")" + ID_A + R"(", "min": "1.0.0", "max": "2.0.0" } ],
              "load_before": [ { "owner": ")" + OWNER + R"(", "id": ")" + ID_A + R"(", "min": "1.0.0", "max": "2.0.0" } ] }
        ])";

        auto descriptors = parse_descriptors(doc);
        REQUIRE(descriptors.is_ok());
        REQUIRE(descriptors->size() == 2);

        const Descriptor& b = (*descriptors)[1];
        REQUIRE(b.name.empty());
        REQUIRE(b.label() == ID_B);
        REQUIRE(b.depends_on.size() == 1);
        REQUIRE(b.load_before.size() == 1);
        REQUIRE(b.conflicts_with.empty());
        REQUIRE(b.depends_on[0].min_version == "1.0.0");

        DescriptorResolver resolver;
        auto ordered = resolver.resolve(*descriptors);
        REQUIRE(ordered.is_ok());
        REQUIRE(ordered->size() == 2);
        REQUIRE((*ordered)[0].descriptor_id == b.descriptor_id);
    }

    SECTION("empty array") {
        auto descriptors = parse_descriptors("[]");
        REQUIRE(descriptors.is_ok());
        REQUIRE(descriptors->empty());
    }

    SECTION("serialized form parses back") {
        Descriptor d(Uuid::from_name("o"), Uuid::from_name("d"), "2.0.0", "named");
        d.conflicts_with.emplace_back(Uuid::from_name("o"), Uuid::from_name("x"), "1.0.0", "1.9.0");

        auto parsed = parse_descriptors(descriptors_to_json({d}));
        REQUIRE(parsed.is_ok());
        REQUIRE(parsed->size() == 1);
        REQUIRE((*parsed)[0].name == "named");
        REQUIRE((*parsed)[0].conflicts_with.size() == 1);
        REQUIRE((*parsed)[0].conflicts_with[0] == d.conflicts_with[0]);
    }

    SECTION("errors name the offending entry") {
        auto not_array = parse_descriptors("{}");
        REQUIRE(not_array.error().code() == ErrorCode::ParseError);

        auto missing_version = parse_descriptors(R"([
            { "owner": ")" + OWNER + R"(", "id": ")" + ID_A + R"(", "version": "1.0.0" },
            { "owner": ")" + OWNER + R"(", "id": ")" + ID_B + R"(" }
        ])");
        REQUIRE(missing_version.is_err());
        REQUIRE(missing_version.error().message().find("descriptor[1]") != std::string::npos);
        REQUIRE(missing_version.error().message().find("version") != std::string::npos);

        auto bad_reference = parse_descriptors(R"([
            { "owner": ")" + OWNER + R"(", "id": ")" + ID_A + R"(", "version": "1.0.0",
              "load_after": [ { "owner": ")" + OWNER + R"(", "id": "bogus", "min": "1", "max": "2" } ] }
        ])");
        REQUIRE(bad_reference.is_err());
        REQUIRE(bad_reference.error().message().find("descriptor[0].load_after[0]") != std::string::npos);
    }

    SECTION("missing file") {
        auto descriptors = load_descriptors("/nonexistent/plughost/descriptors.json");
        REQUIRE(descriptors.is_err());
        REQUIRE(descriptors.error().code() == ErrorCode::NotFound);
    }
}
