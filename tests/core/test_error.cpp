// plughost_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <plughost/core/error.hpp>
#include <string>
#include <vector>

using namespace plughost_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
    }

    SECTION("from code and message") {
        Error err(ErrorCode::InvalidArgument, "Bad argument");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message() == "Bad argument");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("Error factory methods", "[core][error]") {
    SECTION("ResolutionError::index_corrupted") {
        Error err = ResolutionError::index_corrupted("abc", "dangling entry");
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.is<ResolutionError>());
        REQUIRE(err.as<ResolutionError>()->kind == ResolutionError::Kind::IndexCorrupted);
        REQUIRE(err.message().find("dangling entry") != std::string::npos);
    }

    SECTION("ResolutionError::cycle_detected") {
        Error err = ResolutionError::cycle_detected("'a' -> 'b'");
        REQUIRE(err.code() == ErrorCode::ValidationError);
        REQUIRE(err.message().find("'a' -> 'b'") != std::string::npos);
    }

    SECTION("ResolutionError::null_descriptor") {
        Error err = ResolutionError::null_descriptor(3);
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.message().find('3') != std::string::npos);
    }

    SECTION("ManifestError kinds map to codes") {
        REQUIRE(Error(ManifestError::not_found("m.json")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ManifestError::parse_failed("m.json", "bad")).code() == ErrorCode::ParseError);
        REQUIRE(Error(ManifestError::write_failed("m.json", "disk full")).code() == ErrorCode::IOError);
        REQUIRE(Error(ManifestError::unknown_descriptor("id")).code() == ErrorCode::NotFound);
        REQUIRE(Error(ManifestError::system_descriptor("id")).code() == ErrorCode::InvalidArgument);
    }

    SECTION("is and as reject other kinds") {
        Error err = ManifestError::not_found("m.json");
        REQUIRE_FALSE(err.is<ResolutionError>());
        REQUIRE(err.as<ResolutionError>() == nullptr);
        REQUIRE(err.as<ManifestError>()->path == "m.json");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    SECTION("generic message") {
        Error err(ErrorCode::ParseError, "unexpected token");
        REQUIRE(build_error_chain(err) == "[ParseError] unexpected token");
    }

    SECTION("domain error and context") {
        Error err = ManifestError::parse_failed("plugins.json", "not an object");
        err.with_context("stage", "startup");

        std::string chain = build_error_chain(err);
        REQUIRE(chain.find("[ParseError]") == 0);
        REQUIRE(chain.find("[ManifestError]") != std::string::npos);
        REQUIRE(chain.find("plugins.json") != std::string::npos);
        REQUIRE(chain.find("stage=startup") != std::string::npos);
    }

    SECTION("every code has a name") {
        REQUIRE(std::string(error_code_name(ErrorCode::NotFound)) == "NotFound");
        REQUIRE(std::string(error_code_name(ErrorCode::DependencyMissing)) == "DependencyMissing");
    }
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("Err with domain error") {
        Result<int> r = Err<int>(ResolutionError::null_descriptor(0));
        REQUIRE(r.is_err());
        REQUIRE(r.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("Err void") {
        Result<void> r = Err(Error(ErrorCode::IOError, "disk"));
        REQUIRE(r.is_err());
        REQUIRE(r.error().message() == "disk");
        REQUIRE_THROWS(r.unwrap());
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(7) == 7);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS(r.unwrap());
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result map operations", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("map keeps the error") {
        Result<int> r = Err<int>(Error(ErrorCode::NotFound, "gone"));
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().code() == ErrorCode::NotFound);
    }

    SECTION("and_then chains") {
        Result<std::vector<int>> r = Ok(std::vector<int>{1, 2, 3});
        auto r2 = r.and_then([](std::vector<int> v) -> Result<std::size_t> {
            return Ok(v.size());
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 3);
    }
}
