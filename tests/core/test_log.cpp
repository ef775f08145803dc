// plughost_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <plughost/core/log.hpp>

#include <spdlog/sinks/ringbuffer_sink.h>

#include <memory>
#include <string>

using namespace plughost_core;

namespace {

std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> attach_ring(const std::shared_ptr<spdlog::logger>& logger) {
    auto sink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
    sink->set_pattern("%l %v");
    logger->sinks().push_back(sink);
    return sink;
}

} // anonymous namespace

TEST_CASE("Log level names", "[core][log]") {
    SECTION("parse") {
        REQUIRE(parse_log_level("warn") == spdlog::level::warn);
        REQUIRE(parse_log_level("warning") == spdlog::level::warn);
        REQUIRE(parse_log_level("err") == spdlog::level::err);
        REQUIRE(parse_log_level("off") == spdlog::level::off);
        REQUIRE_FALSE(parse_log_level("loud").has_value());
    }

    SECTION("name") {
        REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
        REQUIRE(std::string(log_level_name(spdlog::level::trace)) == "trace");
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns the same logger") {
        REQUIRE(get_logger("plughost.test.same") == get_logger("plughost.test.same"));
        REQUIRE(resolver_logger()->name() == "plughost.resolver");
        REQUIRE(manifest_logger()->name() == "plughost.manifest");
    }

    SECTION("per-logger level") {
        auto logger = get_logger("plughost.test.level");
        set_logger_level("plughost.test.level", spdlog::level::err);
        REQUIRE(logger->level() == spdlog::level::err);
    }

    SECTION("global level reaches existing loggers") {
        auto logger = get_logger("plughost.test.global");
        set_global_log_level(spdlog::level::warn);
        REQUIRE(get_global_log_level() == spdlog::level::warn);
        REQUIRE(logger->level() == spdlog::level::warn);

        set_global_log_level(spdlog::level::info);
        REQUIRE(logger->level() == spdlog::level::info);
    }

    SECTION("structured entries") {
        auto logger = get_logger("plughost.test.structured");
        logger->set_level(spdlog::level::info);
        auto sink = attach_ring(logger);

        log_structured(spdlog::level::info, "plughost.test.structured", "Descriptor disabled",
            {{"name", "Inspector"}, {"extension_point", "panels"}});

        auto lines = sink->last_formatted();
        REQUIRE(lines.size() == 1);
        REQUIRE(lines[0].find("Descriptor disabled {extension_point=\"panels\", name=\"Inspector\"}") != std::string::npos);
    }

    SECTION("scope traces entry and exit") {
        auto logger = get_logger("plughost.test.scope");
        logger->set_level(spdlog::level::trace);
        auto sink = attach_ring(logger);

        {
            PLUGHOST_LOG_SCOPE("work", "plughost.test.scope");
        }

        auto lines = sink->last_formatted();
        REQUIRE(lines.size() == 2);
        REQUIRE(lines[0].find(">>> Entering work") != std::string::npos);
        REQUIRE(lines[1].find("<<< Exiting work") != std::string::npos);
        flush_all_loggers();
    }

    SECTION("nested scopes in one block") {
        auto logger = get_logger("plughost.test.nested");
        logger->set_level(spdlog::level::trace);
        auto sink = attach_ring(logger);

        {
            PLUGHOST_LOG_SCOPE("outer", "plughost.test.nested");
            PLUGHOST_LOG_SCOPE("inner", "plughost.test.nested");
        }

        auto lines = sink->last_formatted();
        REQUIRE(lines.size() == 4);
        REQUIRE(lines[0].find(">>> Entering outer") != std::string::npos);
        REQUIRE(lines[1].find(">>> Entering inner") != std::string::npos);
        REQUIRE(lines[2].find("<<< Exiting inner") != std::string::npos);
        REQUIRE(lines[3].find("<<< Exiting outer") != std::string::npos);
    }
}
