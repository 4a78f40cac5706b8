// hoard_core logging tests

#include <catch2/catch_test_macros.hpp>
#include <hoard/core/log.hpp>
#include <string>

using namespace hoard_core;

TEST_CASE("parse_log_level", "[core][log]") {
    REQUIRE(parse_log_level("trace") == spdlog::level::trace);
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("info") == spdlog::level::info);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE(parse_log_level("err") == spdlog::level::err);
    REQUIRE(parse_log_level("fatal") == spdlog::level::critical);
    REQUIRE(parse_log_level("off") == spdlog::level::off);
    REQUIRE_FALSE(parse_log_level("loud").has_value());
}

TEST_CASE("log_level_name round trips through parse_log_level", "[core][log]") {
    for (auto level : {spdlog::level::trace, spdlog::level::debug, spdlog::level::info,
                       spdlog::level::warn, spdlog::level::err, spdlog::level::critical}) {
        auto parsed = parse_log_level(log_level_name(level));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == level);
    }
}

TEST_CASE("Named loggers", "[core][log]") {
    SECTION("same name returns the same logger") {
        auto a = get_logger("hoard_test_logger");
        auto b = get_logger("hoard_test_logger");
        REQUIRE(a == b);
        REQUIRE(a->name() == "hoard_test_logger");
    }

    SECTION("module loggers") {
        REQUIRE(core_logger()->name() == "hoard_core");
        REQUIRE(res_logger()->name() == "hoard_res");
        REQUIRE(bundle_logger()->name() == "hoard_bundle");
    }
}

TEST_CASE("Global log level applies to existing loggers", "[core][log]") {
    auto previous = get_global_log_level();
    auto logger = get_logger("hoard_level_test");

    set_global_log_level(spdlog::level::err);
    REQUIRE(get_global_log_level() == spdlog::level::err);
    REQUIRE(logger->level() == spdlog::level::err);

    set_global_log_level(previous);
    REQUIRE(logger->level() == previous);
}

TEST_CASE("configure_logging updates the level", "[core][log]") {
    auto previous = get_global_log_level();

    LogConfig config;
    config.level = spdlog::level::warn;
    configure_logging(config);
    REQUIRE(get_global_log_level() == spdlog::level::warn);

    config.level = previous;
    configure_logging(config);
}

TEST_CASE("LogScope traces without throwing", "[core][log]") {
    auto traced = [] {
        HOARD_LOG_SCOPE("scoped work", "hoard_core");
        HOARD_LOG_DEBUG("inside scope {}", 1);
    };
    REQUIRE_NOTHROW(traced());
}

TEST_CASE("LogScope macros nest within one block", "[core][log]") {
    auto traced = [] {
        HOARD_LOG_SCOPE("outer", "hoard_core");
        HOARD_LOG_SCOPE("inner", "hoard_res");
        HOARD_LOG_INFO("two scopes open");
    };
    REQUIRE_NOTHROW(traced());
}
