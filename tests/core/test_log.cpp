// Logging channel tests

#include <catch2/catch_test_macros.hpp>
#include <attest/core/log.hpp>

using namespace attest_core;

TEST_CASE("Channels are shared by name", "[core][log]") {
    auto first = get_logger("log-test-shared");
    auto second = get_logger("log-test-shared");
    REQUIRE(first == second);
    REQUIRE(first->name() == "log-test-shared");
    REQUIRE(resolver_logger()->name() == "resolver");
}

TEST_CASE("Reconfiguring leaves handed-out channels intact", "[core][log]") {
    LogConfig quiet;
    quiet.console_enabled = false;
    configure_logging(quiet);

    auto before = get_logger("log-test-reconfigure");
    const auto sinks_before = before->sinks();
    REQUIRE(sinks_before.empty());

    LogConfig verbose;
    verbose.level = spdlog::level::debug;
    configure_logging(verbose);

    // The earlier handle keeps its own sink vector and follows the new level
    REQUIRE(before->sinks() == sinks_before);
    REQUIRE(before->level() == spdlog::level::debug);

    auto after = get_logger("log-test-reconfigure");
    REQUIRE(after != before);
    REQUIRE(after->sinks().size() == 1);
    REQUIRE(after->level() == spdlog::level::debug);

    before->debug("still safe to use");
    configure_logging(LogConfig{});
}

TEST_CASE("LogScope logs on a named channel", "[core][log]") {
    REQUIRE_NOTHROW([] { LogScope scope("unit of work", "log-test-scope"); }());
}
