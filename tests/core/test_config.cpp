// attest_core configuration tests

#include <catch2/catch_test_macros.hpp>
#include <attest/core/config.hpp>
#include <attest/core/log.hpp>

#include "../support/test_support.hpp"

#include <cstdlib>

using namespace attest_core;

TEST_CASE("AttestConfig defaults", "[core][config]") {
    AttestConfig config;
    REQUIRE(config.scheme_prefix == "classpath:");
    REQUIRE(config.source_resources_prefix == "src/main/resources/");
    REQUIRE(config.search_subfolders == std::vector<std::string>{"bpmn", "fhir"});
    REQUIRE(config.dependency_directories ==
            std::vector<std::string>{"target/dependency", "target/dependencies"});
    REQUIRE_FALSE(config.accept_absolute_references);
    REQUIRE(config.log_level == spdlog::level::info);
}

TEST_CASE("AttestConfig from JSON", "[core][config]") {
    SECTION("missing keys keep defaults") {
        auto config = AttestConfig::from_json_string(R"({"search_subfolders": ["models"]})");
        REQUIRE(config);
        REQUIRE(config->search_subfolders == std::vector<std::string>{"models"});
        REQUIRE(config->scheme_prefix == "classpath:");
    }

    SECTION("all keys") {
        auto config = AttestConfig::from_json_string(R"({
            "scheme_prefix": "cp:",
            "accept_absolute_references": true,
            "archive_extensions": [".jar", ".zip"],
            "log_level": "DEBUG"
        })");
        REQUIRE(config);
        REQUIRE(config->scheme_prefix == "cp:");
        REQUIRE(config->accept_absolute_references);
        REQUIRE(config->is_archive("lib/a.ZIP"));
        REQUIRE(config->log_level == spdlog::level::debug);
    }

    SECTION("wrong type is a config error") {
        auto config = AttestConfig::from_json_string(R"({"search_subfolders": "bpmn"})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().is<ConfigError>());
        REQUIRE(config.error().as<ConfigError>()->key == "search_subfolders");
    }

    SECTION("unknown log level") {
        auto config = AttestConfig::from_json_string(R"({"log_level": "loud"})");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("malformed document") {
        auto config = AttestConfig::from_json_string("{ not json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::ParseError);
    }
}

TEST_CASE("AttestConfig load and write back", "[core][config]") {
    attest_test::TempProject dir("config");

    SECTION("missing file") {
        auto config = AttestConfig::load(dir.path() / "absent.json");
        REQUIRE(config.is_err());
        REQUIRE(config.error().code() == ErrorCode::NotFound);
    }

    SECTION("round trip through a file") {
        AttestConfig original;
        original.temp_prefix = "custom-";
        original.search_subfolders = {"bpe"};
        const auto file = dir.write("attest.json", original.to_json_string());

        auto loaded = AttestConfig::load(file);
        REQUIRE(loaded);
        REQUIRE(loaded->temp_prefix == "custom-");
        REQUIRE(loaded->search_subfolders == std::vector<std::string>{"bpe"});
    }
}

TEST_CASE("AttestConfig environment overlay", "[core][config]") {
    ::setenv("ATTEST_LOG_LEVEL", "warn", 1);
    ::setenv("ATTEST_TEMP_PREFIX", "env-prefix-", 1);

    AttestConfig config;
    config.apply_environment();
    REQUIRE(config.log_level == spdlog::level::warn);
    REQUIRE(config.temp_prefix == "env-prefix-");

    ::unsetenv("ATTEST_LOG_LEVEL");
    ::unsetenv("ATTEST_TEMP_PREFIX");
}

TEST_CASE("Log level parsing", "[core][log]") {
    REQUIRE(parse_log_level("debug") == spdlog::level::debug);
    REQUIRE(parse_log_level("warning") == spdlog::level::warn);
    REQUIRE_FALSE(parse_log_level("verbose").has_value());
    REQUIRE(std::string(log_level_name(spdlog::level::err)) == "error");
}
