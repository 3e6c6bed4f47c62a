// attest_plugin descriptor parsing tests

#include <catch2/catch_test_macros.hpp>
#include <attest/plugin/descriptor.hpp>

#include "../support/test_support.hpp"

using namespace attest_plugin;
using attest_types::ApiVersion;
using attest_types::ElementRole;
using attest_core::ErrorCode;

TEST_CASE("Descriptor from JSON", "[plugin][descriptor]") {
    SECTION("full document") {
        const std::string json = R"({
            "name": "ping",
            "api_version": "v2",
            "definition_type": "org.example.ping.PingProcessPluginDefinition",
            "code_source": "target/classes",
            "process_models": ["bpe/ping.bpmn", "bpe/pong.bpmn"],
            "fhir_resources": ["fhir/ActivityDefinition/ping.xml"],
            "implementation_types": [
                "org.example.ping.Log",
                {"type": "org.example.ping.SendPing", "role": "send-task",
                 "process_model": "bpe/ping.bpmn", "element": "sendPing"}
            ]
        })";

        auto descriptor = StaticPluginDescriptor::from_json_string(json, "/work/ping");
        REQUIRE(descriptor);
        REQUIRE(descriptor->name() == "ping");
        REQUIRE(descriptor->api_version() == ApiVersion::V2);
        REQUIRE(descriptor->definition_type() == "org.example.ping.PingProcessPluginDefinition");
        REQUIRE(descriptor->code_source() == fs::path("/work/ping/target/classes"));
        REQUIRE(descriptor->process_models() == std::vector<std::string>{"bpe/ping.bpmn", "bpe/pong.bpmn"});
        REQUIRE(descriptor->fhir_resources().size() == 1);

        const auto types = descriptor->implementation_types();
        REQUIRE(types.size() == 2);
        REQUIRE(types[0].type_name == "org.example.ping.Log");
        REQUIRE(types[0].role == ElementRole::Generic);
        REQUIRE(types[1].role == ElementRole::SendTask);
        REQUIRE(types[1].process_model == "bpe/ping.bpmn");
        REQUIRE(types[1].element_id == "sendPing");

        const auto hints = descriptor->root_hints();
        REQUIRE(hints.plugin_name == "ping");
        REQUIRE(hints.code_source == fs::path("/work/ping/target/classes"));
        REQUIRE(hints.definition_type == "org.example.ping.PingProcessPluginDefinition");
    }

    SECTION("minimal document") {
        auto descriptor = StaticPluginDescriptor::from_json_string(R"({"name": "minimal"})");
        REQUIRE(descriptor);
        REQUIRE(descriptor->api_version() == ApiVersion::Unknown);
        REQUIRE_FALSE(descriptor->code_source());
        REQUIRE(descriptor->process_models().empty());
        REQUIRE(descriptor->implementation_types().empty());
    }

    SECTION("absolute code source is kept") {
        auto descriptor = StaticPluginDescriptor::from_json_string(
            R"({"name": "abs", "code_source": "/opt/plugin/classes"})", "/work");
        REQUIRE(descriptor);
        REQUIRE(descriptor->code_source() == fs::path("/opt/plugin/classes"));
    }
}

TEST_CASE("Descriptor errors", "[plugin][descriptor]") {
    auto error_of = [](const std::string& json) {
        auto result = StaticPluginDescriptor::from_json_string(json);
        REQUIRE(result.is_err());
        return result.error();
    };

    REQUIRE(error_of("{ not json").code() == ErrorCode::ParseError);
    REQUIRE(error_of("[]").code() == ErrorCode::ParseError);
    REQUIRE(error_of(R"({"api_version": "v1"})").message().find("name") != std::string::npos);
    REQUIRE(error_of(R"({"name": "x", "api_version": 2})").code() == ErrorCode::ParseError);
    REQUIRE(error_of(R"({"name": "x", "process_models": "bpe/a.bpmn"})").message().find("process_models") !=
            std::string::npos);
    REQUIRE(error_of(R"({"name": "x", "fhir_resources": [1]})").code() == ErrorCode::ParseError);
    REQUIRE(error_of(R"({"name": "x", "implementation_types": [{"role": "send-task"}]})").code() ==
            ErrorCode::ParseError);
    REQUIRE(error_of(R"({"name": "x", "implementation_types": [{"type": "a.B", "role": "gateway"}]})")
                .message().find("gateway") != std::string::npos);
}

TEST_CASE("Descriptor files", "[plugin][descriptor]") {
    attest_test::TempProject project("descriptor");

    SECTION("relative code source resolves against the file") {
        const auto file = project.write("plugins/ping.json",
            R"({"name": "ping", "api_version": "1", "code_source": "classes"})");
        auto descriptor = StaticPluginDescriptor::load(file);
        REQUIRE(descriptor);
        REQUIRE(descriptor->api_version() == ApiVersion::V1);
        REQUIRE(descriptor->code_source() == project.path() / "plugins" / "classes");
    }

    SECTION("missing file") {
        auto descriptor = StaticPluginDescriptor::load(project.path() / "absent.json");
        REQUIRE(descriptor.is_err());
        REQUIRE(descriptor.error().code() == ErrorCode::NotFound);
    }

    SECTION("parse errors carry the file") {
        const auto file = project.write("broken.json", "{");
        auto descriptor = StaticPluginDescriptor::load(file);
        REQUIRE(descriptor.is_err());
        const std::string* context = descriptor.error().get_context("file");
        REQUIRE(context);
        REQUIRE(*context == file.string());
    }
}

TEST_CASE("Descriptors built in code", "[plugin][descriptor]") {
    StaticPluginDescriptor descriptor("pong", ApiVersion::V2);
    descriptor.add_process_model("bpe/pong.bpmn")
        .add_fhir_resource("fhir/Task/pong.xml")
        .add_implementation_type({"org.example.Pong", ElementRole::ServiceTask, "bpe/pong.bpmn", "pong"})
        .set_definition_type("org.example.PongDefinition");

    const PluginDescriptor& base = descriptor;
    REQUIRE(base.name() == "pong");
    REQUIRE(base.process_models() == std::vector<std::string>{"bpe/pong.bpmn"});
    REQUIRE(base.implementation_types()[0].role == ElementRole::ServiceTask);
    REQUIRE_FALSE(base.root_hints().code_source);
}
