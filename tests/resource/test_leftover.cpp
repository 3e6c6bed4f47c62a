// attest_resource unreferenced resource detection tests

#include <catch2/catch_test_macros.hpp>
#include <attest/resource/leftover.hpp>

#include "../support/test_support.hpp"

using namespace attest_resource;

TEST_CASE("Unreferenced resources are reported", "[resource][leftover]") {
    attest_test::TempProject project("leftover");
    project.write("bpe/ping.bpmn");
    project.write("bpe/sub/pong.bpmn");
    project.write("bpe/notes.txt");
    project.write("fhir/ActivityDefinition/ping.xml");
    project.write("fhir/CodeSystem/codes.json");

    auto analysis = find_unreferenced_resources(project.path(),
        {"bpe/ping.bpmn"}, {"fhir/ActivityDefinition/ping.xml"});

    REQUIRE(analysis.process_model_count == 2);
    REQUIRE(analysis.fhir_resource_count == 2);
    REQUIRE(analysis.unreferenced_process_models == std::set<std::string>{"bpe/sub/pong.bpmn"});
    REQUIRE(analysis.unreferenced_fhir_resources == std::set<std::string>{"fhir/CodeSystem/codes.json"});
    REQUIRE_FALSE(analysis.empty());
}

TEST_CASE("Everything referenced", "[resource][leftover]") {
    attest_test::TempProject project("leftover-none");
    project.write("bpe/ping.bpmn");

    auto analysis = find_unreferenced_resources(project.path(), {"bpe/ping.bpmn"}, {});
    REQUIRE(analysis.empty());

    auto missing_root = find_unreferenced_resources(project.path() / "absent", {}, {});
    REQUIRE(missing_root.empty());
    REQUIRE(missing_root.process_model_count == 0);
}

TEST_CASE("Process models in the bpmn folder", "[resource][leftover]") {
    attest_test::TempProject project("leftover-bpmn");
    project.write("bpmn/ping.bpmn");
    project.write("bpmn/pong.bpmn");
    project.write("bpmn/stale.bpmn");

    // Referenced with the folder name, and bare as the subfolder search resolves it
    auto analysis = find_unreferenced_resources(project.path(), {"bpmn/ping.bpmn", "pong.bpmn"}, {});

    REQUIRE(analysis.process_model_count == 3);
    REQUIRE(analysis.unreferenced_process_models == std::set<std::string>{"bpmn/stale.bpmn"});
}
