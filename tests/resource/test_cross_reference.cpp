// attest_resource FHIR document and cross-reference tests

#include <catch2/catch_test_macros.hpp>
#include <attest/resource/cross_reference.hpp>
#include <attest/resource/fhir_document.hpp>

#include "../support/test_support.hpp"

using namespace attest_resource;
using attest_test::TempProject;

namespace {

constexpr const char* k_activity_definition_xml = R"(<?xml version="1.0" encoding="UTF-8"?>
<ActivityDefinition xmlns="http://hl7.org/fhir">
  <extension url="http://dsf.dev/fhir/StructureDefinition/extension-process-authorization">
    <extension url="message-name">
      <valueString value="startPing"/>
    </extension>
  </extension>
  <url value="http://dsf.dev/bpe/Process/ping"/>
  <version value="#{version}"/>
  <status value="unknown"/>
</ActivityDefinition>)";

constexpr const char* k_activity_definition_json = R"({
  "resourceType": "ActivityDefinition",
  "extension": [{
    "url": "http://dsf.dev/fhir/StructureDefinition/extension-process-authorization",
    "extension": [{"url": "message-name", "valueString": "pong"}]
  }],
  "url": "http://dsf.dev/bpe/Process/pong",
  "status": "unknown"
})";

constexpr const char* k_task_profile_xml = R"(<StructureDefinition xmlns="http://hl7.org/fhir">
  <url value="http://dsf.dev/fhir/StructureDefinition/task-start-ping"/>
  <differential>
    <element id="Task.instantiatesCanonical">
      <path value="Task.instantiatesCanonical"/>
      <fixedCanonical value="http://dsf.dev/bpe/Process/ping|#{version}"/>
    </element>
    <element id="Task.input:message-name.value[x]">
      <path value="Task.input.value[x]"/>
      <fixedString value="startPing"/>
    </element>
  </differential>
</StructureDefinition>)";

constexpr const char* k_questionnaire_json = R"({
  "resourceType": "Questionnaire",
  "url": "http://dsf.dev/fhir/Questionnaire/user-task",
  "item": [{"linkId": "business-key", "type": "string"}]
})";

} // anonymous namespace

TEST_CASE("FhirDocument parses both encodings", "[resource][fhir]") {
    SECTION("XML") {
        auto doc = FhirDocument::parse_xml(k_activity_definition_xml);
        REQUIRE(doc);
        REQUIRE(doc->resource_type() == "ActivityDefinition");
        REQUIRE(*doc->root().child("url")->value() == "http://dsf.dev/bpe/Process/ping");
    }

    SECTION("JSON maps onto the XML shape") {
        auto doc = FhirDocument::parse_json(k_activity_definition_json);
        REQUIRE(doc);
        REQUIRE(doc->resource_type() == "ActivityDefinition");
        const FhirElement* extension = doc->root().child("extension");
        REQUIRE(extension);
        REQUIRE(*extension->attribute("url") ==
                "http://dsf.dev/fhir/StructureDefinition/extension-process-authorization");
        REQUIRE(*extension->child("extension")->child("valueString")->value() == "pong");
    }

    SECTION("arrays repeat the element") {
        auto doc = FhirDocument::parse_json(R"({"resourceType": "Task", "input": [{"id": "a"}, {"id": "b"}]})");
        REQUIRE(doc);
        const auto inputs = doc->root().find_all([](const FhirElement& e) { return e.name() == "input"; });
        REQUIRE(inputs.size() == 2);
        REQUIRE(*inputs[1]->attribute("id") == "b");
    }

    SECTION("malformed input") {
        REQUIRE(FhirDocument::parse_xml("<ActivityDefinition><url").is_err());
        REQUIRE(FhirDocument::parse_json("{\"url\": \"x\"}").is_err());
        REQUIRE(FhirDocument::parse_json("[1, 2").is_err());
    }
}

TEST_CASE("cross_reference on resolution results", "[resource][crossref]") {
    TempProject project("crossref");
    const auto xml = project.write("fhir/ActivityDefinition/ping.xml", k_activity_definition_xml);
    const auto json = project.write("fhir/ActivityDefinition/pong.json", k_activity_definition_json);
    const auto broken = project.write("fhir/ActivityDefinition/broken.xml", "<ActivityDefinition");
    const auto questionnaire = project.write("fhir/Questionnaire/q.json", k_questionnaire_json);
    const auto profile = project.write("fhir/StructureDefinition/task.xml", k_task_profile_xml);

    SECTION("message name") {
        REQUIRE(cross_reference(FoundInRoot{xml}, CrossReferenceKind::ActivityDefinitionMessageName, "startPing"));
        REQUIRE(cross_reference(FoundInRoot{json}, "activity-definition-message-name", "pong"));
        REQUIRE_FALSE(cross_reference(FoundInRoot{xml}, "activity-definition-message-name", "pong"));
    }

    SECTION("canonical url ignores the version suffix") {
        REQUIRE(cross_reference(FoundInRoot{xml}, "activity-definition-url", "http://dsf.dev/bpe/Process/ping|1.0"));
        REQUIRE(cross_reference(FoundInRoot{questionnaire}, "questionnaire-url",
                                "http://dsf.dev/fhir/Questionnaire/user-task|#{version}"));
    }

    SECTION("structure definition values") {
        REQUIRE(cross_reference(FoundInRoot{profile}, "structure-definition-value", "startPing"));
        REQUIRE(cross_reference(FoundInRoot{profile}, "structure-definition-value",
                                "http://dsf.dev/fhir/StructureDefinition/task-start-ping"));
    }

    SECTION("any found variant is inspected") {
        REQUIRE(cross_reference(FoundOutsideRoot{xml, xml, project.path()}, "activity-definition-url",
                                "http://dsf.dev/bpe/Process/ping"));
        REQUIRE(cross_reference(FoundInDependency{json, project.path() / "x.jar", project.path()},
                                "activity-definition-url", "http://dsf.dev/bpe/Process/pong"));
    }

    SECTION("never matches") {
        REQUIRE_FALSE(cross_reference(NotFound{}, "activity-definition-url", "http://dsf.dev/bpe/Process/ping"));
        REQUIRE_FALSE(cross_reference(FoundInRoot{broken}, "activity-definition-url", "x"));
        REQUIRE_FALSE(cross_reference(FoundInRoot{xml}, "questionnaire-url", "http://dsf.dev/bpe/Process/ping"));
        REQUIRE_FALSE(cross_reference(FoundInRoot{xml}, "no-such-kind", "x"));
    }
}

TEST_CASE("CrossReferencer searches nested then flat layouts", "[resource][crossref]") {
    TempProject project("crossref-search");
    project.write("fhir/ActivityDefinition/broken.xml", "not xml at all");
    const auto flat = project.write("fhir/ActivityDefinition/ping.xml", k_activity_definition_xml);

    CrossReferencer referencer;

    SECTION("flat layout") {
        auto hit = referencer.find(project.path(), CrossReferenceKind::ActivityDefinitionMessageName, "startPing");
        REQUIRE(hit);
        REQUIRE(*hit == flat);
    }

    SECTION("nested layout wins") {
        const auto nested = project.write("src/main/resources/fhir/ActivityDefinition/ping.xml",
                                          k_activity_definition_xml);
        auto hit = referencer.find(project.path(), CrossReferenceKind::ActivityDefinitionUrl,
                                   "http://dsf.dev/bpe/Process/ping");
        REQUIRE(hit);
        REQUIRE(*hit == nested);
    }

    SECTION("absent value") {
        REQUIRE_FALSE(referencer.exists(project.path(), CrossReferenceKind::QuestionnaireUrl, "http://x"));
    }
}

TEST_CASE("Task profile extraction", "[resource][crossref]") {
    auto doc = FhirDocument::parse_xml(k_task_profile_xml);
    REQUIRE(doc);
    REQUIRE(task_instantiates_canonical(*doc) == "http://dsf.dev/bpe/Process/ping|#{version}");
    REQUIRE(task_message_name(*doc) == "startPing");

    auto other = FhirDocument::parse_json(k_questionnaire_json);
    REQUIRE(other);
    REQUIRE_FALSE(task_message_name(*other).has_value());
}
