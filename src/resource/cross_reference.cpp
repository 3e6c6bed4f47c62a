/// @file cross_reference.cpp
/// @brief FHIR content cross-referencing

#include <attest/resource/cross_reference.hpp>
#include <attest/resource/normalizer.hpp>
#include <attest/core/log.hpp>

#include <algorithm>

namespace attest_resource {

namespace {

bool has_value(const FhirElement& element, std::string_view expected) {
    const std::string* value = element.value();
    return value && *value == expected;
}

bool is_named(const FhirElement& element, std::string_view a, std::string_view b) {
    return element.name() == a || element.name() == b;
}

/// First value attribute of a child named a or b below the element with the given id
std::optional<std::string> element_fixed_value(const FhirDocument& document,
                                               std::string_view element_id,
                                               std::string_view a,
                                               std::string_view b) {
    const auto elements = document.root().find_all([element_id](const FhirElement& e) {
        const std::string* id = e.attribute("id");
        return e.name() == "element" && id && *id == element_id;
    });
    for (const FhirElement* element : elements) {
        for (const auto& child : element->children()) {
            if (is_named(child, a, b) && child.value()) {
                return *child.value();
            }
        }
    }
    return std::nullopt;
}

} // anonymous namespace

const char* cross_reference_kind_name(CrossReferenceKind kind) noexcept {
    switch (kind) {
        case CrossReferenceKind::ActivityDefinitionMessageName: return "activity-definition-message-name";
        case CrossReferenceKind::ActivityDefinitionUrl: return "activity-definition-url";
        case CrossReferenceKind::StructureDefinitionValue: return "structure-definition-value";
        case CrossReferenceKind::QuestionnaireUrl: return "questionnaire-url";
        default: return "unknown";
    }
}

std::optional<CrossReferenceKind> parse_cross_reference_kind(std::string_view name) {
    for (auto kind : {CrossReferenceKind::ActivityDefinitionMessageName,
                      CrossReferenceKind::ActivityDefinitionUrl,
                      CrossReferenceKind::StructureDefinitionValue,
                      CrossReferenceKind::QuestionnaireUrl}) {
        if (name == cross_reference_kind_name(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

const char* resource_type_for(CrossReferenceKind kind) noexcept {
    switch (kind) {
        case CrossReferenceKind::ActivityDefinitionMessageName:
        case CrossReferenceKind::ActivityDefinitionUrl:
            return "ActivityDefinition";
        case CrossReferenceKind::StructureDefinitionValue:
            return "StructureDefinition";
        case CrossReferenceKind::QuestionnaireUrl:
            return "Questionnaire";
        default:
            return "";
    }
}

bool matches(const FhirDocument& document, CrossReferenceKind kind, std::string_view value) {
    if (document.resource_type() != resource_type_for(kind)) {
        return false;
    }
    const FhirElement& root = document.root();

    switch (kind) {
        case CrossReferenceKind::ActivityDefinitionMessageName:
            return root.any_of([value](const FhirElement& e) {
                const std::string* url = e.attribute("url");
                if (e.name() != "extension" || !url || *url != "message-name") {
                    return false;
                }
                return std::any_of(e.children().begin(), e.children().end(), [value](const FhirElement& c) {
                    return is_named(c, "valueString", "fixedString") && has_value(c, value);
                });
            });

        case CrossReferenceKind::StructureDefinitionValue:
            return root.any_of([value](const FhirElement& e) {
                return (e.name() == "url" || is_named(e, "fixedString", "valueString")) && has_value(e, value);
            });

        case CrossReferenceKind::ActivityDefinitionUrl:
        case CrossReferenceKind::QuestionnaireUrl: {
            const std::string canonical = remove_version_suffix(value);
            return std::any_of(root.children().begin(), root.children().end(), [&canonical](const FhirElement& c) {
                return c.name() == "url" && has_value(c, canonical);
            });
        }

        default:
            return false;
    }
}

bool cross_reference(const ResolutionResult& result, CrossReferenceKind kind, std::string_view value) {
    const auto file = file_of(result);
    if (!file) {
        return false;
    }
    auto document = FhirDocument::load(*file);
    if (!document) {
        attest_core::resolver_logger()->debug("Skipping unreadable FHIR file: {}",
            attest_core::build_error_chain(document.error()));
        return false;
    }
    return matches(*document, kind, value);
}

bool cross_reference(const ResolutionResult& result, std::string_view kind, std::string_view value) {
    const auto parsed = parse_cross_reference_kind(kind);
    if (!parsed) {
        attest_core::resolver_logger()->debug("Unknown cross-reference kind '{}'", kind);
        return false;
    }
    return cross_reference(result, *parsed, value);
}

// =============================================================================
// CrossReferencer
// =============================================================================

CrossReferencer::CrossReferencer()
    : m_layouts{"src/main/resources/fhir", "fhir"} {}

CrossReferencer::CrossReferencer(std::vector<std::string> layouts)
    : m_layouts(std::move(layouts)) {}

std::vector<FhirDocument> CrossReferencer::load_resources(const fs::path& dir, std::string_view resource_type) {
    std::vector<FhirDocument> documents;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return documents;
    }

    std::vector<fs::path> files;
    for (fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (it->is_regular_file(fec) && is_fhir_file(it->path())) {
            files.push_back(it->path());
        }
    }
    std::sort(files.begin(), files.end());

    auto log = attest_core::resolver_logger();
    for (const auto& file : files) {
        auto document = FhirDocument::load(file);
        if (!document) {
            log->debug("Skipping {}: {}", file.string(), document.error().message());
            continue;
        }
        if (document->resource_type() != resource_type) {
            continue;
        }
        documents.push_back(std::move(*document));
    }
    return documents;
}

std::optional<fs::path> CrossReferencer::find(const fs::path& base,
                                              CrossReferenceKind kind,
                                              std::string_view value) const {
    const std::string type = resource_type_for(kind);
    for (const auto& layout : m_layouts) {
        for (const auto& document : load_resources(base / layout / type, type)) {
            if (matches(document, kind, value)) {
                return document.source();
            }
        }
    }
    return std::nullopt;
}

// =============================================================================
// StructureDefinition Extraction
// =============================================================================

std::optional<std::string> task_instantiates_canonical(const FhirDocument& structure_definition) {
    return element_fixed_value(structure_definition, "Task.instantiatesCanonical", "fixedCanonical", "fixedCanonical");
}

std::optional<std::string> task_message_name(const FhirDocument& structure_definition) {
    return element_fixed_value(structure_definition, "Task.input:message-name.value[x]", "fixedString", "valueString");
}

} // namespace attest_resource
