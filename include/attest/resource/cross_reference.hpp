#pragma once

/// @file cross_reference.hpp
/// @brief Searches FHIR resource content for declarations referenced elsewhere
///
/// A cross-reference answers "found" or "not found". Files that cannot be
/// parsed never match.

#include "fwd.hpp"
#include "fhir_document.hpp"
#include "resolution.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

enum class CrossReferenceKind : std::uint8_t {
    /// ActivityDefinition extension[url=message-name] with valueString/fixedString = value
    ActivityDefinitionMessageName,
    /// ActivityDefinition.url = value (version suffix "|x" ignored)
    ActivityDefinitionUrl,
    /// StructureDefinition declaring value as url, fixedString or valueString
    StructureDefinitionValue,
    /// Questionnaire.url = value (version suffix "|x" ignored)
    QuestionnaireUrl,
};

/// "activity-definition-message-name", "activity-definition-url", ...
[[nodiscard]] const char* cross_reference_kind_name(CrossReferenceKind kind) noexcept;

[[nodiscard]] std::optional<CrossReferenceKind> parse_cross_reference_kind(std::string_view name);

/// FHIR resource type a kind searches ("ActivityDefinition", ...)
[[nodiscard]] const char* resource_type_for(CrossReferenceKind kind) noexcept;

/// True when the document is of the kind's resource type and declares value
[[nodiscard]] bool matches(const FhirDocument& document, CrossReferenceKind kind, std::string_view value);

/// Check the file behind a found result; NotFound and unreadable files yield false
[[nodiscard]] bool cross_reference(const ResolutionResult& result, CrossReferenceKind kind, std::string_view value);

/// String-kind variant; an unknown kind yields false
[[nodiscard]] bool cross_reference(const ResolutionResult& result, std::string_view kind, std::string_view value);

// =============================================================================
// Directory Search
// =============================================================================

class CrossReferencer {
public:
    /// FHIR directories tried in order below a base directory
    CrossReferencer();
    explicit CrossReferencer(std::vector<std::string> layouts);

    /// First file declaring value, searching <base>/<layout>/<ResourceType> per layout.
    /// The first layout directory that yields a match wins.
    [[nodiscard]] std::optional<fs::path> find(const fs::path& base,
                                               CrossReferenceKind kind,
                                               std::string_view value) const;

    [[nodiscard]] bool exists(const fs::path& base, CrossReferenceKind kind, std::string_view value) const {
        return find(base, kind, value).has_value();
    }

    /// Parsed resources of one type below a directory (recursive, sorted by path).
    /// Unparsable files and files of another resource type are skipped.
    [[nodiscard]] static std::vector<FhirDocument> load_resources(const fs::path& dir,
                                                                  std::string_view resource_type);

    [[nodiscard]] const std::vector<std::string>& layouts() const noexcept { return m_layouts; }

private:
    std::vector<std::string> m_layouts;
};

// =============================================================================
// StructureDefinition Extraction
// =============================================================================

/// Task.instantiatesCanonical fixedCanonical of a Task profile
[[nodiscard]] std::optional<std::string> task_instantiates_canonical(const FhirDocument& structure_definition);

/// Task.input:message-name.value[x] fixedString (or valueString) of a Task profile
[[nodiscard]] std::optional<std::string> task_message_name(const FhirDocument& structure_definition);

} // namespace attest_resource
