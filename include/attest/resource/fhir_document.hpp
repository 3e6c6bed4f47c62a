#pragma once

/// @file fhir_document.hpp
/// @brief Element tree for FHIR resources in XML or JSON encoding
///
/// Both encodings map onto the XML shape: the root element is the resource
/// type, primitives are elements with a "value" attribute, arrays repeat
/// the element, and the JSON keys "id", "sliceName" and "url" of complex
/// values become attributes. An embedded resource ("resource": {...})
/// becomes <resource><Type>...</Type></resource>.

#include "fwd.hpp"

#include <attest/core/error.hpp>

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

class FhirElement {
public:
    FhirElement() = default;
    explicit FhirElement(std::string name) : m_name(std::move(name)) {}

    [[nodiscard]] const std::string& name() const noexcept { return m_name; }

    /// Attribute value, or nullptr when absent
    [[nodiscard]] const std::string* attribute(std::string_view name) const;

    /// Shorthand for attribute("value")
    [[nodiscard]] const std::string* value() const { return attribute("value"); }

    [[nodiscard]] const std::vector<FhirElement>& children() const noexcept { return m_children; }

    /// First direct child with the given name
    [[nodiscard]] const FhirElement* child(std::string_view name) const;

    /// True when this element or any descendant satisfies pred
    [[nodiscard]] bool any_of(const std::function<bool(const FhirElement&)>& pred) const;

    /// Every element (this one included) satisfying pred, document order
    [[nodiscard]] std::vector<const FhirElement*> find_all(const std::function<bool(const FhirElement&)>& pred) const;

    void set_attribute(std::string name, std::string value);
    FhirElement& add_child(FhirElement child);

private:
    std::string m_name;
    std::vector<std::pair<std::string, std::string>> m_attributes;
    std::vector<FhirElement> m_children;
};

class FhirDocument {
public:
    /// Load a .xml or .json file (other extensions are sniffed by content)
    [[nodiscard]] static attest_core::Result<FhirDocument> load(const fs::path& path);

    [[nodiscard]] static attest_core::Result<FhirDocument> parse_xml(std::string_view text);

    /// Fails when the JSON has no string "resourceType"
    [[nodiscard]] static attest_core::Result<FhirDocument> parse_json(std::string_view text);

    [[nodiscard]] const FhirElement& root() const noexcept { return m_root; }

    [[nodiscard]] const std::string& resource_type() const noexcept { return m_root.name(); }

    [[nodiscard]] const fs::path& source() const noexcept { return m_source; }

private:
    FhirElement m_root;
    fs::path m_source;
};

/// True for file names ending in .xml or .json (case-insensitive)
[[nodiscard]] bool is_fhir_file(const fs::path& path);

} // namespace attest_resource
