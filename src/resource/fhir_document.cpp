/// @file fhir_document.cpp
/// @brief FHIR XML (libxml2) and JSON (nlohmann) readers

#include <attest/resource/fhir_document.hpp>

#include <libxml/parser.h>
#include <libxml/tree.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

namespace attest_resource {

using attest_core::Err;
using attest_core::Error;
using attest_core::ErrorCode;
using attest_core::Ok;
using attest_core::Result;

namespace {

// =============================================================================
// XML
// =============================================================================

void ensure_libxml_initialized() {
    static std::once_flag once;
    std::call_once(once, []() { xmlInitParser(); });
}

struct XmlDocDeleter {
    void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};

struct XmlCharDeleter {
    void operator()(xmlChar* text) const { xmlFree(text); }
};

FhirElement convert_xml_element(xmlDoc* doc, const xmlNode* node) {
    FhirElement element(reinterpret_cast<const char*>(node->name));

    for (const xmlAttr* attr = node->properties; attr; attr = attr->next) {
        std::unique_ptr<xmlChar, XmlCharDeleter> text(xmlNodeListGetString(doc, attr->children, 1));
        element.set_attribute(reinterpret_cast<const char*>(attr->name),
                              text ? reinterpret_cast<const char*>(text.get()) : "");
    }

    for (const xmlNode* child = node->children; child; child = child->next) {
        if (child->type == XML_ELEMENT_NODE) {
            element.add_child(convert_xml_element(doc, child));
        }
    }
    return element;
}

// =============================================================================
// JSON
// =============================================================================

constexpr std::array<std::string_view, 3> k_attribute_keys = {"id", "sliceName", "url"};

bool is_attribute_key(const std::string& key) {
    return std::find(k_attribute_keys.begin(), k_attribute_keys.end(), key) != k_attribute_keys.end();
}

std::string scalar_text(const nlohmann::json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump();
}

void convert_json_member(const std::string& name, const nlohmann::json& value, FhirElement& parent);

void convert_json_fields(const nlohmann::json& object, FhirElement& element, bool promote_attributes) {
    for (const auto& [key, value] : object.items()) {
        if (key == "resourceType") {
            continue;
        }
        if (promote_attributes && is_attribute_key(key) && !value.is_structured()) {
            continue;
        }
        convert_json_member(key, value, element);
    }
}

void convert_json_member(const std::string& name, const nlohmann::json& value, FhirElement& parent) {
    if (value.is_null()) {
        return;
    }

    if (value.is_array()) {
        for (const auto& item : value) {
            convert_json_member(name, item, parent);
        }
        return;
    }

    if (!value.is_object()) {
        FhirElement leaf(name);
        leaf.set_attribute("value", scalar_text(value));
        parent.add_child(std::move(leaf));
        return;
    }

    // Embedded resource: <name><Type>...</Type></name>
    if (value.contains("resourceType") && value["resourceType"].is_string()) {
        FhirElement wrapper(name);
        FhirElement resource(value["resourceType"].get<std::string>());
        convert_json_fields(value, resource, false);
        wrapper.add_child(std::move(resource));
        parent.add_child(std::move(wrapper));
        return;
    }

    FhirElement element(name);
    for (auto key : k_attribute_keys) {
        auto it = value.find(std::string(key));
        if (it != value.end() && !it->is_structured() && !it->is_null()) {
            element.set_attribute(std::string(key), scalar_text(*it));
        }
    }
    convert_json_fields(value, element, true);
    parent.add_child(std::move(element));
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

// =============================================================================
// FhirElement
// =============================================================================

const std::string* FhirElement::attribute(std::string_view name) const {
    for (const auto& [key, value] : m_attributes) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

const FhirElement* FhirElement::child(std::string_view name) const {
    for (const auto& c : m_children) {
        if (c.m_name == name) {
            return &c;
        }
    }
    return nullptr;
}

bool FhirElement::any_of(const std::function<bool(const FhirElement&)>& pred) const {
    if (pred(*this)) {
        return true;
    }
    return std::any_of(m_children.begin(), m_children.end(),
        [&pred](const FhirElement& c) { return c.any_of(pred); });
}

std::vector<const FhirElement*> FhirElement::find_all(const std::function<bool(const FhirElement&)>& pred) const {
    std::vector<const FhirElement*> found;
    std::vector<const FhirElement*> stack{this};
    while (!stack.empty()) {
        const FhirElement* current = stack.back();
        stack.pop_back();
        if (pred(*current)) {
            found.push_back(current);
        }
        for (auto it = current->m_children.rbegin(); it != current->m_children.rend(); ++it) {
            stack.push_back(&*it);
        }
    }
    return found;
}

void FhirElement::set_attribute(std::string name, std::string value) {
    for (auto& [key, existing] : m_attributes) {
        if (key == name) {
            existing = std::move(value);
            return;
        }
    }
    m_attributes.emplace_back(std::move(name), std::move(value));
}

FhirElement& FhirElement::add_child(FhirElement child) {
    m_children.push_back(std::move(child));
    return m_children.back();
}

// =============================================================================
// FhirDocument
// =============================================================================

Result<FhirDocument> FhirDocument::load(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return Err<FhirDocument>(Error(ErrorCode::IOError, "Cannot open " + path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    const std::string text = buffer.str();

    const std::string ext = to_lower(path.extension().string());
    bool as_json = ext == ".json";
    if (ext != ".json" && ext != ".xml") {
        const auto first = text.find_first_not_of(" \t\r\n\xEF\xBB\xBF");
        as_json = first != std::string::npos && text[first] == '{';
    }

    auto result = as_json ? parse_json(text) : parse_xml(text);
    if (!result) {
        result.error().with_context("file", path.string());
        return result;
    }
    result->m_source = path;
    return result;
}

Result<FhirDocument> FhirDocument::parse_xml(std::string_view text) {
    ensure_libxml_initialized();

    std::unique_ptr<xmlDoc, XmlDocDeleter> doc(xmlReadMemory(
        text.data(), static_cast<int>(text.size()), "resource.xml", nullptr,
        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING));
    if (!doc) {
        const xmlError* error = xmlGetLastError();
        std::string reason = error && error->message ? error->message : "malformed XML";
        while (!reason.empty() && (reason.back() == '\n' || reason.back() == ' ')) {
            reason.pop_back();
        }
        return Err<FhirDocument>(Error(ErrorCode::ParseError, "XML parse error: " + reason));
    }

    const xmlNode* root = xmlDocGetRootElement(doc.get());
    if (!root) {
        return Err<FhirDocument>(Error(ErrorCode::ParseError, "XML document has no root element"));
    }

    FhirDocument document;
    document.m_root = convert_xml_element(doc.get(), root);
    return Ok(std::move(document));
}

Result<FhirDocument> FhirDocument::parse_json(std::string_view text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<FhirDocument>(Error(ErrorCode::ParseError, std::string("JSON parse error: ") + e.what()));
    }

    if (!j.is_object() || !j.contains("resourceType") || !j["resourceType"].is_string()) {
        return Err<FhirDocument>(Error(ErrorCode::ParseError,
            "JSON does not appear to be a FHIR resource (missing resourceType)"));
    }

    FhirDocument document;
    document.m_root = FhirElement(j["resourceType"].get<std::string>());
    convert_json_fields(j, document.m_root, false);
    return Ok(std::move(document));
}

bool is_fhir_file(const fs::path& path) {
    const std::string ext = to_lower(path.extension().string());
    return ext == ".xml" || ext == ".json";
}

} // namespace attest_resource
