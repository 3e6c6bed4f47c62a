/// @file descriptor.cpp
/// @brief Plugin descriptors and descriptor documents

#include <attest/plugin/descriptor.hpp>
#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace attest_plugin {

using attest_core::Err;
using attest_core::Error;
using attest_core::ErrorCode;
using attest_core::Ok;
using attest_core::Result;

attest_resource::RootHints PluginDescriptor::root_hints() const {
    attest_resource::RootHints hints;
    hints.plugin_name = name();
    hints.code_source = code_source();
    hints.definition_type = definition_type();
    return hints;
}

// =============================================================================
// JSON Parsing Helpers
// =============================================================================

namespace {

Result<std::vector<std::string>> parse_string_array(const nlohmann::json& j, const char* key) {
    std::vector<std::string> values;
    if (!j.contains(key)) {
        return Ok(std::move(values));
    }

    const auto& arr = j[key];
    if (!arr.is_array()) {
        return Err<std::vector<std::string>>(
            Error(ErrorCode::ParseError, std::string("'") + key + "' must be an array"));
    }

    for (const auto& item : arr) {
        if (!item.is_string()) {
            return Err<std::vector<std::string>>(
                Error(ErrorCode::ParseError, std::string("'") + key + "' must contain strings only"));
        }
        values.push_back(item.get<std::string>());
    }
    return Ok(std::move(values));
}

Result<ImplementationType> parse_implementation_type(const nlohmann::json& j) {
    ImplementationType type;

    // A bare string is a type without a known role
    if (j.is_string()) {
        type.type_name = j.get<std::string>();
        return Ok(std::move(type));
    }

    if (!j.is_object() || !j.contains("type") || !j["type"].is_string()) {
        return Err<ImplementationType>(
            Error(ErrorCode::ParseError, "Implementation type missing 'type' field"));
    }
    type.type_name = j["type"].get<std::string>();

    if (j.contains("role") && j["role"].is_string()) {
        const auto role_text = j["role"].get<std::string>();
        auto role = attest_types::parse_element_role(role_text);
        if (!role) {
            return Err<ImplementationType>(
                Error(ErrorCode::ParseError,
                      "Unknown element role '" + role_text + "' for " + type.type_name));
        }
        type.role = *role;
    }

    if (j.contains("process_model") && j["process_model"].is_string()) {
        type.process_model = j["process_model"].get<std::string>();
    }
    if (j.contains("element") && j["element"].is_string()) {
        type.element_id = j["element"].get<std::string>();
    }

    return Ok(std::move(type));
}

} // anonymous namespace

// =============================================================================
// StaticPluginDescriptor
// =============================================================================

Result<StaticPluginDescriptor> StaticPluginDescriptor::from_json_string(
    const std::string& json_str, const fs::path& base_dir) {

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<StaticPluginDescriptor>(
            Error(ErrorCode::ParseError, std::string("Descriptor JSON parse error: ") + e.what()));
    }

    if (!j.is_object()) {
        return Err<StaticPluginDescriptor>(
            Error(ErrorCode::ParseError, "Descriptor must be a JSON object"));
    }

    StaticPluginDescriptor descriptor;

    // Name is required
    if (!j.contains("name") || !j["name"].is_string() || j["name"].get<std::string>().empty()) {
        return Err<StaticPluginDescriptor>(
            Error(ErrorCode::ParseError, "Descriptor missing 'name' field"));
    }
    descriptor.m_name = j["name"].get<std::string>();

    if (j.contains("api_version")) {
        if (!j["api_version"].is_string()) {
            return Err<StaticPluginDescriptor>(
                Error(ErrorCode::ParseError, "'api_version' must be a string"));
        }
        descriptor.m_version = attest_types::parse_api_version(j["api_version"].get<std::string>());
    }

    if (j.contains("definition_type") && j["definition_type"].is_string()) {
        descriptor.m_definition_type = j["definition_type"].get<std::string>();
    }

    if (j.contains("code_source") && j["code_source"].is_string()) {
        fs::path source = j["code_source"].get<std::string>();
        if (source.is_relative() && !base_dir.empty()) {
            source = base_dir / source;
        }
        descriptor.m_code_source = source;
    }

    auto models = parse_string_array(j, "process_models");
    if (!models) {
        return Err<StaticPluginDescriptor>(models.error());
    }
    descriptor.m_process_models = std::move(*models);

    auto resources = parse_string_array(j, "fhir_resources");
    if (!resources) {
        return Err<StaticPluginDescriptor>(resources.error());
    }
    descriptor.m_fhir_resources = std::move(*resources);

    if (j.contains("implementation_types")) {
        if (!j["implementation_types"].is_array()) {
            return Err<StaticPluginDescriptor>(
                Error(ErrorCode::ParseError, "'implementation_types' must be an array"));
        }
        for (const auto& item : j["implementation_types"]) {
            auto type = parse_implementation_type(item);
            if (!type) {
                return Err<StaticPluginDescriptor>(type.error());
            }
            descriptor.m_types.push_back(std::move(*type));
        }
    }

    return Ok(std::move(descriptor));
}

Result<StaticPluginDescriptor> StaticPluginDescriptor::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Err<StaticPluginDescriptor>(
            Error(ErrorCode::NotFound, "Descriptor file not found: " + path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<StaticPluginDescriptor>(
            Error(ErrorCode::IOError, "Failed to open descriptor file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str(), path.parent_path());
    if (!result) {
        return Err<StaticPluginDescriptor>(result.error().with_context("file", path.string()));
    }
    return result;
}

StaticPluginDescriptor& StaticPluginDescriptor::add_process_model(std::string reference) {
    m_process_models.push_back(std::move(reference));
    return *this;
}

StaticPluginDescriptor& StaticPluginDescriptor::add_fhir_resource(std::string reference) {
    m_fhir_resources.push_back(std::move(reference));
    return *this;
}

StaticPluginDescriptor& StaticPluginDescriptor::add_implementation_type(ImplementationType type) {
    m_types.push_back(std::move(type));
    return *this;
}

StaticPluginDescriptor& StaticPluginDescriptor::set_code_source(fs::path dir) {
    m_code_source = std::move(dir);
    return *this;
}

StaticPluginDescriptor& StaticPluginDescriptor::set_definition_type(std::string type_name) {
    m_definition_type = std::move(type_name);
    return *this;
}

} // namespace attest_plugin
