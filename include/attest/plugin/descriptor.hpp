#pragma once

/// @file descriptor.hpp
/// @brief Plugin descriptor abstraction
///
/// A descriptor is what plugin discovery produced for one plugin: its API
/// generation, the resource references it declares and the implementation
/// types its process models name. The engine only consumes descriptors.

#include "fwd.hpp"

#include <attest/core/error.hpp>
#include <attest/resource/root_resolver.hpp>
#include <attest/types/capability.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace attest_plugin {

namespace fs = std::filesystem;

/// Implementation type named by a BPMN element, with the element's role
struct ImplementationType {
    std::string type_name;
    attest_types::ElementRole role = attest_types::ElementRole::Generic;

    /// Declaring process model and element, for findings
    std::string process_model;
    std::string element_id;
};

// =============================================================================
// PluginDescriptor
// =============================================================================

class PluginDescriptor {
public:
    virtual ~PluginDescriptor() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual attest_types::ApiVersion api_version() const = 0;

    /// Process model references, in declaration order
    [[nodiscard]] virtual std::vector<std::string> process_models() const = 0;

    /// FHIR resource references, in declaration order
    [[nodiscard]] virtual std::vector<std::string> fhir_resources() const = 0;

    [[nodiscard]] virtual std::vector<ImplementationType> implementation_types() const = 0;

    /// Directory the plugin definition type was loaded from
    [[nodiscard]] virtual std::optional<fs::path> code_source() const { return std::nullopt; }

    /// Fully qualified name of the plugin definition type
    [[nodiscard]] virtual std::string definition_type() const { return {}; }

    /// Hints for the resource root resolver
    [[nodiscard]] attest_resource::RootHints root_hints() const;
};

// =============================================================================
// StaticPluginDescriptor
// =============================================================================

/// Descriptor held in memory, typically read from a JSON document:
///
/// {
///   "name": "ping",
///   "api_version": "v2",
///   "definition_type": "org.example.ping.PingProcessPluginDefinition",
///   "code_source": "target/classes",
///   "process_models": ["bpe/ping.bpmn"],
///   "fhir_resources": ["fhir/ActivityDefinition/ping.xml"],
///   "implementation_types": [
///     {"type": "org.example.ping.SendPing", "role": "send-task",
///      "process_model": "bpe/ping.bpmn", "element": "sendPing"}
///   ]
/// }
class StaticPluginDescriptor : public PluginDescriptor {
public:
    StaticPluginDescriptor() = default;
    StaticPluginDescriptor(std::string name, attest_types::ApiVersion version)
        : m_name(std::move(name)), m_version(version) {}

    /// Parse a descriptor document. A relative code source is resolved
    /// against base_dir when one is given.
    [[nodiscard]] static attest_core::Result<StaticPluginDescriptor> from_json_string(
        const std::string& json_str, const fs::path& base_dir = {});

    [[nodiscard]] static attest_core::Result<StaticPluginDescriptor> load(const fs::path& path);

    [[nodiscard]] std::string name() const override { return m_name; }
    [[nodiscard]] attest_types::ApiVersion api_version() const override { return m_version; }
    [[nodiscard]] std::vector<std::string> process_models() const override { return m_process_models; }
    [[nodiscard]] std::vector<std::string> fhir_resources() const override { return m_fhir_resources; }
    [[nodiscard]] std::vector<ImplementationType> implementation_types() const override { return m_types; }
    [[nodiscard]] std::optional<fs::path> code_source() const override { return m_code_source; }
    [[nodiscard]] std::string definition_type() const override { return m_definition_type; }

    StaticPluginDescriptor& add_process_model(std::string reference);
    StaticPluginDescriptor& add_fhir_resource(std::string reference);
    StaticPluginDescriptor& add_implementation_type(ImplementationType type);
    StaticPluginDescriptor& set_code_source(fs::path dir);
    StaticPluginDescriptor& set_definition_type(std::string type_name);

private:
    std::string m_name;
    attest_types::ApiVersion m_version = attest_types::ApiVersion::Unknown;
    std::vector<std::string> m_process_models;
    std::vector<std::string> m_fhir_resources;
    std::vector<ImplementationType> m_types;
    std::optional<fs::path> m_code_source;
    std::string m_definition_type;
};

} // namespace attest_plugin
