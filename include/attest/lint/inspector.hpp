#pragma once

/// @file inspector.hpp
/// @brief Runs resolution and verification for the plugins of a project
///
/// The inspector is the glue between a plugin descriptor and the engine:
/// resolve the resource root, locate every reference, verify every
/// implementation type and turn the classified outcomes into findings.
/// Content rules on the located files are left to the caller.

#include "fwd.hpp"
#include "context.hpp"

#include <attest/plugin/descriptor.hpp>
#include <attest/resource/leftover.hpp>
#include <attest/resource/resolution.hpp>

#include <memory>
#include <string>
#include <vector>

namespace attest_lint {

enum class Severity : std::uint8_t {
    Info,
    Warning,
    Error,
};

[[nodiscard]] const char* severity_name(Severity severity) noexcept;

struct Finding {
    Severity severity = Severity::Info;

    /// Stable identifier, e.g. "resource-outside-root"
    std::string code;

    /// Reference or type name the finding is about
    std::string subject;

    std::string message;
};

struct TypeCheck {
    attest_plugin::ImplementationType type;
    attest_types::VerificationResult result;
};

struct PluginReport {
    std::string plugin_name;
    attest_types::ApiVersion api_version = attest_types::ApiVersion::Unknown;
    attest_resource::ResourceRoot resource_root;

    attest_resource::ResolvedResources process_models;
    attest_resource::ResolvedResources fhir_resources;
    std::vector<TypeCheck> type_checks;
    std::vector<Finding> findings;

    [[nodiscard]] std::size_t count(Severity severity) const noexcept;
    [[nodiscard]] bool passed() const noexcept { return count(Severity::Error) == 0; }
};

struct ProjectReport {
    fs::path project_dir;
    attest_resource::ResourceRoot shared_root;
    std::vector<PluginReport> plugins;
    attest_resource::LeftoverAnalysis leftovers;

    /// Findings not tied to a single plugin (unreferenced files)
    std::vector<Finding> findings;

    [[nodiscard]] bool passed() const noexcept;
};

class PluginInspector {
public:
    explicit PluginInspector(ResolutionContext& ctx) : m_ctx(ctx) {}

    /// Inspect one plugin of a project against the given root.
    /// Throws std::invalid_argument when project_dir is not a directory.
    [[nodiscard]] PluginReport inspect(const fs::path& project_dir,
                                       const attest_plugin::PluginDescriptor& plugin,
                                       const attest_resource::ResourceRoot& root);

    /// Inspect one plugin, resolving its root first
    [[nodiscard]] PluginReport inspect(const fs::path& project_dir,
                                       const attest_plugin::PluginDescriptor& plugin);

    /// Inspect every plugin of a project and look for resources none of them
    /// references. A single plugin without a code source uses the shared root.
    [[nodiscard]] ProjectReport inspect_project(
        const fs::path& project_dir,
        const std::vector<std::shared_ptr<const attest_plugin::PluginDescriptor>>& plugins);

private:
    [[nodiscard]] attest_resource::ResourceRoot root_for(
        const fs::path& project_dir,
        const attest_plugin::PluginDescriptor& plugin,
        std::size_t plugin_count,
        const attest_resource::ResourceRoot& shared);

    ResolutionContext& m_ctx;
};

} // namespace attest_lint
