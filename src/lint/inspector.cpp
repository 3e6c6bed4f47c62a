/// @file inspector.cpp
/// @brief PluginInspector

#include <attest/lint/inspector.hpp>
#include <attest/plugin/api_version.hpp>
#include <attest/resource/normalizer.hpp>
#include <attest/core/log.hpp>

#include <set>
#include <stdexcept>

namespace attest_lint {

using attest_resource::FoundInDependency;
using attest_resource::FoundOutsideRoot;
using attest_resource::ResolvedResources;
using attest_types::VerificationResult;

namespace {

void require_directory(const fs::path& project_dir) {
    std::error_code ec;
    if (!fs::is_directory(project_dir, ec)) {
        throw std::invalid_argument("Project directory does not exist: " + project_dir.string());
    }
}

void add_resource_findings(const ResolvedResources& resolved, const char* what, std::vector<Finding>& findings) {
    for (const auto& reference : resolved.missing_references) {
        findings.push_back({Severity::Error, "resource-missing", reference,
                            std::string(what) + " reference not found: " + reference});
    }

    for (const auto& [reference, hit] : resolved.outside_root) {
        findings.push_back({Severity::Error, "resource-outside-root", reference,
                            std::string(what) + " " + reference + " found at " + hit.actual_location.string() +
                                ", outside the resource root " + hit.expected_root.string()});
    }

    for (const auto& [reference, hit] : resolved.from_dependencies) {
        findings.push_back({Severity::Info, "resource-from-dependency", reference,
                            std::string(what) + " " + reference + " provided by " + hit.origin_archive.string()});
    }
}

Finding type_finding(const attest_plugin::ImplementationType& type, const VerificationResult& result) {
    std::string where;
    if (!type.process_model.empty()) {
        where = " (" + type.process_model + (type.element_id.empty() ? "" : "#" + type.element_id) + ")";
    }

    switch (result.status) {
        case VerificationResult::Status::NotFound:
            return {Severity::Error, "type-not-found", type.type_name, result.message + where};
        case VerificationResult::Status::NotSatisfied:
            return {Severity::Error, "type-not-satisfied", type.type_name, result.message + where};
        case VerificationResult::Status::EmptyName:
            return {Severity::Error, "type-name-empty", type.type_name, result.message + where};
        case VerificationResult::Status::Passed:
        default:
            return {Severity::Info, "type-verified", type.type_name, result.message + where};
    }
}

} // anonymous namespace

const char* severity_name(Severity severity) noexcept {
    switch (severity) {
        case Severity::Info: return "info";
        case Severity::Warning: return "warning";
        case Severity::Error: return "error";
        default: return "unknown";
    }
}

std::size_t PluginReport::count(Severity severity) const noexcept {
    std::size_t n = 0;
    for (const auto& finding : findings) {
        if (finding.severity == severity) {
            ++n;
        }
    }
    return n;
}

bool ProjectReport::passed() const noexcept {
    for (const auto& plugin : plugins) {
        if (!plugin.passed()) {
            return false;
        }
    }
    for (const auto& finding : findings) {
        if (finding.severity == Severity::Error) {
            return false;
        }
    }
    return true;
}

// =============================================================================
// PluginInspector
// =============================================================================

PluginReport PluginInspector::inspect(const fs::path& project_dir,
                                      const attest_plugin::PluginDescriptor& plugin,
                                      const attest_resource::ResourceRoot& root) {
    require_directory(project_dir);

    auto log = attest_core::lint_logger();
    attest_core::LogScope scope("inspect plugin " + plugin.name(), "lint");

    PluginReport report;
    report.plugin_name = plugin.name();
    report.resource_root = root;
    report.api_version = plugin.api_version();

    if (report.api_version == attest_types::ApiVersion::Unknown) {
        if (auto detected = attest_plugin::detect_api_version(project_dir)) {
            report.api_version = detected->version;
            log->debug("Plugin '{}' uses API {} ({})", report.plugin_name,
                       attest_types::api_version_name(detected->version), detected->evidence.string());
        } else {
            report.findings.push_back({Severity::Warning, "api-version-unknown", report.plugin_name,
                                       "Could not determine the API generation of " + report.plugin_name});
        }
    }

    if (root.is_degraded()) {
        report.findings.push_back({Severity::Warning, "resource-root-degraded", root.directory.string(),
                                   "No resource layout detected, using " + root.directory.string()});
    }

    auto& locator = m_ctx.locator();
    report.process_models = locator.locate_all(plugin.process_models(), root, project_dir);
    report.fhir_resources = locator.locate_all(plugin.fhir_resources(), root, project_dir);

    add_resource_findings(report.process_models, "Process model", report.findings);
    add_resource_findings(report.fhir_resources, "FHIR resource", report.findings);

    const auto types = plugin.implementation_types();
    if (!types.empty()) {
        auto registry = m_ctx.registries().for_project(project_dir);
        for (const auto& type : types) {
            const auto capabilities = attest_types::capabilities_for(report.api_version, type.role);
            auto result = attest_types::verify(type.type_name, capabilities, *registry);
            report.findings.push_back(type_finding(type, result));
            if (result.base_warning) {
                report.findings.push_back({Severity::Warning, "type-base-not-extended", type.type_name,
                                           *result.base_warning});
            }
            report.type_checks.push_back({type, std::move(result)});
        }
    }

    log->info("Plugin '{}': process models={} (missing={}, outside-root={}, from-dependencies={}), "
              "FHIR resources={} (missing={}, outside-root={}, from-dependencies={}), types={}",
              report.plugin_name,
              report.process_models.valid_files.size(), report.process_models.missing_references.size(),
              report.process_models.outside_root.size(), report.process_models.from_dependencies.size(),
              report.fhir_resources.valid_files.size(), report.fhir_resources.missing_references.size(),
              report.fhir_resources.outside_root.size(), report.fhir_resources.from_dependencies.size(),
              report.type_checks.size());

    return report;
}

PluginReport PluginInspector::inspect(const fs::path& project_dir,
                                      const attest_plugin::PluginDescriptor& plugin) {
    require_directory(project_dir);
    const auto shared = m_ctx.roots().resolve_shared_root(project_dir, {plugin.root_hints()});
    return inspect(project_dir, plugin, root_for(project_dir, plugin, 1, shared));
}

ProjectReport PluginInspector::inspect_project(
    const fs::path& project_dir,
    const std::vector<std::shared_ptr<const attest_plugin::PluginDescriptor>>& plugins) {

    require_directory(project_dir);

    ProjectReport report;
    report.project_dir = project_dir;

    std::vector<attest_resource::RootHints> hints;
    hints.reserve(plugins.size());
    for (const auto& plugin : plugins) {
        hints.push_back(plugin->root_hints());
    }
    report.shared_root = m_ctx.roots().resolve_shared_root(project_dir, hints);

    std::set<std::string> referenced_models;
    std::set<std::string> referenced_fhir;

    for (const auto& plugin : plugins) {
        const auto root = root_for(project_dir, *plugin, plugins.size(), report.shared_root);
        report.plugins.push_back(inspect(project_dir, *plugin, root));

        for (const auto& reference : plugin->process_models()) {
            auto path = attest_resource::normalize_reference(reference, m_ctx.config());
            if (!path.empty()) {
                referenced_models.insert(path.str());
            }
        }
        for (const auto& reference : plugin->fhir_resources()) {
            auto path = attest_resource::normalize_reference(reference, m_ctx.config());
            if (!path.empty()) {
                referenced_fhir.insert(path.str());
            }
        }
    }

    report.leftovers = attest_resource::find_unreferenced_resources(
        report.shared_root.directory, referenced_models, referenced_fhir);

    for (const auto& path : report.leftovers.unreferenced_process_models) {
        report.findings.push_back({Severity::Warning, "resource-unreferenced", path,
                                   "Process model is not referenced by any plugin: " + path});
    }
    for (const auto& path : report.leftovers.unreferenced_fhir_resources) {
        report.findings.push_back({Severity::Warning, "resource-unreferenced", path,
                                   "FHIR resource is not referenced by any plugin: " + path});
    }

    return report;
}

attest_resource::ResourceRoot PluginInspector::root_for(
    const fs::path& project_dir,
    const attest_plugin::PluginDescriptor& plugin,
    std::size_t plugin_count,
    const attest_resource::ResourceRoot& shared) {

    if (plugin_count <= 1 && !plugin.code_source()) {
        return shared;
    }
    return m_ctx.roots().resolve_root(project_dir, plugin.root_hints());
}

} // namespace attest_lint
