/// @file main.cpp
/// @brief Plugin inspection demo
///
/// Inspects the plugins of one project directory. Each plugin is described
/// by a JSON descriptor document (see StaticPluginDescriptor).
///
///   attest_inspect [--config attest.json] [--deep] <project-dir> <descriptor.json>...

#include <attest/attest.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace {

void print_usage() {
    spdlog::info("usage: attest_inspect [--config attest.json] [--deep] <project-dir> <descriptor.json>...");
}

void print_findings(const std::vector<attest_lint::Finding>& findings) {
    for (const auto& finding : findings) {
        switch (finding.severity) {
            case attest_lint::Severity::Error:
                spdlog::error("  [{}] {}", finding.code, finding.message);
                break;
            case attest_lint::Severity::Warning:
                spdlog::warn("  [{}] {}", finding.code, finding.message);
                break;
            case attest_lint::Severity::Info:
            default:
                spdlog::info("  [{}] {}", finding.code, finding.message);
                break;
        }
    }
}

void print_registry(attest_lint::ResolutionContext& ctx, const std::filesystem::path& project_dir, bool deep) {
    auto registry = deep ? attest_lint::for_project_deep(ctx, project_dir)
                         : attest_lint::for_project(ctx, project_dir);
    std::string chain;
    for (const auto& stage : registry->stage_names()) {
        chain += chain.empty() ? stage : " -> " + stage;
    }
    spdlog::info("Type registry stages: {}", chain);
    for (const auto& location : registry->locations()) {
        spdlog::info("  {}", location.string());
    }
}

} // anonymous namespace

int main(int argc, char** argv) {
    std::filesystem::path config_path;
    bool deep = false;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--deep") {
            deep = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        print_usage();
        return 2;
    }

    attest_core::AttestConfig config;
    if (!config_path.empty()) {
        auto loaded = attest_core::AttestConfig::load(config_path);
        if (!loaded) {
            spdlog::error("{}", attest_core::build_error_chain(loaded.error()));
            return 2;
        }
        config = std::move(*loaded);
    }
    config.apply_environment();

    attest_core::LogConfig log_config;
    log_config.level = config.log_level;
    attest_core::configure_logging(log_config);

    const std::filesystem::path project_dir = positional.front();
    std::error_code ec;
    if (!std::filesystem::is_directory(project_dir, ec)) {
        spdlog::error("Not a directory: {}", project_dir.string());
        return 2;
    }

    std::vector<std::shared_ptr<const attest_plugin::PluginDescriptor>> plugins;
    for (std::size_t i = 1; i < positional.size(); ++i) {
        auto descriptor = attest_plugin::StaticPluginDescriptor::load(positional[i]);
        if (!descriptor) {
            spdlog::error("{}", attest_core::build_error_chain(descriptor.error()));
            return 2;
        }
        plugins.push_back(std::make_shared<attest_plugin::StaticPluginDescriptor>(std::move(*descriptor)));
    }

    attest_lint::ResolutionContext ctx(config);
    print_registry(ctx, project_dir, deep);

    attest_lint::PluginInspector inspector(ctx);
    const auto report = inspector.inspect_project(project_dir, plugins);

    spdlog::info("Shared resource root: {}", report.shared_root.to_string());
    for (const auto& plugin : report.plugins) {
        spdlog::info("Plugin '{}' (API {}), root {}", plugin.plugin_name,
                     attest_types::api_version_name(plugin.api_version), plugin.resource_root.to_string());
        print_findings(plugin.findings);
    }
    if (!report.findings.empty()) {
        spdlog::info("Project:");
        print_findings(report.findings);
    }

    attest_core::shutdown_logging();
    return report.passed() ? 0 : 1;
}
