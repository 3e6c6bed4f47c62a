/// @file root_resolver.cpp
/// @brief Resource root resolution strategies

#include <attest/resource/root_resolver.hpp>
#include <attest/resource/project_layout.hpp>
#include <attest/core/log.hpp>

namespace attest_resource {

namespace {

bool is_dir(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

bool exists(const fs::path& p) {
    std::error_code ec;
    return fs::exists(p, ec);
}

bool ends_with(const std::string& s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

ResourceRoot make_root(fs::path dir, RootStrategy strategy, std::string description) {
    return ResourceRoot{std::move(dir), strategy, std::move(description)};
}

} // anonymous namespace

const char* root_strategy_name(RootStrategy strategy) noexcept {
    switch (strategy) {
        case RootStrategy::CodeSourceMaven: return "CodeSourceMaven";
        case RootStrategy::CodeSourceGradle: return "CodeSourceGradle";
        case RootStrategy::CodeSourceDirect: return "CodeSourceDirect";
        case RootStrategy::PackageModuleMaven: return "PackageModuleMaven";
        case RootStrategy::PackageModuleGradle: return "PackageModuleGradle";
        case RootStrategy::MavenTargetClasses: return "MavenTargetClasses";
        case RootStrategy::MavenSourceResources: return "MavenSourceResources";
        case RootStrategy::GradleBuildResources: return "GradleBuildResources";
        case RootStrategy::GradleSourceResources: return "GradleSourceResources";
        case RootStrategy::SourceResources: return "SourceResources";
        case RootStrategy::FlatLayout: return "FlatLayout";
        case RootStrategy::SharedRootParent: return "SharedRootParent";
        case RootStrategy::ProjectRootFallback: return "ProjectRootFallback";
        default: return "Unknown";
    }
}

std::string ResourceRoot::to_string() const {
    return std::string("ResourceRoot[") + root_strategy_name(strategy) + "]: " +
           directory.string() + " (" + description + ")";
}

// =============================================================================
// Strategies
// =============================================================================

namespace strategies {

std::optional<ResourceRoot> from_code_source(const fs::path& code_source) {
    // Archives as code source carry no resource directory
    if (!is_dir(code_source)) {
        return std::nullopt;
    }

    const fs::path dir(canonical_key(code_source));
    std::string norm = dir.generic_string();
    while (norm.size() > 1 && norm.back() == '/') {
        norm.pop_back();
    }

    if (ends_with(norm, "/target/classes")) {
        return make_root(dir, RootStrategy::CodeSourceMaven, "Detected from plugin code source (Maven)");
    }

    if (ends_with(norm, "/build/classes/java/main")) {
        const fs::path resources = dir.parent_path().parent_path().parent_path() / "resources" / "main";
        if (is_dir(resources)) {
            return make_root(resources, RootStrategy::CodeSourceGradle,
                "Detected from plugin code source (Gradle resources)");
        }
        return make_root(dir, RootStrategy::CodeSourceGradle,
            "Detected from plugin code source (Gradle classes, no resources dir)");
    }

    return make_root(dir, RootStrategy::CodeSourceDirect, "Detected from plugin code source (unknown layout)");
}

std::optional<ResourceRoot> from_package_module(const fs::path& base_dir, const std::string& definition_type) {
    const auto last_dot = definition_type.rfind('.');
    if (last_dot == std::string::npos) {
        return std::nullopt;
    }
    const std::string package = definition_type.substr(0, last_dot);

    // A single-segment package is too generic to name a module
    const auto package_dot = package.rfind('.');
    if (package_dot == std::string::npos) {
        return std::nullopt;
    }
    const std::string module = package.substr(package_dot + 1);

    const fs::path module_dir = base_dir / module;
    if (!is_dir(module_dir)) {
        return std::nullopt;
    }

    if (is_dir(module_dir / "target" / "classes")) {
        return make_root(module_dir / "target" / "classes", RootStrategy::PackageModuleMaven,
            "Detected from package-based module resolution (Maven)");
    }
    if (is_dir(module_dir / "build" / "resources" / "main")) {
        return make_root(module_dir / "build" / "resources" / "main", RootStrategy::PackageModuleGradle,
            "Detected from package-based module resolution (Gradle)");
    }
    return std::nullopt;
}

ResourceRoot from_structure(const fs::path& project_dir) {
    const fs::path source_resources = project_dir / "src" / "main" / "resources";

    if (attest_resource::exists(project_dir / "pom.xml")) {
        if (is_dir(project_dir / "target" / "classes")) {
            return make_root(project_dir / "target" / "classes", RootStrategy::MavenTargetClasses,
                "Maven project with compiled classes");
        }
        if (is_dir(source_resources)) {
            return make_root(source_resources, RootStrategy::MavenSourceResources,
                "Maven project with source resources (not yet compiled)");
        }
    }

    if (attest_resource::exists(project_dir / "build.gradle") || attest_resource::exists(project_dir / "build.gradle.kts")) {
        if (is_dir(project_dir / "build" / "resources" / "main")) {
            return make_root(project_dir / "build" / "resources" / "main", RootStrategy::GradleBuildResources,
                "Gradle project with compiled resources");
        }
        if (is_dir(source_resources)) {
            return make_root(source_resources, RootStrategy::GradleSourceResources,
                "Gradle project with source resources (not yet compiled)");
        }
    }

    if (is_dir(source_resources)) {
        return make_root(source_resources, RootStrategy::SourceResources, "Nested source resource layout");
    }

    if (is_dir(project_dir / "bpe") || is_dir(project_dir / "fhir")) {
        return make_root(project_dir, RootStrategy::FlatLayout, "Flat resource layout");
    }

    return make_root(project_dir, RootStrategy::ProjectRootFallback, "Using project root as last resort");
}

} // namespace strategies

// =============================================================================
// ResourceRootResolver
// =============================================================================

ResourceRoot ResourceRootResolver::resolve_root(const fs::path& project_dir) {
    const std::string key = canonical_key(project_dir);
    return m_defaults.get_or_create(key, [&key]() {
        ResourceRoot root = strategies::from_structure(fs::path(key));
        attest_core::resolver_logger()->debug("Default root for {}: {}", key, root.to_string());
        return root;
    });
}

ResourceRoot ResourceRootResolver::resolve_shared_root(const fs::path& project_dir,
                                                       const std::vector<RootHints>& plugins) {
    const std::string key = canonical_key(project_dir);
    return m_shared.get_or_create(key, [this, &key, &project_dir, &plugins]() {
        if (plugins.size() > 1) {
            attest_core::resolver_logger()->debug(
                "{} plugins share {}; shared root follows the first plugin '{}'",
                plugins.size(), key, plugins.front().plugin_name);
        }
        if (!plugins.empty() && plugins.front().code_source) {
            if (auto root = strategies::from_code_source(*plugins.front().code_source)) {
                return *root;
            }
        }
        return resolve_root(project_dir);
    });
}

ResourceRoot ResourceRootResolver::resolve_root(const fs::path& project_dir, const RootHints& plugin) {
    const std::string project_key = canonical_key(project_dir);
    const std::string key = project_key + "#" + plugin.plugin_name + "#" + plugin.definition_type;

    return m_plugins.get_or_create(key, [this, &project_key, &project_dir, &plugin]() {
        if (plugin.code_source) {
            if (auto root = strategies::from_code_source(*plugin.code_source)) {
                return *root;
            }
        }

        std::optional<ResourceRoot> memo = m_shared.get(project_key);
        const ResourceRoot shared = memo ? std::move(*memo) : resolve_root(project_dir);

        // Roots that already are the project directory have no usable parent
        fs::path base = shared.directory.parent_path();
        if (shared.directory == fs::path(project_key) || base.empty()) {
            base = fs::path(project_key);
        }

        if (!plugin.definition_type.empty()) {
            if (auto root = strategies::from_package_module(fs::path(project_key), plugin.definition_type)) {
                return *root;
            }
            if (base != fs::path(project_key)) {
                if (auto root = strategies::from_package_module(base, plugin.definition_type)) {
                    return *root;
                }
            }
        }

        if (base == fs::path(project_key)) {
            return shared;
        }
        return make_root(base, RootStrategy::SharedRootParent,
            "Parent of shared root " + shared.directory.string());
    });
}

void ResourceRootResolver::clear() {
    m_defaults.clear();
    m_shared.clear();
    m_plugins.clear();
}

} // namespace attest_resource
