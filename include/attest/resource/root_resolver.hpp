#pragma once

/// @file root_resolver.hpp
/// @brief Determines the directory a plugin's resources are expected in
///
/// Strategies, in priority order:
/// 1. code source of the plugin definition type (Maven, Gradle or direct)
/// 2. package-based module directory (plugin-specific resolution only)
/// 3. Maven structure (pom.xml): target/classes, else src/main/resources
/// 4. Gradle structure (build.gradle[.kts]): build/resources/main, else src/main/resources
/// 5. nested source layout without build file: src/main/resources
/// 6. flat layout: project directory holding bpe/ or fhir/
/// 7. degraded: the project directory itself
///
/// Probing only reads directory metadata. Results are memoized per
/// canonical project path.

#include "fwd.hpp"

#include <attest/core/concurrent_cache.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

enum class RootStrategy : std::uint8_t {
    CodeSourceMaven,
    CodeSourceGradle,
    CodeSourceDirect,
    PackageModuleMaven,
    PackageModuleGradle,
    MavenTargetClasses,
    MavenSourceResources,
    GradleBuildResources,
    GradleSourceResources,
    SourceResources,
    FlatLayout,
    SharedRootParent,
    ProjectRootFallback,
};

[[nodiscard]] const char* root_strategy_name(RootStrategy strategy) noexcept;

struct ResourceRoot {
    fs::path directory;
    RootStrategy strategy = RootStrategy::ProjectRootFallback;
    std::string description;

    /// True when no convention matched and the project directory is used as-is
    [[nodiscard]] bool is_degraded() const noexcept {
        return strategy == RootStrategy::ProjectRootFallback;
    }

    [[nodiscard]] std::string to_string() const;
};

/// What the resolver may know about one plugin
struct RootHints {
    std::string plugin_name;

    /// Directory the plugin definition type was loaded from, if known
    std::optional<fs::path> code_source;

    /// Fully qualified name of the plugin definition type ("org.example.proc.ExamplePlugin")
    std::string definition_type;
};

class ResourceRootResolver {
public:
    ResourceRootResolver() = default;

    /// Project-wide default root from the directory structure alone
    [[nodiscard]] ResourceRoot resolve_root(const fs::path& project_dir);

    /// Root of one plugin. Falls back to the parent of the shared root when
    /// the plugin carries no convention of its own.
    [[nodiscard]] ResourceRoot resolve_root(const fs::path& project_dir, const RootHints& plugin);

    /// Root shared by all plugins of a project. The first plugin's code
    /// source decides when present (first plugin wins).
    [[nodiscard]] ResourceRoot resolve_shared_root(const fs::path& project_dir,
                                                   const std::vector<RootHints>& plugins);

    /// Number of distinct filesystem probes performed (memoization is observable in tests)
    [[nodiscard]] std::size_t probe_count() const {
        return m_defaults.construction_count() + m_shared.construction_count() +
               m_plugins.construction_count();
    }

    void clear();

private:
    attest_core::ConcurrentCache<std::string, ResourceRoot> m_defaults;
    attest_core::ConcurrentCache<std::string, ResourceRoot> m_shared;
    attest_core::ConcurrentCache<std::string, ResourceRoot> m_plugins;
};

// =============================================================================
// Individual Strategies (exposed for testing)
// =============================================================================

namespace strategies {

[[nodiscard]] std::optional<ResourceRoot> from_code_source(const fs::path& code_source);

[[nodiscard]] std::optional<ResourceRoot> from_package_module(const fs::path& base_dir,
                                                              const std::string& definition_type);

/// Steps 3 to 7 of the priority list; always yields a root
[[nodiscard]] ResourceRoot from_structure(const fs::path& project_dir);

} // namespace strategies

} // namespace attest_resource
