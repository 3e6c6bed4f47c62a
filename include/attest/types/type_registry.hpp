#pragma once

/// @file type_registry.hpp
/// @brief Layered, per-project type lookup
///
/// A registry answers structural questions about type names of one project
/// through an ordered chain of lookup stages:
/// 1. ambient: the platform API types
/// 2. project: compiled output directories and archives of the project
/// 3. probe: direct class file existence check below conventional folders
///
/// Registries are read-only after construction. TypeRegistryCache builds at
/// most one registry per canonical project path (and one more per path for
/// the deep variant).

#include "fwd.hpp"
#include "type_source.hpp"

#include <attest/core/concurrent_cache.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attest_core {
struct AttestConfig;
}

namespace attest_resource {
class ArchiveCache;
enum class LayoutDepth : std::uint8_t;
}

namespace attest_types {

namespace fs = std::filesystem;

class TypeRegistry {
public:
    struct Stage {
        std::string name;
        TypeLookup lookup;
    };

    TypeRegistry(fs::path project_dir, std::vector<Stage> stages, std::vector<fs::path> locations = {});

    /// True when any stage knows the type
    [[nodiscard]] bool exists(std::string_view name) const;

    /// Descriptor from the first stage that knows the type
    [[nodiscard]] std::optional<TypeDescriptor> resolve(std::string_view name) const;

    /// Name of the stage that resolved the type ("ambient", "project", "probe")
    [[nodiscard]] std::optional<std::string> stage_of(std::string_view name) const;

    /// Location the type was read from, analogous to a code source
    [[nodiscard]] std::optional<std::string> origin_of(std::string_view name) const;

    /// Transitive supertypes, nearest first, each listed once. Unresolvable
    /// ancestors are listed but not expanded.
    [[nodiscard]] std::vector<std::string> supertypes_of(std::string_view name) const;

    /// True when name is `of` or descends from it. With proper set, a type
    /// is never a subtype of itself.
    [[nodiscard]] bool is_subtype_of(std::string_view name, std::string_view of, bool proper = false) const;

    [[nodiscard]] const fs::path& project_dir() const noexcept { return m_project_dir; }

    /// Class directories and archives the project stage reads from
    [[nodiscard]] const std::vector<fs::path>& locations() const noexcept { return m_locations; }

    [[nodiscard]] std::vector<std::string> stage_names() const;

private:
    fs::path m_project_dir;
    std::vector<Stage> m_stages;
    std::vector<fs::path> m_locations;
};

/// Build a registry for one project. Locations that cannot be opened are
/// logged at debug level and left out.
[[nodiscard]] std::shared_ptr<const TypeRegistry> build_type_registry(
    const fs::path& project_dir,
    attest_resource::LayoutDepth depth,
    const attest_core::AttestConfig& config,
    attest_resource::ArchiveCache& archives,
    std::shared_ptr<const TypeSource> ambient);

class TypeRegistryCache {
public:
    TypeRegistryCache(const attest_core::AttestConfig& config,
                      attest_resource::ArchiveCache& archives,
                      std::shared_ptr<const TypeSource> ambient);

    /// Registry over the conventional top-level output folders.
    /// Throws std::invalid_argument when project_dir is not a directory.
    [[nodiscard]] std::shared_ptr<const TypeRegistry> for_project(const fs::path& project_dir);

    /// Registry over the whole directory tree (multi-module projects)
    [[nodiscard]] std::shared_ptr<const TypeRegistry> for_project_deep(const fs::path& project_dir);

    /// Registries built so far (standard and deep)
    [[nodiscard]] std::size_t construction_count() const { return m_registries.construction_count(); }

    [[nodiscard]] std::size_t size() const { return m_registries.size(); }

    void clear() { m_registries.clear(); }

private:
    [[nodiscard]] std::shared_ptr<const TypeRegistry> get(const fs::path& project_dir,
                                                          attest_resource::LayoutDepth depth);

    const attest_core::AttestConfig& m_config;
    attest_resource::ArchiveCache& m_archives;
    std::shared_ptr<const TypeSource> m_ambient;
    attest_core::ConcurrentCache<std::string, std::shared_ptr<const TypeRegistry>> m_registries;
};

} // namespace attest_types
