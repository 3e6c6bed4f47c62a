/// @file type_registry.cpp
/// @brief TypeRegistry lookup chain and per-project cache

#include <attest/types/type_registry.hpp>
#include <attest/resource/archive.hpp>
#include <attest/resource/project_layout.hpp>
#include <attest/core/config.hpp>
#include <attest/core/log.hpp>

#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace attest_types {

// =============================================================================
// TypeRegistry
// =============================================================================

TypeRegistry::TypeRegistry(fs::path project_dir, std::vector<Stage> stages, std::vector<fs::path> locations)
    : m_project_dir(std::move(project_dir))
    , m_stages(std::move(stages))
    , m_locations(std::move(locations)) {}

bool TypeRegistry::exists(std::string_view name) const {
    return resolve(name).has_value();
}

std::optional<TypeDescriptor> TypeRegistry::resolve(std::string_view name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    for (const auto& stage : m_stages) {
        if (auto descriptor = stage.lookup(name)) {
            return descriptor;
        }
    }
    return std::nullopt;
}

std::optional<std::string> TypeRegistry::stage_of(std::string_view name) const {
    if (name.empty()) {
        return std::nullopt;
    }
    for (const auto& stage : m_stages) {
        if (stage.lookup(name)) {
            return stage.name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> TypeRegistry::origin_of(std::string_view name) const {
    auto descriptor = resolve(name);
    if (!descriptor) {
        return std::nullopt;
    }
    return descriptor->origin;
}

std::vector<std::string> TypeRegistry::supertypes_of(std::string_view name) const {
    std::vector<std::string> result;
    auto start = resolve(name);
    if (!start) {
        return result;
    }

    std::unordered_set<std::string> seen{std::string(name)};
    std::deque<std::string> queue;
    for (auto& super : start->direct_supertypes()) {
        if (seen.insert(super).second) {
            queue.push_back(std::move(super));
        }
    }

    // Breadth-first so nearer ancestors come first
    while (!queue.empty()) {
        std::string current = std::move(queue.front());
        queue.pop_front();

        if (auto descriptor = resolve(current)) {
            for (auto& super : descriptor->direct_supertypes()) {
                if (seen.insert(super).second) {
                    queue.push_back(std::move(super));
                }
            }
        }
        result.push_back(std::move(current));
    }
    return result;
}

bool TypeRegistry::is_subtype_of(std::string_view name, std::string_view of, bool proper) const {
    if (name.empty() || of.empty() || !exists(name)) {
        return false;
    }
    if (name == of) {
        return !proper;
    }
    for (const auto& super : supertypes_of(name)) {
        if (super == of) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> TypeRegistry::stage_names() const {
    std::vector<std::string> names;
    names.reserve(m_stages.size());
    for (const auto& stage : m_stages) {
        names.push_back(stage.name);
    }
    return names;
}

// =============================================================================
// Construction
// =============================================================================

std::shared_ptr<const TypeRegistry> build_type_registry(
    const fs::path& project_dir,
    attest_resource::LayoutDepth depth,
    const attest_core::AttestConfig& config,
    attest_resource::ArchiveCache& archives,
    std::shared_ptr<const TypeSource> ambient)
{
    const bool deep = depth == attest_resource::LayoutDepth::Deep;
    attest_core::LogScope scope(std::string("type registry for ") + project_dir.string() + (deep ? " (deep)" : ""),
                                "types");
    auto log = attest_core::types_logger();

    const auto layout = attest_resource::scan_project_layout(project_dir, config, depth);

    std::vector<std::unique_ptr<TypeSource>> sources;
    std::vector<fs::path> locations;

    for (const auto& dir : layout.class_directories) {
        sources.push_back(std::make_unique<ClassDirectorySource>(dir));
        locations.push_back(dir);
    }

    for (const auto& path : layout.all_archives()) {
        auto archive = archives.get(path);
        if (!archive) {
            log->debug("Leaving unreadable archive {} out of the type registry", path.string());
            continue;
        }
        sources.push_back(std::make_unique<ClassArchiveSource>(std::move(archive)));
        locations.push_back(path);
    }

    log->debug("Type registry for {}: {} location(s)", layout.project_dir.string(), locations.size());

    auto project = std::make_shared<const ProjectTypeContext>(std::move(sources));

    std::vector<TypeRegistry::Stage> stages;
    if (ambient) {
        stages.push_back({"ambient", [ambient](std::string_view name) { return ambient->find(name); }});
    }
    stages.push_back({"project", [project](std::string_view name) { return project->find(name); }});
    stages.push_back({"probe", make_file_probe(layout.project_dir)});

    return std::make_shared<const TypeRegistry>(layout.project_dir, std::move(stages), std::move(locations));
}

// =============================================================================
// TypeRegistryCache
// =============================================================================

TypeRegistryCache::TypeRegistryCache(const attest_core::AttestConfig& config,
                                     attest_resource::ArchiveCache& archives,
                                     std::shared_ptr<const TypeSource> ambient)
    : m_config(config)
    , m_archives(archives)
    , m_ambient(std::move(ambient)) {}

std::shared_ptr<const TypeRegistry> TypeRegistryCache::for_project(const fs::path& project_dir) {
    return get(project_dir, attest_resource::LayoutDepth::Standard);
}

std::shared_ptr<const TypeRegistry> TypeRegistryCache::for_project_deep(const fs::path& project_dir) {
    return get(project_dir, attest_resource::LayoutDepth::Deep);
}

std::shared_ptr<const TypeRegistry> TypeRegistryCache::get(const fs::path& project_dir,
                                                           attest_resource::LayoutDepth depth) {
    std::error_code ec;
    if (!fs::is_directory(project_dir, ec)) {
        throw std::invalid_argument("Project directory does not exist: " + project_dir.string());
    }

    const bool deep = depth == attest_resource::LayoutDepth::Deep;
    const std::string key = attest_resource::canonical_key(project_dir) + (deep ? "#deep" : "");

    return m_registries.get_or_create(key, [this, &project_dir, depth]() {
        return build_type_registry(project_dir, depth, m_config, m_archives, m_ambient);
    });
}

} // namespace attest_types
