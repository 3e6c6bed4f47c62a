/// @file locator.cpp
/// @brief Resource location across disk layouts and dependency archives

#include <attest/resource/locator.hpp>
#include <attest/resource/archive.hpp>
#include <attest/resource/normalizer.hpp>
#include <attest/resource/project_layout.hpp>
#include <attest/resource/temp_files.hpp>
#include <attest/core/config.hpp>
#include <attest/core/log.hpp>

#include <optional>
#include <set>
#include <stdexcept>

namespace attest_resource {

namespace {

bool is_file(const fs::path& p) {
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

fs::path canonical_or_self(const fs::path& p) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : canonical;
}

std::string_view trim(std::string_view s) {
    constexpr std::string_view whitespace = " \t\r\n\f\v";
    const auto first = s.find_first_not_of(whitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    return s.substr(first, s.find_last_not_of(whitespace) - first + 1);
}

bool has_build_file(const fs::path& dir) {
    std::error_code ec;
    return fs::exists(dir / "pom.xml", ec) || fs::exists(dir / "build.gradle", ec) ||
           fs::exists(dir / "build.gradle.kts", ec);
}

/// Directory above a conventional resource or class output folder
std::optional<fs::path> layout_parent(const fs::path& dir) {
    struct Layout {
        std::string_view suffix;
        int depth;
    };
    static constexpr Layout k_layouts[] = {
        {"/src/main/resources", 3},
        {"/build/resources/main", 3},
        {"/build/classes/java/main", 4},
        {"/target/classes", 2},
    };

    const std::string norm = dir.generic_string();
    for (const auto& layout : k_layouts) {
        if (norm.size() >= layout.suffix.size() &&
            norm.compare(norm.size() - layout.suffix.size(), layout.suffix.size(), layout.suffix) == 0) {
            fs::path project = dir;
            for (int i = 0; i < layout.depth; ++i) {
                project = project.parent_path();
            }
            return project;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

// =============================================================================
// Free Functions
// =============================================================================

bool is_under_directory(const fs::path& file, const fs::path& dir) {
    const fs::path file_canonical = canonical_or_self(file);
    const fs::path dir_canonical = canonical_or_self(dir);

    const fs::path rel = file_canonical.lexically_relative(dir_canonical);
    if (rel.empty() || rel == ".") {
        return false;
    }
    return *rel.begin() != "..";
}

fs::path project_dir_for_root(const fs::path& root_dir) {
    const fs::path root = canonical_or_self(root_dir);

    // Only the conventional output folders are climbed out of. A build file
    // further up belongs to an enclosing project, not to this root.
    for (fs::path dir = root; !dir.empty(); dir = dir.parent_path()) {
        if (has_build_file(dir)) {
            break;
        }
        if (auto project = layout_parent(dir)) {
            return *project;
        }
        if (dir == dir.parent_path()) {
            break;
        }
    }
    return root;
}

// =============================================================================
// ResourceLocator
// =============================================================================

ResourceLocator::ResourceLocator(const attest_core::AttestConfig& config,
                                 ArchiveCache& archives,
                                 TempFileRegistry& temp_files)
    : m_config(config)
    , m_archives(archives)
    , m_temp_files(temp_files) {}

ResolutionResult ResourceLocator::locate(std::string_view reference, const ResourceRoot& root) {
    return locate(reference, root, project_dir_for_root(root.directory));
}

ResolutionResult ResourceLocator::locate(std::string_view reference,
                                         const ResourceRoot& root,
                                         const fs::path& project_dir) {
    const NormalizedPath normalized = normalize_reference(reference, m_config);
    if (normalized.empty()) {
        return NotFound{};
    }
    const std::string& path = normalized.str();
    auto log = attest_core::resolver_logger();

    // Disk: directly below the root
    try {
        const fs::path direct = root.directory / path;
        if (is_file(direct)) {
            return classify(direct, root);
        }
    } catch (const fs::filesystem_error& e) {
        log->debug("Disk lookup of '{}' failed: {}", path, e.what());
    }

    // Disk: well-known subfolders
    for (const auto& subfolder : m_config.search_subfolders) {
        try {
            const fs::path candidate = root.directory / subfolder / path;
            if (is_file(candidate)) {
                return classify(candidate, root);
            }
        } catch (const fs::filesystem_error& e) {
            log->debug("Subfolder lookup of '{}' in {} failed: {}", path, subfolder, e.what());
        }
    }

    if (m_config.accept_absolute_references) {
        const fs::path raw(std::string(trim(reference)));
        if (raw.is_absolute() && is_file(raw)) {
            return classify(raw, root);
        }
    }

    if (auto dependency = search_dependencies(path, root, project_dir)) {
        return *dependency;
    }

    return NotFound{};
}

ResolutionResult ResourceLocator::classify(const fs::path& candidate, const ResourceRoot& root) const {
    const fs::path canonical = canonical_or_self(candidate);
    if (is_under_directory(canonical, root.directory)) {
        return FoundInRoot{canonical};
    }
    attest_core::resolver_logger()->debug("{} resolves outside expected root {}",
        candidate.string(), root.directory.string());
    return FoundOutsideRoot{candidate, canonical, root.directory};
}

std::shared_ptr<const DependencyArchiveSet> ResourceLocator::archives_for(const fs::path& project_dir) {
    const std::string key = canonical_key(project_dir);
    return m_archive_sets.get_or_create(key, [this, &key]() {
        return DependencyArchiveSet::scan(fs::path(key), m_config, m_archives);
    });
}

std::optional<FoundInDependency> ResourceLocator::search_dependencies(const std::string& path,
                                                                      const ResourceRoot& root,
                                                                      const fs::path& project_dir) {
    const std::string key = canonical_key(project_dir) + "::dep::" + path;
    auto log = attest_core::resolver_logger();

    for (int attempt = 0; attempt < 2; ++attempt) {
        std::optional<Materialized> hit;
        try {
            hit = m_materialized.get_or_create(key, [this, &project_dir, &path]() -> std::optional<Materialized> {
                const auto archive_set = archives_for(project_dir);
                const auto archive = archive_set->find_entry(path);
                if (!archive) {
                    return std::nullopt;
                }
                return Materialized{materialize(*archive, path), archive->path()};
            });
        } catch (const std::exception& e) {
            log->debug("Dependency lookup of '{}' failed: {}", path, e.what());
            return std::nullopt;
        }

        if (!hit) {
            return std::nullopt;
        }
        if (is_file(hit->file)) {
            return FoundInDependency{hit->file, hit->archive, root.directory};
        }

        // The materialized copy was released by a caller; extract again
        m_materialized.erase(key);
    }
    return std::nullopt;
}

fs::path ResourceLocator::materialize(const ZipArchive& archive, const std::string& path) {
    const fs::path dir = m_temp_files.create_directory();
    if (dir.empty()) {
        throw std::runtime_error("no temporary directory for " + path);
    }

    const fs::path target = dir / fs::path(path).relative_path();
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        throw std::runtime_error("cannot create " + target.parent_path().string() + ": " + ec.message());
    }

    auto extracted = archive.extract_to(path, target);
    if (!extracted) {
        m_temp_files.track(target);
        m_temp_files.release(target);
        throw std::runtime_error(attest_core::build_error_chain(extracted.error()));
    }

    m_temp_files.track(target);
    attest_core::resolver_logger()->debug("Materialized '{}' from {} to {}",
        path, archive.path().filename().string(), target.string());
    return target;
}

ResolvedResources ResourceLocator::locate_all(const std::vector<std::string>& references,
                                              const ResourceRoot& root,
                                              const fs::path& project_dir) {
    ResolvedResources resources;
    std::set<std::string> seen;

    for (const auto& reference : references) {
        const NormalizedPath normalized = normalize_reference(reference, m_config);
        if (!seen.insert(normalized.str()).second) {
            continue;
        }

        const ResolutionResult result = locate(reference, root, project_dir);
        if (const auto* in_root = std::get_if<FoundInRoot>(&result)) {
            resources.valid_files.push_back(in_root->file);
        } else if (const auto* dependency = std::get_if<FoundInDependency>(&result)) {
            resources.valid_files.push_back(dependency->materialized_file);
            resources.from_dependencies.emplace(reference, *dependency);
        } else if (const auto* outside = std::get_if<FoundOutsideRoot>(&result)) {
            resources.outside_root.emplace(reference, *outside);
        } else {
            resources.missing_references.push_back(reference);
        }
    }

    return resources;
}

} // namespace attest_resource
