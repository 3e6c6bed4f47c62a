/// @file project_layout.cpp
/// @brief Project layout scanning and dependency archive sets

#include <attest/resource/project_layout.hpp>
#include <attest/resource/archive.hpp>
#include <attest/core/config.hpp>
#include <attest/core/log.hpp>

#include <algorithm>
#include <initializer_list>

namespace attest_resource {

namespace {

/// True when the trailing components of rel equal tail
bool ends_with_components(const fs::path& rel, std::initializer_list<std::string_view> tail) {
    std::vector<std::string> parts;
    for (const auto& part : rel) {
        parts.push_back(part.string());
    }
    if (parts.size() < tail.size()) {
        return false;
    }
    auto it = parts.end() - static_cast<std::ptrdiff_t>(tail.size());
    for (auto expected : tail) {
        if (*it++ != expected) {
            return false;
        }
    }
    return true;
}

bool has_component(const fs::path& rel, std::string_view a, std::string_view b) {
    for (const auto& part : rel) {
        const auto s = part.string();
        if (s == a || s == b) {
            return true;
        }
    }
    return false;
}

bool is_directory(const fs::path& p) {
    std::error_code ec;
    return fs::is_directory(p, ec);
}

/// Archives directly inside dir, sorted by name
std::vector<fs::path> list_archives(const fs::path& dir, const attest_core::AttestConfig& config) {
    std::vector<fs::path> result;
    std::error_code ec;
    fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return result;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            attest_core::resolver_logger()->debug("Stopped listing {}: {}", dir.string(), ec.message());
            break;
        }
        std::error_code fec;
        if (it->is_regular_file(fec) && config.is_archive(it->path())) {
            result.push_back(it->path());
        }
    }
    std::sort(result.begin(), result.end());
    return result;
}

void scan_deep(ProjectLayout& layout, const attest_core::AttestConfig& config) {
    std::error_code ec;
    fs::recursive_directory_iterator it(layout.project_dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        attest_core::resolver_logger()->debug("Cannot walk {}: {}", layout.project_dir.string(), ec.message());
        return;
    }

    std::vector<fs::path> class_dirs;
    std::vector<fs::path> dependency_archives;

    for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            attest_core::resolver_logger()->debug("Walk of {} cut short: {}",
                layout.project_dir.string(), ec.message());
            break;
        }
        const fs::path rel = it->path().lexically_relative(layout.project_dir);
        const std::string name = it->path().filename().string();

        std::error_code sec;
        if (it->is_directory(sec)) {
            if (!name.empty() && name.front() == '.') {
                it.disable_recursion_pending();
                continue;
            }
            if (ends_with_components(rel, {"target", "classes"}) ||
                ends_with_components(rel, {"build", "classes", "java", "main"}) ||
                ends_with_components(rel, {"out", "production", "classes"})) {
                class_dirs.push_back(it->path());
                // Class output never nests further build output
                it.disable_recursion_pending();
            }
        } else if (it->is_regular_file(sec) && config.is_archive(it->path())) {
            if (has_component(rel.parent_path(), "dependency", "dependencies")) {
                dependency_archives.push_back(it->path());
            }
        }
    }

    std::sort(class_dirs.begin(), class_dirs.end());
    std::sort(dependency_archives.begin(), dependency_archives.end());

    layout.class_directories.insert(layout.class_directories.end(), class_dirs.begin(), class_dirs.end());
    layout.dependency_archives = std::move(dependency_archives);
}

} // anonymous namespace

std::vector<fs::path> ProjectLayout::all_archives() const {
    std::vector<fs::path> archives = root_archives;
    archives.insert(archives.end(), dependency_archives.begin(), dependency_archives.end());
    return archives;
}

std::string canonical_key(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        canonical = fs::absolute(path, ec).lexically_normal();
    }
    return canonical.string();
}

ProjectLayout scan_project_layout(const fs::path& project_dir,
                                  const attest_core::AttestConfig& config,
                                  LayoutDepth depth) {
    ProjectLayout layout;
    layout.project_dir = fs::path(canonical_key(project_dir));
    layout.depth = depth;

    if (!attest_resource::is_directory(layout.project_dir)) {
        return layout;
    }

    layout.class_directories.push_back(layout.project_dir);
    layout.root_archives = list_archives(layout.project_dir, config);

    if (depth == LayoutDepth::Deep) {
        scan_deep(layout, config);
        return layout;
    }

    for (const auto* rel : {"target/classes", "build/classes/java/main"}) {
        const fs::path dir = layout.project_dir / rel;
        if (attest_resource::is_directory(dir)) {
            layout.class_directories.push_back(dir);
        }
    }

    for (const auto& rel : config.dependency_directories) {
        const fs::path dir = layout.project_dir / rel;
        if (attest_resource::is_directory(dir)) {
            auto archives = list_archives(dir, config);
            layout.dependency_archives.insert(layout.dependency_archives.end(), archives.begin(), archives.end());
        }
    }

    return layout;
}

// =============================================================================
// DependencyArchiveSet
// =============================================================================

std::shared_ptr<const DependencyArchiveSet> DependencyArchiveSet::scan(
    const fs::path& project_dir,
    const attest_core::AttestConfig& config,
    ArchiveCache& cache)
{
    const ProjectLayout layout = scan_project_layout(project_dir, config, LayoutDepth::Standard);

    std::vector<std::shared_ptr<const ZipArchive>> archives;
    for (const auto& path : layout.all_archives()) {
        if (auto archive = cache.get(path)) {
            archives.push_back(std::move(archive));
        }
    }

    attest_core::resolver_logger()->debug("{} dependency archive(s) visible to {}",
        archives.size(), layout.project_dir.string());

    return std::make_shared<const DependencyArchiveSet>(std::move(archives));
}

std::shared_ptr<const ZipArchive> DependencyArchiveSet::find_entry(std::string_view entry) const {
    for (const auto& archive : m_archives) {
        if (archive->contains(entry)) {
            return archive;
        }
    }
    return nullptr;
}

} // namespace attest_resource
