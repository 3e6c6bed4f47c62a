#pragma once

/// @file project_layout.hpp
/// @brief Build-tool layout conventions of a plugin project
///
/// One place knows where compiled output and archives live:
/// - the project root itself (exploded layouts)
/// - target/classes (Maven) and build/classes/java/main (Gradle)
/// - archives directly in the project root
/// - archives in the configured dependency directories
///
/// The deep variant walks the whole tree for multi-module projects and also
/// accepts out/production/classes.

#include "fwd.hpp"

#include <attest/core/fwd.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

enum class LayoutDepth : std::uint8_t {
    Standard,  ///< Top-level conventional folders, dependency dirs listed shallowly
    Deep,      ///< Recursive walk of the project tree
};

struct ProjectLayout {
    fs::path project_dir;
    LayoutDepth depth = LayoutDepth::Standard;

    /// Directories holding loose class files, in lookup order
    std::vector<fs::path> class_directories;

    /// Archives directly in the project directory
    std::vector<fs::path> root_archives;

    /// Archives from dependency-output directories
    std::vector<fs::path> dependency_archives;

    /// Root archives followed by dependency archives
    [[nodiscard]] std::vector<fs::path> all_archives() const;
};

/// Canonical string key for a project directory (symlinks resolved where possible)
[[nodiscard]] std::string canonical_key(const fs::path& path);

/// Collect lookup locations. Unreadable directories are skipped.
[[nodiscard]] ProjectLayout scan_project_layout(const fs::path& project_dir,
                                                const attest_core::AttestConfig& config,
                                                LayoutDepth depth = LayoutDepth::Standard);

/// Opened archives visible to one project, in lookup order
class DependencyArchiveSet {
public:
    DependencyArchiveSet() = default;
    explicit DependencyArchiveSet(std::vector<std::shared_ptr<const ZipArchive>> archives)
        : m_archives(std::move(archives)) {}

    /// Open every archive of the standard layout through the shared cache
    [[nodiscard]] static std::shared_ptr<const DependencyArchiveSet> scan(
        const fs::path& project_dir,
        const attest_core::AttestConfig& config,
        ArchiveCache& cache);

    /// First archive that contains the entry, or nullptr
    [[nodiscard]] std::shared_ptr<const ZipArchive> find_entry(std::string_view entry) const;

    [[nodiscard]] const std::vector<std::shared_ptr<const ZipArchive>>& archives() const noexcept {
        return m_archives;
    }

    [[nodiscard]] bool empty() const noexcept { return m_archives.empty(); }

private:
    std::vector<std::shared_ptr<const ZipArchive>> m_archives;
};

} // namespace attest_resource
