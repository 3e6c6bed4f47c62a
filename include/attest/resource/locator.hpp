#pragma once

/// @file locator.hpp
/// @brief Locates declared resource references and classifies the hit
///
/// Search order (a priority order, the first hit decides the classification):
/// 1. <root>/<path>
/// 2. <root>/<subfolder>/<path> for each configured subfolder
/// 3. the raw reference as an absolute path (when enabled)
/// 4. archives visible to the project; a hit is materialized to a temp file
///
/// Containment is decided on canonical paths, so symlinks and ".." segments
/// that escape the root yield FoundOutsideRoot.

#include "fwd.hpp"
#include "resolution.hpp"
#include "root_resolver.hpp"

#include <attest/core/concurrent_cache.hpp>

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

namespace fs = std::filesystem;

/// True when file's canonical path lies strictly below dir's canonical path
[[nodiscard]] bool is_under_directory(const fs::path& file, const fs::path& dir);

/// Project directory a resource root belongs to: the directory above the
/// conventional output folder the root sits in, else the root itself. The
/// climb stops at the first directory holding a build file.
[[nodiscard]] fs::path project_dir_for_root(const fs::path& root_dir);

class ResourceLocator {
public:
    ResourceLocator(const attest_core::AttestConfig& config,
                    ArchiveCache& archives,
                    TempFileRegistry& temp_files);

    /// Locate a raw reference below root; the project is derived from the root
    [[nodiscard]] ResolutionResult locate(std::string_view reference, const ResourceRoot& root);

    /// Locate a raw reference below root, searching the archives of project_dir
    [[nodiscard]] ResolutionResult locate(std::string_view reference,
                                          const ResourceRoot& root,
                                          const fs::path& project_dir);

    /// Locate a batch of references; duplicates (after normalization) are resolved once
    [[nodiscard]] ResolvedResources locate_all(const std::vector<std::string>& references,
                                               const ResourceRoot& root,
                                               const fs::path& project_dir);

    /// Archives visible to a project, scanned once per project
    [[nodiscard]] std::shared_ptr<const DependencyArchiveSet> archives_for(const fs::path& project_dir);

    /// Number of archive entries extracted so far
    [[nodiscard]] std::size_t materialization_count() const { return m_materialized.construction_count(); }

private:
    [[nodiscard]] ResolutionResult classify(const fs::path& candidate, const ResourceRoot& root) const;

    [[nodiscard]] std::optional<FoundInDependency> search_dependencies(const std::string& path,
                                                                       const ResourceRoot& root,
                                                                       const fs::path& project_dir);

    [[nodiscard]] fs::path materialize(const ZipArchive& archive, const std::string& path);

    const attest_core::AttestConfig& m_config;
    ArchiveCache& m_archives;
    TempFileRegistry& m_temp_files;

    attest_core::ConcurrentCache<std::string, std::shared_ptr<const DependencyArchiveSet>> m_archive_sets;

    struct Materialized {
        fs::path file;
        fs::path archive;
    };
    attest_core::ConcurrentCache<std::string, std::optional<Materialized>> m_materialized;
};

} // namespace attest_resource
