#pragma once

/// @file temp_files.hpp
/// @brief Tracking and cleanup of materialized dependency resources

#include "fwd.hpp"

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

/// Owns temporary files created while materializing archive entries.
/// cleanup() deletes every tracked file, then the directories created by
/// create_directory() that are left empty. Deletion failures are ignored.
/// The destructor runs cleanup().
class TempFileRegistry {
public:
    explicit TempFileRegistry(std::string prefix = "attest-dependency-");
    ~TempFileRegistry();

    TempFileRegistry(const TempFileRegistry&) = delete;
    TempFileRegistry& operator=(const TempFileRegistry&) = delete;

    /// Create a fresh, uniquely named directory below the system temp dir.
    /// Returns an empty path when the directory cannot be created.
    [[nodiscard]] fs::path create_directory();

    /// Track a file for deletion
    void track(const fs::path& file);

    /// Delete one tracked file now, with the directories it leaves empty
    void release(const fs::path& file);

    /// Delete every tracked file and directory
    void cleanup();

    [[nodiscard]] std::size_t tracked_count() const;
    [[nodiscard]] std::vector<fs::path> tracked_files() const;
    [[nodiscard]] const std::string& prefix() const noexcept { return m_prefix; }

private:
    [[nodiscard]] fs::path owning_directory(const fs::path& file) const;
    static void remove_file_and_empty_parents(const fs::path& file, const fs::path& owner);
    static void prune_empty_directories(const fs::path& dir);

    std::string m_prefix;
    mutable std::mutex m_mutex;
    std::vector<fs::path> m_files;
    std::vector<fs::path> m_directories;
    std::uint64_t m_counter = 0;
};

} // namespace attest_resource
