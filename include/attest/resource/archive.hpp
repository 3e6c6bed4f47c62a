#pragma once

/// @file archive.hpp
/// @brief Read-only access to zip containers (jar files)
///
/// Only the central directory is parsed on open; entry data is read on
/// demand. Stored and deflated entries are supported. Zip64 archives and
/// encrypted entries are rejected.

#include "fwd.hpp"

#include <attest/core/concurrent_cache.hpp>
#include <attest/core/error.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace attest_resource {

namespace fs = std::filesystem;

/// Central directory record of one entry
struct ZipEntry {
    std::string name;
    std::uint16_t method = 0;  ///< 0 = stored, 8 = deflated
    std::uint16_t flags = 0;
    std::uint32_t crc32 = 0;
    std::uint32_t compressed_size = 0;
    std::uint32_t uncompressed_size = 0;
    std::uint32_t local_header_offset = 0;

    [[nodiscard]] bool is_directory() const noexcept {
        return !name.empty() && name.back() == '/';
    }
};

class ZipArchive {
public:
    /// Open an archive and index its central directory
    [[nodiscard]] static attest_core::Result<std::shared_ptr<const ZipArchive>> open(const fs::path& path);

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }
    [[nodiscard]] const std::vector<ZipEntry>& entries() const noexcept { return m_entries; }
    [[nodiscard]] std::size_t entry_count() const noexcept { return m_entries.size(); }

    /// Find an entry by exact name ('/' separators, no leading '/')
    [[nodiscard]] const ZipEntry* find(std::string_view name) const;

    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }

    /// Read and decompress an entry, verifying its CRC-32
    [[nodiscard]] attest_core::Result<std::vector<std::uint8_t>> read(std::string_view name) const;

    /// Read an entry and write it to dest (parent directories must exist)
    [[nodiscard]] attest_core::Result<void> extract_to(std::string_view name, const fs::path& dest) const;

private:
    ZipArchive() = default;

    [[nodiscard]] attest_core::Result<std::vector<std::uint8_t>> read_entry(const ZipEntry& entry) const;

    fs::path m_path;
    std::uint64_t m_file_size = 0;
    std::vector<ZipEntry> m_entries;
    std::unordered_map<std::string, std::size_t> m_index;
};

/// Archives opened once per canonical path and shared between the locator
/// and the type registry. Unreadable archives are cached as null.
class ArchiveCache {
public:
    ArchiveCache() = default;

    /// Opened archive, or nullptr when the file is not a readable zip
    [[nodiscard]] std::shared_ptr<const ZipArchive> get(const fs::path& path);

    [[nodiscard]] std::size_t size() const { return m_cache.size(); }

    void clear() { m_cache.clear(); }

private:
    attest_core::ConcurrentCache<std::string, std::shared_ptr<const ZipArchive>> m_cache;
};

} // namespace attest_resource
