#pragma once

/// @file test_support.hpp
/// @brief Throw-away project trees, zip archives and class files for tests

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace attest_test {

namespace fs = std::filesystem;

/// Unique directory below the system temp dir, removed on destruction
class TempProject {
public:
    explicit TempProject(std::string_view tag = "project");
    ~TempProject();

    TempProject(const TempProject&) = delete;
    TempProject& operator=(const TempProject&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return m_path; }

    /// Write a text file, creating parent directories
    fs::path write(const fs::path& relative, std::string_view content = "x") const;

    /// Write a binary file, creating parent directories
    fs::path write_bytes(const fs::path& relative, const std::vector<std::uint8_t>& bytes) const;

    fs::path mkdir(const fs::path& relative) const;

    /// Canonical form of path() / relative
    [[nodiscard]] fs::path canonical(const fs::path& relative = {}) const;

private:
    fs::path m_path;
};

/// Builds zip archives with stored or deflated entries
class ZipWriter {
public:
    ZipWriter& add(std::string name, std::string_view data, bool deflate = true);
    ZipWriter& add(std::string name, const std::vector<std::uint8_t>& data, bool deflate = true);

    [[nodiscard]] std::vector<std::uint8_t> bytes() const;

    void write(const fs::path& path) const;

private:
    struct Entry {
        std::string name;
        std::vector<std::uint8_t> data;
        bool deflate = true;
    };
    std::vector<Entry> m_entries;
};

/// Offsets of 32-bit fields inside a central directory header
inline constexpr std::size_t k_central_compressed_size = 20;
inline constexpr std::size_t k_central_uncompressed_size = 24;

/// Overwrite a 32-bit field of the first central directory header in bytes
void patch_central_field(std::vector<std::uint8_t>& bytes, std::size_t field_offset, std::uint32_t value);

/// Minimal class file image: constant pool, flags, this, super, interfaces
[[nodiscard]] std::vector<std::uint8_t> make_class_file(std::string_view name,
                                                        std::optional<std::string_view> super_name,
                                                        const std::vector<std::string>& interfaces = {},
                                                        std::uint16_t access_flags = 0x0021);

/// Same, with the interface access flags set
[[nodiscard]] std::vector<std::uint8_t> make_interface_file(std::string_view name,
                                                            const std::vector<std::string>& extends = {});

/// Number of entries in the temp dir whose name starts with prefix
[[nodiscard]] std::size_t count_temp_entries(std::string_view prefix);

/// Prefix unique to the calling test, for temp file registries
[[nodiscard]] std::string unique_prefix(std::string_view tag);

} // namespace attest_test
