/// @file archive.cpp
/// @brief Zip central directory parsing and entry extraction

#include <attest/resource/archive.hpp>
#include <attest/core/log.hpp>

#include <zlib.h>

#include <algorithm>
#include <fstream>

namespace attest_resource {

using attest_core::ArchiveError;
using attest_core::Err;
using attest_core::Ok;
using attest_core::Result;

namespace {

constexpr std::uint32_t k_local_header_sig = 0x04034b50;
constexpr std::uint32_t k_central_header_sig = 0x02014b50;
constexpr std::uint32_t k_end_of_central_dir_sig = 0x06054b50;

constexpr std::size_t k_local_header_size = 30;
constexpr std::size_t k_central_header_size = 46;
constexpr std::size_t k_end_of_central_dir_size = 22;
constexpr std::size_t k_max_comment_size = 0xFFFF;

constexpr std::uint16_t k_method_stored = 0;
constexpr std::uint16_t k_method_deflated = 8;
constexpr std::uint16_t k_flag_encrypted = 0x0001;

// Deflate cannot expand data by more than about 1032:1
constexpr std::uint64_t k_max_deflate_ratio = 1032;
constexpr std::uint64_t k_max_entry_size = 256ull * 1024 * 1024;

std::uint16_t read_u16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t read_u32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

bool read_at(std::ifstream& in, std::uint64_t offset, std::uint8_t* out, std::size_t size) {
    in.clear();
    in.seekg(static_cast<std::streamoff>(offset));
    in.read(reinterpret_cast<char*>(out), static_cast<std::streamsize>(size));
    return static_cast<std::size_t>(in.gcount()) == size;
}

Result<std::vector<std::uint8_t>> inflate_raw(const std::vector<std::uint8_t>& compressed,
                                              std::size_t expected_size,
                                              const std::string& archive,
                                              const std::string& entry) {
    // zlib rejects a null output buffer, so keep at least one byte
    std::vector<std::uint8_t> out(std::max<std::size_t>(expected_size, 1));

    z_stream stream{};
    // Negative window bits: raw deflate data without zlib header
    if (inflateInit2(&stream, -MAX_WBITS) != Z_OK) {
        return Err<std::vector<std::uint8_t>>(ArchiveError::corrupt(archive, "inflateInit2 failed"));
    }

    stream.next_in = const_cast<Bytef*>(compressed.data());
    stream.avail_in = static_cast<uInt>(compressed.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    const int rc = inflate(&stream, Z_FINISH);
    const auto produced = stream.total_out;
    inflateEnd(&stream);

    if (rc != Z_STREAM_END || produced != expected_size) {
        return Err<std::vector<std::uint8_t>>(
            ArchiveError::corrupt(archive, "deflate stream of '" + entry + "' is invalid"));
    }
    out.resize(expected_size);
    return Ok(std::move(out));
}

} // anonymous namespace

// =============================================================================
// ZipArchive
// =============================================================================

Result<std::shared_ptr<const ZipArchive>> ZipArchive::open(const fs::path& path) {
    using R = std::shared_ptr<const ZipArchive>;

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Err<R>(ArchiveError::open_failed(path.string()));
    }

    in.seekg(0, std::ios::end);
    const auto file_size = static_cast<std::uint64_t>(in.tellg());
    if (file_size < k_end_of_central_dir_size) {
        return Err<R>(ArchiveError::not_an_archive(path.string()));
    }

    // The end record sits in the last 22 bytes plus an optional comment
    const std::size_t tail_size = static_cast<std::size_t>(
        std::min<std::uint64_t>(file_size, k_end_of_central_dir_size + k_max_comment_size));
    std::vector<std::uint8_t> tail(tail_size);
    if (!read_at(in, file_size - tail_size, tail.data(), tail_size)) {
        return Err<R>(ArchiveError::open_failed(path.string()));
    }

    std::size_t eocd = std::string::npos;
    for (std::size_t i = tail_size - k_end_of_central_dir_size + 1; i-- > 0;) {
        if (read_u32(&tail[i]) == k_end_of_central_dir_sig) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) {
        return Err<R>(ArchiveError::not_an_archive(path.string()));
    }

    const std::uint8_t* rec = &tail[eocd];
    const std::uint16_t entry_count = read_u16(rec + 10);
    const std::uint32_t dir_size = read_u32(rec + 12);
    const std::uint32_t dir_offset = read_u32(rec + 16);

    if (entry_count == 0xFFFF || dir_size == 0xFFFFFFFF || dir_offset == 0xFFFFFFFF) {
        return Err<R>(ArchiveError::unsupported(path.string(), "zip64"));
    }
    if (static_cast<std::uint64_t>(dir_offset) + dir_size > file_size) {
        return Err<R>(ArchiveError::corrupt(path.string(), "central directory out of bounds"));
    }

    std::vector<std::uint8_t> dir(dir_size);
    if (dir_size > 0 && !read_at(in, dir_offset, dir.data(), dir_size)) {
        return Err<R>(ArchiveError::open_failed(path.string()));
    }

    std::shared_ptr<ZipArchive> archive(new ZipArchive());
    archive->m_path = path;
    archive->m_file_size = file_size;
    archive->m_entries.reserve(entry_count);

    std::size_t pos = 0;
    for (std::uint16_t i = 0; i < entry_count; ++i) {
        if (pos + k_central_header_size > dir.size() || read_u32(&dir[pos]) != k_central_header_sig) {
            return Err<R>(ArchiveError::corrupt(path.string(), "bad central directory header"));
        }
        const std::uint8_t* h = &dir[pos];
        const std::uint16_t name_len = read_u16(h + 28);
        const std::uint16_t extra_len = read_u16(h + 30);
        const std::uint16_t comment_len = read_u16(h + 32);

        if (pos + k_central_header_size + name_len + extra_len + comment_len > dir.size()) {
            return Err<R>(ArchiveError::corrupt(path.string(), "central directory entry truncated"));
        }

        ZipEntry entry;
        entry.flags = read_u16(h + 8);
        entry.method = read_u16(h + 10);
        entry.crc32 = read_u32(h + 16);
        entry.compressed_size = read_u32(h + 20);
        entry.uncompressed_size = read_u32(h + 24);
        entry.local_header_offset = read_u32(h + 42);
        entry.name.assign(reinterpret_cast<const char*>(h + k_central_header_size), name_len);

        archive->m_index.emplace(entry.name, archive->m_entries.size());
        archive->m_entries.push_back(std::move(entry));

        pos += k_central_header_size + name_len + extra_len + comment_len;
    }

    return Ok<R>(std::move(archive));
}

const ZipEntry* ZipArchive::find(std::string_view name) const {
    auto it = m_index.find(std::string(name));
    return it != m_index.end() ? &m_entries[it->second] : nullptr;
}

Result<std::vector<std::uint8_t>> ZipArchive::read(std::string_view name) const {
    const ZipEntry* entry = find(name);
    if (!entry) {
        return Err<std::vector<std::uint8_t>>(ArchiveError::entry_not_found(m_path.string(), std::string(name)));
    }
    return read_entry(*entry);
}

Result<std::vector<std::uint8_t>> ZipArchive::read_entry(const ZipEntry& entry) const {
    using Bytes = std::vector<std::uint8_t>;
    const std::string archive = m_path.string();

    if (entry.flags & k_flag_encrypted) {
        return Err<Bytes>(ArchiveError::unsupported(archive, "encrypted entry"));
    }
    if (entry.method != k_method_stored && entry.method != k_method_deflated) {
        return Err<Bytes>(ArchiveError::unsupported(archive, "compression method " + std::to_string(entry.method)));
    }

    std::ifstream in(m_path, std::ios::binary);
    if (!in.is_open()) {
        return Err<Bytes>(ArchiveError::open_failed(archive));
    }

    std::uint8_t local[k_local_header_size];
    if (!read_at(in, entry.local_header_offset, local, sizeof(local)) ||
        read_u32(local) != k_local_header_sig) {
        return Err<Bytes>(ArchiveError::corrupt(archive, "bad local header for '" + entry.name + "'"));
    }

    // Local name/extra lengths may differ from the central directory copy
    const std::uint64_t data_offset = static_cast<std::uint64_t>(entry.local_header_offset) +
        k_local_header_size + read_u16(local + 26) + read_u16(local + 28);

    // Sizes come from the central directory; check them before allocating
    if (data_offset + entry.compressed_size > m_file_size) {
        return Err<Bytes>(ArchiveError::corrupt(archive, "entry data of '" + entry.name + "' exceeds the file"));
    }
    if (entry.uncompressed_size > k_max_entry_size) {
        return Err<Bytes>(ArchiveError::unsupported(archive, "entry '" + entry.name + "' larger than 256 MiB"));
    }
    if (entry.method == k_method_deflated &&
        entry.uncompressed_size > (static_cast<std::uint64_t>(entry.compressed_size) + 1) * k_max_deflate_ratio) {
        return Err<Bytes>(ArchiveError::corrupt(archive, "implausible size for '" + entry.name + "'"));
    }

    Bytes compressed(entry.compressed_size);
    if (entry.compressed_size > 0 && !read_at(in, data_offset, compressed.data(), compressed.size())) {
        return Err<Bytes>(ArchiveError::corrupt(archive, "entry data truncated for '" + entry.name + "'"));
    }

    Bytes data;
    if (entry.method == k_method_stored) {
        data = std::move(compressed);
    } else {
        auto inflated = inflate_raw(compressed, entry.uncompressed_size, archive, entry.name);
        if (!inflated) {
            return inflated;
        }
        data = std::move(*inflated);
    }

    const auto crc = static_cast<std::uint32_t>(
        ::crc32(::crc32(0L, Z_NULL, 0), data.data(), static_cast<uInt>(data.size())));
    if (crc != entry.crc32) {
        return Err<Bytes>(ArchiveError::checksum_mismatch(archive, entry.name));
    }

    return Ok(std::move(data));
}

Result<void> ZipArchive::extract_to(std::string_view name, const fs::path& dest) const {
    auto data = read(name);
    if (!data) {
        return Err(std::move(data.error()));
    }

    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Err(attest_core::Error(attest_core::ErrorCode::IOError,
            "Cannot create file: " + dest.string()));
    }
    out.write(reinterpret_cast<const char*>(data->data()), static_cast<std::streamsize>(data->size()));
    if (!out) {
        return Err(attest_core::Error(attest_core::ErrorCode::IOError,
            "Failed writing file: " + dest.string()));
    }
    return Ok();
}

// =============================================================================
// ArchiveCache
// =============================================================================

std::shared_ptr<const ZipArchive> ArchiveCache::get(const fs::path& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(path, ec);
    if (ec) {
        canonical = path;
    }

    return m_cache.get_or_create(canonical.string(), [&canonical]() -> std::shared_ptr<const ZipArchive> {
        auto opened = ZipArchive::open(canonical);
        if (!opened) {
            attest_core::resolver_logger()->debug("Skipping archive {}: {}",
                canonical.string(), opened.error().message());
            return nullptr;
        }
        return std::move(*opened);
    });
}

} // namespace attest_resource
