/// @file test_support.cpp
/// @brief Test fixtures

#include "test_support.hpp"

#include <zlib.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <fstream>
#include <mutex>
#include <random>
#include <stdexcept>

namespace attest_test {

namespace {

std::atomic<std::uint64_t> g_counter{0};

std::string random_suffix() {
    static std::mt19937_64 rng(static_cast<std::uint64_t>(
        std::chrono::steady_clock::now().time_since_epoch().count()));
    static std::mutex mutex;
    std::lock_guard lock(mutex);
    return std::to_string(rng() % 1000000000ULL) + "-" + std::to_string(g_counter.fetch_add(1));
}

void put_u16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
}

void put_u32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFF));
    }
}

void put_be16(std::vector<std::uint8_t>& out, std::uint16_t v) {
    out.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<std::uint8_t>(v & 0xFF));
}

std::vector<std::uint8_t> raw_deflate(const std::vector<std::uint8_t>& data) {
    z_stream stream{};
    if (deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }

    std::vector<std::uint8_t> out(deflateBound(&stream, static_cast<uLong>(data.size())) + 16);
    stream.next_in = const_cast<Bytef*>(data.data());
    stream.avail_in = static_cast<uInt>(data.size());
    stream.next_out = out.data();
    stream.avail_out = static_cast<uInt>(out.size());

    const int rc = deflate(&stream, Z_FINISH);
    deflateEnd(&stream);
    if (rc != Z_STREAM_END) {
        throw std::runtime_error("deflate failed");
    }
    out.resize(stream.total_out);
    return out;
}

} // anonymous namespace

// =============================================================================
// TempProject
// =============================================================================

TempProject::TempProject(std::string_view tag) {
    m_path = fs::temp_directory_path() / ("attest-test-" + std::string(tag) + "-" + random_suffix());
    fs::create_directories(m_path);
}

TempProject::~TempProject() {
    std::error_code ec;
    fs::remove_all(m_path, ec);
}

fs::path TempProject::write(const fs::path& relative, std::string_view content) const {
    const fs::path file = m_path / relative;
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    return file;
}

fs::path TempProject::write_bytes(const fs::path& relative, const std::vector<std::uint8_t>& bytes) const {
    const fs::path file = m_path / relative;
    fs::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return file;
}

fs::path TempProject::mkdir(const fs::path& relative) const {
    const fs::path dir = m_path / relative;
    fs::create_directories(dir);
    return dir;
}

fs::path TempProject::canonical(const fs::path& relative) const {
    return fs::weakly_canonical(relative.empty() ? m_path : m_path / relative);
}

// =============================================================================
// ZipWriter
// =============================================================================

ZipWriter& ZipWriter::add(std::string name, std::string_view data, bool deflate) {
    return add(std::move(name), std::vector<std::uint8_t>(data.begin(), data.end()), deflate);
}

ZipWriter& ZipWriter::add(std::string name, const std::vector<std::uint8_t>& data, bool deflate) {
    m_entries.push_back({std::move(name), data, deflate});
    return *this;
}

std::vector<std::uint8_t> ZipWriter::bytes() const {
    std::vector<std::uint8_t> out;
    std::vector<std::uint8_t> central;

    for (const auto& entry : m_entries) {
        const auto crc = static_cast<std::uint32_t>(
            crc32(0L, entry.data.data(), static_cast<uInt>(entry.data.size())));
        const bool is_dir = !entry.name.empty() && entry.name.back() == '/';
        const bool deflate = entry.deflate && !is_dir;
        const std::vector<std::uint8_t> payload = deflate ? raw_deflate(entry.data) : entry.data;
        const std::uint16_t method = deflate ? 8 : 0;
        const auto offset = static_cast<std::uint32_t>(out.size());
        const auto name_len = static_cast<std::uint16_t>(entry.name.size());

        // Local file header
        put_u32(out, 0x04034b50);
        put_u16(out, 20);
        put_u16(out, 0);
        put_u16(out, method);
        put_u16(out, 0);
        put_u16(out, 0);
        put_u32(out, crc);
        put_u32(out, static_cast<std::uint32_t>(payload.size()));
        put_u32(out, static_cast<std::uint32_t>(entry.data.size()));
        put_u16(out, name_len);
        put_u16(out, 0);
        out.insert(out.end(), entry.name.begin(), entry.name.end());
        out.insert(out.end(), payload.begin(), payload.end());

        // Central directory header
        put_u32(central, 0x02014b50);
        put_u16(central, 20);
        put_u16(central, 20);
        put_u16(central, 0);
        put_u16(central, method);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, crc);
        put_u32(central, static_cast<std::uint32_t>(payload.size()));
        put_u32(central, static_cast<std::uint32_t>(entry.data.size()));
        put_u16(central, name_len);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u16(central, 0);
        put_u32(central, is_dir ? 0x10 : 0);
        put_u32(central, offset);
        central.insert(central.end(), entry.name.begin(), entry.name.end());
    }

    const auto dir_offset = static_cast<std::uint32_t>(out.size());
    out.insert(out.end(), central.begin(), central.end());

    // End of central directory
    put_u32(out, 0x06054b50);
    put_u16(out, 0);
    put_u16(out, 0);
    put_u16(out, static_cast<std::uint16_t>(m_entries.size()));
    put_u16(out, static_cast<std::uint16_t>(m_entries.size()));
    put_u32(out, static_cast<std::uint32_t>(central.size()));
    put_u32(out, dir_offset);
    put_u16(out, 0);
    return out;
}

void ZipWriter::write(const fs::path& path) const {
    fs::create_directories(path.parent_path());
    const auto data = bytes();
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
}

// =============================================================================
// Class files
// =============================================================================

std::vector<std::uint8_t> make_class_file(std::string_view name,
                                          std::optional<std::string_view> super_name,
                                          const std::vector<std::string>& interfaces,
                                          std::uint16_t access_flags) {
    std::vector<std::uint8_t> pool;
    std::uint16_t next_index = 1;

    // Each class reference is a Utf8 entry followed by a Class entry
    auto add_class = [&pool, &next_index](std::string_view dotted) -> std::uint16_t {
        std::string internal(dotted);
        std::replace(internal.begin(), internal.end(), '.', '/');

        pool.push_back(1);
        put_be16(pool, static_cast<std::uint16_t>(internal.size()));
        pool.insert(pool.end(), internal.begin(), internal.end());
        const std::uint16_t utf8_index = next_index++;

        pool.push_back(7);
        put_be16(pool, utf8_index);
        return next_index++;
    };

    const std::uint16_t this_index = add_class(name);
    const std::uint16_t super_index = super_name ? add_class(*super_name) : 0;
    std::vector<std::uint16_t> interface_indices;
    for (const auto& iface : interfaces) {
        interface_indices.push_back(add_class(iface));
    }

    std::vector<std::uint8_t> out = {0xCA, 0xFE, 0xBA, 0xBE};
    put_be16(out, 0);
    put_be16(out, 61);
    put_be16(out, next_index);
    out.insert(out.end(), pool.begin(), pool.end());
    put_be16(out, access_flags);
    put_be16(out, this_index);
    put_be16(out, super_index);
    put_be16(out, static_cast<std::uint16_t>(interface_indices.size()));
    for (auto index : interface_indices) {
        put_be16(out, index);
    }
    put_be16(out, 0);  // fields
    put_be16(out, 0);  // methods
    put_be16(out, 0);  // attributes
    return out;
}

std::vector<std::uint8_t> make_interface_file(std::string_view name, const std::vector<std::string>& extends) {
    return make_class_file(name, std::string_view("java.lang.Object"), extends, 0x0601);
}

std::size_t count_temp_entries(std::string_view prefix) {
    std::size_t count = 0;
    std::error_code ec;
    for (fs::directory_iterator it(fs::temp_directory_path(), ec), end; !ec && it != end; it.increment(ec)) {
        if (it->path().filename().string().rfind(prefix, 0) == 0) {
            ++count;
        }
    }
    return count;
}

void patch_central_field(std::vector<std::uint8_t>& bytes, std::size_t field_offset, std::uint32_t value) {
    for (std::size_t i = 0; i + 46 <= bytes.size(); ++i) {
        if (bytes[i] == 0x50 && bytes[i + 1] == 0x4b && bytes[i + 2] == 0x01 && bytes[i + 3] == 0x02) {
            for (std::size_t b = 0; b < 4; ++b) {
                bytes[i + field_offset + b] = static_cast<std::uint8_t>(value >> (8 * b));
            }
            return;
        }
    }
    throw std::runtime_error("no central directory header");
}

std::string unique_prefix(std::string_view tag) {
    return "attest-test-" + std::string(tag) + "-" + random_suffix() + "-";
}

} // namespace attest_test
