/// @file temp_files.cpp
/// @brief TempFileRegistry implementation

#include <attest/resource/temp_files.hpp>
#include <attest/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <random>

namespace attest_resource {

TempFileRegistry::TempFileRegistry(std::string prefix)
    : m_prefix(std::move(prefix)) {}

TempFileRegistry::~TempFileRegistry() {
    cleanup();
}

fs::path TempFileRegistry::create_directory() {
    std::error_code ec;
    const fs::path base = fs::temp_directory_path(ec);
    if (ec) {
        attest_core::resolver_logger()->debug("No temp directory available: {}", ec.message());
        return {};
    }

    static thread_local std::mt19937_64 rng(
        static_cast<std::uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count()));

    for (int attempt = 0; attempt < 16; ++attempt) {
        std::uint64_t serial;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            serial = ++m_counter;
        }
        const fs::path dir = base / (m_prefix + std::to_string(rng()) + "-" + std::to_string(serial));
        if (fs::create_directory(dir, ec) && !ec) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_directories.push_back(dir);
            return dir;
        }
    }

    attest_core::resolver_logger()->debug("Could not create temp directory below {}", base.string());
    return {};
}

void TempFileRegistry::track(const fs::path& file) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_files.push_back(file);
}

void TempFileRegistry::release(const fs::path& file) {
    fs::path owner;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find(m_files.begin(), m_files.end(), file);
        if (it == m_files.end()) {
            return;
        }
        m_files.erase(it);
        owner = owning_directory(file);
    }
    remove_file_and_empty_parents(file, owner);
}

void TempFileRegistry::cleanup() {
    std::vector<fs::path> files;
    std::vector<fs::path> directories;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        files.swap(m_files);
        directories.swap(m_directories);
    }

    for (const auto& file : files) {
        std::error_code ec;
        fs::remove(file, ec);
    }

    for (const auto& dir : directories) {
        prune_empty_directories(dir);
    }
}

std::size_t TempFileRegistry::tracked_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files.size();
}

std::vector<fs::path> TempFileRegistry::tracked_files() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_files;
}

fs::path TempFileRegistry::owning_directory(const fs::path& file) const {
    for (const auto& dir : m_directories) {
        const auto rel = file.lexically_relative(dir);
        if (!rel.empty() && *rel.begin() != "..") {
            return dir;
        }
    }
    return file.parent_path();
}

void TempFileRegistry::remove_file_and_empty_parents(const fs::path& file, const fs::path& owner) {
    std::error_code ec;
    fs::remove(file, ec);

    // Walk up to (and including) the owning directory while directories are empty
    fs::path dir = file.parent_path();
    while (!dir.empty()) {
        ec.clear();
        if (!fs::is_empty(dir, ec) || ec || !fs::remove(dir, ec)) {
            break;
        }
        if (dir == owner || dir == dir.parent_path()) {
            break;
        }
        dir = dir.parent_path();
    }
}

void TempFileRegistry::prune_empty_directories(const fs::path& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return;
    }

    std::vector<fs::path> subdirs;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code sec;
        if (it->is_directory(sec)) {
            subdirs.push_back(it->path());
        }
    }

    // Deepest first
    std::sort(subdirs.begin(), subdirs.end(), [](const fs::path& a, const fs::path& b) {
        return a.string().size() > b.string().size();
    });
    for (const auto& sub : subdirs) {
        if (fs::is_empty(sub, ec) && !ec) {
            fs::remove(sub, ec);
        }
        ec.clear();
    }

    if (fs::is_empty(dir, ec) && !ec) {
        fs::remove(dir, ec);
    }
}

} // namespace attest_resource
