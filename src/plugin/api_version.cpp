/// @file api_version.cpp
/// @brief API generation detection

#include <attest/plugin/api_version.hpp>
#include <attest/core/log.hpp>

#include <fstream>

namespace attest_plugin {

using attest_types::ApiVersion;

namespace {

std::string trim(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

bool is_regular_file(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

bool is_directory(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

std::optional<DetectedVersion> detect_by_package_scan(const fs::path& project_dir) {
    fs::path start = project_dir;
    if (attest_plugin::is_directory(project_dir / "target" / "classes")) {
        start = project_dir / "target" / "classes";
    } else if (attest_plugin::is_directory(project_dir / "build" / "classes" / "java" / "main")) {
        start = project_dir / "build" / "classes" / "java" / "main";
    }

    std::optional<fs::path> first_v1;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(start, fs::directory_options::skip_permission_denied, ec), end;
         !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.rfind("dev.dsf.bpe.v2", 0) == 0) {
            return DetectedVersion{ApiVersion::V2, it->path(), DetectionSource::PackageScan};
        }
        if (!first_v1 && name.rfind("dev.dsf.bpe.v1", 0) == 0) {
            first_v1 = it->path();
        }
    }

    if (first_v1) {
        return DetectedVersion{ApiVersion::V1, *first_v1, DetectionSource::PackageScan};
    }
    return std::nullopt;
}

} // anonymous namespace

const std::vector<std::string>& service_directories() {
    static const std::vector<std::string> dirs = {
        "META-INF/services",
        "src/main/resources/META-INF/services",
        "target/classes/META-INF/services",
        "build/resources/main/META-INF/services",
        "build/classes/java/main/META-INF/services",
    };
    return dirs;
}

std::optional<DetectedVersion> detect_api_version(const fs::path& project_dir) {
    for (const auto& rel : service_directories()) {
        const fs::path dir = project_dir / rel;
        if (attest_plugin::is_regular_file(dir / k_v2_service_file)) {
            return DetectedVersion{ApiVersion::V2, dir / k_v2_service_file, DetectionSource::ServiceFile};
        }
        if (attest_plugin::is_regular_file(dir / k_v1_service_file)) {
            return DetectedVersion{ApiVersion::V1, dir / k_v1_service_file, DetectionSource::ServiceFile};
        }
    }

    auto detected = detect_by_package_scan(project_dir);
    if (!detected) {
        attest_core::lint_logger()->debug("No API generation evidence below {}", project_dir.string());
    }
    return detected;
}

attest_core::Result<std::vector<std::string>> read_service_registrations(const fs::path& file) {
    std::ifstream in(file);
    if (!in.is_open()) {
        return attest_core::Err<std::vector<std::string>>(
            attest_core::Error(attest_core::ErrorCode::IOError,
                               "Failed to open service registration: " + file.string()));
    }

    std::vector<std::string> providers;
    std::string line;
    while (std::getline(in, line)) {
        const auto comment = line.find('#');
        if (comment != std::string::npos) {
            line.erase(comment);
        }
        auto entry = trim(line);
        if (!entry.empty()) {
            providers.push_back(std::move(entry));
        }
    }
    return attest_core::Ok(std::move(providers));
}

} // namespace attest_plugin
