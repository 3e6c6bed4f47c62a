#pragma once

/// @file api_version.hpp
/// @brief API generation detection from service registrations

#include "fwd.hpp"

#include <attest/core/error.hpp>
#include <attest/types/capability.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace attest_plugin {

namespace fs = std::filesystem;

/// Registration file names below META-INF/services
inline constexpr const char* k_v1_service_file = "dev.dsf.bpe.v1.ProcessPluginDefinition";
inline constexpr const char* k_v2_service_file = "dev.dsf.bpe.v2.ProcessPluginDefinition";

enum class DetectionSource : std::uint8_t {
    ServiceFile,
    PackageScan,
};

struct DetectedVersion {
    attest_types::ApiVersion version = attest_types::ApiVersion::Unknown;

    /// Registration file, or the first file whose name revealed the generation
    fs::path evidence;
    DetectionSource source = DetectionSource::ServiceFile;
};

/// Service directories checked, relative to the project directory
[[nodiscard]] const std::vector<std::string>& service_directories();

/// Detect the API generation of a project.
///
/// Each service directory is checked for a v2 registration, then a v1
/// registration. When none exists, compiled output (or the project tree)
/// is scanned for file names starting with the API package; v2 wins over v1.
[[nodiscard]] std::optional<DetectedVersion> detect_api_version(const fs::path& project_dir);

/// Provider type names listed in a registration file. Blank lines and
/// '#' comments are ignored.
[[nodiscard]] attest_core::Result<std::vector<std::string>> read_service_registrations(const fs::path& file);

} // namespace attest_plugin
