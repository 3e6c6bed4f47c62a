#pragma once

/// @file config.hpp
/// @brief Layout conventions and tunables shared by every resolver
///
/// Defaults describe the conventional Maven/Gradle layout of a process
/// plugin project. A JSON file may override any subset of the keys; the
/// environment overlay is applied last.

#include "fwd.hpp"
#include "error.hpp"

#include <spdlog/common.h>

#include <filesystem>
#include <string>
#include <vector>

namespace attest_core {

struct AttestConfig {
    /// Scheme prefix stripped from references ("classpath:")
    std::string scheme_prefix = "classpath:";

    /// Source-tree prefix stripped from references
    std::string source_resources_prefix = "src/main/resources/";

    /// Well-known subfolders below a resource root searched after the root itself
    std::vector<std::string> search_subfolders = {"bpmn", "fhir"};

    /// Directories (relative to the project) holding copied dependency archives
    std::vector<std::string> dependency_directories = {"target/dependency", "target/dependencies"};

    /// File extensions treated as archives
    std::vector<std::string> archive_extensions = {".jar"};

    /// Prefix of temporary directories receiving materialized dependency resources
    std::string temp_prefix = "attest-dependency-";

    /// Accept a raw reference that is an absolute path to an existing file
    /// (checked after the subfolders, before dependency archives)
    bool accept_absolute_references = false;

    spdlog::level::level_enum log_level = spdlog::level::info;

    /// Load from a JSON file; missing keys keep their defaults
    [[nodiscard]] static Result<AttestConfig> load(const std::filesystem::path& path);

    /// Parse from a JSON document
    [[nodiscard]] static Result<AttestConfig> from_json_string(const std::string& json_str);

    /// Overlay ATTEST_LOG_LEVEL and ATTEST_TEMP_PREFIX when set
    void apply_environment();

    [[nodiscard]] std::string to_json_string() const;

    [[nodiscard]] bool is_archive(const std::filesystem::path& file) const;
};

} // namespace attest_core
