/// @file config.cpp
/// @brief AttestConfig loading and serialization

#include <attest/core/config.hpp>
#include <attest/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace attest_core {

namespace {

Result<void> read_string(const nlohmann::json& j, const char* key, std::string& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_string()) {
        return Err(ConfigError::invalid_value(key, "expected a string"));
    }
    out = j[key].get<std::string>();
    return Ok();
}

Result<void> read_string_list(const nlohmann::json& j, const char* key, std::vector<std::string>& out) {
    if (!j.contains(key)) {
        return Ok();
    }
    if (!j[key].is_array()) {
        return Err(ConfigError::invalid_value(key, "expected an array of strings"));
    }
    std::vector<std::string> values;
    for (const auto& item : j[key]) {
        if (!item.is_string()) {
            return Err(ConfigError::invalid_value(key, "expected an array of strings"));
        }
        values.push_back(item.get<std::string>());
    }
    out = std::move(values);
    return Ok();
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

// =============================================================================
// Loading
// =============================================================================

Result<AttestConfig> AttestConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err<AttestConfig>(ConfigError::file_not_found(path.string()));
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<AttestConfig>(Error(ErrorCode::IOError, "Failed to open config file: " + path.string()));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = from_json_string(buffer.str());
    if (!result) {
        result.error().with_context("file", path.string());
    }
    return result;
}

Result<AttestConfig> AttestConfig::from_json_string(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<AttestConfig>(ConfigError::parse_failed(e.what()));
    }

    if (!j.is_object()) {
        return Err<AttestConfig>(ConfigError::parse_failed("top-level value must be an object"));
    }

    AttestConfig config;

    for (auto step : {
            read_string(j, "scheme_prefix", config.scheme_prefix),
            read_string(j, "source_resources_prefix", config.source_resources_prefix),
            read_string(j, "temp_prefix", config.temp_prefix),
            read_string_list(j, "search_subfolders", config.search_subfolders),
            read_string_list(j, "dependency_directories", config.dependency_directories),
            read_string_list(j, "archive_extensions", config.archive_extensions)}) {
        if (!step) {
            return Err<AttestConfig>(std::move(step.error()));
        }
    }

    if (j.contains("accept_absolute_references")) {
        if (!j["accept_absolute_references"].is_boolean()) {
            return Err<AttestConfig>(
                ConfigError::invalid_value("accept_absolute_references", "expected a boolean"));
        }
        config.accept_absolute_references = j["accept_absolute_references"].get<bool>();
    }

    if (j.contains("log_level")) {
        if (!j["log_level"].is_string()) {
            return Err<AttestConfig>(ConfigError::invalid_value("log_level", "expected a string"));
        }
        auto level = parse_log_level(to_lower(j["log_level"].get<std::string>()));
        if (!level) {
            return Err<AttestConfig>(
                ConfigError::invalid_value("log_level", "unknown level '" + j["log_level"].get<std::string>() + "'"));
        }
        config.log_level = *level;
    }

    if (config.temp_prefix.empty()) {
        return Err<AttestConfig>(ConfigError::invalid_value("temp_prefix", "must not be empty"));
    }

    return Ok(std::move(config));
}

// =============================================================================
// Environment Overlay
// =============================================================================

void AttestConfig::apply_environment() {
    if (const char* level_str = std::getenv("ATTEST_LOG_LEVEL")) {
        if (auto level = parse_log_level(to_lower(level_str))) {
            log_level = *level;
        } else {
            ATTEST_LOG_WARN("Ignoring unknown ATTEST_LOG_LEVEL '{}'", level_str);
        }
    }
    if (const char* prefix = std::getenv("ATTEST_TEMP_PREFIX")) {
        if (*prefix != '\0') {
            temp_prefix = prefix;
        }
    }
}

// =============================================================================
// Serialization
// =============================================================================

std::string AttestConfig::to_json_string() const {
    nlohmann::json j;
    j["scheme_prefix"] = scheme_prefix;
    j["source_resources_prefix"] = source_resources_prefix;
    j["search_subfolders"] = search_subfolders;
    j["dependency_directories"] = dependency_directories;
    j["archive_extensions"] = archive_extensions;
    j["temp_prefix"] = temp_prefix;
    j["accept_absolute_references"] = accept_absolute_references;
    j["log_level"] = log_level_name(log_level);
    return j.dump(2);
}

bool AttestConfig::is_archive(const std::filesystem::path& file) const {
    const std::string ext = to_lower(file.extension().string());
    return std::find(archive_extensions.begin(), archive_extensions.end(), ext) != archive_extensions.end();
}

} // namespace attest_core
