#pragma once

/// @file log.hpp
/// @brief spdlog channels for the resolver, type and lint subsystems
///
/// Every channel shares one sink set. Reconfiguring swaps the sinks and level
/// of channels that already exist, so subsystems may cache their logger.

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#define ATTEST_LOG_TRACE(...) spdlog::trace(__VA_ARGS__)
#define ATTEST_LOG_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define ATTEST_LOG_INFO(...) spdlog::info(__VA_ARGS__)
#define ATTEST_LOG_WARN(...) spdlog::warn(__VA_ARGS__)
#define ATTEST_LOG_ERROR(...) spdlog::error(__VA_ARGS__)

namespace attest_core {

/// Sink and level settings applied to all channels
struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::info;
    bool console_enabled = true;
    /// Write a rotating attest.log below log_directory
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;
};

void configure_logging(const LogConfig& config);

/// Flush and drop every channel
void shutdown_logging();

/// Channel by name, created on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

[[nodiscard]] std::shared_ptr<spdlog::logger> resolver_logger();
[[nodiscard]] std::shared_ptr<spdlog::logger> types_logger();
[[nodiscard]] std::shared_ptr<spdlog::logger> lint_logger();

/// Accepts the lower-case spdlog names plus "warning", "err" and "fatal"
[[nodiscard]] std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text);

[[nodiscard]] const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry of a unit of work and reports its duration at debug level
class LogScope {
public:
    explicit LogScope(std::string what, const std::string& channel = "attest");
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_what;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_started;
};

} // namespace attest_core
