/// @file log.cpp
/// @brief Channel bookkeeping on top of spdlog

#include <attest/core/log.hpp>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <utility>
#include <vector>

namespace attest_core {

namespace {

constexpr const char* k_console_pattern = "%H:%M:%S.%e %^%-5l%$ %-8n %v";
constexpr const char* k_file_pattern = "%Y-%m-%dT%H:%M:%S.%e %-5l %-8n [%t] %v";

class ChannelSet {
public:
    static ChannelSet& instance() {
        static ChannelSet set;
        return set;
    }

    /// Existing channels are replaced, not mutated; handles already given
    /// out keep logging to the previous sinks
    void apply(const LogConfig& config) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config = config;
        m_sinks = build_sinks(m_config);
        m_sinks_built = true;
        for (auto& entry : m_channels) {
            entry->set_level(m_config.level);
            entry = make_channel(entry->name());
        }
        spdlog::set_level(m_config.level);
    }

    std::shared_ptr<spdlog::logger> channel(const std::string& name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& existing : m_channels) {
            if (existing->name() == name) {
                return existing;
            }
        }
        if (!m_sinks_built) {
            m_sinks = build_sinks(m_config);
            m_sinks_built = true;
        }
        m_channels.push_back(make_channel(name));
        return m_channels.back();
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_channels) {
            entry->flush();
        }
        m_channels.clear();
        m_sinks.clear();
        m_sinks_built = false;
    }

private:
    ChannelSet() = default;

    std::shared_ptr<spdlog::logger> make_channel(const std::string& name) const {
        auto created = std::make_shared<spdlog::logger>(name, m_sinks.begin(), m_sinks.end());
        created->set_level(m_config.level);
        return created;
    }

    static std::vector<spdlog::sink_ptr> build_sinks(const LogConfig& config) {
        std::vector<spdlog::sink_ptr> sinks;
        if (config.console_enabled) {
            auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console->set_pattern(k_console_pattern);
            sinks.push_back(std::move(console));
        }
        if (config.file_enabled && !config.log_directory.empty()) {
            const auto file = std::filesystem::path(config.log_directory) / "attest.log";
            try {
                auto rotating = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                    file.string(), config.max_file_size, config.max_files);
                rotating->set_pattern(k_file_pattern);
                sinks.push_back(std::move(rotating));
            } catch (const spdlog::spdlog_ex& e) {
                spdlog::warn("Cannot open log file {}: {}", file.string(), e.what());
            }
        }
        return sinks;
    }

    std::mutex m_mutex;
    LogConfig m_config;
    std::vector<spdlog::sink_ptr> m_sinks;
    bool m_sinks_built = false;
    std::vector<std::shared_ptr<spdlog::logger>> m_channels;
};

struct LevelName {
    const char* text;
    spdlog::level::level_enum level;
};

constexpr std::array<LevelName, 10> k_level_names = {{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
    {"warning", spdlog::level::warn},
    {"err", spdlog::level::err},
    {"fatal", spdlog::level::critical},
}};

} // namespace

void configure_logging(const LogConfig& config) {
    ChannelSet::instance().apply(config);
}

void shutdown_logging() {
    ChannelSet::instance().close();
    spdlog::default_logger()->flush();
}

std::shared_ptr<spdlog::logger> get_logger(const std::string& name) {
    return ChannelSet::instance().channel(name);
}

std::shared_ptr<spdlog::logger> resolver_logger() {
    return get_logger("resolver");
}

std::shared_ptr<spdlog::logger> types_logger() {
    return get_logger("types");
}

std::shared_ptr<spdlog::logger> lint_logger() {
    return get_logger("lint");
}

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& text) {
    for (const auto& entry : k_level_names) {
        if (text == entry.text) {
            return entry.level;
        }
    }
    return std::nullopt;
}

const char* log_level_name(spdlog::level::level_enum level) {
    // The first seven entries are the canonical spellings
    for (std::size_t i = 0; i < 7; ++i) {
        if (k_level_names[i].level == level) {
            return k_level_names[i].text;
        }
    }
    return "unknown";
}

// =============================================================================
// LogScope
// =============================================================================

LogScope::LogScope(std::string what, const std::string& channel)
    : m_what(std::move(what))
    , m_logger(get_logger(channel))
    , m_started(std::chrono::steady_clock::now())
{
    m_logger->trace("begin {}", m_what);
}

LogScope::~LogScope() {
    const auto elapsed = std::chrono::steady_clock::now() - m_started;
    m_logger->debug("end {} after {:.3f} ms", m_what,
                    std::chrono::duration<double, std::milli>(elapsed).count());
}

} // namespace attest_core
