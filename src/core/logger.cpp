#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include <spdlog/pattern_formatter.h>
#include <algorithm>
#include <array>
#include <utility>
#include <vector>

namespace handoff::core {

namespace {

constexpr std::size_t MAX_LOG_FILE_SIZE = 5 * 1024 * 1024;
constexpr std::size_t MAX_LOG_FILES = 3;

constexpr std::array<std::pair<const char*, LogLevel>, 8> LEVEL_NAMES = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"critical", LogLevel::Critical},
    {"off", LogLevel::Off},
}};

spdlog::level::level_enum to_spdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}

std::shared_ptr<spdlog::logger> Logger::logger_;

void Logger::initialize(const std::string& log_file, LogLevel level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(to_spdlog(level));
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    
    // The file always keeps debug output so a failed handshake can be traced afterwards.
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, MAX_LOG_FILE_SIZE,
                                                                            MAX_LOG_FILES);
    file_sink->set_level(spdlog::level::debug);
    file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%s:%#] %v");
    
    std::vector<spdlog::sink_ptr> sinks{console_sink, file_sink};
    logger_ = std::make_shared<spdlog::logger>("handoff", sinks.begin(), sinks.end());
    logger_->set_level(std::min(to_spdlog(level), spdlog::level::debug));
    logger_->flush_on(spdlog::level::warn);
    
    spdlog::set_default_logger(logger_);
    
    LOG_DEBUG("Logging to console at {} and to {}", spdlog::level::to_string_view(to_spdlog(level)), log_file);
}

void Logger::shutdown() {
    if (!logger_) {
        return;
    }
    
    logger_->flush();
    spdlog::shutdown();
    logger_.reset();
    
    // LOG_* macros go through the default logger; keep one without sinks.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("handoff"));
}

LogLevel Logger::parse_level(const std::string& name, LogLevel fallback) {
    auto lower = utils::StringUtils::to_lower(utils::StringUtils::trim(name));
    for (const auto& [level_name, level] : LEVEL_NAMES) {
        if (lower == level_name) {
            return level;
        }
    }
    return fallback;
}

}
