/**
 * LINGUACACHE - Translation Memory Cache
 * Logger Implementation
 */

#include "util/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <vector>

namespace linguacache::util {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::init_flag_;

std::string_view component_name(LogComponent component) {
    switch (component) {
        case LogComponent::Store:  return "store";
        case LogComponent::Redis:  return "redis";
        case LogComponent::Local:  return "local";
        case LogComponent::Config: return "config";
    }
    return "unknown";
}

void Logger::init(const LogConfig& config) {
    bool created = false;
    std::call_once(init_flag_, [&config, &created]() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->build_loggers(config);
        created = true;
    });

    if (!created) {
        instance_->set_level(config.level);
    }
}

Logger& Logger::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
        instance_->build_loggers(LogConfig{});
    });
    return *instance_;
}

Logger::~Logger() {
    flush();
}

void Logger::build_loggers(const LogConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<spdlog::sink_ptr> sinks;
    if (config.enable_console) {
        auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        if (!config.enable_colors) {
            console->set_color_mode(spdlog::color_mode::never);
        }
        console->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
        sinks.push_back(std::move(console));
    }
    if (!config.file_path.empty()) {
        auto file = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, config.max_file_size_mb * 1024 * 1024, config.max_files);
        file->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
        sinks.push_back(std::move(file));
    }

    for (std::size_t i = 0; i < kLogComponentCount; ++i) {
        auto name = component_name(static_cast<LogComponent>(i));
        auto logger = std::make_shared<spdlog::logger>(std::string(name), sinks.begin(), sinks.end());
        logger->set_level(to_spdlog_level(config.level));
        logger->flush_on(spdlog::level::warn);
        loggers_[i] = std::move(logger);
    }
    level_.store(config.level, std::memory_order_relaxed);

    spdlog::set_default_logger(loggers_[static_cast<std::size_t>(LogComponent::Config)]);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& logger : loggers_) {
        if (logger) {
            logger->set_level(to_spdlog_level(level));
        }
    }
    level_.store(level, std::memory_order_relaxed);
}

LogLevel Logger::get_level() const {
    return level_.load(std::memory_order_relaxed);
}

std::optional<LogLevel> Logger::parse_level(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

std::string_view Logger::level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& logger : loggers_) {
        if (logger) {
            logger->flush();
        }
    }
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

} // namespace linguacache::util
