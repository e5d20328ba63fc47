/**
 * LINGUACACHE - Translation Memory Cache
 * Logger - One spdlog logger per store component over shared sinks
 *
 * Output: [timestamp] [level] [component] message
 * The "config" logger doubles as the spdlog default logger, so plain
 * spdlog:: calls land in the same sinks.
 */

#ifndef LINGUACACHE_UTIL_LOGGER_HPP
#define LINGUACACHE_UTIL_LOGGER_HPP

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace linguacache::util {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error,
    Off
};

/**
 * Parts of the store that log under their own name
 */
enum class LogComponent : std::size_t {
    Store,   // Backend selection, hits/misses, manual saves
    Redis,   // Remote backend
    Local,   // File backend
    Config   // Configuration loading (spdlog default logger)
};

constexpr std::size_t kLogComponentCount = 4;

std::string_view component_name(LogComponent component);

struct LogConfig {
    LogLevel level{LogLevel::Info};
    std::string file_path;             // Empty for console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Process-wide logger registry
 *
 * Sinks are fixed by whichever of init()/instance() runs first; a later
 * init() only changes the level.
 */
class Logger {
public:
    static void init(const LogConfig& config);
    static Logger& instance();

    ~Logger();

    void set_level(LogLevel level);
    LogLevel get_level() const;

    /**
     * Case-insensitive: debug, info, warn (warning), error, off
     */
    static std::optional<LogLevel> parse_level(std::string_view text);
    static std::string_view level_to_string(LogLevel level);

    template<typename... Args>
    void log(LogComponent component, LogLevel level,
             spdlog::format_string_t<Args...> fmt, Args&&... args) {
        auto& logger = loggers_[static_cast<std::size_t>(component)];
        if (logger) {
            logger->log(to_spdlog_level(level), fmt, std::forward<Args>(args)...);
        }
    }

    void flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void build_loggers(const LogConfig& config);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);

    std::array<std::shared_ptr<spdlog::logger>, kLogComponentCount> loggers_;
    std::atomic<LogLevel> level_{LogLevel::Info};
    std::mutex mutex_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag init_flag_;
};

#define LINGUACACHE_LOG_DEBUG(component, ...) \
    ::linguacache::util::Logger::instance().log(component, ::linguacache::util::LogLevel::Debug, __VA_ARGS__)
#define LINGUACACHE_LOG_INFO(component, ...) \
    ::linguacache::util::Logger::instance().log(component, ::linguacache::util::LogLevel::Info, __VA_ARGS__)
#define LINGUACACHE_LOG_WARN(component, ...) \
    ::linguacache::util::Logger::instance().log(component, ::linguacache::util::LogLevel::Warn, __VA_ARGS__)
#define LINGUACACHE_LOG_ERROR(component, ...) \
    ::linguacache::util::Logger::instance().log(component, ::linguacache::util::LogLevel::Error, __VA_ARGS__)

} // namespace linguacache::util

#endif // LINGUACACHE_UTIL_LOGGER_HPP
