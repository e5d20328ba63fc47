/**
 * LINGUACACHE - Translation Memory Cache
 * Configuration System - Supports JSON file and environment variables
 *
 * Configuration hierarchy (highest precedence first):
 * 1. Environment variables (LINGUACACHE_*, plus REDIS_URL)
 * 2. Configuration file (JSON)
 * 3. Default values
 */

#ifndef LINGUACACHE_CONFIG_CONFIG_HPP
#define LINGUACACHE_CONFIG_CONFIG_HPP

#include "store/translation_memory.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace linguacache::config {

/**
 * Translation memory store settings
 */
struct StoreSettings {
    std::string redis_url;                               // Empty = local/disabled only
    std::uint32_t ttl_seconds{2592000};                  // 30 days
    std::string local_store_path{"translation_memory.json"};
    bool local_fallback{true};
    std::uint32_t connect_timeout_ms{5000};
    std::uint32_t io_timeout_ms{5000};
};

/**
 * Logging settings
 */
struct LogSettings {
    std::string level{"info"};
    std::string file;                    // Empty = console only
    std::size_t max_file_size_mb{100};
    std::size_t max_files{5};
    bool enable_console{true};
    bool enable_colors{true};
};

/**
 * Complete application configuration
 */
struct Config {
    StoreSettings store;
    LogSettings logging;

    /**
     * Validate configuration and throw if invalid
     */
    void validate() const;

    /**
     * Settings for the translation memory
     */
    store::TranslationMemoryConfig to_memory_config() const;

    /**
     * Settings for the logger (level must already be validated)
     */
    util::LogConfig to_log_config() const;
};

/**
 * Configuration manager - handles loading and parsing
 */
class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    // Non-copyable
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    /**
     * Load configuration: defaults, then the JSON file (this path, or
     * LINGUACACHE_CONFIG when empty), then environment overrides
     *
     * @throws std::runtime_error on configuration errors
     */
    void load(const std::filesystem::path& config_path = {});

    /**
     * Get the current configuration (thread-safe)
     */
    Config get_config() const;

    /**
     * Get the configuration file path (empty if none was used)
     */
    std::filesystem::path get_config_path() const;

private:
    void load_from_file(const std::filesystem::path& path);
    void apply_environment_overrides();

    static std::optional<std::string> get_env(const std::string& name);

    mutable std::mutex config_mutex_;
    Config config_;
    std::filesystem::path config_path_;
};

// JSON serialization support
void to_json(nlohmann::json& j, const StoreSettings& s);
void from_json(const nlohmann::json& j, StoreSettings& s);
void to_json(nlohmann::json& j, const LogSettings& l);
void from_json(const nlohmann::json& j, LogSettings& l);
void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

} // namespace linguacache::config

#endif // LINGUACACHE_CONFIG_CONFIG_HPP
