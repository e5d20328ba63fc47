/**
 * LINGUACACHE - Translation Memory Cache
 * Configuration System Implementation
 */

#include "config/config.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace linguacache::config {

namespace {

constexpr std::uint32_t kMaxTimeoutMs = 60000;

std::uint32_t parse_u32(const std::string& name, const std::string& value) {
    try {
        std::size_t pos = 0;
        auto parsed = std::stoul(value, &pos);
        if (pos != value.size() || parsed > 0xFFFFFFFFul) {
            throw std::invalid_argument(value);
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::logic_error&) {
        throw std::runtime_error("Invalid " + name + " value: " + value);
    }
}

bool parse_bool(const std::string& value) {
    return value == "true" || value == "1" || value == "yes";
}

} // namespace

// JSON serialization implementations
void to_json(nlohmann::json& j, const StoreSettings& s) {
    j = nlohmann::json{
        {"redis_url", s.redis_url},
        {"ttl_seconds", s.ttl_seconds},
        {"local_store_path", s.local_store_path},
        {"local_fallback", s.local_fallback},
        {"connect_timeout_ms", s.connect_timeout_ms},
        {"io_timeout_ms", s.io_timeout_ms}
    };
}

void from_json(const nlohmann::json& j, StoreSettings& s) {
    if (j.contains("redis_url")) j.at("redis_url").get_to(s.redis_url);
    if (j.contains("ttl_seconds")) j.at("ttl_seconds").get_to(s.ttl_seconds);
    if (j.contains("local_store_path")) j.at("local_store_path").get_to(s.local_store_path);
    if (j.contains("local_fallback")) j.at("local_fallback").get_to(s.local_fallback);
    if (j.contains("connect_timeout_ms")) j.at("connect_timeout_ms").get_to(s.connect_timeout_ms);
    if (j.contains("io_timeout_ms")) j.at("io_timeout_ms").get_to(s.io_timeout_ms);
}

void to_json(nlohmann::json& j, const LogSettings& l) {
    j = nlohmann::json{
        {"level", l.level},
        {"file", l.file},
        {"max_file_size_mb", l.max_file_size_mb},
        {"max_files", l.max_files},
        {"enable_console", l.enable_console},
        {"enable_colors", l.enable_colors}
    };
}

void from_json(const nlohmann::json& j, LogSettings& l) {
    if (j.contains("level")) j.at("level").get_to(l.level);
    if (j.contains("file")) j.at("file").get_to(l.file);
    if (j.contains("max_file_size_mb")) j.at("max_file_size_mb").get_to(l.max_file_size_mb);
    if (j.contains("max_files")) j.at("max_files").get_to(l.max_files);
    if (j.contains("enable_console")) j.at("enable_console").get_to(l.enable_console);
    if (j.contains("enable_colors")) j.at("enable_colors").get_to(l.enable_colors);
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json{
        {"store", c.store},
        {"logging", c.logging}
    };
}

void from_json(const nlohmann::json& j, Config& c) {
    if (j.contains("store")) j.at("store").get_to(c.store);
    if (j.contains("logging")) j.at("logging").get_to(c.logging);
}

// Config validation
void Config::validate() const {
    if (store.ttl_seconds == 0) {
        throw std::runtime_error("Configuration error: store.ttl_seconds must be non-zero");
    }
    if (store.connect_timeout_ms == 0 || store.connect_timeout_ms > kMaxTimeoutMs) {
        throw std::runtime_error("Configuration error: store.connect_timeout_ms must be in 1.." +
                                 std::to_string(kMaxTimeoutMs));
    }
    if (store.io_timeout_ms == 0 || store.io_timeout_ms > kMaxTimeoutMs) {
        throw std::runtime_error("Configuration error: store.io_timeout_ms must be in 1.." +
                                 std::to_string(kMaxTimeoutMs));
    }
    if (store.local_fallback && store.local_store_path.empty()) {
        throw std::runtime_error("Configuration error: store.local_store_path cannot be empty when local_fallback is enabled");
    }

    if (!util::Logger::parse_level(logging.level)) {
        throw std::runtime_error("Configuration error: unknown logging.level '" + logging.level + "'");
    }
    if (!logging.file.empty() && (logging.max_file_size_mb == 0 || logging.max_files == 0)) {
        throw std::runtime_error("Configuration error: logging.max_file_size_mb and logging.max_files must be non-zero");
    }

    spdlog::debug("Configuration validated successfully");
}

store::TranslationMemoryConfig Config::to_memory_config() const {
    store::TranslationMemoryConfig memory;
    memory.redis_url = store.redis_url;
    memory.ttl = std::chrono::seconds(store.ttl_seconds);
    memory.local_store_path = store.local_store_path;
    memory.local_fallback = store.local_fallback;
    memory.connect_timeout = std::chrono::milliseconds(store.connect_timeout_ms);
    memory.io_timeout = std::chrono::milliseconds(store.io_timeout_ms);
    return memory;
}

util::LogConfig Config::to_log_config() const {
    util::LogConfig log;
    log.level = util::Logger::parse_level(logging.level).value_or(util::LogLevel::Info);
    log.file_path = logging.file;
    log.max_file_size_mb = logging.max_file_size_mb;
    log.max_files = logging.max_files;
    log.enable_console = logging.enable_console;
    log.enable_colors = logging.enable_colors;
    return log;
}

// ConfigManager implementation
ConfigManager::ConfigManager() = default;
ConfigManager::~ConfigManager() = default;

void ConfigManager::load(const std::filesystem::path& config_path) {
    std::lock_guard<std::mutex> lock(config_mutex_);

    // Start with defaults
    config_ = Config{};
    config_path_ = config_path;

    if (config_path_.empty()) {
        if (auto env = get_env("LINGUACACHE_CONFIG")) {
            config_path_ = *env;
        }
    }

    if (!config_path_.empty()) {
        load_from_file(config_path_);
    }

    apply_environment_overrides();

    config_.validate();

    spdlog::info("Configuration loaded successfully");
}

Config ConfigManager::get_config() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

std::filesystem::path ConfigManager::get_config_path() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_path_;
}

void ConfigManager::load_from_file(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open configuration file: " + path.string());
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config_ = j.get<Config>();
        spdlog::debug("Loaded configuration from {}", path.string());
    } catch (const nlohmann::json::exception& e) {
        throw std::runtime_error("Invalid JSON in configuration file: " + std::string(e.what()));
    }
}

void ConfigManager::apply_environment_overrides() {
    // Store settings
    if (auto env = get_env("LINGUACACHE_REDIS_URL")) {
        config_.store.redis_url = *env;
        spdlog::debug("Applied LINGUACACHE_REDIS_URL");
    } else if (auto legacy = get_env("REDIS_URL")) {
        config_.store.redis_url = *legacy;
        spdlog::debug("Applied REDIS_URL");
    }

    if (auto env = get_env("LINGUACACHE_TTL")) {
        config_.store.ttl_seconds = parse_u32("LINGUACACHE_TTL", *env);
        spdlog::debug("Applied LINGUACACHE_TTL={}", config_.store.ttl_seconds);
    }

    if (auto env = get_env("LINGUACACHE_LOCAL_STORE")) {
        config_.store.local_store_path = *env;
        spdlog::debug("Applied LINGUACACHE_LOCAL_STORE={}", config_.store.local_store_path);
    }

    if (auto env = get_env("LINGUACACHE_LOCAL_FALLBACK")) {
        config_.store.local_fallback = parse_bool(*env);
        spdlog::debug("Applied LINGUACACHE_LOCAL_FALLBACK={}", config_.store.local_fallback);
    }

    if (auto env = get_env("LINGUACACHE_CONNECT_TIMEOUT_MS")) {
        config_.store.connect_timeout_ms = parse_u32("LINGUACACHE_CONNECT_TIMEOUT_MS", *env);
        spdlog::debug("Applied LINGUACACHE_CONNECT_TIMEOUT_MS={}", config_.store.connect_timeout_ms);
    }

    if (auto env = get_env("LINGUACACHE_IO_TIMEOUT_MS")) {
        config_.store.io_timeout_ms = parse_u32("LINGUACACHE_IO_TIMEOUT_MS", *env);
        spdlog::debug("Applied LINGUACACHE_IO_TIMEOUT_MS={}", config_.store.io_timeout_ms);
    }

    // Logging settings
    if (auto env = get_env("LINGUACACHE_LOG_LEVEL")) {
        config_.logging.level = *env;
        spdlog::debug("Applied LINGUACACHE_LOG_LEVEL={}", config_.logging.level);
    }

    if (auto env = get_env("LINGUACACHE_LOG_FILE")) {
        config_.logging.file = *env;
        spdlog::debug("Applied LINGUACACHE_LOG_FILE={}", config_.logging.file);
    }
}

std::optional<std::string> ConfigManager::get_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

} // namespace linguacache::config
