/**
 * LINGUACACHE - Translation Memory Cache
 * Redis Backend Implementation
 */

#include "store/redis_backend.hpp"
#include "util/logger.hpp"

#include <algorithm>
#include <cctype>

namespace linguacache::store {

namespace {

std::string_view trim(std::string_view text) {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string describe(const sw::redis::ConnectionOptions& opts) {
    return opts.host + ":" + std::to_string(opts.port) + "/" + std::to_string(opts.db);
}

} // namespace

bool is_placeholder_target(std::string_view url) {
    auto trimmed = trim(url);
    if (trimmed.empty()) {
        return true;
    }

    std::string lower(trimmed);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none" || lower == "null" || lower == "disabled" || lower == "changeme") {
        return true;
    }

    return lower.find("your-redis") != std::string::npos ||
           lower.find('<') != std::string::npos ||
           lower.find('>') != std::string::npos;
}

RedisBackend::RedisBackend(RedisBackendConfig config)
    : config_(std::move(config)) {
    LINGUACACHE_LOG_DEBUG(util::LogComponent::Redis,
                          "Redis backend created (connect_timeout={}ms, io_timeout={}ms)",
                          config_.connect_timeout.count(), config_.io_timeout.count());
}

RedisBackend::~RedisBackend() {
    close();
}

void RedisBackend::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (redis_) {
        return;
    }

    sw::redis::ConnectionOptions opts;
    try {
        opts = sw::redis::ConnectionOptions(std::string(trim(config_.url)));
    } catch (const std::exception&) {
        // sw::redis::Error, or std::invalid_argument from a bad port.
        // The URL may carry credentials, so it stays out of the message
        throw BackendError(BackendErrorKind::Connect, "Malformed or unsupported Redis URL");
    }
    opts.connect_timeout = config_.connect_timeout;
    opts.socket_timeout = config_.io_timeout;
    target_ = describe(opts);

    try {
        auto redis = std::make_unique<sw::redis::Redis>(opts);
        auto pong = redis->ping();
        if (pong != "PONG") {
            throw BackendError(BackendErrorKind::Connect, "Unexpected PING reply from " + target_);
        }
        redis_ = std::move(redis);
    } catch (const sw::redis::Error& e) {
        throw BackendError(BackendErrorKind::Connect,
                           "Failed to connect to " + target_ + ": " + e.what());
    }

    LINGUACACHE_LOG_INFO(util::LogComponent::Redis, "Connected to Redis at {}", target_);
}

void RedisBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!redis_) {
        return;
    }

    redis_.reset();
    LINGUACACHE_LOG_INFO(util::LogComponent::Redis, "Connection to {} closed", target_);
}

std::optional<std::string> RedisBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& redis = client(BackendErrorKind::Read);
    try {
        auto value = redis.get(key);
        if (!value) {
            return std::nullopt;
        }
        return std::move(*value);
    } catch (const sw::redis::Error& e) {
        throw BackendError(BackendErrorKind::Read, "GET " + key + " failed: " + e.what());
    }
}

void RedisBackend::set(const std::string& key, const std::string& value,
                       std::optional<std::chrono::seconds> ttl) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& redis = client(BackendErrorKind::Write);
    std::chrono::milliseconds expiry{0};    // 0 = no expiry
    if (ttl && ttl->count() > 0) {
        expiry = std::chrono::duration_cast<std::chrono::milliseconds>(*ttl);
    }

    bool stored = false;
    try {
        stored = redis.set(key, value, expiry);
    } catch (const sw::redis::Error& e) {
        throw BackendError(BackendErrorKind::Write, "SET " + key + " failed: " + e.what());
    }
    if (!stored) {
        throw BackendError(BackendErrorKind::Write, "SET " + key + " was not applied");
    }
}

bool RedisBackend::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return redis_ != nullptr;
}

sw::redis::Redis& RedisBackend::client(BackendErrorKind kind) {
    if (!redis_) {
        throw BackendError(kind, "Not connected to Redis");
    }
    return *redis_;
}

} // namespace linguacache::store
