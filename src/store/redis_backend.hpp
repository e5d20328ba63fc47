/**
 * LINGUACACHE - Translation Memory Cache
 * Redis Backend - Remote store through redis++
 */

#ifndef LINGUACACHE_STORE_REDIS_BACKEND_HPP
#define LINGUACACHE_STORE_REDIS_BACKEND_HPP

#include "store/backend.hpp"

#include <sw/redis++/redis++.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace linguacache::store {

/**
 * Configuration for the Redis backend
 */
struct RedisBackendConfig {
    std::string url;                                  // redis://[[user]:password@]host[:port][/db]
    std::chrono::milliseconds connect_timeout{5000};  // TCP connect
    std::chrono::milliseconds io_timeout{5000};       // Per command, including the PING in connect()
};

/**
 * True when a configured Redis target is empty or an unfilled template
 * value (none, null, disabled, changeme, your-redis..., <...>)
 */
bool is_placeholder_target(std::string_view url);

/**
 * Redis backend
 *
 * Features:
 * - redis++ client with a single pooled connection
 * - AUTH and SELECT from the URL, PING during connect()
 * - SET with PX for TTL expiry
 *
 * redis++ errors surface as BackendError. An error reply leaves the
 * connection usable; a broken connection is reopened by redis++ on the
 * next command.
 */
class RedisBackend : public StoreBackend {
public:
    explicit RedisBackend(RedisBackendConfig config);
    ~RedisBackend() override;

    // Non-copyable
    RedisBackend(const RedisBackend&) = delete;
    RedisBackend& operator=(const RedisBackend&) = delete;

    void connect() override;
    void close() override;
    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override;

    bool is_connected() const override;
    ExpiryPolicy expiry_policy() const override { return ExpiryPolicy::Ttl; }
    std::string_view name() const override { return "redis"; }

private:
    /**
     * Caller holds mutex_
     * @throws BackendError of the given kind when closed
     */
    sw::redis::Redis& client(BackendErrorKind kind);

    RedisBackendConfig config_;
    std::string target_;    // host:port/db, safe to log

    mutable std::mutex mutex_;
    std::unique_ptr<sw::redis::Redis> redis_;
};

} // namespace linguacache::store

#endif // LINGUACACHE_STORE_REDIS_BACKEND_HPP
