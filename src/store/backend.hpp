/**
 * LINGUACACHE - Translation Memory Cache
 * Store Backend - Common interface over remote and local storage
 */

#ifndef LINGUACACHE_STORE_BACKEND_HPP
#define LINGUACACHE_STORE_BACKEND_HPP

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace linguacache::store {

/**
 * Which kind of I/O call site a failure came from
 */
enum class BackendErrorKind {
    Connect,
    Read,
    Write
};

inline std::string_view to_string(BackendErrorKind kind) {
    switch (kind) {
        case BackendErrorKind::Connect: return "connect";
        case BackendErrorKind::Read: return "read";
        case BackendErrorKind::Write: return "write";
        default: return "unknown";
    }
}

/**
 * Error raised by a backend operation
 */
class BackendError : public std::runtime_error {
public:
    BackendError(BackendErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {
    }

    BackendErrorKind kind() const noexcept { return kind_; }

private:
    BackendErrorKind kind_;
};

/**
 * Retention policy a backend applies to stored entries
 */
enum class ExpiryPolicy {
    Ttl,        // Entries expire after the configured TTL
    Unbounded   // Entries persist until overwritten or the store is deleted
};

/**
 * Storage backend for translation memory entries
 *
 * Implementations report failures by throwing BackendError with the
 * kind matching the operation. close() must never throw.
 */
class StoreBackend {
public:
    virtual ~StoreBackend() = default;

    /**
     * Establish the backend (open connection, load file)
     * @throws BackendError (Connect)
     */
    virtual void connect() = 0;

    /**
     * Release the backend (close connection, flush file). Idempotent.
     */
    virtual void close() = 0;

    /**
     * Read a value
     * @return Stored value, or nullopt if the key is absent
     * @throws BackendError (Read)
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * Write a value, overwriting any existing entry
     * @param ttl Expiry for backends with ExpiryPolicy::Ttl; ignored otherwise
     * @throws BackendError (Write)
     */
    virtual void set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl) = 0;

    virtual bool is_connected() const = 0;

    virtual ExpiryPolicy expiry_policy() const = 0;

    /**
     * Short name for logging ("redis", "local")
     */
    virtual std::string_view name() const = 0;
};

} // namespace linguacache::store

#endif // LINGUACACHE_STORE_BACKEND_HPP
