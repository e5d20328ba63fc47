/**
 * LINGUACACHE - Translation Memory Cache
 * Translation Memory - Cache-aside layer in front of an expensive translation call
 *
 * Features:
 * - Keys derived from normalized text + target language (see cache/cache_key.hpp)
 * - Redis as the primary store, local JSON file as fallback
 * - Backend chosen once in connect(), never re-selected
 * - Backend failures are absorbed (logged, counted); only compute failures
 *   reach the caller
 */

#ifndef LINGUACACHE_STORE_TRANSLATION_MEMORY_HPP
#define LINGUACACHE_STORE_TRANSLATION_MEMORY_HPP

#include "store/backend.hpp"
#include "store/local_backend.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace linguacache::store {

/**
 * Which backend the store ended up using
 */
enum class BackendMode {
    Uninitialized,  // connect() not called yet
    Remote,         // Redis reachable
    Local,          // File-backed fallback
    Disabled,       // No backend available; every lookup computes
    Closed          // close() called
};

inline std::string_view to_string(BackendMode mode) {
    switch (mode) {
        case BackendMode::Uninitialized: return "uninitialized";
        case BackendMode::Remote: return "remote";
        case BackendMode::Local: return "local";
        case BackendMode::Disabled: return "disabled";
        case BackendMode::Closed: return "closed";
        default: return "unknown";
    }
}

/**
 * Default TTL for remote entries: 30 days
 */
constexpr std::chrono::seconds kDefaultTtl{2592000};

/**
 * Translation memory configuration
 */
struct TranslationMemoryConfig {
    std::string redis_url;                                           // Empty or placeholder = no Redis
    std::chrono::seconds ttl{kDefaultTtl};                           // Remote entry expiry
    std::filesystem::path local_store_path{kDefaultLocalStoreFile};  // Fallback file
    bool local_fallback{true};                                       // Use the file when Redis is down
    std::chrono::milliseconds connect_timeout{5000};                 // Redis connect + PING
    std::chrono::milliseconds io_timeout{5000};                      // Redis round-trip
};

/**
 * Counters for monitoring
 */
struct MemoryStats {
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t computes{0};
    std::uint64_t compute_failures{0};
    std::uint64_t read_errors{0};
    std::uint64_t write_errors{0};
    std::uint64_t manual_saves{0};

    double hit_rate() const {
        auto total = hits + misses;
        return total > 0 ? static_cast<double>(hits) / total : 0.0;
    }
};

/**
 * Result of a lookup-or-compute call
 */
struct TranslationResult {
    std::string translation;
    bool cached{false};  // Served from the store, compute not invoked
};

/**
 * Produces the translation on a cache miss. May throw; the exception
 * reaches the caller unchanged.
 */
using ComputeFn = std::function<std::string()>;

/**
 * Translation memory - memoizes translations by (normalized text, language)
 *
 * All lookup/save operations are thread-safe. connect() and close() are
 * lifecycle calls made once at startup and shutdown.
 */
class TranslationMemory {
public:
    /**
     * Build Redis and local backends from configuration
     */
    explicit TranslationMemory(const TranslationMemoryConfig& config);

    /**
     * Use the given backends (either may be null)
     */
    TranslationMemory(std::unique_ptr<StoreBackend> remote,
                      std::unique_ptr<StoreBackend> local,
                      std::chrono::seconds ttl = kDefaultTtl);

    ~TranslationMemory();

    // Non-copyable
    TranslationMemory(const TranslationMemory&) = delete;
    TranslationMemory& operator=(const TranslationMemory&) = delete;

    /**
     * Select the backend: Redis if it connects, else the local file,
     * else Disabled. Never throws. Only the first call has an effect.
     */
    void connect();

    /**
     * Close the active backend (Redis: disconnect, local: flush).
     * Idempotent; safe without connect().
     */
    void close();

    /**
     * Store a translation directly, overwriting any existing entry
     *
     * @return false if text or translation is empty, no backend is active,
     *         or the write failed
     */
    bool save_manual(std::string_view text, std::string_view translation,
                     std::string_view target_lang = "tr");

    /**
     * Return the stored translation or compute, store and return it
     *
     * Blank text returns "" without calling compute. Backend errors are
     * treated as misses / ignored on write-back.
     *
     * @throws whatever compute throws
     */
    std::string get_or_compute(std::string_view text, std::string_view target_lang,
                               const ComputeFn& compute);

    /**
     * Same as get_or_compute, also reporting whether the value was cached
     */
    TranslationResult lookup_or_compute(std::string_view text, std::string_view target_lang,
                                        const ComputeFn& compute);

    /**
     * Read-only lookup; never computes
     */
    std::optional<std::string> lookup(std::string_view text, std::string_view target_lang);

    BackendMode mode() const noexcept { return mode_.load(std::memory_order_acquire); }

    /**
     * True unless running against Redis
     */
    bool is_degraded() const noexcept { return mode() != BackendMode::Remote; }

    MemoryStats get_stats() const;

    /**
     * Mode and counters as a JSON document for health endpoints
     */
    std::string health_json() const;

    std::chrono::seconds ttl() const { return ttl_; }

private:
    /**
     * Read key from backend; errors count as a miss
     */
    std::optional<std::string> read_entry(StoreBackend& backend, const std::string& key);

    /**
     * Write key to backend
     * @return false on failure (logged)
     */
    bool write_entry(StoreBackend& backend, const std::string& key, const std::string& value);

    /**
     * TTL argument for the backend's expiry policy
     */
    std::optional<std::chrono::seconds> ttl_for(const StoreBackend& backend) const;

    static bool is_blank(std::string_view text);

    std::unique_ptr<StoreBackend> remote_;
    std::unique_ptr<StoreBackend> local_;
    std::chrono::seconds ttl_;

    std::atomic<StoreBackend*> active_{nullptr};  // remote_, local_ or null
    std::atomic<BackendMode> mode_{BackendMode::Uninitialized};
    std::mutex lifecycle_mutex_;

    std::atomic<std::uint64_t> hits_{0};
    std::atomic<std::uint64_t> misses_{0};
    std::atomic<std::uint64_t> computes_{0};
    std::atomic<std::uint64_t> compute_failures_{0};
    std::atomic<std::uint64_t> read_errors_{0};
    std::atomic<std::uint64_t> write_errors_{0};
    std::atomic<std::uint64_t> manual_saves_{0};
};

} // namespace linguacache::store

#endif // LINGUACACHE_STORE_TRANSLATION_MEMORY_HPP
