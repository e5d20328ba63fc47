/**
 * LINGUACACHE - Translation Memory Cache
 * Local Backend - File-backed key/value map used when Redis is unavailable
 *
 * The whole map lives in memory and is written to a single JSON file
 * ({"<key>": "<translation>", ...}) after every write and on close.
 * Entries never expire.
 */

#ifndef LINGUACACHE_STORE_LOCAL_BACKEND_HPP
#define LINGUACACHE_STORE_LOCAL_BACKEND_HPP

#include "store/backend.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <unordered_map>

namespace linguacache::store {

/**
 * Default store file, relative to the working directory
 */
constexpr const char* kDefaultLocalStoreFile = "translation_memory.json";

class LocalBackend : public StoreBackend {
public:
    explicit LocalBackend(std::filesystem::path path);
    ~LocalBackend() override;

    // Non-copyable
    LocalBackend(const LocalBackend&) = delete;
    LocalBackend& operator=(const LocalBackend&) = delete;

    /**
     * Load the map from disk. A missing, unreadable or corrupt file
     * yields an empty map.
     * @throws BackendError (Connect) only if no path is configured
     */
    void connect() override;

    /**
     * Flush the map to disk. Failures are logged.
     */
    void close() override;

    std::optional<std::string> get(const std::string& key) override;

    /**
     * Store the value and rewrite the file; ttl is ignored
     * @throws BackendError (Write) if the value is not valid UTF-8 or the
     *         file cannot be written. The entry is left as it was.
     */
    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override;

    bool is_connected() const override;
    ExpiryPolicy expiry_policy() const override { return ExpiryPolicy::Unbounded; }
    std::string_view name() const override { return "local"; }

    const std::filesystem::path& path() const { return path_; }

    /**
     * Number of entries currently held
     */
    std::size_t size() const;

private:
    void load_locked();

    /**
     * Write the map to a temporary file and rename it over the store file.
     * Caller holds mutex_.
     * @throws BackendError (Write)
     */
    void flush_locked();

    std::filesystem::path path_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> entries_;
    bool loaded_{false};
};

} // namespace linguacache::store

#endif // LINGUACACHE_STORE_LOCAL_BACKEND_HPP
