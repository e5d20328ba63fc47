/**
 * LINGUACACHE - Translation Memory Cache
 * Translation Memory Implementation
 */

#include "store/translation_memory.hpp"

#include "cache/cache_key.hpp"
#include "store/redis_backend.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace linguacache::store {

using util::LogComponent;

TranslationMemory::TranslationMemory(const TranslationMemoryConfig& config)
    : ttl_(config.ttl) {
    if (is_placeholder_target(config.redis_url)) {
        LINGUACACHE_LOG_INFO(LogComponent::Store, "No Redis target configured");
    } else {
        RedisBackendConfig redis_config;
        redis_config.url = config.redis_url;
        redis_config.connect_timeout = config.connect_timeout;
        redis_config.io_timeout = config.io_timeout;
        remote_ = std::make_unique<RedisBackend>(std::move(redis_config));
    }

    if (config.local_fallback && !config.local_store_path.empty()) {
        local_ = std::make_unique<LocalBackend>(config.local_store_path);
    }
}

TranslationMemory::TranslationMemory(std::unique_ptr<StoreBackend> remote,
                                     std::unique_ptr<StoreBackend> local,
                                     std::chrono::seconds ttl)
    : remote_(std::move(remote))
    , local_(std::move(local))
    , ttl_(ttl) {
}

TranslationMemory::~TranslationMemory() {
    close();
}

void TranslationMemory::connect() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (mode() != BackendMode::Uninitialized) {
        LINGUACACHE_LOG_WARN(LogComponent::Store, "connect() ignored, mode is already {}", to_string(mode()));
        return;
    }

    if (remote_) {
        try {
            remote_->connect();
            active_.store(remote_.get(), std::memory_order_release);
            mode_.store(BackendMode::Remote, std::memory_order_release);
            LINGUACACHE_LOG_INFO(LogComponent::Store, "Translation memory using {} backend", remote_->name());
            return;
        } catch (const BackendError& e) {
            LINGUACACHE_LOG_ERROR(LogComponent::Store, "Failed to connect to {} ({} error): {}",
                                  remote_->name(), to_string(e.kind()), e.what());
        } catch (const std::exception& e) {
            LINGUACACHE_LOG_ERROR(LogComponent::Store, "Failed to connect to {}: {}", remote_->name(), e.what());
        }
    }

    if (local_) {
        try {
            local_->connect();
            active_.store(local_.get(), std::memory_order_release);
            mode_.store(BackendMode::Local, std::memory_order_release);
            LINGUACACHE_LOG_WARN(LogComponent::Store, "Translation memory running in degraded mode ({} backend)",
                                 local_->name());
            return;
        } catch (const BackendError& e) {
            LINGUACACHE_LOG_ERROR(LogComponent::Store, "Failed to open {} backend ({} error): {}",
                                  local_->name(), to_string(e.kind()), e.what());
        } catch (const std::exception& e) {
            LINGUACACHE_LOG_ERROR(LogComponent::Store, "Failed to open {} backend: {}", local_->name(), e.what());
        }
    }

    mode_.store(BackendMode::Disabled, std::memory_order_release);
    LINGUACACHE_LOG_WARN(LogComponent::Store, "No backend available, translations will not be cached");
}

void TranslationMemory::close() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    if (mode() == BackendMode::Closed) {
        return;
    }

    if (auto* backend = active_.exchange(nullptr, std::memory_order_acq_rel)) {
        backend->close();
        LINGUACACHE_LOG_INFO(LogComponent::Store, "Translation memory closed ({} backend)", backend->name());
    }
    mode_.store(BackendMode::Closed, std::memory_order_release);
}

bool TranslationMemory::save_manual(std::string_view text, std::string_view translation,
                                    std::string_view target_lang) {
    if (text.empty() || translation.empty()) {
        return false;
    }

    auto* backend = active_.load(std::memory_order_acquire);
    if (!backend) {
        LINGUACACHE_LOG_WARN(LogComponent::Store, "Manual save skipped, no backend available (mode={})",
                             to_string(mode()));
        return false;
    }

    auto key = cache::derive_key(text, target_lang);
    if (!write_entry(*backend, key, std::string(translation))) {
        return false;
    }

    ++manual_saves_;
    LINGUACACHE_LOG_INFO(LogComponent::Store, "TM updated: '{}' -> '{}'", text, translation);
    return true;
}

std::string TranslationMemory::get_or_compute(std::string_view text, std::string_view target_lang,
                                              const ComputeFn& compute) {
    return lookup_or_compute(text, target_lang, compute).translation;
}

TranslationResult TranslationMemory::lookup_or_compute(std::string_view text, std::string_view target_lang,
                                                       const ComputeFn& compute) {
    if (is_blank(text)) {
        return {};
    }

    auto key = cache::derive_key(text, target_lang);
    auto* backend = active_.load(std::memory_order_acquire);

    if (backend) {
        auto stored = read_entry(*backend, key);
        if (stored && !stored->empty()) {
            ++hits_;
            LINGUACACHE_LOG_DEBUG(LogComponent::Store, "Cache HIT for key {}", key);
            return TranslationResult{std::move(*stored), true};
        }
    }

    ++misses_;
    LINGUACACHE_LOG_DEBUG(LogComponent::Store, "Cache MISS for key {}, computing", key);

    std::string translation;
    ++computes_;
    try {
        translation = compute();
    } catch (...) {
        ++compute_failures_;
        throw;
    }

    if (backend && !translation.empty()) {
        write_entry(*backend, key, translation);
    }

    return TranslationResult{std::move(translation), false};
}

std::optional<std::string> TranslationMemory::lookup(std::string_view text, std::string_view target_lang) {
    if (is_blank(text)) {
        return std::nullopt;
    }

    auto* backend = active_.load(std::memory_order_acquire);
    if (!backend) {
        return std::nullopt;
    }

    auto stored = read_entry(*backend, cache::derive_key(text, target_lang));
    if (!stored || stored->empty()) {
        return std::nullopt;
    }
    return stored;
}

MemoryStats TranslationMemory::get_stats() const {
    MemoryStats stats;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.computes = computes_.load(std::memory_order_relaxed);
    stats.compute_failures = compute_failures_.load(std::memory_order_relaxed);
    stats.read_errors = read_errors_.load(std::memory_order_relaxed);
    stats.write_errors = write_errors_.load(std::memory_order_relaxed);
    stats.manual_saves = manual_saves_.load(std::memory_order_relaxed);
    return stats;
}

std::string TranslationMemory::health_json() const {
    auto stats = get_stats();
    auto* backend = active_.load(std::memory_order_acquire);

    nlohmann::json j{
        {"mode", std::string(to_string(mode()))},
        {"degraded", is_degraded()},
        {"backend", backend ? nlohmann::json(std::string(backend->name())) : nlohmann::json(nullptr)},
        {"ttl_seconds", ttl_.count()},
        {"stats", {
            {"hits", stats.hits},
            {"misses", stats.misses},
            {"hit_rate", stats.hit_rate()},
            {"computes", stats.computes},
            {"compute_failures", stats.compute_failures},
            {"read_errors", stats.read_errors},
            {"write_errors", stats.write_errors},
            {"manual_saves", stats.manual_saves}
        }}
    };
    return j.dump();
}

std::optional<std::string> TranslationMemory::read_entry(StoreBackend& backend, const std::string& key) {
    try {
        return backend.get(key);
    } catch (const BackendError& e) {
        ++read_errors_;
        LINGUACACHE_LOG_ERROR(LogComponent::Store, "{} {} error for {}: {}",
                              backend.name(), to_string(e.kind()), key, e.what());
    } catch (const std::exception& e) {
        ++read_errors_;
        LINGUACACHE_LOG_ERROR(LogComponent::Store, "{} read error for {}: {}", backend.name(), key, e.what());
    }
    return std::nullopt;
}

bool TranslationMemory::write_entry(StoreBackend& backend, const std::string& key, const std::string& value) {
    try {
        backend.set(key, value, ttl_for(backend));
        return true;
    } catch (const BackendError& e) {
        ++write_errors_;
        LINGUACACHE_LOG_ERROR(LogComponent::Store, "{} {} error for {}: {}",
                              backend.name(), to_string(e.kind()), key, e.what());
    } catch (const std::exception& e) {
        ++write_errors_;
        LINGUACACHE_LOG_ERROR(LogComponent::Store, "{} write error for {}: {}", backend.name(), key, e.what());
    }
    return false;
}

std::optional<std::chrono::seconds> TranslationMemory::ttl_for(const StoreBackend& backend) const {
    if (backend.expiry_policy() == ExpiryPolicy::Ttl) {
        return ttl_;
    }
    return std::nullopt;
}

bool TranslationMemory::is_blank(std::string_view text) {
    return std::all_of(text.begin(), text.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace linguacache::store
