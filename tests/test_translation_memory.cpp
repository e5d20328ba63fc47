/**
 * @file test_translation_memory.cpp
 * @brief Unit tests for the cache-aside translation memory
 */

#include <catch2/catch_test_macros.hpp>

#include "cache/cache_key.hpp"
#include "store/translation_memory.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <filesystem>
#include <map>
#include <mutex>
#include <random>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace linguacache::store;
namespace fs = std::filesystem;

namespace {

/**
 * In-memory backend with switchable failures
 */
class FakeBackend : public StoreBackend {
public:
    struct State {
        std::map<std::string, std::string> data;
        bool fail_connect{false};
        bool fail_get{false};
        bool fail_set{false};
        int connects{0};
        int closes{0};
        int gets{0};
        int sets{0};
        std::optional<std::chrono::seconds> last_ttl;
    };

    FakeBackend(std::shared_ptr<State> state, ExpiryPolicy policy, std::string name)
        : state_(std::move(state))
        , policy_(policy)
        , name_(std::move(name)) {
    }

    void connect() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++state_->connects;
        if (state_->fail_connect) {
            throw BackendError(BackendErrorKind::Connect, "connection refused");
        }
        connected_ = true;
    }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connected_) {
            ++state_->closes;
            connected_ = false;
        }
    }

    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++state_->gets;
        if (state_->fail_get) {
            throw BackendError(BackendErrorKind::Read, "read timed out");
        }
        auto it = state_->data.find(key);
        if (it == state_->data.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++state_->sets;
        if (state_->fail_set) {
            throw BackendError(BackendErrorKind::Write, "write timed out");
        }
        state_->data[key] = value;
        state_->last_ttl = ttl;
    }

    bool is_connected() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    ExpiryPolicy expiry_policy() const override { return policy_; }
    std::string_view name() const override { return name_; }

private:
    std::shared_ptr<State> state_;
    ExpiryPolicy policy_;
    std::string name_;
    mutable std::mutex mutex_;
    bool connected_{false};
};

std::unique_ptr<StoreBackend> make_remote(const std::shared_ptr<FakeBackend::State>& state) {
    return std::make_unique<FakeBackend>(state, ExpiryPolicy::Ttl, "redis");
}

std::unique_ptr<StoreBackend> make_local(const std::shared_ptr<FakeBackend::State>& state) {
    return std::make_unique<FakeBackend>(state, ExpiryPolicy::Unbounded, "local");
}

fs::path temp_store_path() {
    std::random_device rd;
    return fs::temp_directory_path() / ("linguacache_tm_" + std::to_string(rd()) + ".json");
}

} // namespace

TEST_CASE("TranslationMemory lookup-or-compute", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();
    TranslationMemory memory(make_remote(remote), nullptr, std::chrono::seconds(120));
    memory.connect();
    REQUIRE(memory.mode() == BackendMode::Remote);

    int calls = 0;
    auto compute = [&calls]() { ++calls; return std::string("Merhaba"); };

    SECTION("Blank text returns empty without computing or touching the store") {
        REQUIRE(memory.get_or_compute("", "tr", compute).empty());
        REQUIRE(memory.get_or_compute("   \t", "tr", compute).empty());
        REQUIRE(calls == 0);
        REQUIRE(remote->gets == 0);
        REQUIRE(remote->sets == 0);
    }

    SECTION("Computed once, then served from the store") {
        auto first = memory.lookup_or_compute("Hello", "tr", compute);
        REQUIRE(first.translation == "Merhaba");
        REQUIRE_FALSE(first.cached);

        auto second = memory.lookup_or_compute("Hello", "tr", compute);
        REQUIRE(second.translation == "Merhaba");
        REQUIRE(second.cached);
        REQUIRE(calls == 1);

        auto stats = memory.get_stats();
        REQUIRE(stats.hits == 1);
        REQUIRE(stats.misses == 1);
        REQUIRE(stats.computes == 1);
    }

    SECTION("Case and whitespace variants share an entry") {
        memory.get_or_compute("Hello", "tr", compute);
        REQUIRE(memory.get_or_compute("  HELLO\n", "tr", compute) == "Merhaba");
        REQUIRE(memory.get_or_compute("hello", "TR", compute) == "Merhaba");
        REQUIRE(calls == 1);
    }

    SECTION("Languages are cached separately") {
        memory.get_or_compute("Hello", "tr", compute);
        memory.get_or_compute("Hello", "de", compute);
        REQUIRE(calls == 2);
    }

    SECTION("Entry stored under the derived key with the TTL") {
        memory.get_or_compute("Hello", "tr", compute);
        auto key = linguacache::cache::derive_key("Hello", "tr");
        REQUIRE(remote->data.at(key) == "Merhaba");
        REQUIRE(remote->last_ttl == std::optional<std::chrono::seconds>(std::chrono::seconds(120)));
    }

    SECTION("Empty computed result is returned but not stored") {
        auto result = memory.get_or_compute("Hello", "tr", []() { return std::string(); });
        REQUIRE(result.empty());
        REQUIRE(remote->sets == 0);
    }

    SECTION("Stored empty value counts as a miss") {
        remote->data[linguacache::cache::derive_key("Hello", "tr")] = "";
        REQUIRE(memory.get_or_compute("Hello", "tr", compute) == "Merhaba");
        REQUIRE(calls == 1);
    }

    SECTION("lookup never computes") {
        REQUIRE_FALSE(memory.lookup("Hello", "tr").has_value());
        memory.get_or_compute("Hello", "tr", compute);
        REQUIRE(memory.lookup("hello ", "tr") == std::optional<std::string>("Merhaba"));
        REQUIRE_FALSE(memory.lookup("", "tr").has_value());
    }
}

TEST_CASE("TranslationMemory absorbs backend failures", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();
    TranslationMemory memory(make_remote(remote), nullptr);
    memory.connect();

    int calls = 0;
    auto compute = [&calls]() { ++calls; return std::string("Merhaba"); };

    SECTION("Read failure falls through to compute") {
        remote->fail_get = true;
        REQUIRE(memory.get_or_compute("Hello", "tr", compute) == "Merhaba");
        REQUIRE(calls == 1);
        REQUIRE(memory.get_stats().read_errors == 1);
        REQUIRE(remote->sets == 1);
    }

    SECTION("Write failure still returns the computed value") {
        remote->fail_set = true;
        REQUIRE(memory.get_or_compute("Hello", "tr", compute) == "Merhaba");
        REQUIRE(memory.get_stats().write_errors == 1);
        REQUIRE(remote->data.empty());
    }

    SECTION("Compute failure propagates and nothing is stored") {
        auto failing = []() -> std::string { throw std::runtime_error("quota exceeded"); };
        REQUIRE_THROWS_AS(memory.get_or_compute("Hello", "tr", failing), std::runtime_error);
        REQUIRE(remote->sets == 0);
        REQUIRE(memory.get_stats().compute_failures == 1);

        // Next call computes again
        REQUIRE(memory.get_or_compute("Hello", "tr", compute) == "Merhaba");
        REQUIRE(calls == 1);
    }
}

TEST_CASE("TranslationMemory manual save", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();
    TranslationMemory memory(make_remote(remote), nullptr);

    SECTION("Rejected before connect") {
        REQUIRE_FALSE(memory.save_manual("Hello", "Merhaba"));
    }

    SECTION("Connected") {
        memory.connect();

        SECTION("Empty text or translation is rejected") {
            REQUIRE_FALSE(memory.save_manual("", "Merhaba"));
            REQUIRE_FALSE(memory.save_manual("Hello", ""));
            REQUIRE(remote->sets == 0);
        }

        SECTION("Saved entry is served without computing") {
            REQUIRE(memory.save_manual("Hello", "Selam", "tr"));
            auto result = memory.lookup_or_compute("hello", "tr", []() -> std::string {
                throw std::logic_error("compute must not run");
            });
            REQUIRE(result.translation == "Selam");
            REQUIRE(result.cached);
            REQUIRE(memory.get_stats().manual_saves == 1);
        }

        SECTION("Overwrites a computed entry") {
            memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); });
            REQUIRE(memory.save_manual("Hello", "Selam"));
            REQUIRE(memory.lookup("Hello", "tr") == std::optional<std::string>("Selam"));
        }

        SECTION("Default language is tr") {
            REQUIRE(memory.save_manual("Hello", "Selam"));
            REQUIRE(remote->data.count(linguacache::cache::derive_key("Hello", "tr")) == 1);
        }

        SECTION("Write failure reports false") {
            remote->fail_set = true;
            REQUIRE_FALSE(memory.save_manual("Hello", "Selam"));
            REQUIRE(memory.get_stats().manual_saves == 0);
        }
    }
}

TEST_CASE("TranslationMemory backend selection", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();
    auto local = std::make_shared<FakeBackend::State>();

    SECTION("Remote preferred when reachable") {
        TranslationMemory memory(make_remote(remote), make_local(local));
        memory.connect();
        REQUIRE(memory.mode() == BackendMode::Remote);
        REQUIRE(local->connects == 0);
    }

    SECTION("Local used when remote fails, without TTL") {
        remote->fail_connect = true;
        TranslationMemory memory(make_remote(remote), make_local(local), std::chrono::seconds(60));
        memory.connect();
        REQUIRE(memory.mode() == BackendMode::Local);
        REQUIRE(memory.is_degraded());

        memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); });
        REQUIRE(local->sets == 1);
        REQUIRE_FALSE(local->last_ttl.has_value());
        REQUIRE(remote->sets == 0);
    }

    SECTION("Disabled when nothing connects") {
        remote->fail_connect = true;
        local->fail_connect = true;
        TranslationMemory memory(make_remote(remote), make_local(local));
        REQUIRE_NOTHROW(memory.connect());
        REQUIRE(memory.mode() == BackendMode::Disabled);

        int calls = 0;
        auto compute = [&calls]() { ++calls; return std::string("Merhaba"); };
        REQUIRE(memory.get_or_compute("Hello", "tr", compute) == "Merhaba");
        REQUIRE(memory.get_or_compute("Hello", "tr", compute) == "Merhaba");
        REQUIRE(calls == 2);
        REQUIRE_FALSE(memory.save_manual("Hello", "Selam"));
    }

    SECTION("No backends at all") {
        TranslationMemory memory(nullptr, nullptr);
        memory.connect();
        REQUIRE(memory.mode() == BackendMode::Disabled);
    }

    SECTION("Mode stays fixed after connect") {
        TranslationMemory memory(make_remote(remote), make_local(local));
        memory.connect();
        remote->fail_get = true;
        memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); });
        memory.connect();
        REQUIRE(memory.mode() == BackendMode::Remote);
        REQUIRE(remote->connects == 1);
        REQUIRE(local->connects == 0);
    }
}

TEST_CASE("TranslationMemory close", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();

    SECTION("Close without connect") {
        TranslationMemory memory(make_remote(remote), nullptr);
        REQUIRE_NOTHROW(memory.close());
        REQUIRE(memory.mode() == BackendMode::Closed);
    }

    SECTION("Close is idempotent") {
        TranslationMemory memory(make_remote(remote), nullptr);
        memory.connect();
        memory.close();
        memory.close();
        REQUIRE(remote->closes == 1);
        REQUIRE(memory.mode() == BackendMode::Closed);
    }

    SECTION("Calls after close compute without storing") {
        TranslationMemory memory(make_remote(remote), nullptr);
        memory.connect();
        memory.close();
        REQUIRE(memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); }) == "Merhaba");
        REQUIRE(remote->sets == 0);
        REQUIRE_FALSE(memory.save_manual("Hello", "Merhaba"));
    }

    SECTION("Connect after close is ignored") {
        TranslationMemory memory(make_remote(remote), nullptr);
        memory.close();
        memory.connect();
        REQUIRE(memory.mode() == BackendMode::Closed);
        REQUIRE(remote->connects == 0);
    }
}

TEST_CASE("TranslationMemory concurrent use", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();
    TranslationMemory memory(make_remote(remote), nullptr);
    memory.connect();

    std::atomic<int> mismatches{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&memory, &mismatches]() {
            for (int i = 0; i < 50; ++i) {
                auto text = "line " + std::to_string(i);
                auto result = memory.get_or_compute(text, "tr", [&text]() { return "tr:" + text; });
                if (result != "tr:" + text) {
                    ++mismatches;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    REQUIRE(mismatches == 0);
    auto stats = memory.get_stats();
    REQUIRE(stats.hits + stats.misses == 200);
    REQUIRE(remote->data.size() == 50);
}

TEST_CASE("TranslationMemory health report", "[translation_memory]") {
    auto remote = std::make_shared<FakeBackend::State>();
    TranslationMemory memory(make_remote(remote), nullptr, std::chrono::seconds(600));
    memory.connect();
    memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); });
    memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); });

    auto health = nlohmann::json::parse(memory.health_json());
    REQUIRE(health.at("mode") == "remote");
    REQUIRE(health.at("degraded") == false);
    REQUIRE(health.at("backend") == "redis");
    REQUIRE(health.at("ttl_seconds") == 600);
    REQUIRE(health.at("stats").at("hits") == 1);
    REQUIRE(health.at("stats").at("misses") == 1);
    REQUIRE(health.at("stats").at("hit_rate") == 0.5);

    memory.close();
    auto closed = nlohmann::json::parse(memory.health_json());
    REQUIRE(closed.at("mode") == "closed");
    REQUIRE(closed.at("backend").is_null());
}

TEST_CASE("TranslationMemory local store survives restart", "[translation_memory]") {
    auto path = temp_store_path();
    fs::remove(path);

    TranslationMemoryConfig config;
    config.redis_url = "";
    config.local_store_path = path;

    {
        TranslationMemory memory(config);
        memory.connect();
        REQUIRE(memory.mode() == BackendMode::Local);
        REQUIRE(memory.get_or_compute("Hello", "tr", []() { return std::string("Merhaba"); }) == "Merhaba");
        memory.close();
    }

    {
        TranslationMemory memory(config);
        memory.connect();
        auto result = memory.lookup_or_compute("hello", "tr", []() -> std::string {
            throw std::runtime_error("translation service unavailable");
        });
        REQUIRE(result.translation == "Merhaba");
        REQUIRE(result.cached);
    }

    fs::remove(path);
}

TEST_CASE("TranslationMemory placeholder Redis target", "[translation_memory]") {
    TranslationMemoryConfig config;
    config.redis_url = "redis://your-redis-host:6379";
    config.local_fallback = false;

    TranslationMemory memory(config);
    memory.connect();
    REQUIRE(memory.mode() == BackendMode::Disabled);
}
