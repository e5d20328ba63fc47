/**
 * LINGUACACHE - Translation Memory Cache
 * Local Backend Implementation
 */

#include "store/local_backend.hpp"
#include "util/logger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <system_error>

namespace linguacache::store {

LocalBackend::LocalBackend(std::filesystem::path path)
    : path_(std::move(path)) {
}

LocalBackend::~LocalBackend() {
    close();
}

void LocalBackend::connect() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (path_.empty()) {
        throw BackendError(BackendErrorKind::Connect, "No local store path configured");
    }

    if (loaded_) {
        return;
    }

    load_locked();
    loaded_ = true;
}

void LocalBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!loaded_) {
        return;
    }

    try {
        flush_locked();
        LINGUACACHE_LOG_INFO(util::LogComponent::Local, "Flushed {} entries to {}",
                             entries_.size(), path_.string());
    } catch (const BackendError& e) {
        LINGUACACHE_LOG_ERROR(util::LogComponent::Local, "Flush on close failed: {}", e.what());
    }
    loaded_ = false;
}

std::optional<std::string> LocalBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!loaded_) {
        throw BackendError(BackendErrorKind::Read, "Local store is not open");
    }

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void LocalBackend::set(const std::string& key, const std::string& value,
                       std::optional<std::chrono::seconds> /*ttl*/) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!loaded_) {
        throw BackendError(BackendErrorKind::Write, "Local store is not open");
    }

    std::optional<std::string> previous;
    if (auto it = entries_.find(key); it != entries_.end()) {
        previous = it->second;
    }

    entries_[key] = value;
    try {
        flush_locked();
    } catch (const BackendError&) {
        // The map must match the file
        if (previous) {
            entries_[key] = std::move(*previous);
        } else {
            entries_.erase(key);
        }
        throw;
    }
}

bool LocalBackend::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return loaded_;
}

std::size_t LocalBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void LocalBackend::load_locked() {
    entries_.clear();

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        LINGUACACHE_LOG_INFO(util::LogComponent::Local,
                             "No local store at {}, starting empty", path_.string());
        return;
    }

    std::ifstream file(path_);
    if (!file.is_open()) {
        LINGUACACHE_LOG_WARN(util::LogComponent::Local,
                             "Cannot open local store {}, starting empty", path_.string());
        return;
    }

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(file);
    } catch (const nlohmann::json::exception& e) {
        LINGUACACHE_LOG_WARN(util::LogComponent::Local,
                             "Local store {} is corrupt ({}), starting empty", path_.string(), e.what());
        return;
    }

    if (!j.is_object()) {
        LINGUACACHE_LOG_WARN(util::LogComponent::Local,
                             "Local store {} is not a JSON object, starting empty", path_.string());
        return;
    }

    std::size_t skipped = 0;
    for (const auto& [key, value] : j.items()) {
        if (!value.is_string()) {
            ++skipped;
            continue;
        }
        entries_.emplace(key, value.get<std::string>());
    }

    if (skipped > 0) {
        LINGUACACHE_LOG_WARN(util::LogComponent::Local,
                             "Skipped {} non-string entries in {}", skipped, path_.string());
    }
    LINGUACACHE_LOG_INFO(util::LogComponent::Local, "Loaded {} entries from {}",
                         entries_.size(), path_.string());
}

void LocalBackend::flush_locked() {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, value] : entries_) {
        j[key] = value;
    }

    std::string text;
    try {
        text = j.dump(2, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::exception& e) {
        throw BackendError(BackendErrorKind::Write,
                           std::string("Cannot encode local store: ") + e.what());
    }

    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw BackendError(BackendErrorKind::Write,
                               "Cannot create directory for " + path_.string() + ": " + ec.message());
        }
    }

    auto tmp_path = path_;
    tmp_path += ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw BackendError(BackendErrorKind::Write, "Cannot open " + tmp_path.string() + " for writing");
        }
        out << text << '\n';
        out.flush();
        if (!out) {
            throw BackendError(BackendErrorKind::Write, "Failed writing " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        auto message = "Cannot replace " + path_.string() + ": " + ec.message();
        std::filesystem::remove(tmp_path, ec);
        throw BackendError(BackendErrorKind::Write, message);
    }
}

} // namespace linguacache::store
