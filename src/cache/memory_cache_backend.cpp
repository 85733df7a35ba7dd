#include <ragcore/cache/memory_cache_backend.h>

#include <algorithm>

namespace ragcore::cache {

MemoryCacheBackend::MemoryCacheBackend(size_t capacity, WallClockFn clock)
    : capacity_(capacity == 0 ? 1 : capacity), clock_(std::move(clock)) {}

Result<void> MemoryCacheBackend::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = true;
    return {};
}

void MemoryCacheBackend::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    open_ = false;
    entries_.clear();
}

Result<void> MemoryCacheBackend::requireOpen() const {
    if (!open_) {
        return Error{ErrorCode::CacheTierUnavailable, "memory cache is closed"};
    }
    return {};
}

Result<std::optional<std::string>> MemoryCacheBackend::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = requireOpen(); !r) {
        return r.error();
    }
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::optional<std::string>{};
    }
    if (clock_() >= it->second.expiresAt) {
        entries_.erase(it);
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{it->second.value};
}

Result<void> MemoryCacheBackend::set(const std::string& key, const std::string& value,
                                     std::chrono::milliseconds ttl, const std::string&) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = requireOpen(); !r) {
        return r;
    }
    auto expiresAt = clock_() + ttl;
    if (entries_.find(key) == entries_.end() && entries_.size() >= capacity_) {
        auto victim = std::min_element(entries_.begin(), entries_.end(), [](const auto& a,
                                                                             const auto& b) {
            return a.second.expiresAt < b.second.expiresAt;
        });
        entries_.erase(victim);
    }
    entries_[key] = Entry{value, expiresAt};
    return {};
}

Result<void> MemoryCacheBackend::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = requireOpen(); !r) {
        return r;
    }
    entries_.erase(key);
    return {};
}

Result<size_t> MemoryCacheBackend::removePrefix(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = requireOpen(); !r) {
        return r.error();
    }
    size_t removed = 0;
    auto it = entries_.lower_bound(prefix);
    while (it != entries_.end() && it->first.compare(0, prefix.size(), prefix) == 0) {
        it = entries_.erase(it);
        ++removed;
    }
    return removed;
}

Result<size_t> MemoryCacheBackend::clearExpired() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto r = requireOpen(); !r) {
        return r.error();
    }
    auto now = clock_();
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expiresAt) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool MemoryCacheBackend::health() {
    std::lock_guard<std::mutex> lock(mutex_);
    return open_;
}

size_t MemoryCacheBackend::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace ragcore::cache
