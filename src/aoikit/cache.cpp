#include "aoikit/cache.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace aoikit {

    TtlCache::TtlCache(CacheConfig config, NowFn now) : config_(config), now_(std::move(now)) {
        config_.ttl = std::min(config_.ttl, MAX_CACHE_TTL);
        ttl_ = std::chrono::duration_cast<Clock::duration>(config_.ttl);
    }

    std::optional<std::string> TtlCache::get(const std::string &key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;

        // Expired but not yet swept behaves as absent
        if (now_() - it->second.stored_at >= ttl_)
            return std::nullopt;

        return it->second.value;
    }

    void TtlCache::put(const std::string &key, std::string value) {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = now_();
        entries_[key] = Entry{std::move(value), now};
        cleanup_locked(now);
    }

    std::size_t TtlCache::cleanup() {
        std::lock_guard<std::mutex> lock(mutex_);
        return cleanup_locked(now_());
    }

    std::size_t TtlCache::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    void TtlCache::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
    }

    std::size_t TtlCache::cleanup_locked(TimePoint now) {
        std::size_t removed = 0;

        for (auto it = entries_.begin(); it != entries_.end();) {
            if (now - it->second.stored_at >= ttl_) {
                it = entries_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }

        if (entries_.size() <= config_.max_size)
            return removed;

        // Oldest first among the survivors
        std::vector<std::pair<TimePoint, std::string>> by_age;
        by_age.reserve(entries_.size());
        for (const auto &[key, entry] : entries_)
            by_age.emplace_back(entry.stored_at, key);

        std::size_t excess = entries_.size() - config_.max_size;
        std::partial_sort(by_age.begin(), by_age.begin() + static_cast<std::ptrdiff_t>(excess), by_age.end());

        for (std::size_t i = 0; i < excess; ++i)
            entries_.erase(by_age[i].second);

        return removed + excess;
    }

} // namespace aoikit
