#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace aoikit {

    /// Longest TTL a cache honours; larger values are clamped to it
    inline constexpr std::chrono::milliseconds MAX_CACHE_TTL{std::chrono::hours(24 * 365)};

    /**
     * @brief Limits applied to a TtlCache
     */
    struct CacheConfig {
        std::chrono::milliseconds ttl{std::chrono::minutes(5)};
        std::size_t max_size = 1000;
    };

    /**
     * @brief Bounded, time-expiring key/value store for upstream responses
     *
     * Values are opaque payloads (the upstream JSON body). Entries are never
     * modified after insertion; a second put under the same key replaces the
     * entry. Every public call takes the same mutex, so request handlers and
     * the periodic sweep can share one instance.
     */
    class TtlCache {
      public:
        using Clock = std::chrono::steady_clock;
        using TimePoint = Clock::time_point;
        using NowFn = std::function<TimePoint()>;

        struct Entry {
            std::string value;
            TimePoint stored_at;
        };

        /// ttl above MAX_CACHE_TTL is clamped to it
        explicit TtlCache(CacheConfig config = {}, NowFn now = &Clock::now);

        TtlCache(const TtlCache &) = delete;
        TtlCache &operator=(const TtlCache &) = delete;

        /**
         * @brief Look up a live entry
         *
         * @param key Request fingerprint
         * @return Copy of the stored value, or nullopt when absent or expired
         */
        std::optional<std::string> get(const std::string &key) const;

        /**
         * @brief Insert or replace an entry stamped with the current time
         *
         * Runs a cleanup pass afterwards, so the size bound holds on return.
         */
        void put(const std::string &key, std::string value);

        /**
         * @brief Drop expired entries, then the oldest ones above max_size
         *
         * @return Number of entries removed
         */
        std::size_t cleanup();

        /// Number of stored entries, expired ones included until swept
        std::size_t size() const;

        void clear();

        const CacheConfig &config() const { return config_; }

      private:
        std::size_t cleanup_locked(TimePoint now);

        CacheConfig config_;
        Clock::duration ttl_;
        NowFn now_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, Entry> entries_;
    };

} // namespace aoikit
