#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>

#include "aoikit/cache.hpp"

namespace aoikit {

    /// Longest pause between sweeps; larger intervals are clamped to it
    inline constexpr std::chrono::milliseconds MAX_SWEEP_INTERVAL{std::chrono::hours(24)};

    /**
     * @brief Background thread running TtlCache::cleanup on a fixed period
     *
     * The sweep goes through the cache's own lock, the same path as put().
     * Destroying the sweeper wakes the thread and joins it.
     */
    class CacheSweeper {
      public:
        /// @throws std::invalid_argument when interval is not positive
        CacheSweeper(TtlCache &cache, std::chrono::milliseconds interval);
        ~CacheSweeper();

        CacheSweeper(const CacheSweeper &) = delete;
        CacheSweeper &operator=(const CacheSweeper &) = delete;

        /// Completed sweep passes since construction
        std::size_t sweeps() const { return sweeps_.load(); }

        std::chrono::milliseconds interval() const { return interval_; }

      private:
        void run();

        TtlCache &cache_;
        std::chrono::milliseconds interval_;
        std::atomic<std::size_t> sweeps_{0};

        std::mutex mutex_;
        std::condition_variable cv_;
        bool stop_ = false;
        std::thread worker_;
    };

} // namespace aoikit
