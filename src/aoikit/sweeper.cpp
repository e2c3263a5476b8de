#include "aoikit/sweeper.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace aoikit {

    CacheSweeper::CacheSweeper(TtlCache &cache, std::chrono::milliseconds interval)
        : cache_(cache), interval_(std::min(interval, MAX_SWEEP_INTERVAL)) {
        if (interval_.count() <= 0)
            throw std::invalid_argument("sweep interval must be positive");

        worker_ = std::thread([this] { run(); });
    }

    CacheSweeper::~CacheSweeper() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        if (worker_.joinable())
            worker_.join();
    }

    void CacheSweeper::run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!stop_) {
            if (cv_.wait_for(lock, interval_, [this] { return stop_; }))
                break;

            lock.unlock();
            std::size_t removed = cache_.cleanup();
            ++sweeps_;
            if (removed > 0) {
                std::cout << "Cache sweep removed " << removed << " entries, " << cache_.size() << " left"
                          << std::endl;
            }
            lock.lock();
        }
    }

} // namespace aoikit
