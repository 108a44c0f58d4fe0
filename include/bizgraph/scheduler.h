#pragma once
// ═══════════════════════════════════════════════════════════════════
//  bizgraph/scheduler.h - Background periodic work
// ═══════════════════════════════════════════════════════════════════
//
//  scheduler::PeriodicTask task(std::chrono::seconds(60), [&] { cache.purgeExpired(); });
//  ...
//  task.stop();   // wakes the worker and joins it
//
// ═══════════════════════════════════════════════════════════════════

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace bizgraph::scheduler {

// Runs `tick` every `period` on an owned thread until stopped. The
// first tick happens one period after construction. stop() returns
// only after a tick in progress has finished, so whatever the tick
// touches may be destroyed right after.
class PeriodicTask {
public:
    PeriodicTask(std::chrono::milliseconds period, std::function<void()> tick)
        : period_(period), tick_(std::move(tick)) {
        worker_ = std::thread([this] { run(); });
    }

    ~PeriodicTask() { stop(); }

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        wake_.notify_all();
        if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
            worker_.join();
        }
    }

    bool stopped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stopping_;
    }

    std::uint64_t ticks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return ticks_;
    }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        using Clock = std::chrono::steady_clock;
        Clock::time_point next = Clock::now() + period_;
        while (!wake_.wait_until(lock, next, [this] { return stopping_; })) {
            lock.unlock();
            tick_();
            lock.lock();
            ticks_++;
            // no catch-up after a slow tick
            next = std::max<Clock::time_point>(next + period_, Clock::now());
        }
    }

    std::chrono::milliseconds period_;
    std::function<void()> tick_;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    bool stopping_ = false;
    std::uint64_t ticks_ = 0;
    std::thread worker_;
};

} // namespace bizgraph::scheduler
