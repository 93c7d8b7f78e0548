#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

// Shared between a caller and a blocking poll loop.
// cancel() wakes any wait_for() in progress.
class CancelToken {
public:
    void cancel() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            cancelled_ = true;
        }
        cv_.notify_all();
    }

    bool cancelled() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return cancelled_;
    }

    // Sleeps up to d; returns false if cancelled before or during the wait
    bool wait_for(std::chrono::milliseconds d) const {
        std::unique_lock<std::mutex> lk(mtx_);
        return !cv_.wait_for(lk, d, [&] { return cancelled_; });
    }

private:
    mutable std::mutex mtx_;
    mutable std::condition_variable cv_;
    bool cancelled_{false};
};
