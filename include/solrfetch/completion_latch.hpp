#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace solrfetch {

// Single-use countdown: wait() returns after count_down() was called count times.
class CompletionLatch {
public:
    explicit CompletionLatch(std::size_t count) : remaining_(count) {}

    CompletionLatch(const CompletionLatch&) = delete;
    CompletionLatch& operator=(const CompletionLatch&) = delete;

    void countDown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (remaining_ > 0) {
                --remaining_;
            }
        }
        cv_.notify_all();
    }

    void wait() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return remaining_ == 0; });
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::size_t remaining_;
};

} // namespace solrfetch
