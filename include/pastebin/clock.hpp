#pragma once

#include <chrono>
#include <mutex>

namespace pastebin {

/**
 * Clock - Source of creation instants.
 *
 * Injected into the store so identifier derivation and created_at
 * stamping can be pinned down in tests.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::chrono::system_clock::time_point now() = 0;
};

/**
 * Wall clock.
 */
class SystemClock : public Clock {
public:
    std::chrono::system_clock::time_point now() override {
        return std::chrono::system_clock::now();
    }
};

/**
 * Settable clock for tests.
 *
 * Returns the current instant, then advances it by the configured tick.
 * A zero tick freezes time.
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(std::chrono::system_clock::time_point start,
                         std::chrono::microseconds tick = std::chrono::microseconds(0))
        : current_(start), tick_(tick) {}

    std::chrono::system_clock::time_point now() override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto result = current_;
        current_ += tick_;
        return result;
    }

    void set(std::chrono::system_clock::time_point t) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = t;
    }

    void advance(std::chrono::microseconds delta) {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ += delta;
    }

    void set_tick(std::chrono::microseconds tick) {
        std::lock_guard<std::mutex> lock(mutex_);
        tick_ = tick;
    }

private:
    std::chrono::system_clock::time_point current_;
    std::chrono::microseconds tick_;
    std::mutex mutex_;
};

}  // namespace pastebin
