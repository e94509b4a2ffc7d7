#pragma once

#include <atomic>
#include <chrono>

namespace capflow {

class IClock {
public:
    virtual ~IClock() = default;
    virtual long long nowMs() const = 0;
};

class SystemClock : public IClock {
public:
    long long nowMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()
        ).count();
    }
};

// Clock driven by the caller. Used by paper-mode replays and tests.
class ManualClock : public IClock {
public:
    explicit ManualClock(long long start_ms = 0) : now_ms_(start_ms) {}

    long long nowMs() const override { return now_ms_.load(); }
    void set(long long now_ms) { now_ms_.store(now_ms); }
    void advance(long long delta_ms) { now_ms_.fetch_add(delta_ms); }

private:
    std::atomic<long long> now_ms_;
};

} // namespace capflow
