#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

namespace fleetinv {
namespace collector {

/**
 * Time source for breakers and locks.
 *
 * Wall-clock time is used throughout because lock expirations are stored in
 * a shared object and compared by other processes.
 */
class Clock {
public:
    using time_point = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
    virtual void sleep_for(std::chrono::milliseconds duration) = 0;
};

class SystemClock : public Clock {
public:
    time_point now() const override;
    void sleep_for(std::chrono::milliseconds duration) override;

    static std::shared_ptr<Clock> instance();
};

// Deterministic clock: sleep_for advances time instead of blocking
class ManualClock : public Clock {
public:
    explicit ManualClock(time_point start = std::chrono::system_clock::now()) : now_(start) {}

    time_point now() const override {
        std::lock_guard<std::mutex> lk(mu_);
        return now_;
    }

    void sleep_for(std::chrono::milliseconds duration) override {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += duration;
        slept_ += duration;
    }

    void advance(std::chrono::milliseconds duration) {
        std::lock_guard<std::mutex> lk(mu_);
        now_ += duration;
    }

    std::chrono::milliseconds total_slept() const {
        std::lock_guard<std::mutex> lk(mu_);
        return slept_;
    }

private:
    mutable std::mutex mu_;
    time_point now_;
    std::chrono::milliseconds slept_{0};
};

// ISO 8601 UTC with microseconds, e.g. 2025-05-13T22:25:17.091000Z
std::string format_iso8601(Clock::time_point tp);

// Accepts the format above, with or without fraction and trailing 'Z'
bool parse_iso8601(const std::string& text, Clock::time_point& out);

} // namespace collector
} // namespace fleetinv
