#pragma once

#include "fleetinv/collector/clock.hpp"
#include "fleetinv/collector/core.hpp"
#include "fleetinv/collector/observability.hpp"
#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <string>

namespace fleetinv {
namespace collector {

/**
 * Per-operation circuit breaker (CLOSED / OPEN / HALF_OPEN).
 *
 * There is no background timer: OPEN -> HALF_OPEN happens inside
 * allow_request() once recovery_timeout has passed since the last failure,
 * and admits the single call that observed it. Further calls are rejected
 * until that trial call records its outcome. Outcomes are matched to the
 * trial by the ticket admit() returned; while HALF_OPEN, an outcome carrying
 * another ticket (a call admitted before the circuit opened) is counted but
 * neither closes the circuit nor frees the trial slot. Ticket 0 means the
 * caller does not track tickets and settles the current trial.
 *
 * Only transient failures move failure_count or state. Other kinds are
 * counted in ignored_failures for observability.
 *
 * Thread-safe: every mutation happens under one mutex per instance.
 */
class CircuitBreaker {
public:
    struct Settings {
        int32_t failure_threshold = 5;
        std::chrono::seconds recovery_timeout{30};
        std::chrono::seconds reset_timeout{60};
    };

    CircuitBreaker(std::string name,
                   Settings settings,
                   std::shared_ptr<Clock> clock = SystemClock::instance(),
                   std::shared_ptr<Observability> observability = nullptr);

    // 0 when rejected, otherwise a ticket to hand back with the outcome
    uint64_t admit();
    bool allow_request() { return admit() != 0; }

    void record_success(uint64_t ticket = 0);
    void record_failure(ErrorKind kind, uint64_t ticket = 0);
    // Classifies the error first
    void record_failure(const std::exception& error, uint64_t ticket = 0);

    BreakerState get_state() const;
    int32_t failure_count() const;
    void reset();

    BreakerSnapshot snapshot() const;

    const std::string& name() const { return name_; }
    const Settings& settings() const { return settings_; }

private:
    std::string name_;
    Settings settings_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mu_;
    BreakerState state_ = BreakerState::closed;
    int32_t failure_count_ = 0;
    Clock::time_point last_failure_time_{};
    Clock::time_point last_success_time_{};
    uint64_t next_ticket_ = 0;
    uint64_t trial_ticket_ = 0;  // nonzero while a HALF_OPEN trial is in flight
    int64_t ignored_failures_ = 0;
    int64_t successes_ = 0;
    int64_t rejections_ = 0;

    // Caller holds mu_
    void expire_failure_count(Clock::time_point now);
    void transition(BreakerState to);
    // True when an outcome with this ticket is not the HALF_OPEN trial's
    bool is_stray_outcome(uint64_t ticket) const;
};

} // namespace collector
} // namespace fleetinv
