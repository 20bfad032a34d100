#include "fleetinv/collector/circuit_breaker.hpp"
#include "fleetinv/collector/error_classifier.hpp"
#include "fleetinv/collector/result_converter.hpp"

namespace fleetinv {
namespace collector {

CircuitBreaker::CircuitBreaker(std::string name,
                               Settings settings,
                               std::shared_ptr<Clock> clock,
                               std::shared_ptr<Observability> observability)
    : name_(std::move(name)),
      settings_(settings),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {
    if (settings_.failure_threshold < 1) {
        settings_.failure_threshold = 1;
    }
    last_success_time_ = clock_->now();
    if (observability_) {
        observability_->log_debug("Circuit breaker initialized", LogFields{"", "", name_}, {
            {"failure_threshold", std::to_string(settings_.failure_threshold)},
            {"recovery_timeout_seconds", std::to_string(settings_.recovery_timeout.count())},
            {"reset_timeout_seconds", std::to_string(settings_.reset_timeout.count())}
        });
    }
}

void CircuitBreaker::expire_failure_count(Clock::time_point now) {
    if (state_ == BreakerState::closed && failure_count_ > 0 &&
        now - last_failure_time_ >= settings_.reset_timeout) {
        failure_count_ = 0;
        if (observability_) {
            observability_->log_debug("Circuit failure count reset after quiet period",
                                      LogFields{"", "", name_});
        }
    }
}

void CircuitBreaker::transition(BreakerState to) {
    BreakerState from = state_;
    state_ = to;
    if (!observability_) {
        return;
    }
    Observability::Context context = {
        {"from", ResultConverter::breaker_state_to_string(from)},
        {"to", ResultConverter::breaker_state_to_string(to)},
        {"failure_count", std::to_string(failure_count_)}
    };
    if (to == BreakerState::open) {
        observability_->log_warn("Circuit opened", LogFields{"", "", name_}, context);
    } else {
        observability_->log_info("Circuit state changed", LogFields{"", "", name_}, context);
    }
    observability_->record_breaker_transition(name_, from, to);
}

bool CircuitBreaker::is_stray_outcome(uint64_t ticket) const {
    return state_ == BreakerState::half_open && ticket != 0 && ticket != trial_ticket_;
}

uint64_t CircuitBreaker::admit() {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = clock_->now();

    expire_failure_count(now);

    switch (state_) {
        case BreakerState::closed:
            return ++next_ticket_;
        case BreakerState::open:
            if (now - last_failure_time_ >= settings_.recovery_timeout) {
                transition(BreakerState::half_open);
                trial_ticket_ = ++next_ticket_;
                return trial_ticket_;
            }
            break;
        case BreakerState::half_open:
            if (trial_ticket_ == 0) {
                trial_ticket_ = ++next_ticket_;
                return trial_ticket_;
            }
            break;
    }

    ++rejections_;
    if (observability_) {
        observability_->record_breaker_rejection(name_);
    }
    return 0;
}

void CircuitBreaker::record_success(uint64_t ticket) {
    std::lock_guard<std::mutex> lk(mu_);
    last_success_time_ = clock_->now();
    ++successes_;

    if (state_ == BreakerState::half_open && !is_stray_outcome(ticket)) {
        trial_ticket_ = 0;
        failure_count_ = 0;
        transition(BreakerState::closed);
    }
}

void CircuitBreaker::record_failure(ErrorKind kind, uint64_t ticket) {
    std::lock_guard<std::mutex> lk(mu_);
    auto now = clock_->now();
    bool stray = is_stray_outcome(ticket);
    if (state_ == BreakerState::half_open && !stray) {
        trial_ticket_ = 0;
    }

    if (kind != ErrorKind::transient || stray) {
        ++ignored_failures_;
        if (observability_) {
            observability_->log_debug(stray ? "Failure from a call admitted before the trial ignored"
                                            : "Non-transient failure ignored by circuit",
                                      LogFields{"", "", name_}, {
                {"error_kind", ResultConverter::error_kind_to_string(kind)}
            });
        }
        return;
    }

    expire_failure_count(now);
    ++failure_count_;
    last_failure_time_ = now;

    if (state_ == BreakerState::half_open) {
        transition(BreakerState::open);
    } else if (state_ == BreakerState::closed && failure_count_ >= settings_.failure_threshold) {
        transition(BreakerState::open);
    }
}

void CircuitBreaker::record_failure(const std::exception& error, uint64_t ticket) {
    record_failure(ErrorClassifier::classify(error), ticket);
}

BreakerState CircuitBreaker::get_state() const {
    std::lock_guard<std::mutex> lk(mu_);
    return state_;
}

int32_t CircuitBreaker::failure_count() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failure_count_;
}

void CircuitBreaker::reset() {
    std::lock_guard<std::mutex> lk(mu_);
    failure_count_ = 0;
    last_failure_time_ = Clock::time_point{};
    last_success_time_ = clock_->now();
    trial_ticket_ = 0;
    if (state_ != BreakerState::closed) {
        transition(BreakerState::closed);
    } else if (observability_) {
        observability_->log_info("Circuit manually reset", LogFields{"", "", name_});
    }
}

BreakerSnapshot CircuitBreaker::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    BreakerSnapshot snap;
    snap.name = name_;
    snap.state = state_;
    snap.failure_count = failure_count_;
    snap.ignored_failures = ignored_failures_;
    snap.successes = successes_;
    snap.rejections = rejections_;
    return snap;
}

} // namespace collector
} // namespace fleetinv
