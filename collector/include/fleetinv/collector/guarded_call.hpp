#pragma once

#include "fleetinv/collector/circuit_breaker.hpp"
#include "fleetinv/collector/errors.hpp"
#include <exception>
#include <functional>
#include <memory>
#include <utility>

namespace fleetinv {
namespace collector {

/**
 * A remote operation bound to its breaker and an optional fallback.
 *
 * execute():
 * - breaker rejects: returns fallback() if set, else throws CircuitOpenError
 * - operation returns: records success, returns the value
 * - operation throws: records the classified failure, rethrows unchanged
 *
 * The fallback runs without touching breaker state.
 */
template <typename T>
class GuardedCall {
public:
    using Operation = std::function<T()>;

    GuardedCall(std::shared_ptr<CircuitBreaker> breaker, Operation operation, Operation fallback = nullptr)
        : breaker_(std::move(breaker)),
          operation_(std::move(operation)),
          fallback_(std::move(fallback)) {}

    T execute() const {
        uint64_t ticket = breaker_->admit();
        if (ticket == 0) {
            if (fallback_) {
                return fallback_();
            }
            throw CircuitOpenError(breaker_->name());
        }

        try {
            T value = operation_();
            breaker_->record_success(ticket);
            return value;
        } catch (const std::exception& e) {
            breaker_->record_failure(e, ticket);
            throw;
        } catch (...) {
            breaker_->record_failure(ErrorKind::unknown, ticket);
            throw;
        }
    }

    const std::string& operation_name() const { return breaker_->name(); }
    bool has_fallback() const { return static_cast<bool>(fallback_); }

private:
    std::shared_ptr<CircuitBreaker> breaker_;
    Operation operation_;
    Operation fallback_;
};

template <typename F>
auto guarded(std::shared_ptr<CircuitBreaker> breaker, F&& operation) {
    using T = decltype(operation());
    return GuardedCall<T>(std::move(breaker), std::forward<F>(operation)).execute();
}

} // namespace collector
} // namespace fleetinv
