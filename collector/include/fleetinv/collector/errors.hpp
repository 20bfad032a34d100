#pragma once

#include "fleetinv/collector/core.hpp"
#include <stdexcept>
#include <string>

namespace fleetinv {
namespace collector {

/**
 * Failure reported by a remote collaborator (role assumption, listing,
 * detail fetch, publish). Mirrors the shape of a cloud SDK client error:
 * a service error code plus the HTTP status when one was received.
 */
class RemoteError : public std::runtime_error {
public:
    RemoteError(std::string code, const std::string& message, int http_status = 0)
        : std::runtime_error(message), code_(std::move(code)), http_status_(http_status) {}

    const std::string& code() const { return code_; }
    int http_status() const { return http_status_; }

private:
    std::string code_;
    int http_status_;
};

// Thrown by a guarded call rejected by its breaker when no fallback is set
class CircuitOpenError : public std::runtime_error {
public:
    explicit CircuitOpenError(const std::string& breaker_name)
        : std::runtime_error("Circuit '" + breaker_name + "' is OPEN"), breaker_name_(breaker_name) {}

    const std::string& breaker_name() const { return breaker_name_; }

private:
    std::string breaker_name_;
};

} // namespace collector
} // namespace fleetinv
