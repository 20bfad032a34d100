#pragma once

#include "fleetinv/collector/circuit_breaker.hpp"
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace fleetinv {
namespace collector {

// Well-known operation names, one breaker each
namespace operations {
constexpr const char* assume_role = "assume-role";
constexpr const char* list_resources = "list-resources";
constexpr const char* resource_detail = "resource-detail";
constexpr const char* publish = "publish";
} // namespace operations

/**
 * Registry of named circuit breakers shared by every worker thread.
 *
 * Breakers are created on first access with the per-name settings when
 * present, otherwise the default settings.
 */
class BreakerRegistry {
public:
    BreakerRegistry(CircuitBreaker::Settings default_settings,
                    std::map<std::string, CircuitBreaker::Settings> per_name = {},
                    std::shared_ptr<Clock> clock = SystemClock::instance(),
                    std::shared_ptr<Observability> observability = nullptr);

    // Default per-operation settings for the collector
    static std::map<std::string, CircuitBreaker::Settings> default_operation_settings();

    std::shared_ptr<CircuitBreaker> get(const std::string& name);

    // Sorted by name
    std::vector<BreakerSnapshot> snapshot() const;

    void reset_all();

    size_t size() const;

private:
    CircuitBreaker::Settings default_settings_;
    std::map<std::string, CircuitBreaker::Settings> per_name_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    std::unordered_map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
    mutable std::shared_mutex breakers_mutex_;
};

} // namespace collector
} // namespace fleetinv
