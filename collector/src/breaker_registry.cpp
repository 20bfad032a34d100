#include "fleetinv/collector/breaker_registry.hpp"
#include <algorithm>
#include <mutex>

namespace fleetinv {
namespace collector {

BreakerRegistry::BreakerRegistry(CircuitBreaker::Settings default_settings,
                                 std::map<std::string, CircuitBreaker::Settings> per_name,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<Observability> observability)
    : default_settings_(default_settings),
      per_name_(std::move(per_name)),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

std::map<std::string, CircuitBreaker::Settings> BreakerRegistry::default_operation_settings() {
    using std::chrono::seconds;
    return {
        {operations::assume_role, CircuitBreaker::Settings{3, seconds(60), seconds(60)}},
        {operations::list_resources, CircuitBreaker::Settings{3, seconds(30), seconds(60)}},
        {operations::resource_detail, CircuitBreaker::Settings{5, seconds(15), seconds(60)}},
        {operations::publish, CircuitBreaker::Settings{5, seconds(30), seconds(60)}}
    };
}

std::shared_ptr<CircuitBreaker> BreakerRegistry::get(const std::string& name) {
    // Fast path: existing breaker
    {
        std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
        auto it = breakers_.find(name);
        if (it != breakers_.end()) {
            return it->second;
        }
    }

    CircuitBreaker::Settings settings = default_settings_;
    auto cfg = per_name_.find(name);
    if (cfg != per_name_.end()) {
        settings = cfg->second;
    }

    std::unique_lock<std::shared_mutex> lock(breakers_mutex_);
    auto [it, inserted] = breakers_.try_emplace(name, nullptr);
    if (inserted) {
        it->second = std::make_shared<CircuitBreaker>(name, settings, clock_, observability_);
    }
    return it->second;
}

std::vector<BreakerSnapshot> BreakerRegistry::snapshot() const {
    std::vector<BreakerSnapshot> result;
    {
        std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
        result.reserve(breakers_.size());
        for (const auto& [name, breaker] : breakers_) {
            result.push_back(breaker->snapshot());
        }
    }
    std::sort(result.begin(), result.end(),
              [](const BreakerSnapshot& a, const BreakerSnapshot& b) { return a.name < b.name; });
    return result;
}

void BreakerRegistry::reset_all() {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    for (const auto& [name, breaker] : breakers_) {
        breaker->reset();
    }
}

size_t BreakerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(breakers_mutex_);
    return breakers_.size();
}

} // namespace collector
} // namespace fleetinv
