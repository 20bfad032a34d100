#pragma once

#include "fleetinv/collector/breaker_registry.hpp"
#include "fleetinv/collector/feature_flags.hpp"
#include <chrono>
#include <map>
#include <string>

namespace fleetinv {
namespace collector {

// Process exit codes of the collector CLI
namespace exit_codes {
constexpr int success = 0;
constexpr int config_error = 1;   // also used for fatal errors
constexpr int partial = 2;        // at least one account did not succeed
constexpr int report_failed = 3;  // a requested report was not written
} // namespace exit_codes

// report_status is empty when no report was requested. A failed report
// outranks partial collection: the shared artifact is stale either way.
inline int run_exit_code(bool all_accounts_succeeded, const std::string& report_status) {
    if (report_status == "error") {
        return exit_codes::report_failed;
    }
    return all_accounts_succeeded ? exit_codes::success : exit_codes::partial;
}

struct BreakerOptions {
    int failure_threshold = 5;
    int recovery_seconds = 30;
};

// Everything one collection run needs; bound to CLI options in main
struct CollectorConfig {
    int max_account_concurrency = 3;
    int max_resource_concurrency = 5;

    std::string accounts_file;
    std::string fixture_file;
    std::string request_id;

    // Publishing (skipped when publish_file is empty)
    std::string publish_file;
    std::string topic = "fleetinv-inventory";
    int publish_batch_size = 10;
    int publish_pause_ms = 200;

    // Report (skipped when report_key is empty)
    std::string report_root = "./data";
    std::string report_key;

    std::string metrics_file;

    BreakerOptions assume_role{3, 60};
    BreakerOptions list_resources{3, 30};
    BreakerOptions resource_detail{5, 15};
    BreakerOptions publish{5, 30};
    int breaker_reset_seconds = 60;

    LockSettings lock = LockSettings::from_env();

    std::map<std::string, CircuitBreaker::Settings> breaker_settings() const {
        auto to_settings = [this](const BreakerOptions& opts) {
            CircuitBreaker::Settings settings;
            settings.failure_threshold = opts.failure_threshold;
            settings.recovery_timeout = std::chrono::seconds(opts.recovery_seconds);
            settings.reset_timeout = std::chrono::seconds(breaker_reset_seconds);
            return settings;
        };
        return {
            {operations::assume_role, to_settings(assume_role)},
            {operations::list_resources, to_settings(list_resources)},
            {operations::resource_detail, to_settings(resource_detail)},
            {operations::publish, to_settings(publish)}
        };
    }
};

} // namespace collector
} // namespace fleetinv
