#pragma once

#include <string>
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <cstdint>

namespace fleetinv {
namespace collector {

/**
 * Environment-driven settings.
 *
 * Optional behaviour is gated behind flags that default to `false`.
 * Flags can be set via environment variables:
 * - FLEETINV_METRICS_ENABLED
 * - FLEETINV_TRACING_ENABLED
 * - FLEETINV_LOG_LEVEL (DEBUG|INFO|WARN|ERROR, default INFO)
 */
class FeatureFlags {
public:
    /**
     * Check if Prometheus metric recording is enabled
     */
    static bool is_metrics_enabled() {
        return get_env_bool("FLEETINV_METRICS_ENABLED", false);
    }

    /**
     * Check if OpenTelemetry span export is enabled
     */
    static bool is_tracing_enabled() {
        return get_env_bool("FLEETINV_TRACING_ENABLED", false);
    }

    static std::string log_level() {
        std::string level = get_env_string("FLEETINV_LOG_LEVEL", "INFO");
        std::transform(level.begin(), level.end(), level.begin(), ::toupper);
        return level;
    }

    /**
     * Get boolean value from environment variable
     *
     * Returns `true` if environment variable is set to:
     * - "true" (case-insensitive)
     * - "1"
     * - "yes" (case-insensitive)
     *
     * Returns `false` for any other value, and `default_value` if unset.
     */
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }

    static int64_t get_env_int(const char* env_var, int64_t default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return default_value;
        }
        char* end = nullptr;
        long long parsed = std::strtoll(value, &end, 10);
        if (end == value || *end != '\0') {
            return default_value;
        }
        return static_cast<int64_t>(parsed);
    }

    static double get_env_double(const char* env_var, double default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr || *value == '\0') {
            return default_value;
        }
        char* end = nullptr;
        double parsed = std::strtod(value, &end);
        if (end == value || *end != '\0') {
            return default_value;
        }
        return parsed;
    }

    static std::string get_env_string(const char* env_var, const std::string& default_value) {
        const char* value = std::getenv(env_var);
        return value == nullptr ? default_value : std::string(value);
    }
};

// Lock configuration with defaults, overridable from the environment
struct LockSettings {
    int64_t timeout_seconds = 60;
    int32_t max_attempts = 5;
    double base_backoff_seconds = 2.0;
    double jitter_factor = 1.0;
    bool require_conditional_write = true;

    static LockSettings from_env() {
        LockSettings settings;
        settings.timeout_seconds = FeatureFlags::get_env_int("FLEETINV_LOCK_TIMEOUT_SECONDS", settings.timeout_seconds);
        settings.max_attempts = static_cast<int32_t>(
            FeatureFlags::get_env_int("FLEETINV_LOCK_MAX_ATTEMPTS", settings.max_attempts));
        settings.base_backoff_seconds =
            FeatureFlags::get_env_double("FLEETINV_LOCK_BASE_BACKOFF_SECONDS", settings.base_backoff_seconds);
        settings.jitter_factor = FeatureFlags::get_env_double("FLEETINV_LOCK_JITTER_FACTOR", settings.jitter_factor);
        settings.require_conditional_write = FeatureFlags::get_env_bool(
            "FLEETINV_LOCK_REQUIRE_CONDITIONAL_WRITE", settings.require_conditional_write);
        return settings;
    }
};

} // namespace collector
} // namespace fleetinv
