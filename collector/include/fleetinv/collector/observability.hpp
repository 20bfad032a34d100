#pragma once

#include "fleetinv/collector/core.hpp"
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <opentelemetry/nostd/shared_ptr.h>
#include <opentelemetry/trace/span.h>
#include <opentelemetry/trace/tracer.h>
#include <cstdint>
#include <map>
#include <memory>
#include <string>

namespace fleetinv {
namespace collector {

// Correlation fields promoted to the top level of a log entry
struct LogFields {
    std::string request_id;
    std::string account_id;
    std::string operation;
};

class Observability {
public:
    using Context = std::map<std::string, std::string>;
    using SpanPtr = opentelemetry::nostd::shared_ptr<opentelemetry::trace::Span>;

    enum class Level { debug = 0, info = 1, warn = 2, error = 3 };

    explicit Observability(const std::string& instance_id);

    // Logging
    void log_debug(const std::string& message, const LogFields& fields = {}, const Context& context = {});
    void log_info(const std::string& message, const LogFields& fields = {}, const Context& context = {});
    void log_warn(const std::string& message, const LogFields& fields = {}, const Context& context = {});
    void log_error(const std::string& message, const LogFields& fields = {}, const Context& context = {});

    bool is_enabled(Level level) const { return level >= min_level_; }

    // Renders one entry without writing it; used by the log functions
    std::string format_json_log(Level level,
                                const std::string& message,
                                const LogFields& fields,
                                const Context& context) const;

    // Metrics (gated behind FLEETINV_METRICS_ENABLED)
    void record_breaker_transition(const std::string& breaker, BreakerState from, BreakerState to);
    void record_breaker_rejection(const std::string& breaker);
    void record_account_outcome(AccountStatus status, double duration_seconds);
    void record_resource_outcome(const std::string& service, bool collected);
    void record_lock_attempt(const std::string& result);
    void record_publish_outcome(bool success);
    void set_pool_queue_depth(const std::string& pool, int64_t depth);

    // Prometheus text exposition of the registry
    std::string metrics_text() const;
    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Tracing
    SpanPtr start_span(const std::string& name, const Context& attributes = {});

    const std::string& instance_id() const { return instance_id_; }

private:
    std::string instance_id_;
    Level min_level_;
    bool metrics_enabled_;
    std::shared_ptr<prometheus::Registry> registry_;

    prometheus::Family<prometheus::Counter>* breaker_transitions_family_;
    prometheus::Family<prometheus::Counter>* breaker_rejections_family_;
    prometheus::Family<prometheus::Counter>* accounts_total_family_;
    prometheus::Family<prometheus::Histogram>* account_duration_family_;
    prometheus::Family<prometheus::Counter>* resources_total_family_;
    prometheus::Family<prometheus::Counter>* lock_attempts_family_;
    prometheus::Family<prometheus::Counter>* publish_total_family_;
    prometheus::Family<prometheus::Gauge>* pool_queue_depth_family_;

    opentelemetry::nostd::shared_ptr<opentelemetry::trace::Tracer> tracer_;

    void initialize_metrics();
    void initialize_tracing();
    void write(Level level, const std::string& message, const LogFields& fields, const Context& context);
};

} // namespace collector
} // namespace fleetinv
