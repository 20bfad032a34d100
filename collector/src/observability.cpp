#include "fleetinv/collector/observability.hpp"
#include "fleetinv/collector/clock.hpp"
#include "fleetinv/collector/feature_flags.hpp"
#include "fleetinv/collector/result_converter.hpp"
#include <prometheus/text_serializer.h>
#include <opentelemetry/exporters/ostream/span_exporter.h>
#include <opentelemetry/sdk/trace/simple_processor.h>
#include <opentelemetry/sdk/trace/tracer_provider.h>
#include <opentelemetry/trace/provider.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <mutex>
#include <vector>

namespace fleetinv {
namespace collector {

using json = nlohmann::json;

// Secret fields to filter; assumed-role credentials must never reach a log line
static const std::vector<std::string> SECRET_FIELDS = {
    "password", "secret", "token", "access_key", "session",
    "authorization", "credential"
};

// Helper function to check if a field name should be filtered (case-insensitive)
static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Recursively filter secrets from JSON object
static void filter_secrets_recursive(json& obj) {
    if (obj.is_object()) {
        for (auto it = obj.begin(); it != obj.end(); ++it) {
            if (is_secret_field(it.key())) {
                it.value() = "[REDACTED]";
            } else if (it.value().is_object() || it.value().is_array()) {
                filter_secrets_recursive(it.value());
            }
        }
    } else if (obj.is_array()) {
        for (auto& item : obj) {
            if (item.is_object() || item.is_array()) {
                filter_secrets_recursive(item);
            }
        }
    }
}

static Observability::Level parse_level(const std::string& level) {
    if (level == "DEBUG") return Observability::Level::debug;
    if (level == "WARN" || level == "WARNING") return Observability::Level::warn;
    if (level == "ERROR") return Observability::Level::error;
    return Observability::Level::info;
}

static const char* level_name(Observability::Level level) {
    switch (level) {
        case Observability::Level::debug: return "DEBUG";
        case Observability::Level::info: return "INFO";
        case Observability::Level::warn: return "WARN";
        case Observability::Level::error: return "ERROR";
    }
    return "INFO";
}

// Serializes whole lines across worker threads
static std::mutex& output_mutex() {
    static std::mutex mu;
    return mu;
}

Observability::Observability(const std::string& instance_id)
    : instance_id_(instance_id),
      min_level_(parse_level(FeatureFlags::log_level())),
      metrics_enabled_(FeatureFlags::is_metrics_enabled()) {
    initialize_metrics();
    initialize_tracing();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    breaker_transitions_family_ = &prometheus::BuildCounter()
        .Name("fleetinv_breaker_transitions_total")
        .Help("Circuit breaker state transitions")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    breaker_rejections_family_ = &prometheus::BuildCounter()
        .Name("fleetinv_breaker_rejections_total")
        .Help("Calls rejected by an open circuit breaker")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    accounts_total_family_ = &prometheus::BuildCounter()
        .Name("fleetinv_accounts_total")
        .Help("Account collection outcomes")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    account_duration_family_ = &prometheus::BuildHistogram()
        .Name("fleetinv_account_duration_seconds")
        .Help("Account collection duration in seconds")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    resources_total_family_ = &prometheus::BuildCounter()
        .Name("fleetinv_resources_total")
        .Help("Resource detail outcomes")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    lock_attempts_family_ = &prometheus::BuildCounter()
        .Name("fleetinv_lock_attempts_total")
        .Help("Distributed lock acquisition attempts")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    publish_total_family_ = &prometheus::BuildCounter()
        .Name("fleetinv_publish_total")
        .Help("Inventory message publish outcomes")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);

    pool_queue_depth_family_ = &prometheus::BuildGauge()
        .Name("fleetinv_pool_queue_depth")
        .Help("Queue depth for worker pools")
        .Labels({{"instance_id", instance_id_}})
        .Register(*registry_);
}

void Observability::initialize_tracing() {
    static std::once_flag provider_once;
    if (FeatureFlags::is_tracing_enabled()) {
        std::call_once(provider_once, []() {
            auto exporter = std::unique_ptr<opentelemetry::sdk::trace::SpanExporter>(
                new opentelemetry::exporter::trace::OStreamSpanExporter());
            auto processor = std::unique_ptr<opentelemetry::sdk::trace::SpanProcessor>(
                new opentelemetry::sdk::trace::SimpleSpanProcessor(std::move(exporter)));
            opentelemetry::nostd::shared_ptr<opentelemetry::trace::TracerProvider> provider(
                new opentelemetry::sdk::trace::TracerProvider(std::move(processor)));
            opentelemetry::trace::Provider::SetTracerProvider(provider);
        });
    }

    // Falls back to the global no-op provider when export is disabled
    tracer_ = opentelemetry::trace::Provider::GetTracerProvider()->GetTracer("fleetinv_collector", "1.0.0");
}

void Observability::record_breaker_transition(const std::string& breaker, BreakerState from, BreakerState to) {
    if (!metrics_enabled_) {
        return;
    }
    breaker_transitions_family_->Add({
        {"breaker", breaker},
        {"from", ResultConverter::breaker_state_to_string(from)},
        {"to", ResultConverter::breaker_state_to_string(to)}
    }).Increment();
}

void Observability::record_breaker_rejection(const std::string& breaker) {
    if (!metrics_enabled_) {
        return;
    }
    breaker_rejections_family_->Add({{"breaker", breaker}}).Increment();
}

void Observability::record_account_outcome(AccountStatus status, double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }
    std::string status_str = ResultConverter::status_to_string(status);
    accounts_total_family_->Add({{"status", status_str}}).Increment();
    account_duration_family_->Add({{"status", status_str}},
        prometheus::Histogram::BucketBoundaries{0.1, 0.5, 1.0, 5.0, 10.0, 30.0, 60.0, 300.0})
        .Observe(duration_seconds);
}

void Observability::record_resource_outcome(const std::string& service, bool collected) {
    if (!metrics_enabled_) {
        return;
    }
    resources_total_family_->Add({
        {"service", service},
        {"outcome", collected ? "collected" : "failed"}
    }).Increment();
}

void Observability::record_lock_attempt(const std::string& result) {
    if (!metrics_enabled_) {
        return;
    }
    lock_attempts_family_->Add({{"result", result}}).Increment();
}

void Observability::record_publish_outcome(bool success) {
    if (!metrics_enabled_) {
        return;
    }
    publish_total_family_->Add({{"outcome", success ? "success" : "failed"}}).Increment();
}

void Observability::set_pool_queue_depth(const std::string& pool, int64_t depth) {
    if (!metrics_enabled_) {
        return;
    }
    pool_queue_depth_family_->Add({{"pool", pool}}).Set(static_cast<double>(depth));
}

std::string Observability::metrics_text() const {
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

Observability::SpanPtr Observability::start_span(const std::string& name, const Context& attributes) {
    auto span = tracer_->StartSpan(name);
    span->SetAttribute("instance_id", opentelemetry::nostd::string_view(instance_id_));
    for (const auto& [key, value] : attributes) {
        if (is_secret_field(key)) {
            continue;
        }
        span->SetAttribute(key, opentelemetry::nostd::string_view(value));
    }
    return span;
}

void Observability::log_debug(const std::string& message, const LogFields& fields, const Context& context) {
    write(Level::debug, message, fields, context);
}

void Observability::log_info(const std::string& message, const LogFields& fields, const Context& context) {
    write(Level::info, message, fields, context);
}

void Observability::log_warn(const std::string& message, const LogFields& fields, const Context& context) {
    write(Level::warn, message, fields, context);
}

void Observability::log_error(const std::string& message, const LogFields& fields, const Context& context) {
    write(Level::error, message, fields, context);
}

void Observability::write(Level level, const std::string& message, const LogFields& fields, const Context& context) {
    if (!is_enabled(level)) {
        return;
    }
    std::string line = format_json_log(level, message, fields, context);
    std::lock_guard<std::mutex> lk(output_mutex());
    if (level >= Level::warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::string Observability::format_json_log(Level level,
                                           const std::string& message,
                                           const LogFields& fields,
                                           const Context& context) const {
    json log_entry;

    // Required fields (always present)
    log_entry["timestamp"] = format_iso8601(std::chrono::system_clock::now());
    log_entry["level"] = level_name(level);
    log_entry["component"] = "collector";
    log_entry["message"] = message;

    // Correlation fields (at top level, when provided)
    if (!fields.request_id.empty()) {
        log_entry["request_id"] = fields.request_id;
    }
    if (!fields.account_id.empty()) {
        log_entry["account_id"] = fields.account_id;
    }
    if (!fields.operation.empty()) {
        log_entry["operation"] = fields.operation;
    }

    // Context object (technical details)
    json context_obj;
    context_obj["instance_id"] = instance_id_;
    for (const auto& [key, value] : context) {
        context_obj[key] = value;
    }
    filter_secrets_recursive(context_obj);
    log_entry["context"] = context_obj;

    return ResultConverter::dump(log_entry);
}

} // namespace collector
} // namespace fleetinv
