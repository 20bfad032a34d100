#include <iostream>
#include <fstream>
#include <caf/actor_system_config.hpp>
#include <caf/config_option_adder.hpp>
#include "fleetinv/collector/collector_config.hpp"
#include "fleetinv/collector/distributed_lock.hpp"
#include "fleetinv/collector/fixture_inventory.hpp"
#include "fleetinv/collector/object_store.hpp"
#include "fleetinv/collector/observability.hpp"
#include "fleetinv/collector/orchestrator.hpp"
#include "fleetinv/collector/publisher.hpp"
#include "fleetinv/collector/report_writer.hpp"
#include "fleetinv/collector/result_converter.hpp"
#include <unistd.h>

namespace fc = fleetinv::collector;

class CollectorCliConfig : public caf::actor_system_config {
public:
    CollectorCliConfig() {
        opt_group{custom_options_, "global"}
            .add(collector_config.accounts_file, "accounts", "JSON file listing account tasks")
            .add(collector_config.fixture_file, "fixture", "JSON inventory fixture")
            .add(collector_config.request_id, "request-id", "Correlation id for logs and lock records")
            .add(collector_config.max_account_concurrency, "max-account-concurrency", "Accounts processed in parallel")
            .add(collector_config.max_resource_concurrency, "max-resource-concurrency", "Resources processed in parallel per account")
            .add(collector_config.publish_file, "publish-file", "Append inventory messages to this JSONL file")
            .add(collector_config.topic, "topic", "Topic name attached to published messages")
            .add(collector_config.publish_batch_size, "publish-batch-size", "Messages per publish batch")
            .add(collector_config.publish_pause_ms, "publish-pause-ms", "Pause between publish batches (ms)")
            .add(collector_config.report_root, "report-root", "Root directory of the report object store")
            .add(collector_config.report_key, "report-key", "Object key of the merged CSV report; exit code 3 when it cannot be written")
            .add(collector_config.metrics_file, "metrics-file", "Write Prometheus metrics text to this file")
            .add(collector_config.breaker_reset_seconds, "breaker-reset-seconds", "Quiet period that clears breaker failure counts");
        opt_group{custom_options_, "breakers"}
            .add(collector_config.assume_role.failure_threshold, "assume-role-threshold", "assume-role failure threshold")
            .add(collector_config.assume_role.recovery_seconds, "assume-role-recovery", "assume-role recovery timeout (s)")
            .add(collector_config.list_resources.failure_threshold, "list-threshold", "list-resources failure threshold")
            .add(collector_config.list_resources.recovery_seconds, "list-recovery", "list-resources recovery timeout (s)")
            .add(collector_config.resource_detail.failure_threshold, "detail-threshold", "resource-detail failure threshold")
            .add(collector_config.resource_detail.recovery_seconds, "detail-recovery", "resource-detail recovery timeout (s)")
            .add(collector_config.publish.failure_threshold, "publish-threshold", "publish failure threshold")
            .add(collector_config.publish.recovery_seconds, "publish-recovery", "publish recovery timeout (s)");
        opt_group{custom_options_, "lock"}
            .add(collector_config.lock.timeout_seconds, "timeout-seconds", "Lock expiration (s)")
            .add(collector_config.lock.max_attempts, "max-attempts", "Lock acquisition attempts")
            .add(collector_config.lock.base_backoff_seconds, "base-backoff-seconds", "Backoff base (s)")
            .add(collector_config.lock.jitter_factor, "jitter-factor", "Maximum jitter added to each backoff (s)")
            .add(collector_config.lock.require_conditional_write, "require-conditional-write",
                 "Refuse to lock stores without create-if-absent");
    }

    fc::CollectorConfig collector_config;
};

int run(const fc::CollectorConfig& config) {
    auto observability = std::make_shared<fc::Observability>("collector_" + std::to_string(getpid()));
    fc::LogFields fields{config.request_id, "", "main"};

    if (config.accounts_file.empty() || config.fixture_file.empty()) {
        observability->log_error("Both --accounts and --fixture are required", fields);
        return fc::exit_codes::config_error;
    }

    auto tasks = fc::load_account_tasks(config.accounts_file);
    if (!tasks) {
        observability->log_error("Failed to load account tasks", fields, {{"error", caf::to_string(tasks.error())}});
        return fc::exit_codes::config_error;
    }
    auto inventory = fc::FixtureInventory::load(config.fixture_file);
    if (!inventory) {
        observability->log_error("Failed to load fixture", fields, {{"error", caf::to_string(inventory.error())}});
        return fc::exit_codes::config_error;
    }

    observability->log_info("Collector starting", fields, {
        {"accounts", std::to_string(tasks->size())},
        {"service", (*inventory)->service_name()},
        {"max_account_concurrency", std::to_string(config.max_account_concurrency)},
        {"max_resource_concurrency", std::to_string(config.max_resource_concurrency)}
    });

    auto breakers = std::make_shared<fc::BreakerRegistry>(
        fc::CircuitBreaker::Settings{}, config.breaker_settings(), fc::SystemClock::instance(), observability);

    fc::OrchestratorOptions options;
    options.max_account_concurrency = config.max_account_concurrency;
    options.max_resource_concurrency = config.max_resource_concurrency;
    options.request_id = config.request_id;
    fc::Orchestrator orchestrator(*inventory, *inventory, breakers, observability, options);

    fc::CollectionResult result = orchestrator.collect(*tasks);
    nlohmann::json output = fc::ResultConverter::to_json(result);

    if (!config.publish_file.empty()) {
        auto sink = std::make_shared<fc::JsonlFilePublisher>(config.publish_file);
        fc::InventoryPublisher publisher(sink, breakers, observability);
        auto messages = fc::make_inventory_messages(result, (*inventory)->service_name());
        auto report = publisher.publish_in_batches(
            config.topic, messages, {{"ExecutionId", config.request_id}},
            static_cast<size_t>(config.publish_batch_size > 0 ? config.publish_batch_size : 1),
            std::chrono::milliseconds(config.publish_pause_ms));
        output["publish"] = report.to_json();
    }

    std::string report_status;
    if (!config.report_key.empty()) {
        auto store = std::make_shared<fc::FilesystemObjectStore>(config.report_root);
        auto lock = std::make_shared<fc::DistributedLock>(store, config.lock, fc::SystemClock::instance(),
                                                          observability, config.request_id);
        fc::ReportWriter writer(store, lock, observability);

        std::vector<fc::ResourceRecord> records;
        for (const auto& [account_id, account] : result.results) {
            records.insert(records.end(), account.items.begin(), account.items.end());
        }
        auto outcome = writer.write_report(config.report_key, records);
        report_status = outcome.status;
        output["report"] = {
            {"status", outcome.status},
            {"rows", outcome.rows},
            {"message", outcome.message}
        };
    }

    // Refresh breaker states so the publish breaker is included
    fc::CollectionSummary final_summary = result.summary;
    final_summary.breaker_states = breakers->snapshot();
    output["summary"] = fc::ResultConverter::to_json(final_summary);

    if (!config.metrics_file.empty()) {
        std::ofstream metrics(config.metrics_file, std::ios::trunc);
        if (!metrics.is_open()) {
            observability->log_warn("Failed to open metrics file", fields, {{"path", config.metrics_file}});
        } else {
            metrics << observability->metrics_text();
        }
    }

    std::cout << fc::ResultConverter::dump(output, 2) << std::endl;
    return fc::run_exit_code(result.all_succeeded(), report_status);
}

int main(int argc, char** argv) {
    CollectorCliConfig config;

    // Parse command line arguments
    if (auto err = config.parse(argc, argv)) {
        // Use stderr for argument parsing errors (before observability is initialized)
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return fc::exit_codes::config_error;
    }
    if (config.cli_helptext_printed) {
        return fc::exit_codes::success;
    }

    try {
        return run(config.collector_config);
    } catch (const std::exception& e) {
        std::cerr << "Collector fatal error: " << e.what() << std::endl;
        return fc::exit_codes::config_error;
    }
}
