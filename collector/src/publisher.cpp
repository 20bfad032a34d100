#include "fleetinv/collector/publisher.hpp"
#include "fleetinv/collector/error_classifier.hpp"
#include "fleetinv/collector/errors.hpp"
#include "fleetinv/collector/guarded_call.hpp"
#include "fleetinv/collector/result_converter.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <sstream>

namespace fleetinv {
namespace collector {

using json = nlohmann::json;

json PublishReport::to_json() const {
    json out;
    out["total_messages"] = total;
    out["successful"] = successful;
    out["failed"] = failed;
    out["batches"] = batches;
    out["success_rate"] = std::round(success_rate() * 10.0) / 10.0;
    out["duration_seconds"] = static_cast<double>(duration.count()) / 1000.0;

    json results = json::array();
    for (const auto& entry : entries) {
        json item;
        item["index"] = entry.index;
        item["status"] = entry.success ? "success" : "failed";
        if (entry.success) {
            item["MessageId"] = entry.message_id;
        } else if (entry.error) {
            item["error"] = ResultConverter::to_json(*entry.error);
        }
        results.push_back(item);
    }
    out["results"] = results;
    return out;
}

InventoryPublisher::InventoryPublisher(std::shared_ptr<MessagePublisher> publisher,
                                       std::shared_ptr<BreakerRegistry> breakers,
                                       std::shared_ptr<Observability> observability,
                                       std::shared_ptr<Clock> clock)
    : publisher_(std::move(publisher)),
      breakers_(std::move(breakers)),
      observability_(std::move(observability)),
      clock_(std::move(clock)) {}

PublishReport InventoryPublisher::publish_batch(const std::string& topic,
                                                const std::vector<OutboundMessage>& messages,
                                                const MessageAttributes& common_attributes) {
    auto started = std::chrono::steady_clock::now();
    PublishReport report;
    report.total = static_cast<int64_t>(messages.size());
    report.batches = messages.empty() ? 0 : 1;

    if (messages.empty()) {
        observability_->log_warn("Empty messages list provided, nothing to send", LogFields{"", "", operations::publish},
                                 {{"topic", topic}});
        return report;
    }

    auto breaker = breakers_->get(operations::publish);
    for (size_t index = 0; index < messages.size(); ++index) {
        const auto& message = messages[index];
        MessageAttributes attributes = common_attributes;
        for (const auto& [key, value] : message.attributes) {
            attributes[key] = value;
        }
        std::string payload = message.body.is_string() ? message.body.get<std::string>() : ResultConverter::dump(message.body);

        PublishEntry entry;
        entry.index = index;
        try {
            entry.message_id = GuardedCall<std::string>(breaker, [this, &topic, &payload, &attributes]() {
                return publisher_->publish(topic, payload, attributes);
            }).execute();
            entry.success = true;
            ++report.successful;
        } catch (const std::exception& e) {
            entry.error = ErrorClassifier::to_error_info(e, operations::publish);
            ++report.failed;
            observability_->log_error("Failed to publish message", LogFields{"", "", operations::publish}, {
                {"topic", topic},
                {"index", std::to_string(index)},
                {"error_kind", ResultConverter::error_kind_to_string(entry.error->kind)},
                {"error", entry.error->message}
            });
        }
        observability_->record_publish_outcome(entry.success);
        report.entries.push_back(std::move(entry));
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    observability_->log_info("Completed publishing batch", LogFields{"", "", operations::publish}, {
        {"topic", topic},
        {"successful", std::to_string(report.successful)},
        {"failed", std::to_string(report.failed)},
        {"total", std::to_string(report.total)}
    });
    return report;
}

PublishReport InventoryPublisher::publish_in_batches(const std::string& topic,
                                                     const std::vector<OutboundMessage>& messages,
                                                     const MessageAttributes& common_attributes,
                                                     size_t batch_size,
                                                     std::chrono::milliseconds pause) {
    auto started = std::chrono::steady_clock::now();
    if (batch_size == 0) {
        batch_size = 1;
    }

    PublishReport report;
    report.total = static_cast<int64_t>(messages.size());
    size_t total_batches = (messages.size() + batch_size - 1) / batch_size;

    observability_->log_info("Publishing messages in batches", LogFields{"", "", operations::publish}, {
        {"topic", topic},
        {"total_messages", std::to_string(messages.size())},
        {"batches", std::to_string(total_batches)},
        {"batch_size", std::to_string(batch_size)}
    });

    for (size_t batch = 0; batch < total_batches; ++batch) {
        size_t begin = batch * batch_size;
        size_t end = std::min(begin + batch_size, messages.size());
        std::vector<OutboundMessage> slice(messages.begin() + static_cast<std::ptrdiff_t>(begin),
                                           messages.begin() + static_cast<std::ptrdiff_t>(end));

        PublishReport part = publish_batch(topic, slice, common_attributes);
        report.successful += part.successful;
        report.failed += part.failed;
        ++report.batches;
        for (auto& entry : part.entries) {
            entry.index += begin;
            report.entries.push_back(std::move(entry));
        }

        if (batch + 1 < total_batches && pause.count() > 0) {
            clock_->sleep_for(pause);
        }
    }

    report.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    std::ostringstream rate;
    rate.precision(1);
    rate << std::fixed << report.success_rate();
    observability_->log_info("Batch publishing completed", LogFields{"", "", operations::publish}, {
        {"topic", topic},
        {"successful", std::to_string(report.successful)},
        {"failed", std::to_string(report.failed)},
        {"success_rate", rate.str()},
        {"duration_ms", std::to_string(report.duration.count())}
    });
    return report;
}

std::vector<OutboundMessage> make_inventory_messages(const CollectionResult& result, const std::string& service) {
    std::vector<OutboundMessage> messages;
    int64_t id = 0;
    for (const auto& [account_id, account] : result.results) {
        if (!account.is_success()) {
            continue;
        }
        for (const auto& record : account.items) {
            OutboundMessage message;
            json data;
            data["AccountId"] = record.account_id;
            data["ResourceId"] = record.resource_id;
            data["ResourceType"] = record.resource_type;
            data["Tags"] = record.tags;
            data["Attributes"] = record.attributes;
            message.body["message"] = {{"id", ++id}, {"data", data}};
            message.attributes["Service"] = service;
            message.attributes["Region"] = record.region;
            message.attributes["Source"] = "fleetinv:inventory";
            messages.push_back(std::move(message));
        }
    }
    return messages;
}

JsonlFilePublisher::JsonlFilePublisher(std::filesystem::path path) : path_(std::move(path)) {}

std::string JsonlFilePublisher::publish(const std::string& topic,
                                        const std::string& message,
                                        const MessageAttributes& attributes) {
    std::lock_guard<std::mutex> lk(mu_);
    std::string message_id = "msg-" + std::to_string(++sequence_);

    json line;
    line["MessageId"] = message_id;
    line["TopicArn"] = topic;
    line["Message"] = message;
    line["MessageAttributes"] = attributes;

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        throw RemoteError("EndpointConnectionError", "Failed to open " + path_.string() + " for appending");
    }
    file << ResultConverter::dump(line) << '\n';
    if (!file) {
        throw RemoteError("InternalError", "Failed to append to " + path_.string());
    }
    return message_id;
}

} // namespace collector
} // namespace fleetinv
