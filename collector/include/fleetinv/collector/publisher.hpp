#pragma once

#include "fleetinv/collector/breaker_registry.hpp"
#include "fleetinv/collector/clock.hpp"
#include "fleetinv/collector/core.hpp"
#include "fleetinv/collector/observability.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetinv {
namespace collector {

using MessageAttributes = std::map<std::string, std::string>;

// Message bus client. Failures are reported by throwing RemoteError.
class MessagePublisher {
public:
    virtual ~MessagePublisher() = default;
    virtual std::string publish(const std::string& topic,
                                const std::string& message,
                                const MessageAttributes& attributes) = 0;
};

struct OutboundMessage {
    nlohmann::json body;
    MessageAttributes attributes;
};

struct PublishEntry {
    size_t index = 0;
    bool success = false;
    std::string message_id;
    std::optional<ErrorInfo> error;
};

struct PublishReport {
    int64_t total = 0;
    int64_t successful = 0;
    int64_t failed = 0;
    int64_t batches = 0;
    std::vector<PublishEntry> entries;
    std::chrono::milliseconds duration{0};

    double success_rate() const {
        return total > 0 ? static_cast<double>(successful) * 100.0 / static_cast<double>(total) : 0.0;
    }

    nlohmann::json to_json() const;
};

/**
 * Publishes inventory messages one at a time, each through a guarded call
 * on the "publish" breaker. A failed message never stops the batch.
 */
class InventoryPublisher {
public:
    InventoryPublisher(std::shared_ptr<MessagePublisher> publisher,
                       std::shared_ptr<BreakerRegistry> breakers,
                       std::shared_ptr<Observability> observability,
                       std::shared_ptr<Clock> clock = SystemClock::instance());

    PublishReport publish_batch(const std::string& topic,
                                const std::vector<OutboundMessage>& messages,
                                const MessageAttributes& common_attributes = {});

    // Slices messages into batches of batch_size and pauses between them
    PublishReport publish_in_batches(const std::string& topic,
                                     const std::vector<OutboundMessage>& messages,
                                     const MessageAttributes& common_attributes = {},
                                     size_t batch_size = 10,
                                     std::chrono::milliseconds pause = std::chrono::milliseconds(200));

private:
    std::shared_ptr<MessagePublisher> publisher_;
    std::shared_ptr<BreakerRegistry> breakers_;
    std::shared_ptr<Observability> observability_;
    std::shared_ptr<Clock> clock_;
};

// One message per collected record of every successful account
std::vector<OutboundMessage> make_inventory_messages(const CollectionResult& result, const std::string& service);

// Appends each message as one JSON line; used for dry runs
class JsonlFilePublisher : public MessagePublisher {
public:
    explicit JsonlFilePublisher(std::filesystem::path path);

    std::string publish(const std::string& topic,
                        const std::string& message,
                        const MessageAttributes& attributes) override;

private:
    std::filesystem::path path_;
    std::mutex mu_;
    uint64_t sequence_ = 0;
};

} // namespace collector
} // namespace fleetinv
