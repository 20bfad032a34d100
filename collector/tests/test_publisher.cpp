#include <iostream>
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <unistd.h>
#include "fleetinv/collector/breaker_registry.hpp"
#include "fleetinv/collector/errors.hpp"
#include "fleetinv/collector/publisher.hpp"
#include <nlohmann/json.hpp>

using namespace fleetinv::collector;
using json = nlohmann::json;

// Fails the calls whose sequence number is listed, with the given error code
class ScriptedPublisher : public MessagePublisher {
public:
    std::set<int> failing_calls;
    std::string error_code = "InvalidParameter";
    int calls = 0;
    std::vector<MessageAttributes> seen_attributes;

    std::string publish(const std::string&, const std::string&, const MessageAttributes& attributes) override {
        int call = calls++;
        seen_attributes.push_back(attributes);
        if (failing_calls.count(call)) {
            throw RemoteError(error_code, "publish rejected", 400);
        }
        return "id-" + std::to_string(call);
    }
};

struct Harness {
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<Observability> observability = std::make_shared<Observability>("test_publisher");
    std::shared_ptr<BreakerRegistry> breakers = std::make_shared<BreakerRegistry>(
        CircuitBreaker::Settings{}, BreakerRegistry::default_operation_settings(), clock, observability);
    std::shared_ptr<ScriptedPublisher> bus = std::make_shared<ScriptedPublisher>();

    InventoryPublisher make() { return InventoryPublisher(bus, breakers, observability, clock); }
};

static std::vector<OutboundMessage> messages(int count) {
    std::vector<OutboundMessage> out;
    for (int i = 0; i < count; ++i) {
        OutboundMessage message;
        message.body = {{"message", {{"id", i}}}};
        message.attributes["Service"] = "KMS";
        out.push_back(message);
    }
    return out;
}

void test_batches_and_pause() {
    std::cout << "Testing batching with pauses..." << std::endl;

    Harness h;
    PublishReport report = h.make().publish_in_batches("topic", messages(25), {{"Source", "test"}}, 10,
                                                        std::chrono::milliseconds(200));

    assert(report.total == 25);
    assert(report.successful == 25);
    assert(report.failed == 0);
    assert(report.batches == 3);
    assert(report.entries.size() == 25);
    assert(report.entries[24].index == 24);
    assert(report.entries[24].message_id == "id-24");
    assert(report.success_rate() == 100.0);
    // Two pauses between three batches
    assert(h.clock->total_slept() == std::chrono::milliseconds(400));
    assert(h.bus->seen_attributes[0].at("Source") == "test");
    assert(h.bus->seen_attributes[0].at("Service") == "KMS");

    std::cout << "✓ Batching test passed" << std::endl;
}

void test_failed_message_does_not_stop_batch() {
    std::cout << "Testing per-message failure isolation..." << std::endl;

    Harness h;
    h.bus->failing_calls = {1, 3};
    PublishReport report = h.make().publish_batch("topic", messages(5));

    assert(report.successful == 3);
    assert(report.failed == 2);
    assert(!report.entries[1].success);
    assert(report.entries[1].error->kind == ErrorKind::permanent);
    assert(report.entries[1].error->operation == "publish");
    assert(report.entries[4].success);
    assert(h.breakers->get(operations::publish)->get_state() == BreakerState::closed);

    json doc = report.to_json();
    assert(doc["total_messages"] == 5);
    assert(doc["success_rate"] == 60.0);
    assert(doc["results"][1]["status"] == "failed");
    assert(doc["results"][0]["MessageId"] == "id-0");

    std::cout << "✓ Failure isolation test passed" << std::endl;
}

void test_throttling_opens_publish_breaker() {
    std::cout << "Testing publish breaker opening..." << std::endl;

    Harness h;
    h.bus->error_code = "Throttling";
    h.bus->failing_calls = {0, 1, 2, 3, 4, 5, 6, 7};
    PublishReport report = h.make().publish_batch("topic", messages(8));

    assert(report.failed == 8);
    assert(h.bus->calls == 5);
    assert(report.entries[5].error->kind == ErrorKind::circuit_open);
    assert(h.breakers->get(operations::publish)->get_state() == BreakerState::open);

    std::cout << "✓ Publish breaker test passed" << std::endl;
}

void test_empty_batch() {
    std::cout << "Testing empty batch..." << std::endl;

    Harness h;
    PublishReport report = h.make().publish_batch("topic", {});
    assert(report.total == 0);
    assert(report.batches == 0);
    assert(report.success_rate() == 0.0);
    assert(h.bus->calls == 0);

    std::cout << "✓ Empty batch test passed" << std::endl;
}

void test_inventory_messages() {
    std::cout << "Testing inventory message construction..." << std::endl;

    CollectionResult result;
    AccountResult ok;
    ok.account_id = "111111111111";
    ok.status = AccountStatus::success;
    ResourceRecord record;
    record.account_id = "111111111111";
    record.region = "eu-west-1";
    record.resource_id = "key-1";
    record.resource_type = "kms-key";
    record.tags["Owner"] = "sec";
    ok.items.push_back(record);
    result.results["111111111111"] = ok;
    ErrorInfo denied;
    denied.kind = ErrorKind::permanent;
    denied.operation = "assume-role";
    denied.code = "AccessDenied";
    result.results["222222222222"] = AccountResult::failure(
        AccountTask{"222222222222", "InventoryReadRole", "us-east-1"}, AccountStatus::failed, denied);

    auto built = make_inventory_messages(result, "KMS");
    assert(built.size() == 1);
    assert(built[0].body["message"]["id"] == 1);
    assert(built[0].body["message"]["data"]["ResourceId"] == "key-1");
    assert(built[0].body["message"]["data"]["Tags"]["Owner"] == "sec");
    assert(built[0].attributes.at("Region") == "eu-west-1");
    assert(built[0].attributes.at("Service") == "KMS");
    assert(built[0].attributes.at("Source") == "fleetinv:inventory");

    std::cout << "✓ Inventory message test passed" << std::endl;
}

void test_jsonl_file_publisher() {
    std::cout << "Testing JSONL file publisher..." << std::endl;

    auto path = std::filesystem::temp_directory_path() /
                ("fleetinv_publish_" + std::to_string(::getpid()) + ".jsonl");
    std::filesystem::remove(path);

    JsonlFilePublisher publisher(path);
    assert(publisher.publish("topic", R"({"a":1})", {{"Service", "KMS"}}) == "msg-1");
    assert(publisher.publish("topic", R"({"a":2})", {}) == "msg-2");

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        json entry = json::parse(line);
        assert(entry["TopicArn"] == "topic");
        assert(entry.contains("MessageId"));
        ++lines;
    }
    assert(lines == 2);
    std::filesystem::remove(path);

    JsonlFilePublisher broken("/nonexistent-dir/fleetinv/out.jsonl");
    bool thrown = false;
    try {
        broken.publish("topic", "{}", {});
    } catch (const RemoteError& e) {
        thrown = e.code() == "EndpointConnectionError";
    }
    assert(thrown);

    std::cout << "✓ JSONL publisher test passed" << std::endl;
}

int main() {
    std::cout << "=== Publisher Unit Tests ===" << std::endl;
    std::cout << std::endl;

    setenv("FLEETINV_LOG_LEVEL", "ERROR", 1);

    try {
        test_batches_and_pause();
        test_failed_message_does_not_stop_batch();
        test_throttling_opens_publish_breaker();
        test_empty_batch();
        test_inventory_messages();
        test_jsonl_file_publisher();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
