#include <iostream>
#include <cassert>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include "fleetinv/collector/clock.hpp"
#include "fleetinv/collector/distributed_lock.hpp"
#include "fleetinv/collector/object_store.hpp"
#include "fleetinv/collector/report_writer.hpp"

using namespace fleetinv::collector;

static LockSettings fast_settings() {
    LockSettings settings;
    settings.timeout_seconds = 60;
    settings.max_attempts = 2;
    settings.base_backoff_seconds = 2.0;
    settings.jitter_factor = 0.0;
    settings.require_conditional_write = true;
    return settings;
}

static ResourceRecord record(const std::string& id, const std::string& arn, const std::string& owner = "") {
    ResourceRecord r;
    r.account_id = "111111111111";
    r.region = "us-east-1";
    r.resource_id = id;
    r.resource_type = "kms-key";
    r.attributes["Arn"] = arn;
    if (!owner.empty()) {
        r.tags["Owner"] = owner;
    }
    return r;
}

void test_csv_quoting() {
    std::cout << "Testing CSV quoting..." << std::endl;

    ReportRow row{"kms-key", "arn:aws:kms:us-east-1:1:key/a", "1", "us-east-1", R"({"Name":"a, \"b\""})"};
    std::string text = render_csv({row});

    assert(text.rfind("Type,Arn,AccountId,Region,Tags\r\n", 0) == 0);
    assert(text.find(R"("{""Name"":""a, \""b\""""}")") != std::string::npos);

    auto parsed = parse_csv(text);
    assert(parsed);
    assert(parsed->size() == 1);
    assert((*parsed)[0].tags == row.tags);
    assert((*parsed)[0].arn == row.arn);

    std::cout << "✓ CSV quoting test passed" << std::endl;
}

void test_row_with_invalid_utf8_tag() {
    std::cout << "Testing report row with invalid UTF-8 tag..." << std::endl;

    ReportRow row = ReportRow::from_record(record("key-1", "arn-1", "caf\xe9"));
    assert(row.tags == "{\"Owner\":\"caf\xEF\xBF\xBD\"}");

    std::cout << "✓ Invalid UTF-8 tag test passed" << std::endl;
}

void test_csv_parse_errors() {
    std::cout << "Testing CSV parse errors..." << std::endl;

    assert(!parse_csv("Type,Arn\n\"unterminated,x\n"));
    assert(!parse_csv("Kind,Name\nkms-key,a\n"));

    // Column order follows the header; blank lines are skipped
    auto reordered = parse_csv("Arn,Type\narn-1,kms-key\n\n");
    assert(reordered);
    assert(reordered->size() == 1);
    assert((*reordered)[0].type == "kms-key");
    assert((*reordered)[0].arn == "arn-1");
    assert((*reordered)[0].region.empty());

    auto empty = parse_csv("");
    assert(empty && empty->empty());

    std::cout << "✓ CSV parse error test passed" << std::endl;
}

void test_merge_replaces_by_key() {
    std::cout << "Testing merge by (Type, Arn)..." << std::endl;

    std::vector<ReportRow> existing = {
        {"kms-key", "arn-b", "1", "us-east-1", "{}"},
        {"kms-key", "arn-a", "1", "us-east-1", "{}"},
    };
    std::vector<ReportRow> incoming = {
        {"kms-key", "arn-a", "1", "us-east-1", R"({"Owner":"sec"})"},
        {"iam-policy", "arn-a", "1", "us-east-1", "{}"},
    };

    auto merged = merge_rows(existing, incoming);
    assert(merged.size() == 3);
    assert(merged[0].type == "iam-policy");
    assert(merged[1].arn == "arn-a");
    assert(merged[1].tags == R"({"Owner":"sec"})");
    assert(merged[2].arn == "arn-b");

    std::cout << "✓ Merge test passed" << std::endl;
}

void test_write_report_merges_existing() {
    std::cout << "Testing report write under lock..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    auto observability = std::make_shared<Observability>("test_report");
    auto lock = std::make_shared<DistributedLock>(store, fast_settings(), clock, observability);
    ReportWriter writer(store, lock, observability);

    ReportOutcome first = writer.write_report("reports/kms.csv", {record("key-1", "arn-1"), record("key-2", "arn-2")});
    assert(first.status == "success");
    assert(first.rows == 2);
    assert(!first.lock_id.empty());
    assert(!store->contains(DistributedLock::lock_key("reports/kms.csv")));

    ReportOutcome second = writer.write_report("reports/kms.csv", {record("key-2", "arn-2", "ops"), record("key-3", "arn-3")});
    assert(second.status == "success");
    assert(second.rows == 3);
    assert(second.lock_id != first.lock_id);

    auto stored = store->get("reports/kms.csv");
    assert(stored && stored->has_value());
    auto rows = parse_csv(**stored);
    assert(rows && rows->size() == 3);
    assert((*rows)[1].arn == "arn-2");
    assert((*rows)[1].tags == R"({"Owner":"ops"})");

    std::cout << "✓ Report write test passed" << std::endl;
}

void test_write_report_edge_cases() {
    std::cout << "Testing report warning and corrupt input..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    auto observability = std::make_shared<Observability>("test_report");
    auto lock = std::make_shared<DistributedLock>(store, fast_settings(), clock, observability);
    ReportWriter writer(store, lock, observability);

    ReportOutcome empty = writer.write_report("reports/empty.csv", {});
    assert(empty.status == "warning");
    assert(empty.rows == 0);

    auto seeded = store->put("reports/corrupt.csv", "Type,Arn\n\"never closed");
    assert(seeded);
    ReportOutcome rewritten = writer.write_report("reports/corrupt.csv", {record("key-1", "arn-1")});
    assert(rewritten.status == "success");
    assert(rewritten.rows == 1);

    std::cout << "✓ Report edge case test passed" << std::endl;
}

void test_write_report_lock_held() {
    std::cout << "Testing report write while another writer holds the lock..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    auto observability = std::make_shared<Observability>("test_report");
    DistributedLock other(store, fast_settings(), clock);
    AcquireResult held = other.acquire("reports/kms.csv");
    assert(held.acquired);

    auto lock = std::make_shared<DistributedLock>(store, fast_settings(), clock, observability);
    ReportWriter writer(store, lock, observability);
    ReportOutcome outcome = writer.write_report("reports/kms.csv", {record("key-1", "arn-1")});

    assert(outcome.status == "error");
    assert(outcome.message.find("after 2 attempts") != std::string::npos);
    assert(!store->contains("reports/kms.csv"));
    assert(store->contains(DistributedLock::lock_key("reports/kms.csv")));

    std::cout << "✓ Lock held test passed" << std::endl;
}

int main() {
    std::cout << "=== Report Writer Unit Tests ===" << std::endl;
    std::cout << std::endl;

    setenv("FLEETINV_LOG_LEVEL", "ERROR", 1);

    try {
        test_csv_quoting();
        test_row_with_invalid_utf8_tag();
        test_csv_parse_errors();
        test_merge_replaces_by_key();
        test_write_report_merges_existing();
        test_write_report_edge_cases();
        test_write_report_lock_held();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
