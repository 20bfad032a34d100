#include <iostream>
#include <cassert>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include "fleetinv/collector/distributed_lock.hpp"
#include <nlohmann/json.hpp>

using namespace fleetinv::collector;
using json = nlohmann::json;
using std::chrono::milliseconds;
using std::chrono::seconds;

static LockSettings no_jitter_settings() {
    LockSettings settings;
    settings.timeout_seconds = 60;
    settings.max_attempts = 3;
    settings.base_backoff_seconds = 2.0;
    settings.jitter_factor = 0.0;
    settings.require_conditional_write = true;
    return settings;
}

static void put_record(InMemoryObjectStore& store, const std::string& key, const std::string& lock_id,
                       Clock::time_point expires_at) {
    LockRecord record;
    record.lock_id = lock_id;
    record.created_at = expires_at - seconds(60);
    record.expires_at = expires_at;
    record.request_id = "other-writer";
    auto written = store.put(DistributedLock::lock_key(key), record.to_json());
    assert(written);
}

void test_acquire_on_empty_store() {
    std::cout << "Testing acquire on an unlocked key..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock, nullptr, "req-1");

    std::set<std::string> issued;
    for (int i = 0; i < 20; ++i) {
        AcquireResult result = lock.acquire("reports/inventory.csv");
        assert(result.acquired);
        assert(result.reason == "acquired");
        assert(result.lock_id.size() == 36);
        assert(issued.insert(result.lock_id).second);
        assert(store->contains("reports/inventory.csv.lock"));
        assert(lock.release("reports/inventory.csv", result.lock_id) == ReleaseResult::released);
    }
    assert(!store->contains("reports/inventory.csv.lock"));

    std::cout << "✓ Acquire test passed" << std::endl;
}

void test_lock_record_format() {
    std::cout << "Testing lock record contents..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock, nullptr, "req-42");

    AcquireResult result = lock.acquire("report.csv", seconds(90));
    assert(result.acquired);

    auto body = store->get("report.csv.lock");
    assert(body && body->has_value());
    json doc = json::parse(**body);
    assert(doc["lock_id"] == result.lock_id);
    assert(doc["request_id"] == "req-42");
    assert(doc.contains("created_at"));
    assert(doc.contains("expires_at"));

    auto record = LockRecord::parse(**body);
    assert(record.has_value());
    assert(record->expires_at - record->created_at == seconds(90));

    std::cout << "✓ Lock record test passed" << std::endl;
}

void test_acquire_when_held() {
    std::cout << "Testing acquire while another writer holds the lock..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    AcquireResult first = lock.acquire("report.csv");
    AcquireResult second = lock.acquire("report.csv");
    assert(first.acquired);
    assert(!second.acquired);
    assert(second.reason == "held");
    assert(second.lock_id.empty());

    std::cout << "✓ Held lock test passed" << std::endl;
}

void test_stale_detection_and_break() {
    std::cout << "Testing stale lock detection and break..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    StaleCheck absent = lock.check_stale("report.csv");
    assert(!absent.is_stale);
    assert(!absent.record.has_value());

    put_record(*store, "report.csv", "live-owner", clock->now() + seconds(10));
    StaleCheck live = lock.check_stale("report.csv");
    assert(!live.is_stale);
    assert(live.record.has_value());
    assert(live.record->lock_id == "live-owner");
    assert(!lock.break_stale("report.csv"));
    assert(store->contains("report.csv.lock"));

    clock->advance(seconds(11));
    StaleCheck stale = lock.check_stale("report.csv");
    assert(stale.is_stale);
    assert(stale.record->request_id == "other-writer");

    assert(lock.break_stale("report.csv"));
    assert(!store->contains("report.csv.lock"));
    assert(lock.acquire("report.csv").acquired);

    std::cout << "✓ Stale lock test passed" << std::endl;
}

void test_unreadable_record_is_not_stale() {
    std::cout << "Testing unreadable lock record..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    auto garbage = store->put("report.csv.lock", "not json");
    assert(garbage);
    StaleCheck check = lock.check_stale("report.csv");
    assert(!check.is_stale);
    assert(!lock.break_stale("report.csv"));

    auto partial = store->put("report.csv.lock", R"({"lock_id":"abc"})");
    assert(partial);
    assert(!lock.check_stale("report.csv").is_stale);

    std::cout << "✓ Unreadable record test passed" << std::endl;
}

void test_release_checks_owner() {
    std::cout << "Testing release ownership and idempotence..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    AcquireResult held = lock.acquire("report.csv");
    assert(held.acquired);

    assert(lock.release("report.csv", "someone-else") == ReleaseResult::not_owner);
    assert(store->contains("report.csv.lock"));

    assert(lock.release("report.csv", held.lock_id) == ReleaseResult::released);
    assert(lock.release("report.csv", held.lock_id) == ReleaseResult::no_such_lock);
    assert(!store->contains("report.csv.lock"));

    // A newer owner is untouched by a late release of the old id
    AcquireResult next = lock.acquire("report.csv");
    assert(lock.release("report.csv", held.lock_id) == ReleaseResult::not_owner);
    assert(store->contains("report.csv.lock"));
    assert(lock.release("report.csv", next.lock_id) == ReleaseResult::released);

    std::cout << "✓ Release test passed" << std::endl;
}

void test_capability_gap() {
    std::cout << "Testing stores without conditional write..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>(false);
    auto clock = std::make_shared<ManualClock>();

    DistributedLock strict(store, no_jitter_settings(), clock);
    AcquireResult refused = strict.acquire("report.csv");
    assert(!refused.acquired);
    assert(refused.reason == "capability_gap");
    assert(!store->contains("report.csv.lock"));

    auto locked = strict.write_with_lock("report.csv", [](const std::string&) { return 1; });
    assert(!locked.acquired);
    assert(locked.attempts == 1);
    assert(!locked.value.has_value());

    LockSettings relaxed_settings = no_jitter_settings();
    relaxed_settings.require_conditional_write = false;
    DistributedLock relaxed(store, relaxed_settings, clock);
    AcquireResult accepted = relaxed.acquire("report.csv");
    assert(accepted.acquired);
    assert(store->contains("report.csv.lock"));

    std::cout << "✓ Capability gap test passed" << std::endl;
}

void test_write_with_lock_success() {
    std::cout << "Testing write_with_lock success..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    std::string seen_id;
    auto locked = lock.write_with_lock("report.csv", [&](const std::string& lock_id) {
        seen_id = lock_id;
        assert(store->contains("report.csv.lock"));
        return std::string("written");
    });

    assert(locked.acquired);
    assert(locked.attempts == 1);
    assert(locked.value.value() == "written");
    assert(locked.lock_id == seen_id);
    assert(locked.waited == milliseconds(0));
    assert(!store->contains("report.csv.lock"));

    std::cout << "✓ write_with_lock success test passed" << std::endl;
}

void test_write_with_lock_contention() {
    std::cout << "Testing write_with_lock under contention..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    put_record(*store, "report.csv", "long-running", clock->now() + seconds(600));

    bool ran = false;
    auto locked = lock.write_with_lock("report.csv", [&ran](const std::string&) { ran = true; return 0; });

    assert(!locked.acquired);
    assert(!ran);
    assert(locked.attempts == 3);
    // 2^1 + 2^2 seconds with no jitter
    assert(locked.waited == milliseconds(6000));
    assert(clock->total_slept() == milliseconds(6000));
    assert(locked.message.find("after 3 attempts") != std::string::npos);

    // The other writer's lock is intact
    auto body = store->get("report.csv.lock");
    assert(body && body->has_value());
    assert(LockRecord::parse(**body)->lock_id == "long-running");

    std::cout << "✓ Contention test passed" << std::endl;
}

void test_write_with_lock_breaks_stale() {
    std::cout << "Testing write_with_lock breaks an expiring lock..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    put_record(*store, "report.csv", "crashed-writer", clock->now() + seconds(1));

    auto locked = lock.write_with_lock("report.csv", [](const std::string&) { return 7; });
    assert(locked.acquired);
    assert(locked.attempts == 3);
    assert(locked.value.value() == 7);
    assert(!store->contains("report.csv.lock"));

    std::cout << "✓ Stale break retry test passed" << std::endl;
}

void test_writer_exception_releases_lock() {
    std::cout << "Testing writer exception releases the lock..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    bool caught = false;
    try {
        lock.write_with_lock("report.csv", [](const std::string&) -> int {
            throw std::runtime_error("disk full");
        });
    } catch (const std::runtime_error& e) {
        caught = std::string(e.what()) == "disk full";
    }
    assert(caught);
    assert(!store->contains("report.csv.lock"));

    std::cout << "✓ Writer exception test passed" << std::endl;
}

void test_lease_releases_on_scope_exit() {
    std::cout << "Testing LockLease releases on scope exit..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    DistributedLock lock(store, no_jitter_settings(), clock);

    {
        AcquireResult held = lock.acquire("report.csv");
        LockLease lease(lock, "report.csv", held.lock_id);
        assert(store->contains("report.csv.lock"));
    }
    assert(!store->contains("report.csv.lock"));

    AcquireResult held = lock.acquire("report.csv");
    LockLease lease(lock, "report.csv", held.lock_id);
    assert(lease.release() == ReleaseResult::released);
    assert(lease.release() == ReleaseResult::no_such_lock);

    std::cout << "✓ LockLease test passed" << std::endl;
}

void test_backoff_with_jitter() {
    std::cout << "Testing backoff delay bounds..." << std::endl;

    auto store = std::make_shared<InMemoryObjectStore>();
    auto clock = std::make_shared<ManualClock>();
    LockSettings settings = no_jitter_settings();
    settings.jitter_factor = 1.0;
    DistributedLock lock(store, settings, clock);

    for (int i = 0; i < 50; ++i) {
        auto first = lock.backoff_delay(1);
        assert(first >= milliseconds(2000) && first <= milliseconds(3000));
        auto third = lock.backoff_delay(3);
        assert(third >= milliseconds(8000) && third <= milliseconds(9000));
    }

    std::cout << "✓ Backoff test passed" << std::endl;
}

int main() {
    std::cout << "=== Distributed Lock Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_acquire_on_empty_store();
        test_lock_record_format();
        test_acquire_when_held();
        test_stale_detection_and_break();
        test_unreadable_record_is_not_stale();
        test_release_checks_owner();
        test_capability_gap();
        test_write_with_lock_success();
        test_write_with_lock_contention();
        test_write_with_lock_breaks_stale();
        test_writer_exception_releases_lock();
        test_lease_releases_on_scope_exit();
        test_backoff_with_jitter();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
