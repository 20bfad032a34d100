#include <iostream>
#include <cassert>
#include <filesystem>
#include <memory>
#include <string>
#include <unistd.h>
#include "fleetinv/collector/object_store.hpp"

using namespace fleetinv::collector;
namespace fs = std::filesystem;

static fs::path scratch_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("fleetinv_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    return dir;
}

void test_in_memory_store() {
    std::cout << "Testing in-memory object store..." << std::endl;

    InMemoryObjectStore store;
    auto missing = store.get("a");
    assert(missing && !missing->has_value());

    auto put = store.put("a", "1");
    assert(put);
    auto got = store.get("a");
    assert(got && got->value() == "1");

    auto created = store.put_if_absent("a", "2");
    assert(created && !*created);
    assert(store.get("a")->value() == "1");

    auto fresh = store.put_if_absent("b", "3");
    assert(fresh && *fresh);

    auto removed = store.remove("a");
    assert(removed);
    auto removed_again = store.remove("a");
    assert(removed_again);
    assert(store.size() == 1);

    std::cout << "✓ In-memory store test passed" << std::endl;
}

void test_filesystem_store_roundtrip() {
    std::cout << "Testing filesystem object store..." << std::endl;

    fs::path root = scratch_dir("store");
    FilesystemObjectStore store(root);

    auto missing = store.get("reports/2025/inventory.csv");
    assert(missing && !missing->has_value());

    auto put = store.put("reports/2025/inventory.csv", "Type,Arn\n");
    assert(put);
    assert(fs::exists(root / "reports/2025/inventory.csv"));
    assert(store.get("reports/2025/inventory.csv")->value() == "Type,Arn\n");

    auto replaced = store.put("reports/2025/inventory.csv", "v2");
    assert(replaced);
    assert(store.get("reports/2025/inventory.csv")->value() == "v2");

    // No temp files left behind
    size_t entries = 0;
    for (const auto& entry : fs::directory_iterator(root / "reports/2025")) {
        (void)entry;
        ++entries;
    }
    assert(entries == 1);

    auto removed = store.remove("reports/2025/inventory.csv");
    assert(removed);
    assert(!fs::exists(root / "reports/2025/inventory.csv"));

    fs::remove_all(root);
    std::cout << "✓ Filesystem store test passed" << std::endl;
}

void test_filesystem_exclusive_create() {
    std::cout << "Testing filesystem put_if_absent..." << std::endl;

    fs::path root = scratch_dir("exclusive");
    FilesystemObjectStore store(root);
    assert(store.supports_conditional_write());

    auto first = store.put_if_absent("inventory.csv.lock", "owner-1");
    assert(first && *first);
    auto second = store.put_if_absent("inventory.csv.lock", "owner-2");
    assert(second && !*second);
    assert(store.get("inventory.csv.lock")->value() == "owner-1");

    fs::remove_all(root);
    std::cout << "✓ Exclusive create test passed" << std::endl;
}

void test_filesystem_rejects_escaping_keys() {
    std::cout << "Testing filesystem key validation..." << std::endl;

    fs::path root = scratch_dir("keys");
    FilesystemObjectStore store(root);

    assert(!store.put("../outside.csv", "x"));
    assert(!store.put("/etc/passwd", "x"));
    assert(!store.get("reports/../../outside.csv"));
    assert(!store.put_if_absent("", "x"));
    assert(!fs::exists(root.parent_path() / "outside.csv"));

    fs::remove_all(root);
    std::cout << "✓ Key validation test passed" << std::endl;
}

int main() {
    std::cout << "=== Object Store Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_in_memory_store();
        test_filesystem_store_roundtrip();
        test_filesystem_exclusive_create();
        test_filesystem_rejects_escaping_keys();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
