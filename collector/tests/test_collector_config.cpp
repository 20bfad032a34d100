#include <iostream>
#include <cassert>
#include <string>
#include "fleetinv/collector/collector_config.hpp"

using namespace fleetinv::collector;

void test_exit_codes() {
    std::cout << "Testing run exit codes..." << std::endl;

    assert(run_exit_code(true, "") == exit_codes::success);
    assert(run_exit_code(false, "") == exit_codes::partial);
    assert(run_exit_code(true, "success") == exit_codes::success);
    // An empty report is not a failure
    assert(run_exit_code(true, "warning") == exit_codes::success);
    // Lock not acquired or write refused
    assert(run_exit_code(true, "error") == exit_codes::report_failed);
    assert(run_exit_code(false, "error") == exit_codes::report_failed);
    assert(exit_codes::report_failed != exit_codes::config_error);

    std::cout << "✓ Exit code test passed" << std::endl;
}

void test_breaker_settings() {
    std::cout << "Testing per-operation breaker settings..." << std::endl;

    CollectorConfig config;
    config.list_resources = BreakerOptions{7, 45};
    config.breaker_reset_seconds = 90;

    auto settings = config.breaker_settings();
    assert(settings.size() == 4);
    assert(settings.at("assume-role").failure_threshold == 3);
    assert(settings.at("assume-role").recovery_timeout == std::chrono::seconds(60));
    assert(settings.at("list-resources").failure_threshold == 7);
    assert(settings.at("list-resources").recovery_timeout == std::chrono::seconds(45));
    assert(settings.at("resource-detail").failure_threshold == 5);
    assert(settings.at("publish").reset_timeout == std::chrono::seconds(90));

    std::cout << "✓ Breaker settings test passed" << std::endl;
}

int main() {
    std::cout << "=== Collector Config Unit Tests ===" << std::endl;
    std::cout << std::endl;

    try {
        test_exit_codes();
        test_breaker_settings();

        std::cout << std::endl;
        std::cout << "=== All Tests Passed ===" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed: " << e.what() << std::endl;
        return 1;
    }
}
