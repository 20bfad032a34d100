#pragma once

#include "fleetinv/collector/breaker_registry.hpp"
#include "fleetinv/collector/clock.hpp"
#include "fleetinv/collector/core.hpp"
#include "fleetinv/collector/observability.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetinv {
namespace collector {

struct OrchestratorOptions {
    int max_account_concurrency = 3;
    int max_resource_concurrency = 5;
    // Called when the assume-role breaker rejects; std::nullopt fails the account
    std::function<std::optional<Credentials>(const AccountTask&)> role_fallback;
    std::string request_id;
};

/**
 * Two-tier collection: a pool over accounts and, inside each account
 * task, a pool over that account's resources. Every remote call goes
 * through a GuardedCall on the shared breaker for its operation.
 *
 * collect() never throws, whatever a collaborator throws; every submitted
 * account gets exactly one entry. A listing that fails after some pages
 * marks the account failed and keeps the refs already listed in
 * partial_listing; they are not detail-fetched or counted in statistics.
 */
class Orchestrator {
public:
    Orchestrator(std::shared_ptr<RoleAssumer> role_assumer,
                 std::shared_ptr<ResourceSource> source,
                 std::shared_ptr<BreakerRegistry> breakers,
                 std::shared_ptr<Observability> observability,
                 OrchestratorOptions options = {});

    CollectionResult collect(const std::vector<AccountTask>& accounts);
    CollectionResult collect(const std::vector<AccountTask>& accounts,
                             int max_account_concurrency,
                             int max_resource_concurrency);

private:
    std::shared_ptr<RoleAssumer> role_assumer_;
    std::shared_ptr<ResourceSource> source_;
    std::shared_ptr<BreakerRegistry> breakers_;
    std::shared_ptr<Observability> observability_;
    OrchestratorOptions options_;

    AccountResult process_account(const AccountTask& task, int max_resource_concurrency);
    AccountResult collect_resources(const AccountTask& task,
                                    const Credentials& credentials,
                                    int max_resource_concurrency);
    void finish_account(AccountResult& result, std::chrono::steady_clock::time_point started);

    std::vector<AccountTask> deduplicate(const std::vector<AccountTask>& accounts);
    CollectionSummary summarize(const CollectionResult& result, std::chrono::milliseconds elapsed) const;
};

} // namespace collector
} // namespace fleetinv
