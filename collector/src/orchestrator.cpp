#include "fleetinv/collector/orchestrator.hpp"
#include "fleetinv/collector/error_classifier.hpp"
#include "fleetinv/collector/errors.hpp"
#include "fleetinv/collector/guarded_call.hpp"
#include "fleetinv/collector/result_converter.hpp"
#include "runtime/worker_pool.hpp"
#include <algorithm>
#include <future>
#include <mutex>
#include <set>
#include <utility>

namespace fleetinv {
namespace collector {

Orchestrator::Orchestrator(std::shared_ptr<RoleAssumer> role_assumer,
                           std::shared_ptr<ResourceSource> source,
                           std::shared_ptr<BreakerRegistry> breakers,
                           std::shared_ptr<Observability> observability,
                           OrchestratorOptions options)
    : role_assumer_(std::move(role_assumer)),
      source_(std::move(source)),
      breakers_(std::move(breakers)),
      observability_(std::move(observability)),
      options_(std::move(options)) {}

CollectionResult Orchestrator::collect(const std::vector<AccountTask>& accounts) {
    return collect(accounts, options_.max_account_concurrency, options_.max_resource_concurrency);
}

std::vector<AccountTask> Orchestrator::deduplicate(const std::vector<AccountTask>& accounts) {
    std::vector<AccountTask> unique;
    std::set<std::string> seen;
    for (const auto& task : accounts) {
        if (!seen.insert(task.account_id).second) {
            observability_->log_warn("Duplicate account task ignored",
                                     LogFields{options_.request_id, task.account_id, "collect"},
                                     {{"role_name", task.role_name}, {"region", task.region}});
            continue;
        }
        unique.push_back(task);
    }
    return unique;
}

CollectionResult Orchestrator::collect(const std::vector<AccountTask>& accounts,
                                       int max_account_concurrency,
                                       int max_resource_concurrency) {
    auto started = std::chrono::steady_clock::now();
    std::vector<AccountTask> tasks = deduplicate(accounts);

    observability_->log_info("Starting collection", LogFields{options_.request_id, "", "collect"}, {
        {"accounts", std::to_string(tasks.size())},
        {"service", source_->service_name()},
        {"max_account_concurrency", std::to_string(max_account_concurrency)},
        {"max_resource_concurrency", std::to_string(max_resource_concurrency)}
    });

    CollectionResult out;
    std::mutex results_mu;
    {
        WorkerPool account_pool(max_account_concurrency);
        std::vector<std::future<void>> pending;
        pending.reserve(tasks.size());

        for (const auto& task : tasks) {
            pending.push_back(account_pool.submit([this, task, max_resource_concurrency, &out, &results_mu]() {
                AccountResult result;
                try {
                    result = process_account(task, max_resource_concurrency);
                } catch (const std::exception& e) {
                    result = AccountResult::failure(task, AccountStatus::failed,
                                                    ErrorClassifier::to_error_info(e, "collect"));
                } catch (...) {
                    result = AccountResult::failure(task, AccountStatus::failed,
                                                    ErrorClassifier::unknown_error_info("collect"));
                }
                // Each task owns a distinct key; only the insertion is shared
                std::lock_guard<std::mutex> lk(results_mu);
                out.results.emplace(task.account_id, std::move(result));
            }));
        }
        observability_->set_pool_queue_depth("account", static_cast<int64_t>(account_pool.queue_depth()));

        for (auto& f : pending) {
            f.get();
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    out.summary = summarize(out, elapsed);

    const auto& s = out.summary;
    observability_->log_info("Collection completed", LogFields{options_.request_id, "", "collect"}, {
        {"total_accounts", std::to_string(s.total_accounts)},
        {"successful_accounts", std::to_string(s.successful_accounts)},
        {"failed_accounts", std::to_string(s.failed_accounts)},
        {"circuit_open_accounts", std::to_string(s.circuit_open_accounts)},
        {"total_resources", std::to_string(s.total_resources)},
        {"failed_resources", std::to_string(s.failed_resources)},
        {"elapsed_ms", std::to_string(s.elapsed.count())}
    });
    return out;
}

AccountResult Orchestrator::process_account(const AccountTask& task, int max_resource_concurrency) {
    auto started = std::chrono::steady_clock::now();
    auto span = observability_->start_span("collect.account", {
        {"account_id", task.account_id},
        {"region", task.region},
        {"service", source_->service_name()}
    });

    GuardedCall<std::optional<Credentials>>::Operation fallback;
    if (options_.role_fallback) {
        fallback = [this, task]() { return options_.role_fallback(task); };
    }
    GuardedCall<std::optional<Credentials>> role_call(
        breakers_->get(operations::assume_role),
        [this, &task]() { return role_assumer_->assume_role(task); },
        fallback);

    AccountResult result;
    std::optional<Credentials> credentials;
    try {
        credentials = role_call.execute();
    } catch (const CircuitOpenError& e) {
        result = AccountResult::failure(task, AccountStatus::circuit_open,
                                        ErrorClassifier::to_error_info(e, operations::assume_role));
    } catch (const std::exception& e) {
        result = AccountResult::failure(task, AccountStatus::failed,
                                        ErrorClassifier::to_error_info(e, operations::assume_role));
    } catch (...) {
        result = AccountResult::failure(task, AccountStatus::failed,
                                        ErrorClassifier::unknown_error_info(operations::assume_role));
    }

    if (!result.error && !credentials) {
        ErrorInfo error;
        error.kind = ErrorKind::permanent;
        error.operation = operations::assume_role;
        error.code = "NoSessionReturned";
        error.message = "Role assumption returned no session for " + task.role_name;
        error.context["description"] = ErrorClassifier::describe(error.code);
        result = AccountResult::failure(task, AccountStatus::failed, std::move(error));
    }

    if (!result.error) {
        result = collect_resources(task, *credentials, max_resource_concurrency);
        result.credentials_expiration = credentials->expiration;
    }

    if (result.error) {
        observability_->log_error("Account collection failed", LogFields{options_.request_id, task.account_id, result.error->operation}, {
            {"status", ResultConverter::status_to_string(result.status)},
            {"error_kind", ResultConverter::error_kind_to_string(result.error->kind)},
            {"error_code", result.error->code},
            {"error", result.error->message}
        });
        span->SetStatus(opentelemetry::trace::StatusCode::kError, result.error->code);
    }

    finish_account(result, started);
    std::string status = ResultConverter::status_to_string(result.status);
    span->SetAttribute("status", opentelemetry::nostd::string_view(status));
    span->End();
    return result;
}

AccountResult Orchestrator::collect_resources(const AccountTask& task,
                                              const Credentials& credentials,
                                              int max_resource_concurrency) {
    const std::string service = source_->service_name();

    std::unique_ptr<ResourceClient> client;
    try {
        client = source_->open(task, credentials);
    } catch (const std::exception& e) {
        return AccountResult::failure(task, AccountStatus::failed,
                                      ErrorClassifier::to_error_info(e, operations::list_resources));
    } catch (...) {
        return AccountResult::failure(task, AccountStatus::failed,
                                      ErrorClassifier::unknown_error_info(operations::list_resources));
    }

    // Drain pagination; on failure the refs listed so far travel with the failed result
    auto list_breaker = breakers_->get(operations::list_resources);
    std::vector<ResourceRef> refs;
    std::optional<std::string> cursor;
    int32_t pages = 0;
    std::optional<ErrorInfo> listing_error;
    try {
        do {
            ResourcePage page = GuardedCall<ResourcePage>(
                list_breaker, [&client, &cursor]() { return client->list_page(cursor); }).execute();
            ++pages;
            refs.insert(refs.end(), page.items.begin(), page.items.end());
            cursor = page.next_cursor;
        } while (cursor);
    } catch (const std::exception& e) {
        listing_error = ErrorClassifier::to_error_info(e, operations::list_resources);
    } catch (...) {
        listing_error = ErrorClassifier::unknown_error_info(operations::list_resources);
    }

    if (listing_error) {
        ErrorInfo error = std::move(*listing_error);
        error.context["items_listed"] = std::to_string(refs.size());
        error.context["pages_listed"] = std::to_string(pages);
        AccountStatus status = error.kind == ErrorKind::circuit_open ? AccountStatus::circuit_open
                                                                      : AccountStatus::failed;
        AccountResult failed = AccountResult::failure(task, status, std::move(error));
        failed.pages = pages;
        failed.partial_listing = std::move(refs);
        return failed;
    }

    observability_->log_info("Resources listed", LogFields{options_.request_id, task.account_id, operations::list_resources}, {
        {"service", service},
        {"items", std::to_string(refs.size())},
        {"pages", std::to_string(pages)}
    });

    AccountResult result;
    result.account_id = task.account_id;
    result.region = task.region;
    result.pages = pages;

    auto detail_breaker = breakers_->get(operations::resource_detail);
    std::vector<std::pair<std::string, std::future<ResourceRecord>>> pending;
    pending.reserve(refs.size());
    {
        // Scoped to this account task; destroyed once its items are done
        WorkerPool resource_pool(max_resource_concurrency);
        for (const auto& ref : refs) {
            pending.emplace_back(ref.id, resource_pool.submit([&task, &client, detail_breaker, ref]() {
                ResourceDetail detail = GuardedCall<ResourceDetail>(
                    detail_breaker, [&client, &ref]() { return client->get_detail(ref); }).execute();

                ResourceRecord record;
                record.account_id = task.account_id;
                record.region = task.region;
                record.resource_id = ref.id;
                record.resource_type = ref.type;
                record.attributes = ref.attributes;
                for (auto& [key, value] : detail.attributes) {
                    record.attributes[key] = std::move(value);
                }
                record.tags = std::move(detail.tags);
                return record;
            }));
        }
        observability_->set_pool_queue_depth("resource", static_cast<int64_t>(resource_pool.queue_depth()));

        for (auto& [resource_id, fut] : pending) {
            ErrorInfo error;
            try {
                result.items.push_back(fut.get());
                observability_->record_resource_outcome(service, true);
                continue;
            } catch (const std::exception& e) {
                error = ErrorClassifier::to_error_info(e, operations::resource_detail);
            } catch (...) {
                error = ErrorClassifier::unknown_error_info(operations::resource_detail);
            }
            observability_->log_warn("Resource detail fetch failed",
                                     LogFields{options_.request_id, task.account_id, operations::resource_detail}, {
                {"resource_id", resource_id},
                {"error_kind", ResultConverter::error_kind_to_string(error.kind)},
                {"error_code", error.code},
                {"error", error.message}
            });
            observability_->record_resource_outcome(service, false);
            result.failed_items.push_back(FailedItem{resource_id, std::move(error)});
        }
    }

    std::sort(result.items.begin(), result.items.end(),
              [](const ResourceRecord& a, const ResourceRecord& b) { return a.resource_id < b.resource_id; });
    std::sort(result.failed_items.begin(), result.failed_items.end(),
              [](const FailedItem& a, const FailedItem& b) { return a.resource_id < b.resource_id; });

    result.statistics.total = static_cast<int64_t>(result.items.size());
    result.statistics.tagged = std::count_if(result.items.begin(), result.items.end(),
                                             [](const ResourceRecord& r) { return r.is_tagged(); });
    result.statistics.untagged = result.statistics.total - result.statistics.tagged;
    result.statistics.failed = static_cast<int64_t>(result.failed_items.size());
    result.status = AccountStatus::success;
    return result;
}

void Orchestrator::finish_account(AccountResult& result, std::chrono::steady_clock::time_point started) {
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
    double seconds = static_cast<double>(result.duration.count()) / 1000.0;
    observability_->record_account_outcome(result.status, seconds);

    if (result.is_success()) {
        observability_->log_info("Account collected", LogFields{options_.request_id, result.account_id, "collect"}, {
            {"total", std::to_string(result.statistics.total)},
            {"tagged", std::to_string(result.statistics.tagged)},
            {"untagged", std::to_string(result.statistics.untagged)},
            {"failed", std::to_string(result.statistics.failed)},
            {"duration_ms", std::to_string(result.duration.count())}
        });
    }
}

CollectionSummary Orchestrator::summarize(const CollectionResult& result, std::chrono::milliseconds elapsed) const {
    CollectionSummary summary;
    summary.total_accounts = static_cast<int64_t>(result.results.size());
    for (const auto& [account_id, account] : result.results) {
        switch (account.status) {
            case AccountStatus::success:
                ++summary.successful_accounts;
                break;
            case AccountStatus::failed:
                ++summary.failed_accounts;
                break;
            case AccountStatus::circuit_open:
                ++summary.circuit_open_accounts;
                break;
        }
        summary.total_resources += account.statistics.total;
        summary.tagged_resources += account.statistics.tagged;
        summary.untagged_resources += account.statistics.untagged;
        summary.failed_resources += account.statistics.failed;
    }
    summary.elapsed = elapsed;
    summary.breaker_states = breakers_->snapshot();
    return summary;
}

} // namespace collector
} // namespace fleetinv
