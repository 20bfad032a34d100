#include "fleetinv/collector/result_converter.hpp"
#include "fleetinv/collector/clock.hpp"
#include <cmath>

namespace fleetinv {
namespace collector {

using json = nlohmann::json;

static double round_to(double value, int digits) {
    double scale = std::pow(10.0, digits);
    return std::round(value * scale) / scale;
}

json ResultConverter::to_json(const ErrorInfo& error) {
    json out;
    out["kind"] = error_kind_to_string(error.kind);
    out["operation"] = error.operation;
    out["code"] = error.code;
    out["message"] = error.message;
    if (error.http_status > 0) {
        out["http_status"] = error.http_status;
    }
    if (!error.context.empty()) {
        out["context"] = error.context;
    }
    return out;
}

json ResultConverter::to_json(const ResourceRecord& record) {
    json out;
    out["AccountId"] = record.account_id;
    out["Region"] = record.region;
    out["ResourceId"] = record.resource_id;
    out["ResourceType"] = record.resource_type;
    out["Attributes"] = record.attributes;
    out["Tags"] = record.tags;
    return out;
}

json ResultConverter::to_json(const AccountResult& result) {
    json out;
    out["account_id"] = result.account_id;
    out["region"] = result.region;
    out["status"] = status_to_string(result.status);

    json items = json::array();
    for (const auto& item : result.items) {
        items.push_back(to_json(item));
    }
    out["items"] = std::move(items);

    out["statistics"] = {
        {"total", result.statistics.total},
        {"tagged", result.statistics.tagged},
        {"untagged", result.statistics.untagged},
        {"failed", result.statistics.failed},
        {"tagging_percentage", round_to(result.statistics.tagging_percentage(), 1)}
    };

    if (!result.failed_items.empty()) {
        json failed = json::array();
        for (const auto& item : result.failed_items) {
            failed.push_back({{"resource_id", item.resource_id}, {"error", to_json(item.error)}});
        }
        out["failed_items"] = std::move(failed);
    }
    if (!result.partial_listing.empty()) {
        json listed = json::array();
        for (const auto& ref : result.partial_listing) {
            listed.push_back({{"ResourceId", ref.id}, {"ResourceType", ref.type}, {"Attributes", ref.attributes}});
        }
        out["partial_listing"] = std::move(listed);
    }
    if (result.error) {
        out["error"] = to_json(*result.error);
    }
    if (result.credentials_expiration) {
        out["credentials_expiration"] = format_iso8601(*result.credentials_expiration);
    }
    out["pages"] = result.pages;
    out["duration_ms"] = result.duration.count();
    return out;
}

json ResultConverter::to_json(const BreakerSnapshot& snapshot) {
    return {
        {"state", breaker_state_to_string(snapshot.state)},
        {"failure_count", snapshot.failure_count},
        {"ignored_failures", snapshot.ignored_failures},
        {"successes", snapshot.successes},
        {"rejections", snapshot.rejections}
    };
}

json ResultConverter::to_json(const CollectionSummary& summary) {
    json out;
    out["total_accounts"] = summary.total_accounts;
    out["successful_accounts"] = summary.successful_accounts;
    out["failed_accounts"] = summary.failed_accounts;
    out["circuit_open_accounts"] = summary.circuit_open_accounts;
    out["total_resources"] = summary.total_resources;
    out["tagged_resources"] = summary.tagged_resources;
    out["untagged_resources"] = summary.untagged_resources;
    out["failed_resources"] = summary.failed_resources;
    out["tagging_percentage"] = round_to(summary.tagging_percentage(), 1);
    out["execution_time_seconds"] = round_to(static_cast<double>(summary.elapsed.count()) / 1000.0, 3);

    json breakers = json::object();
    for (const auto& snapshot : summary.breaker_states) {
        breakers[snapshot.name] = to_json(snapshot);
    }
    out["circuit_breaker_states"] = std::move(breakers);
    return out;
}

json ResultConverter::to_json(const CollectionResult& result) {
    json accounts = json::object();
    for (const auto& [account_id, account] : result.results) {
        accounts[account_id] = to_json(account);
    }
    return {
        {"accounts", std::move(accounts)},
        {"summary", to_json(result.summary)}
    };
}

} // namespace collector
} // namespace fleetinv
