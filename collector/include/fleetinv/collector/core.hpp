#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetinv {
namespace collector {

// Error taxonomy shared by the classifier, the breakers and the result model
enum class ErrorKind {
    transient,  // throttling, unavailable, connectivity
    permanent,  // authorization, credentials, validation
    unknown,    // not recognized; surfaced like permanent
    circuit_open
};

// Structured failure detail carried in results instead of a bare exception
struct ErrorInfo {
    ErrorKind kind = ErrorKind::unknown;
    std::string operation;   // breaker / call-site name, e.g. "assume-role"
    std::string code;        // remote error code, e.g. "AccessDenied"
    std::string message;
    int http_status = 0;
    std::map<std::string, std::string> context;
};

// Core data structures
struct AccountTask {
    std::string account_id;
    std::string role_name;
    std::string region;
};

// Temporary credentials returned by role assumption
struct Credentials {
    std::string access_key;
    std::string secret_key;
    std::string session_token;
    std::chrono::system_clock::time_point expiration{};
};

// One entry of a listing page; attributes are whatever the listing returned
struct ResourceRef {
    std::string id;
    std::string type;
    std::map<std::string, std::string> attributes;
};

struct ResourcePage {
    std::vector<ResourceRef> items;
    std::optional<std::string> next_cursor;
};

struct ResourceDetail {
    std::map<std::string, std::string> attributes;
    std::map<std::string, std::string> tags;
};

// Produced by a resource-level worker, immutable once produced
struct ResourceRecord {
    std::string account_id;
    std::string region;
    std::string resource_id;
    std::string resource_type;
    std::map<std::string, std::string> attributes;
    std::map<std::string, std::string> tags;

    bool is_tagged() const { return !tags.empty(); }
};

struct ResourceStatistics {
    int64_t total = 0;
    int64_t tagged = 0;
    int64_t untagged = 0;
    int64_t failed = 0;

    double tagging_percentage() const {
        return total > 0 ? static_cast<double>(tagged) * 100.0 / static_cast<double>(total) : 0.0;
    }
};

enum class AccountStatus {
    success,
    failed,
    circuit_open
};

struct FailedItem {
    std::string resource_id;
    ErrorInfo error;
};

// Created once per account task, never mutated after the task completes
struct AccountResult {
    std::string account_id;
    std::string region;
    AccountStatus status = AccountStatus::failed;
    std::vector<ResourceRecord> items;       // sorted by resource_id
    std::optional<ErrorInfo> error;
    ResourceStatistics statistics;
    std::vector<FailedItem> failed_items;    // sorted by resource_id
    std::vector<ResourceRef> partial_listing; // refs listed before a listing failure, in listing order
    std::optional<std::chrono::system_clock::time_point> credentials_expiration;
    int32_t pages = 0;
    std::chrono::milliseconds duration{0};

    bool is_success() const { return status == AccountStatus::success; }

    static AccountResult failure(const AccountTask& task, AccountStatus status, ErrorInfo error) {
        AccountResult result;
        result.account_id = task.account_id;
        result.region = task.region;
        result.status = status;
        result.error = std::move(error);
        return result;
    }
};

enum class BreakerState {
    closed,
    open,
    half_open
};

struct BreakerSnapshot {
    std::string name;
    BreakerState state = BreakerState::closed;
    int32_t failure_count = 0;
    int64_t ignored_failures = 0;
    int64_t successes = 0;
    int64_t rejections = 0;
};

struct CollectionSummary {
    int64_t total_accounts = 0;
    int64_t successful_accounts = 0;
    int64_t failed_accounts = 0;
    int64_t circuit_open_accounts = 0;
    int64_t total_resources = 0;
    int64_t tagged_resources = 0;
    int64_t untagged_resources = 0;
    int64_t failed_resources = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<BreakerSnapshot> breaker_states;

    double tagging_percentage() const {
        return total_resources > 0
            ? static_cast<double>(tagged_resources) * 100.0 / static_cast<double>(total_resources)
            : 0.0;
    }
};

// Keyed by account_id: exactly one entry per submitted account
struct CollectionResult {
    std::map<std::string, AccountResult> results;
    CollectionSummary summary;

    bool all_succeeded() const {
        return summary.successful_accounts == summary.total_accounts;
    }
};

/**
 * Role-assumption collaborator.
 *
 * Returns std::nullopt when the call completed but produced no usable
 * session. Remote failures are reported by throwing RemoteError.
 */
class RoleAssumer {
public:
    virtual ~RoleAssumer() = default;
    virtual std::optional<Credentials> assume_role(const AccountTask& task) = 0;
};

/**
 * Per-account resource client.
 *
 * get_detail() is called concurrently from the resource pool and must be
 * safe to call from several threads at once.
 */
class ResourceClient {
public:
    virtual ~ResourceClient() = default;
    virtual ResourcePage list_page(const std::optional<std::string>& cursor) = 0;
    virtual ResourceDetail get_detail(const ResourceRef& item) = 0;
};

// Opens a ResourceClient bound to an assumed session
class ResourceSource {
public:
    virtual ~ResourceSource() = default;
    virtual std::string service_name() const = 0;
    virtual std::unique_ptr<ResourceClient> open(const AccountTask& task, const Credentials& credentials) = 0;
};

} // namespace collector
} // namespace fleetinv
