#include "fleetinv/collector/distributed_lock.hpp"
#include "fleetinv/collector/result_converter.hpp"
#include <caf/error.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdio>

namespace fleetinv {
namespace collector {

using json = nlohmann::json;

std::string LockRecord::to_json() const {
    json body;
    body["lock_id"] = lock_id;
    body["created_at"] = format_iso8601(created_at);
    body["expires_at"] = format_iso8601(expires_at);
    if (request_id.empty()) {
        body["request_id"] = nullptr;
    } else {
        body["request_id"] = request_id;
    }
    return ResultConverter::dump(body);
}

std::optional<LockRecord> LockRecord::parse(const std::string& body) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    if (!doc.contains("expires_at") || !doc["expires_at"].is_string()) {
        return std::nullopt;
    }

    LockRecord record;
    if (!parse_iso8601(doc["expires_at"].get<std::string>(), record.expires_at)) {
        return std::nullopt;
    }
    if (doc.contains("lock_id") && doc["lock_id"].is_string()) {
        record.lock_id = doc["lock_id"].get<std::string>();
    }
    if (doc.contains("created_at") && doc["created_at"].is_string()) {
        parse_iso8601(doc["created_at"].get<std::string>(), record.created_at);
    }
    if (doc.contains("request_id") && doc["request_id"].is_string()) {
        record.request_id = doc["request_id"].get<std::string>();
    }
    return record;
}

std::string release_result_to_string(ReleaseResult result) {
    switch (result) {
        case ReleaseResult::released:
            return "released";
        case ReleaseResult::not_owner:
            return "not_owner";
        case ReleaseResult::no_such_lock:
            return "no_such_lock";
        case ReleaseResult::store_error:
            return "store_error";
    }
    return "store_error";
}

LockLease::~LockLease() {
    if (lock_ != nullptr) {
        lock_->release(key_, lock_id_);
    }
}

ReleaseResult LockLease::release() {
    if (lock_ == nullptr) {
        return ReleaseResult::no_such_lock;
    }
    DistributedLock* lock = lock_;
    lock_ = nullptr;
    return lock->release(key_, lock_id_);
}

DistributedLock::DistributedLock(std::shared_ptr<ObjectStore> store,
                                 LockSettings settings,
                                 std::shared_ptr<Clock> clock,
                                 std::shared_ptr<Observability> observability,
                                 std::string request_id)
    : store_(std::move(store)),
      settings_(settings),
      clock_(std::move(clock)),
      observability_(std::move(observability)),
      request_id_(std::move(request_id)),
      rng_(std::random_device{}()) {}

void DistributedLock::log_info(const std::string& message, const Observability::Context& context) {
    if (observability_) {
        observability_->log_info(message, LogFields{request_id_, "", "lock"}, context);
    }
}

void DistributedLock::log_warn(const std::string& message, const Observability::Context& context) {
    if (observability_) {
        observability_->log_warn(message, LogFields{request_id_, "", "lock"}, context);
    }
}

void DistributedLock::log_error(const std::string& message, const Observability::Context& context) {
    if (observability_) {
        observability_->log_error(message, LogFields{request_id_, "", "lock"}, context);
    }
}

std::string DistributedLock::generate_lock_id() {
    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lk(rng_mu_);
        hi = rng_();
        lo = rng_();
    }
    // RFC 4122 version 4, variant 1
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(buf);
}

std::chrono::milliseconds DistributedLock::backoff_delay(int32_t attempt) {
    double jitter = 0.0;
    if (settings_.jitter_factor > 0.0) {
        std::uniform_real_distribution<double> dist(0.0, settings_.jitter_factor);
        std::lock_guard<std::mutex> lk(rng_mu_);
        jitter = dist(rng_);
    }
    double seconds = std::pow(settings_.base_backoff_seconds, attempt) + jitter;
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(seconds * 1000.0)));
}

AcquireResult DistributedLock::acquire(const std::string& key, std::optional<std::chrono::seconds> timeout) {
    AcquireResult result;
    std::string lock_key_name = lock_key(key);
    std::chrono::seconds ttl = timeout ? *timeout : std::chrono::seconds(settings_.timeout_seconds);

    LockRecord record;
    record.lock_id = generate_lock_id();
    record.created_at = clock_->now();
    record.expires_at = record.created_at + ttl;
    record.request_id = request_id_;

    log_info("Attempting to acquire lock", {
        {"lock_key", lock_key_name},
        {"lock_id", record.lock_id},
        {"timeout_seconds", std::to_string(ttl.count())}
    });

    if (store_->supports_conditional_write()) {
        auto created = store_->put_if_absent(lock_key_name, record.to_json());
        if (!created) {
            result.reason = "store_error";
            log_error("Error acquiring lock", {{"lock_key", lock_key_name}, {"error", caf::to_string(created.error())}});
        } else if (!*created) {
            result.reason = "held";
            log_info("Lock is held by another writer", {{"lock_key", lock_key_name}});
        } else {
            result.acquired = true;
            result.reason = "acquired";
        }
    } else if (settings_.require_conditional_write) {
        result.reason = "capability_gap";
        log_error("Object store has no conditional write; lock cannot be made exclusive", {
            {"lock_key", lock_key_name}
        });
    } else {
        log_warn("Object store has no conditional write; concurrent writers may both acquire", {
            {"lock_key", lock_key_name}
        });
        auto written = store_->put(lock_key_name, record.to_json());
        if (!written) {
            result.reason = "store_error";
            log_error("Error acquiring lock", {{"lock_key", lock_key_name}, {"error", caf::to_string(written.error())}});
        } else {
            result.acquired = true;
            result.reason = "acquired";
        }
    }

    if (result.acquired) {
        result.lock_id = record.lock_id;
        log_info("Successfully acquired lock", {{"lock_key", lock_key_name}, {"lock_id", record.lock_id}});
    }
    if (observability_) {
        observability_->record_lock_attempt(result.reason);
    }
    return result;
}

StaleCheck DistributedLock::check_stale(const std::string& key) {
    StaleCheck check;
    std::string lock_key_name = lock_key(key);

    auto body = store_->get(lock_key_name);
    if (!body) {
        log_error("Error checking lock", {{"lock_key", lock_key_name}, {"error", caf::to_string(body.error())}});
        return check;
    }
    if (!body->has_value()) {
        log_info("No lock file exists", {{"lock_key", lock_key_name}});
        return check;
    }

    check.record = LockRecord::parse(**body);
    if (!check.record) {
        // Unreadable records are left for their writer to clean up
        log_warn("Lock record has no readable expiration", {{"lock_key", lock_key_name}});
        return check;
    }

    auto now = clock_->now();
    if (now > check.record->expires_at) {
        check.is_stale = true;
        auto expired_ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - check.record->expires_at);
        log_info("Found stale lock", {
            {"lock_key", lock_key_name},
            {"lock_id", check.record->lock_id},
            {"owner_request_id", check.record->request_id},
            {"expired_ms", std::to_string(expired_ms.count())}
        });
    } else {
        log_info("Lock is still valid", {
            {"lock_key", lock_key_name},
            {"lock_id", check.record->lock_id},
            {"owner_request_id", check.record->request_id}
        });
    }
    return check;
}

bool DistributedLock::break_stale(const std::string& key) {
    StaleCheck check = check_stale(key);
    if (!check.is_stale || !check.record) {
        return false;
    }

    std::string lock_key_name = lock_key(key);
    auto removed = store_->remove(lock_key_name);
    if (!removed) {
        log_error("Error breaking stale lock", {{"lock_key", lock_key_name}, {"error", caf::to_string(removed.error())}});
        return false;
    }
    log_info("Successfully broke stale lock", {
        {"lock_key", lock_key_name},
        {"stale_lock_id", check.record->lock_id},
        {"stale_owner_request_id", check.record->request_id}
    });
    return true;
}

ReleaseResult DistributedLock::release(const std::string& key, const std::string& lock_id) {
    std::string lock_key_name = lock_key(key);

    auto body = store_->get(lock_key_name);
    if (!body) {
        log_error("Error releasing lock", {
            {"lock_key", lock_key_name}, {"lock_id", lock_id}, {"error", caf::to_string(body.error())}
        });
        return ReleaseResult::store_error;
    }
    if (!body->has_value()) {
        log_warn("Cannot release lock - lock file does not exist", {{"lock_key", lock_key_name}, {"lock_id", lock_id}});
        return ReleaseResult::no_such_lock;
    }

    json doc = json::parse(**body, nullptr, false);
    std::string current_owner = "unknown";
    if (!doc.is_discarded() && doc.is_object() && doc.contains("lock_id") && doc["lock_id"].is_string()) {
        current_owner = doc["lock_id"].get<std::string>();
    }
    if (current_owner != lock_id) {
        log_warn("Cannot release lock - not the owner", {
            {"lock_key", lock_key_name}, {"lock_id", lock_id}, {"current_owner", current_owner}
        });
        return ReleaseResult::not_owner;
    }

    auto removed = store_->remove(lock_key_name);
    if (!removed) {
        log_error("Error releasing lock", {
            {"lock_key", lock_key_name}, {"lock_id", lock_id}, {"error", caf::to_string(removed.error())}
        });
        return ReleaseResult::store_error;
    }
    log_info("Successfully released lock", {{"lock_key", lock_key_name}, {"lock_id", lock_id}});
    return ReleaseResult::released;
}

} // namespace collector
} // namespace fleetinv
