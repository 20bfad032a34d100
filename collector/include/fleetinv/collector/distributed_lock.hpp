#pragma once

#include "fleetinv/collector/clock.hpp"
#include "fleetinv/collector/feature_flags.hpp"
#include "fleetinv/collector/object_store.hpp"
#include "fleetinv/collector/observability.hpp"
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <type_traits>
#include <utility>

namespace fleetinv {
namespace collector {

// Lock object stored at "<key>.lock"
struct LockRecord {
    std::string lock_id;
    Clock::time_point created_at{};
    Clock::time_point expires_at{};
    std::string request_id;

    std::string to_json() const;
    // std::nullopt when the body is not a lock record or lacks expires_at
    static std::optional<LockRecord> parse(const std::string& body);
};

struct AcquireResult {
    bool acquired = false;
    std::string lock_id;
    std::string reason;  // acquired | held | capability_gap | store_error
};

struct StaleCheck {
    bool is_stale = false;
    std::optional<LockRecord> record;
};

enum class ReleaseResult {
    released,
    not_owner,
    no_such_lock,
    store_error
};

std::string release_result_to_string(ReleaseResult result);

template <typename T>
struct LockedWrite {
    bool acquired = false;
    std::string lock_id;
    int32_t attempts = 0;
    std::chrono::milliseconds waited{0};
    std::optional<T> value;
    std::string message;
};

class DistributedLock;

// Releases the lock when it goes out of scope
class LockLease {
public:
    LockLease(DistributedLock& lock, std::string key, std::string lock_id)
        : lock_(&lock), key_(std::move(key)), lock_id_(std::move(lock_id)) {}
    ~LockLease();

    LockLease(LockLease&& other) noexcept
        : lock_(other.lock_), key_(std::move(other.key_)), lock_id_(std::move(other.lock_id_)) {
        other.lock_ = nullptr;
    }
    LockLease(const LockLease&) = delete;
    LockLease& operator=(const LockLease&) = delete;
    LockLease& operator=(LockLease&&) = delete;

    // Releases now; later calls and the destructor do nothing
    ReleaseResult release();

    const std::string& lock_id() const { return lock_id_; }

private:
    DistributedLock* lock_;
    std::string key_;
    std::string lock_id_;
};

/**
 * Advisory lock over an ObjectStore, coordinating writers across processes.
 *
 * Exclusivity holds only when the store has an atomic create-if-absent.
 * Without one, acquire() refuses (capability_gap) unless
 * require_conditional_write is false, in which case it falls back to an
 * unconditional put and two racing writers may both succeed.
 */
class DistributedLock {
public:
    DistributedLock(std::shared_ptr<ObjectStore> store,
                    LockSettings settings,
                    std::shared_ptr<Clock> clock = SystemClock::instance(),
                    std::shared_ptr<Observability> observability = nullptr,
                    std::string request_id = {});

    static std::string lock_key(const std::string& key) { return key + ".lock"; }

    AcquireResult acquire(const std::string& key, std::optional<std::chrono::seconds> timeout = std::nullopt);
    StaleCheck check_stale(const std::string& key);
    // True when a stale lock was found and deleted
    bool break_stale(const std::string& key);
    ReleaseResult release(const std::string& key, const std::string& lock_id);

    // base^attempt seconds plus uniform jitter in [0, jitter_factor]
    std::chrono::milliseconds backoff_delay(int32_t attempt);

    std::string generate_lock_id();

    /**
     * Runs writer(lock_id) while holding the lock on key.
     *
     * Attempts after the first break a stale lock and back off before
     * trying again. Contention is reported through LockedWrite::acquired;
     * an exception thrown by the writer propagates after the lock is
     * released.
     */
    template <typename Writer>
    auto write_with_lock(const std::string& key, Writer&& writer, int32_t max_attempts = 0)
        -> LockedWrite<std::invoke_result_t<Writer&, const std::string&>> {
        using R = std::invoke_result_t<Writer&, const std::string&>;
        LockedWrite<R> out;
        int32_t attempts = max_attempts > 0 ? max_attempts : settings_.max_attempts;
        if (attempts < 1) {
            attempts = 1;
        }

        auto span = observability_ ? observability_->start_span("lock.write", {{"object_key", key}})
                                   : Observability::SpanPtr{};
        log_info("Attempting write operation with locking", {
            {"object_key", key},
            {"max_attempts", std::to_string(attempts)},
            {"timeout_seconds", std::to_string(settings_.timeout_seconds)}
        });

        for (int32_t attempt = 0; attempt < attempts; ++attempt) {
            out.attempts = attempt + 1;
            if (attempt > 0) {
                if (break_stale(key)) {
                    log_info("Broke stale lock before retry attempt", {
                        {"object_key", key}, {"attempt", std::to_string(attempt + 1)}
                    });
                }
                auto delay = backoff_delay(attempt);
                log_info("Waiting before retry attempt", {
                    {"object_key", key},
                    {"wait_time_ms", std::to_string(delay.count())},
                    {"attempt", std::to_string(attempt + 1)}
                });
                clock_->sleep_for(delay);
                out.waited += delay;
            }

            AcquireResult acquired = acquire(key);
            if (acquired.acquired) {
                LockLease lease(*this, key, acquired.lock_id);
                out.acquired = true;
                out.lock_id = acquired.lock_id;
                out.value.emplace(writer(acquired.lock_id));
                lease.release();
                out.message = "Write completed under lock on " + key;
                if (span) {
                    span->End();
                }
                return out;
            }
            if (acquired.reason == "capability_gap") {
                out.message = "Object store lacks conditional write; refusing to lock " + key;
                if (span) {
                    span->End();
                }
                return out;
            }
        }

        out.message = "Failed to acquire lock on " + key + " after " + std::to_string(attempts) + " attempts";
        log_error(out.message, {
            {"object_key", key},
            {"total_wait_time_ms", std::to_string(out.waited.count())}
        });
        if (span) {
            span->End();
        }
        return out;
    }

    const LockSettings& settings() const { return settings_; }

private:
    std::shared_ptr<ObjectStore> store_;
    LockSettings settings_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;
    std::string request_id_;

    std::mutex rng_mu_;
    std::mt19937_64 rng_;

    void log_info(const std::string& message, const Observability::Context& context);
    void log_warn(const std::string& message, const Observability::Context& context);
    void log_error(const std::string& message, const Observability::Context& context);
};

} // namespace collector
} // namespace fleetinv
