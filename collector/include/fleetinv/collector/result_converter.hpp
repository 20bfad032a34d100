#pragma once

#include "fleetinv/collector/core.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace fleetinv {
namespace collector {

// Converter utilities between the result model and its JSON / string forms.
// The JSON shape is what the CLI prints and what callers parse to decide
// whether to retry, alert, or accept partial success.
class ResultConverter {
public:
    // Contract: "success" | "failed" | "circuit_open"
    static std::string status_to_string(AccountStatus status) {
        switch (status) {
            case AccountStatus::success:
                return "success";
            case AccountStatus::failed:
                return "failed";
            case AccountStatus::circuit_open:
                return "circuit_open";
            default:
                return "failed";
        }
    }

    static AccountStatus string_to_status(const std::string& status_str) {
        if (status_str == "success") {
            return AccountStatus::success;
        } else if (status_str == "circuit_open") {
            return AccountStatus::circuit_open;
        }
        return AccountStatus::failed;  // Default to failed for unknown status
    }

    static std::string error_kind_to_string(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::transient:
                return "transient";
            case ErrorKind::permanent:
                return "permanent";
            case ErrorKind::circuit_open:
                return "circuit_open";
            case ErrorKind::unknown:
            default:
                return "unknown";
        }
    }

    static std::string breaker_state_to_string(BreakerState state) {
        switch (state) {
            case BreakerState::closed:
                return "CLOSED";
            case BreakerState::open:
                return "OPEN";
            case BreakerState::half_open:
                return "HALF_OPEN";
            default:
                return "CLOSED";
        }
    }

    static nlohmann::json to_json(const ErrorInfo& error);
    static nlohmann::json to_json(const ResourceRecord& record);
    static nlohmann::json to_json(const AccountResult& result);
    static nlohmann::json to_json(const BreakerSnapshot& snapshot);
    static nlohmann::json to_json(const CollectionSummary& summary);
    static nlohmann::json to_json(const CollectionResult& result);

    // Serializes without throwing: invalid UTF-8 from remote messages or
    // tags is written as U+FFFD
    static std::string dump(const nlohmann::json& doc, int indent = -1) {
        return doc.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

} // namespace collector
} // namespace fleetinv
