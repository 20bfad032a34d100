#pragma once

#include "fleetinv/collector/core.hpp"
#include <exception>
#include <string>

namespace fleetinv {
namespace collector {

/**
 * Error classification
 *
 * The single gate deciding whether a failure counts toward breaker state:
 * - Transient: throttling, rate limits, unavailable services, connectivity,
 *   HTTP 429 and 5xx
 * - Permanent: authorization, credentials, validation, other HTTP 4xx
 * - Unknown: anything else, including exceptions that are not RemoteError
 */
class ErrorClassifier {
public:
    static ErrorKind classify(const std::exception& error);

    // Known codes win over the HTTP status
    static ErrorKind classify_code(const std::string& code, int http_status = 0);

    static bool is_transient(const std::exception& error) {
        return classify(error) == ErrorKind::transient;
    }

    // Human-readable description of a remote error code
    static std::string describe(const std::string& code);

    // Builds the structured form carried in results
    static ErrorInfo to_error_info(const std::exception& error, const std::string& operation);
    // For a thrown value that does not derive from std::exception
    static ErrorInfo unknown_error_info(const std::string& operation);
};

} // namespace collector
} // namespace fleetinv
