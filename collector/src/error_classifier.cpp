#include "fleetinv/collector/error_classifier.hpp"
#include "fleetinv/collector/errors.hpp"
#include <unordered_map>
#include <unordered_set>

namespace fleetinv {
namespace collector {

namespace {

const std::unordered_set<std::string>& transient_codes() {
    static const std::unordered_set<std::string> codes = {
        "ThrottlingException",
        "Throttling",
        "RequestThrottled",
        "TooManyRequestsException",
        "RequestLimitExceeded",
        "SlowDown",
        "ServiceUnavailable",
        "InternalError",
        "InternalFailure",
        "ConnectionError",
        "EndpointConnectionError",
        "RequestTimeout"
    };
    return codes;
}

const std::unordered_set<std::string>& permanent_codes() {
    static const std::unordered_set<std::string> codes = {
        "AccessDenied",
        "AccessDeniedException",
        "UnauthorizedOperation",
        "InvalidClientTokenId",
        "ExpiredToken",
        "SignatureDoesNotMatch",
        "ValidationError",
        "ValidationException",
        "MalformedPolicyDocument",
        "NoSuchEntity",
        "ResourceNotFoundException",
        "NoSessionReturned"
    };
    return codes;
}

} // namespace

ErrorKind ErrorClassifier::classify_code(const std::string& code, int http_status) {
    if (transient_codes().count(code) > 0) {
        return ErrorKind::transient;
    }
    if (permanent_codes().count(code) > 0) {
        return ErrorKind::permanent;
    }

    // HTTP errors: 429 and 5xx = transient, other 4xx = permanent
    if (http_status == 429 || http_status >= 500) {
        return ErrorKind::transient;
    }
    if (http_status >= 400 && http_status < 500) {
        return ErrorKind::permanent;
    }

    return ErrorKind::unknown;
}

ErrorKind ErrorClassifier::classify(const std::exception& error) {
    if (dynamic_cast<const CircuitOpenError*>(&error) != nullptr) {
        return ErrorKind::circuit_open;
    }
    if (const auto* remote = dynamic_cast<const RemoteError*>(&error)) {
        return classify_code(remote->code(), remote->http_status());
    }
    return ErrorKind::unknown;
}

std::string ErrorClassifier::describe(const std::string& code) {
    static const std::unordered_map<std::string, std::string> descriptions = {
        {"AccessDenied", "Insufficient permissions"},
        {"AccessDeniedException", "Insufficient permissions"},
        {"UnauthorizedOperation", "Insufficient permissions"},
        {"InvalidClientTokenId", "Invalid credentials"},
        {"ExpiredToken", "Credentials expired"},
        {"SignatureDoesNotMatch", "Invalid credentials"},
        {"ValidationError", "Invalid request"},
        {"ValidationException", "Invalid request"},
        {"MalformedPolicyDocument", "Malformed policy document"},
        {"NoSuchEntity", "Resource not found"},
        {"ResourceNotFoundException", "Resource not found"},
        {"NoSessionReturned", "Role assumption returned no session"},
        {"ThrottlingException", "Request throttled"},
        {"Throttling", "Request throttled"},
        {"RequestThrottled", "Request throttled"},
        {"TooManyRequestsException", "Request throttled"},
        {"RequestLimitExceeded", "Request limit exceeded"},
        {"SlowDown", "Request throttled"},
        {"ServiceUnavailable", "Service unavailable"},
        {"InternalError", "Service internal error"},
        {"InternalFailure", "Service internal error"},
        {"ConnectionError", "Connection failed"},
        {"EndpointConnectionError", "Connection failed"},
        {"RequestTimeout", "Request timed out"},
        {"CircuitOpen", "Circuit breaker is open"}
    };
    auto it = descriptions.find(code);
    if (it != descriptions.end()) {
        return it->second;
    }
    return "Unrecognized error";
}

ErrorInfo ErrorClassifier::to_error_info(const std::exception& error, const std::string& operation) {
    ErrorInfo info;
    info.kind = classify(error);
    info.operation = operation;
    info.message = error.what();
    if (const auto* remote = dynamic_cast<const RemoteError*>(&error)) {
        info.code = remote->code();
        info.http_status = remote->http_status();
    } else if (info.kind == ErrorKind::circuit_open) {
        info.code = "CircuitOpen";
    } else {
        info.code = "Unknown";
    }
    info.context["description"] = describe(info.code);
    return info;
}

ErrorInfo ErrorClassifier::unknown_error_info(const std::string& operation) {
    ErrorInfo info;
    info.kind = ErrorKind::unknown;
    info.operation = operation;
    info.code = "Unknown";
    info.message = "Non-standard exception thrown by " + operation;
    info.context["description"] = describe(info.code);
    return info;
}

} // namespace collector
} // namespace fleetinv
