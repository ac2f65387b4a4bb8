#include "objxfer/errors.hpp"

#include <sstream>

namespace objxfer {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Retryable: return "retryable";
        case ErrorKind::Fatal: return "fatal";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

OperationError::OperationError(ErrorKind kind,
                               std::string operation,
                               std::string code,
                               const std::string& message,
                               int attempts,
                               std::map<std::string, std::string> details)
    : std::runtime_error(message)
    , kind_(kind)
    , operation_(std::move(operation))
    , code_(std::move(code))
    , attempts_(attempts)
    , details_(std::move(details)) {}

std::string OperationError::detail(const std::string& name) const {
    auto it = details_.find(name);
    return it == details_.end() ? std::string() : it->second;
}

OperationError OperationError::with_details(
    const std::map<std::string, std::string>& extra) const {
    auto merged = details_;
    merged.insert(extra.begin(), extra.end());
    return OperationError(kind_, operation_, code_, what(), attempts_, std::move(merged));
}

std::string OperationError::describe() const {
    std::ostringstream out;
    out << operation_ << ": ";
    if (!code_.empty()) out << code_ << ": ";
    out << what() << " (attempts=" << attempts_;
    for (const auto& [k, v] : details_) {
        out << ", " << k << "=" << v;
    }
    out << ")";
    return out.str();
}

OperationError make_cancelled(const std::string& operation,
                              std::map<std::string, std::string> details) {
    return OperationError(ErrorKind::Cancelled, operation, CANCELLED_CODE,
                          "operation cancelled", 1, std::move(details));
}

const std::set<std::string>& default_retryable_codes() {
    static const std::set<std::string> codes = {
        // Throttling
        "Throttling", "ThrottlingException", "SlowDown", "TooManyRequests",
        "RequestLimitExceeded", "ProvisionedThroughputExceededException",
        // Timeouts
        "RequestTimeout", "RequestTimeoutException",
        // Service side
        "InternalError", "ServiceUnavailable",
        // Connection level
        "ConnectionError", "EndpointConnectionError", "ConnectTimeout",
        "ReadTimeout", "IncompleteBody",
    };
    return codes;
}

}  // namespace objxfer
