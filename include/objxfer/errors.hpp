#pragma once

#include <map>
#include <set>
#include <stdexcept>
#include <string>

namespace objxfer {

enum class ErrorKind {
    Retryable,  // transient: throttling, timeouts, service/connection errors
    Fatal,      // not found, access denied, invalid argument, ...
    Cancelled   // cooperative cancellation, not a failure
};

const char* error_kind_name(ErrorKind kind);

// Generic code used when wrapping exceptions that carry no backend code
inline constexpr const char* CLIENT_ERROR_CODE = "ClientError";
inline constexpr const char* CANCELLED_CODE = "Cancelled";
inline constexpr const char* ABORTED_CODE = "RequestAborted";

/// Error surfaced by the orchestration layer.
///
/// Carries everything the boundary needs to render a message without
/// re-deriving context: the operation name, the backend error code (if any),
/// how many attempts were made, and a details map (bucket, key, failed item,
/// completed count, ...).
class OperationError : public std::runtime_error {
public:
    OperationError(ErrorKind kind,
                   std::string operation,
                   std::string code,
                   const std::string& message,
                   int attempts = 1,
                   std::map<std::string, std::string> details = {});

    ErrorKind kind() const { return kind_; }
    const std::string& operation() const { return operation_; }
    const std::string& code() const { return code_; }
    int attempts() const { return attempts_; }
    const std::map<std::string, std::string>& details() const { return details_; }

    bool is_cancelled() const { return kind_ == ErrorKind::Cancelled; }

    // Returns the detail value or an empty string
    std::string detail(const std::string& name) const;

    // Copy with extra details merged in (existing keys are kept)
    OperationError with_details(const std::map<std::string, std::string>& extra) const;

    // "upload: NoSuchBucket: bucket does not exist (attempts=1, bucket=b)"
    std::string describe() const;

private:
    ErrorKind kind_;
    std::string operation_;
    std::string code_;
    int attempts_;
    std::map<std::string, std::string> details_;
};

/// Build a cancellation error for the given operation.
OperationError make_cancelled(const std::string& operation,
                              std::map<std::string, std::string> details = {});

/// Transient backend codes retried by default.
const std::set<std::string>& default_retryable_codes();

}  // namespace objxfer
