#pragma once

#include <exception>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>

namespace unistore {

// Fixed set of failure kinds every backend normalizes into.
// Callers branch on the kind, never on the message text.
enum class ErrorKind {
    NotFound,
    Unauthorized,
    TemporaryFailure,  // Retrying later may succeed
    InvalidArgument,
    Internal,
    Timeout,
    Cancelled
};

const char* error_kind_name(ErrorKind kind);

// True for kinds that may succeed when retried without caller intervention.
bool is_retryable(ErrorKind kind);

// Failure raised by single-object operations.
class StorageError : public std::runtime_error {
public:
    StorageError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Kind and diagnostic message extracted from an arbitrary failure.
struct Classification {
    ErrorKind kind = ErrorKind::Internal;
    std::string message;
};

// HTTP status -> kind. Returns nullopt for successful statuses (2xx, 304).
// Statuses missing from the table fall back to TemporaryFailure for 5xx
// and Internal for everything else.
std::optional<ErrorKind> classify_http_status(int status);

// OS / filesystem error code -> kind. Unknown codes map to Internal.
ErrorKind classify_error_code(const std::error_code& ec);

// Classify the exception currently being handled. Must be called from
// inside a catch block.
Classification classify_current_exception();

// Throw a StorageError for a non-success HTTP status. No-op on success.
void throw_for_http_status(int status, const std::string& context);

// Throw a StorageError classified from an error code.
[[noreturn]] void throw_for_error_code(const std::error_code& ec,
                                       const std::string& context);

} // namespace unistore
