#include "unistore/core/errors.hpp"

#include <algorithm>
#include <array>
#include <filesystem>
#include <new>
#include <utility>

namespace unistore {

namespace {

struct StatusRule {
    int status;
    ErrorKind kind;
};

// Statuses with a fixed meaning across providers. Anything not listed here
// is resolved by status class in classify_http_status().
constexpr std::array<StatusRule, 22> kHttpStatusTable = {{
    {400, ErrorKind::InvalidArgument},   // Bad Request
    {401, ErrorKind::Unauthorized},      // Unauthorized
    {403, ErrorKind::Unauthorized},      // Forbidden
    {404, ErrorKind::NotFound},          // Not Found
    {407, ErrorKind::Unauthorized},      // Proxy Authentication Required
    {408, ErrorKind::TemporaryFailure},  // Request Timeout
    {410, ErrorKind::NotFound},          // Gone
    {411, ErrorKind::InvalidArgument},   // Length Required
    {413, ErrorKind::InvalidArgument},   // Payload Too Large
    {414, ErrorKind::InvalidArgument},   // URI Too Long
    {415, ErrorKind::InvalidArgument},   // Unsupported Media Type
    {416, ErrorKind::InvalidArgument},   // Range Not Satisfiable
    {429, ErrorKind::TemporaryFailure},  // Too Many Requests
    {431, ErrorKind::InvalidArgument},   // Request Header Fields Too Large
    {451, ErrorKind::Internal},          // Unavailable For Legal Reasons
    {500, ErrorKind::Internal},          // Internal Server Error
    {501, ErrorKind::Internal},          // Not Implemented
    {502, ErrorKind::TemporaryFailure},  // Bad Gateway
    {503, ErrorKind::TemporaryFailure},  // Service Unavailable
    {504, ErrorKind::Timeout},           // Gateway Timeout
    {507, ErrorKind::Internal},          // Insufficient Storage
    {511, ErrorKind::Unauthorized},      // Network Authentication Required
}};

struct ErrcRule {
    std::errc code;
    ErrorKind kind;
};

constexpr std::array<ErrcRule, 21> kErrcTable = {{
    {std::errc::no_such_file_or_directory, ErrorKind::NotFound},
    {std::errc::no_such_device, ErrorKind::NotFound},
    {std::errc::permission_denied, ErrorKind::Unauthorized},
    {std::errc::operation_not_permitted, ErrorKind::Unauthorized},
    {std::errc::read_only_file_system, ErrorKind::Unauthorized},
    {std::errc::resource_unavailable_try_again, ErrorKind::TemporaryFailure},
    {std::errc::device_or_resource_busy, ErrorKind::TemporaryFailure},
    {std::errc::interrupted, ErrorKind::TemporaryFailure},
    {std::errc::connection_reset, ErrorKind::TemporaryFailure},
    {std::errc::connection_refused, ErrorKind::TemporaryFailure},
    {std::errc::connection_aborted, ErrorKind::TemporaryFailure},
    {std::errc::network_unreachable, ErrorKind::TemporaryFailure},
    {std::errc::host_unreachable, ErrorKind::TemporaryFailure},
    {std::errc::too_many_files_open, ErrorKind::TemporaryFailure},
    {std::errc::invalid_argument, ErrorKind::InvalidArgument},
    {std::errc::filename_too_long, ErrorKind::InvalidArgument},
    {std::errc::file_too_large, ErrorKind::InvalidArgument},
    {std::errc::is_a_directory, ErrorKind::InvalidArgument},
    {std::errc::not_a_directory, ErrorKind::InvalidArgument},
    {std::errc::timed_out, ErrorKind::Timeout},
    {std::errc::operation_canceled, ErrorKind::Cancelled},
}};

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::TemporaryFailure: return "TemporaryFailure";
        case ErrorKind::InvalidArgument: return "InvalidArgument";
        case ErrorKind::Internal: return "Internal";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Internal";
}

bool is_retryable(ErrorKind kind) {
    return kind == ErrorKind::TemporaryFailure || kind == ErrorKind::Timeout;
}

std::optional<ErrorKind> classify_http_status(int status) {
    if ((status >= 200 && status < 300) || status == 304) {
        return std::nullopt;
    }

    auto it = std::find_if(kHttpStatusTable.begin(), kHttpStatusTable.end(),
                           [status](const StatusRule& r) { return r.status == status; });
    if (it != kHttpStatusTable.end()) {
        return it->kind;
    }

    if (status >= 500 && status < 600) {
        return ErrorKind::TemporaryFailure;
    }
    return ErrorKind::Internal;
}

ErrorKind classify_error_code(const std::error_code& ec) {
    // Compare through the generic category so system_category codes match too
    auto condition = ec.default_error_condition();
    for (const auto& rule : kErrcTable) {
        if (condition == std::make_error_condition(rule.code)) {
            return rule.kind;
        }
    }
    return ErrorKind::Internal;
}

Classification classify_current_exception() {
    Classification result;
    try {
        throw;
    } catch (const StorageError& e) {
        result.kind = e.kind();
        result.message = e.what();
    } catch (const std::filesystem::filesystem_error& e) {
        result.kind = classify_error_code(e.code());
        result.message = e.what();
    } catch (const std::system_error& e) {
        result.kind = classify_error_code(e.code());
        result.message = e.what();
    } catch (const std::invalid_argument& e) {
        result.kind = ErrorKind::InvalidArgument;
        result.message = e.what();
    } catch (const std::length_error& e) {
        result.kind = ErrorKind::InvalidArgument;
        result.message = e.what();
    } catch (const std::out_of_range& e) {
        result.kind = ErrorKind::InvalidArgument;
        result.message = e.what();
    } catch (const std::bad_alloc&) {
        result.kind = ErrorKind::Internal;
        result.message = "out of memory";
    } catch (const std::exception& e) {
        result.kind = ErrorKind::Internal;
        result.message = e.what();
    }
    return result;
}

void throw_for_http_status(int status, const std::string& context) {
    auto kind = classify_http_status(status);
    if (!kind) return;
    throw StorageError(*kind, context + ": HTTP " + std::to_string(status));
}

void throw_for_error_code(const std::error_code& ec, const std::string& context) {
    throw StorageError(classify_error_code(ec), context + ": " + ec.message());
}

} // namespace unistore
