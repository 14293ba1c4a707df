// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.h
/// @brief Error codes, result status and diagnostic logging for faunadb.
///
/// Every public operation reports failure through a result struct that
/// carries an ErrorCode and a human-readable message:
///
/// @code
///   ParseResult parsed = parse_json(body);
///   if (!parsed) {
///       std::cerr << parsed.error_message << "\n";
///       return;
///   }
///   std::string name;
///   Status st = parsed.value.at(obj_key("name")).get(name);
/// @endcode
///
/// Errors are grouped into four categories:
/// - WireFormat: malformed JSON, malformed tag payloads, unencodable values
/// - Traversal:  field path applied to a leaf, missing key or index
/// - Decode:     requested native shape incompatible with the value
/// - Transport:  failures reported by the transport or the server status

#pragma once

#include "faunadb_config.h"
#include "api.h"

#include <cstddef>
#include <iostream>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace faunadb {

enum class ErrorCode {
    Success = 0,

    // WireFormat
    MalformedJson,       // JSON syntax error, trailing data, nesting too deep
    InvalidTagPayload,   // @date/@ts/@ref/@set payload of the wrong shape
    UnsupportedValue,    // value with no JSON representation (NaN, Inf)

    // Traversal
    KeyNotFound,         // Object has no such key
    IndexOutOfRange,     // Array index past the end
    NotTraversable,      // Path step applied to a non-container variant

    // Decode
    TypeMismatch,        // Destination shape incompatible with the variant
    PrecisionLoss,       // Double with a fractional part into an integer
    OutOfRange,          // Number does not fit the destination type

    // Transport
    TransportFailure,    // Request never produced an HTTP response
    BadRequest,          // 400
    Unauthorized,        // 401
    PermissionDenied,    // 403
    NotFound,            // 404
    InternalError,       // 500
    Unavailable,         // 503
    UnknownStatus,       // any other non-2xx status
};

enum class ErrorCategory {
    None,
    WireFormat,
    Traversal,
    Decode,
    Transport,
};

[[nodiscard]] FAUNADB_API ErrorCategory error_category(ErrorCode code) noexcept;
[[nodiscard]] FAUNADB_API std::string_view error_code_name(ErrorCode code) noexcept;
[[nodiscard]] FAUNADB_API std::string_view error_category_name(ErrorCategory category) noexcept;

/// Exception thrown by the opt-in throwing accessors (ValueResult::get(), Status::check(), ...)
class FAUNADB_API Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] ErrorCategory category() const noexcept { return error_category(code_); }

private:
    ErrorCode code_;
};

/// Outcome of an operation that produces no value (decode, traversal checks).
struct Status {
    bool success = true;
    ErrorCode error_code = ErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] ErrorCategory category() const noexcept { return error_category(error_code); }

    static Status ok() { return Status{}; }

    static Status failure(ErrorCode code, std::string message) {
        return Status{false, code, std::move(message)};
    }

    /// Throw faunadb::Error if this status is a failure
    void check() const {
        if (!success) {
            throw Error(error_code, error_message);
        }
    }
};

// ============================================================
// Diagnostic logging
//
// Writes to stderr when FAUNADB_VERBOSE_LOG is enabled. Only used next to a
// failure that is also returned to the caller.
// ============================================================

namespace detail {

inline void log_error(
    std::string_view func,
    ErrorCode code,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if FAUNADB_VERBOSE_LOG
    std::cerr << "[" << func << "] " << error_code_name(code) << ": " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)code;
    (void)message;
    (void)loc;
#endif
}

inline void log_status(
    std::string_view func,
    const Status& status,
    std::source_location loc = std::source_location::current()) noexcept
{
    if (!status.success) {
        log_error(func, status.error_code, status.error_message, loc);
    }
}

} // namespace detail

} // namespace faunadb
