// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file errors.cpp
/// @brief Error code classification and names.

#include <faunadb/errors.h>

namespace faunadb {

ErrorCategory error_category(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::Success:
            return ErrorCategory::None;
        case ErrorCode::MalformedJson:
        case ErrorCode::InvalidTagPayload:
        case ErrorCode::UnsupportedValue:
            return ErrorCategory::WireFormat;
        case ErrorCode::KeyNotFound:
        case ErrorCode::IndexOutOfRange:
        case ErrorCode::NotTraversable:
            return ErrorCategory::Traversal;
        case ErrorCode::TypeMismatch:
        case ErrorCode::PrecisionLoss:
        case ErrorCode::OutOfRange:
            return ErrorCategory::Decode;
        case ErrorCode::TransportFailure:
        case ErrorCode::BadRequest:
        case ErrorCode::Unauthorized:
        case ErrorCode::PermissionDenied:
        case ErrorCode::NotFound:
        case ErrorCode::InternalError:
        case ErrorCode::Unavailable:
        case ErrorCode::UnknownStatus:
            return ErrorCategory::Transport;
    }
    return ErrorCategory::None;
}

std::string_view error_code_name(ErrorCode code) noexcept
{
    switch (code) {
        case ErrorCode::Success:           return "Success";
        case ErrorCode::MalformedJson:     return "MalformedJson";
        case ErrorCode::InvalidTagPayload: return "InvalidTagPayload";
        case ErrorCode::UnsupportedValue:  return "UnsupportedValue";
        case ErrorCode::KeyNotFound:       return "KeyNotFound";
        case ErrorCode::IndexOutOfRange:   return "IndexOutOfRange";
        case ErrorCode::NotTraversable:    return "NotTraversable";
        case ErrorCode::TypeMismatch:      return "TypeMismatch";
        case ErrorCode::PrecisionLoss:     return "PrecisionLoss";
        case ErrorCode::OutOfRange:        return "OutOfRange";
        case ErrorCode::TransportFailure:  return "TransportFailure";
        case ErrorCode::BadRequest:        return "BadRequest";
        case ErrorCode::Unauthorized:      return "Unauthorized";
        case ErrorCode::PermissionDenied:  return "PermissionDenied";
        case ErrorCode::NotFound:          return "NotFound";
        case ErrorCode::InternalError:     return "InternalError";
        case ErrorCode::Unavailable:       return "Unavailable";
        case ErrorCode::UnknownStatus:     return "UnknownStatus";
    }
    return "Unknown";
}

std::string_view error_category_name(ErrorCategory category) noexcept
{
    switch (category) {
        case ErrorCategory::None:       return "None";
        case ErrorCategory::WireFormat: return "WireFormatError";
        case ErrorCategory::Traversal:  return "TraversalError";
        case ErrorCategory::Decode:     return "DecodeError";
        case ErrorCategory::Transport:  return "TransportError";
    }
    return "Unknown";
}

} // namespace faunadb
