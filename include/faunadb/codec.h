// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file codec.h
/// @brief FaunaDB tagged JSON wire format: encode Values, parse response bodies.
///
/// Usage:
/// @code
///   #include <faunadb/codec.h>
///
///   Value v = Value::object({{"name", "Bob"}, {"age", 30}});
///   EncodeResult out = encode(v);        // {"object":{"age":30,"name":"Bob"}}
///   ParseResult in = parse_json(out.json);
///   assert(in && in.value == v);
/// @endcode
///
/// Wire shapes:
///   String, Long, Double, Boolean   native JSON
///   Null                            null
///   Date                            {"@date":"YYYY-MM-DD"}
///   Time                            {"@ts":"YYYY-MM-DDTHH:MM:SS.fffffffffZ"}
///   Ref                             {"@ref":"<id>"}
///   SetRef                          {"@set":{<parameters>}}
///   Object                          {"object":{<entries>}}
///   Array                           [<elements>]
///
/// Object keys are written in ascending byte order, so equal values always
/// produce identical bytes.
///
/// On the read side any JSON object that is not exactly one of the tagged
/// shapes above becomes a plain Object. This fallback is intentional: server
/// responses carry untagged objects (e.g. the {"resource": ...} envelope).

#pragma once

#include "value.h"

#include <optional>
#include <string>
#include <string_view>

namespace faunadb {

struct EncodeResult {
    std::string json;
    bool success = false;
    ErrorCode error_code = ErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] Status status() const {
        return success ? Status::ok() : Status::failure(error_code, error_message);
    }

    /// Encoded text, or throws faunadb::Error on failure
    const std::string& get() const {
        if (!success) {
            throw Error(error_code, error_message);
        }
        return json;
    }
};

// ============================================================
// Encoding
// ============================================================

/// Encode a value (typically a query expression) to the wire format
/// @param val The value to encode
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return The JSON text, or UnsupportedValue for NaN/Inf doubles and
///         dates that cannot be written as YYYY-MM-DD
[[nodiscard]] FAUNADB_API EncodeResult encode(const Value& val, bool compact = true);

// ============================================================
// Decoding
// ============================================================

/// Parse a complete JSON document into a Value tree
/// @return MalformedJson on syntax errors, InvalidTagPayload when a tagged
///         object carries a payload of the wrong shape
[[nodiscard]] FAUNADB_API ParseResult parse_json(std::string_view json);

// ============================================================
// Temporal text formats
// ============================================================

/// "YYYY-MM-DD"; std::nullopt for invalid dates or years outside 0..9999
[[nodiscard]] FAUNADB_API std::optional<std::string> format_date(const Date& date);

/// "YYYY-MM-DDTHH:MM:SS.fffffffffZ"
[[nodiscard]] FAUNADB_API std::string format_time(const Time& time);

/// Strict "YYYY-MM-DD" naming a real calendar date
[[nodiscard]] FAUNADB_API std::optional<Date> parse_date(std::string_view text);

/// RFC 3339 instant: 0-9 fraction digits, "Z" or "+HH:MM"/"-HH:MM"; normalized to UTC
[[nodiscard]] FAUNADB_API std::optional<Time> parse_time(std::string_view text);

} // namespace faunadb
