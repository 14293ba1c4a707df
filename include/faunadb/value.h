// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Value type for everything a FaunaDB query can return or accept as a literal.
///
/// This file defines the closed set of result variants:
/// - Scalars: String, Long (int64), Double, Boolean, Null (std::monostate)
/// - Temporal: Date (calendar date), Time (UTC instant, nanosecond precision)
/// - Database types: Ref (opaque id), SetRef (parameters of a lazy set)
/// - Containers: Object and Array (immer's immutable map and vector)
///
/// Values are immutable once constructed. Container nodes are shared through
/// immer's atomic reference counting, so a Value tree may be copied cheaply
/// and read from several threads without synchronization.
///
/// Every Value answers two messages:
/// - get(out):  decode into a native destination (see decode.h)
/// - at(field): traverse with a field path (see field.h)

#pragma once

#include "faunadb_config.h"
#include "api.h"
#include "errors.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace faunadb {

struct Value;
class Field;
struct FieldValue;

namespace detail {

template <typename T>
concept character = std::same_as<T, char> || std::same_as<T, wchar_t> || std::same_as<T, char8_t> ||
                    std::same_as<T, char16_t> || std::same_as<T, char32_t>;

/// Integer types stored as Long: everything integral except bool and characters
template <typename T>
concept integer_number = std::integral<T> && !std::same_as<T, bool> && !character<T>;

} // namespace detail

using memory_policy = immer::default_memory_policy;

using ValueBox    = immer::box<Value, memory_policy>;
using ValueMap    = immer::map<std::string,
                               ValueBox,
                               std::hash<std::string>,
                               std::equal_to<std::string>,
                               memory_policy>;
using ValueVector = immer::vector<ValueBox, memory_policy>;

/// Absolute instant, UTC, nanosecond resolution
using TimePoint = std::chrono::sys_time<std::chrono::nanoseconds>;

/// Calendar date without time of day
struct Date {
    std::chrono::year_month_day ymd{std::chrono::year{1970}, std::chrono::January, std::chrono::day{1}};

    Date() = default;
    constexpr Date(std::chrono::year_month_day d) noexcept : ymd(d) {}
    constexpr Date(int y, unsigned m, unsigned d) noexcept
        : ymd(std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}) {}

    bool operator==(const Date&) const = default;
};

/// Instant in time, always normalized to UTC
struct Time {
    TimePoint instant{};

    Time() = default;
    constexpr Time(TimePoint t) noexcept : instant(t) {}

    bool operator==(const Time&) const = default;
};

/// Reference to a database entity
struct Ref {
    std::string id;

    bool operator==(const Ref&) const = default;
};

/// Description of a server-side set (its parameters, not its contents)
struct SetRef {
    ValueMap parameters;
};

enum class ValueType : std::uint8_t {
    String,
    Long,
    Double,
    Boolean,
    Date,
    Time,
    Ref,
    SetRef,
    Object,
    Array,
    Null,
};

struct FAUNADB_API Value
{
    // Alternative order matches ValueType
    std::variant<std::string,
                 std::int64_t,
                 double,
                 bool,
                 Date,
                 Time,
                 Ref,
                 SetRef,
                 ValueMap,
                 ValueVector,
                 std::monostate>
        data;

    Value() noexcept : data(std::monostate{}) {}
    Value(std::nullptr_t) noexcept : data(std::monostate{}) {}
    Value(const std::string& v) : data(v) {}
    Value(std::string&& v) noexcept : data(std::move(v)) {}
    Value(const char* v) : data(std::in_place_type<std::string>, v) {}
    Value(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    template <detail::integer_number T>
        requires std::signed_integral<T> || (sizeof(T) < sizeof(std::int64_t))
    Value(T v) noexcept : data(static_cast<std::int64_t>(v)) {}
    // Unsigned 64-bit values may not fit in a Long
    template <detail::integer_number T>
        requires std::unsigned_integral<T> && (sizeof(T) >= sizeof(std::int64_t))
    Value(T v) = delete;
    // Characters are not numbers
    template <detail::character T>
    Value(T v) = delete;
    Value(double v) noexcept : data(v) {}
    Value(bool v) noexcept : data(v) {}
    Value(Date v) noexcept : data(v) {}
    Value(Time v) noexcept : data(v) {}
    Value(Ref v) noexcept : data(std::move(v)) {}
    Value(SetRef v) noexcept : data(std::move(v)) {}
    Value(ValueMap v) noexcept : data(std::move(v)) {}
    Value(ValueVector v) noexcept : data(std::move(v)) {}

    // Factory functions
    static Value object(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value array(std::initializer_list<Value> init) {
        auto t = ValueVector{}.transient();
        for (const auto& val : init) {
            t.push_back(ValueBox{val});
        }
        return Value{t.persistent()};
    }

    static Value set_ref(std::initializer_list<std::pair<std::string, Value>> init) {
        auto t = ValueMap{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, ValueBox{val});
        }
        return Value{SetRef{t.persistent()}};
    }

    static Value ref(std::string id) { return Value{Ref{std::move(id)}}; }

    static Value date(int y, unsigned m, unsigned d) { return Value{Date{y, m, d}}; }

    static Value time(TimePoint t) { return Value{Time{t}}; }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueType type() const noexcept { return static_cast<ValueType>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_container() const noexcept { return is<ValueMap>() || is<ValueVector>(); }

    /// Number of entries of an Object or Array, 0 for every other variant
    [[nodiscard]] std::size_t size() const noexcept {
        if (auto* m = get_if<ValueMap>()) return m->size();
        if (auto* v = get_if<ValueVector>()) return v->size();
        return 0;
    }

    /// Decode into a native destination. Defined in decode.h.
    template <typename T>
    [[nodiscard]] Status get(T& out) const;

    /// Traverse with a field path. Only Object and Array can succeed.
    [[nodiscard]] FieldValue at(const Field& field) const;
};

inline bool operator==(const SetRef& a, const SetRef& b)
{
    return a.parameters == b.parameters;
}

inline bool operator==(const Value& a, const Value& b)
{
    return a.data == b.data;
}

// ============================================================
// ValueResult - a Value or the reason there is none
// ============================================================

struct ValueResult {
    Value value;                    // The produced value (null on error)
    bool success = false;
    ErrorCode error_code = ErrorCode::Success;
    std::string error_message;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] ErrorCategory category() const noexcept { return error_category(error_code); }

    [[nodiscard]] Status status() const {
        return success ? Status::ok() : Status::failure(error_code, error_message);
    }

    /// Value, or throws faunadb::Error on failure
    const Value& get() const {
        if (!success) {
            throw Error(error_code, error_message);
        }
        return value;
    }

    Value get_or(Value default_val) const {
        return success ? value : std::move(default_val);
    }

    static ValueResult ok(Value v) {
        return ValueResult{std::move(v), true, ErrorCode::Success, {}};
    }

    static ValueResult failure(ErrorCode code, std::string message) {
        return ValueResult{Value{}, false, code, std::move(message)};
    }
};

using ParseResult = ValueResult;
using QueryResult = ValueResult;

// ============================================================
// Utility functions
// ============================================================

/// Display name of a variant ("String", "Long", ..., "Null")
[[nodiscard]] FAUNADB_API std::string_view type_name(ValueType type) noexcept;

[[nodiscard]] inline std::string_view type_name(const Value& val) noexcept { return type_name(val.type()); }

/// Short human-readable rendering, e.g. "\"Bob\"", "30L", "{object:2}", "@ref(classes/spells)"
[[nodiscard]] FAUNADB_API std::string value_to_string(const Value& val);

} // namespace faunadb
