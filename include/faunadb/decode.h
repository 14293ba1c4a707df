// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file decode.h
/// @brief Generic decoder: convert a Value into a caller-chosen native shape.
///
/// The destination type selects one of a closed set of descriptors:
///
/// | Destination                          | Accepted variants                      |
/// |--------------------------------------|----------------------------------------|
/// | std::string                          | String                                 |
/// | integer types                        | Long, Double without fraction          |
/// | float, double                        | Double, Long                           |
/// | bool                                 | Boolean                                |
/// | Date, std::chrono::year_month_day    | Date                                   |
/// | Time, TimePoint                      | Time, Date (midnight UTC)              |
/// | Ref, SetRef                          | Ref, SetRef                            |
/// | Value, ValueMap, ValueVector         | any, Object, Array                     |
/// | std::optional<T>                     | Null, or whatever T accepts            |
/// | std::vector<T>                       | Array                                  |
/// | std::map / unordered_map<string, T>  | Object                                 |
/// | record (record_fields<T> specialized)| Object                                 |
///
/// Null decodes into every destination and resets it to T{}.
/// Container decoding is atomic: on failure the destination is untouched.
///
/// Records are described by specializing record_fields:
/// @code
///   struct Spell { std::string name; int64_t cost = 0; std::optional<Ref> owner; };
///
///   template <>
///   struct faunadb::record_fields<Spell> {
///       static constexpr std::string_view name = "Spell";
///       static constexpr auto fields = std::make_tuple(
///           faunadb::field("name", &Spell::name),
///           faunadb::field("cost", &Spell::cost),
///           faunadb::field("owner", &Spell::owner));
///   };
///
///   Spell spell;
///   Status st = value.at(obj_key("data")).get(spell);
/// @endcode

#pragma once

#include "field.h"
#include "value.h"

#include <chrono>
#include <concepts>
#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

namespace faunadb {

/// Destination descriptor. Specialized for every supported destination type.
template <typename T, typename Enable = void>
struct decoder;

template <typename T>
concept Decodable = std::default_initializable<T> && requires(const Value& v, T& out) {
    { decoder<T>::decode(v, out) } -> std::same_as<Status>;
    { decoder<T>::name() } -> std::convertible_to<std::string>;
};

/// Decode a value into out. Null always succeeds and resets out to T{}.
template <Decodable T>
[[nodiscard]] Status decode(const Value& val, T& out)
{
    if (val.is_null()) {
        out = T{};
        return Status::ok();
    }
    return decoder<T>::decode(val, out);
}

/// Name of the destination shape as used in error messages ("vector<string>")
template <Decodable T>
[[nodiscard]] std::string destination_name()
{
    return std::string{decoder<T>::name()};
}

// ============================================================
// Non-template helpers (decode.cpp)
// ============================================================

namespace detail {

[[nodiscard]] FAUNADB_API Status type_mismatch(std::string_view requested, const Value& actual);

/// Prefix a nested failure with its location ("[3]", ".name")
[[nodiscard]] FAUNADB_API Status nested_failure(Status inner, std::string_view location);

[[nodiscard]] FAUNADB_API std::string index_location(std::size_t index);
[[nodiscard]] FAUNADB_API std::string key_location(std::string_view key);

/// Long, or Double without fractional part that fits int64
[[nodiscard]] FAUNADB_API Status decode_int64(const Value& val, std::int64_t& out, std::string_view requested);

/// Unsigned destination: same rules, non-negative values up to UINT64_MAX
[[nodiscard]] FAUNADB_API Status decode_uint64(const Value& val, std::uint64_t& out, std::string_view requested);

/// Double, or Long widened to double
[[nodiscard]] FAUNADB_API Status decode_double(const Value& val, double& out, std::string_view requested);

[[nodiscard]] FAUNADB_API Status out_of_range(std::string_view requested, const Value& actual);

template <typename T>
[[nodiscard]] std::string integer_name()
{
    return std::string{std::is_signed_v<T> ? "int" : "uint"} + std::to_string(sizeof(T) * 8);
}

} // namespace detail

// ============================================================
// Scalar descriptors
// ============================================================

template <>
struct decoder<std::string> {
    static std::string name() { return "string"; }

    static Status decode(const Value& val, std::string& out) {
        if (auto* s = val.get_if<std::string>()) {
            out = *s;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <std::integral T>
    requires (!std::same_as<T, bool>)
struct decoder<T> {
    static std::string name() { return detail::integer_name<T>(); }

    static Status decode(const Value& val, T& out) {
        if constexpr (std::is_signed_v<T>) {
            std::int64_t wide = 0;
            Status st = detail::decode_int64(val, wide, name());
            if (!st) return st;
            if (!std::in_range<T>(wide)) return detail::out_of_range(name(), val);
            out = static_cast<T>(wide);
        } else {
            std::uint64_t wide = 0;
            Status st = detail::decode_uint64(val, wide, name());
            if (!st) return st;
            if (!std::in_range<T>(wide)) return detail::out_of_range(name(), val);
            out = static_cast<T>(wide);
        }
        return Status::ok();
    }
};

template <std::floating_point T>
struct decoder<T> {
    static std::string name() { return sizeof(T) == sizeof(float) ? "float" : "double"; }

    static Status decode(const Value& val, T& out) {
        double wide = 0.0;
        Status st = detail::decode_double(val, wide, name());
        if (!st) return st;
        if constexpr (sizeof(T) < sizeof(double)) {
            if (wide > static_cast<double>(std::numeric_limits<T>::max()) ||
                wide < static_cast<double>(std::numeric_limits<T>::lowest())) {
                return detail::out_of_range(name(), val);
            }
        }
        out = static_cast<T>(wide);
        return Status::ok();
    }
};

template <>
struct decoder<bool> {
    static std::string name() { return "bool"; }

    static Status decode(const Value& val, bool& out) {
        if (auto* b = val.get_if<bool>()) {
            out = *b;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<Date> {
    static std::string name() { return "date"; }

    static Status decode(const Value& val, Date& out) {
        if (auto* d = val.get_if<Date>()) {
            out = *d;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<std::chrono::year_month_day> {
    static std::string name() { return "date"; }

    static Status decode(const Value& val, std::chrono::year_month_day& out) {
        if (auto* d = val.get_if<Date>()) {
            out = d->ymd;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<TimePoint> {
    static std::string name() { return "time"; }

    static Status decode(const Value& val, TimePoint& out) {
        if (auto* t = val.get_if<Time>()) {
            out = t->instant;
            return Status::ok();
        }
        if (auto* d = val.get_if<Date>()) {
            out = std::chrono::sys_days{d->ymd};
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<Time> {
    static std::string name() { return "time"; }

    static Status decode(const Value& val, Time& out) {
        TimePoint instant{};
        Status st = decoder<TimePoint>::decode(val, instant);
        if (!st) return st;
        out = Time{instant};
        return Status::ok();
    }
};

template <>
struct decoder<Ref> {
    static std::string name() { return "ref"; }

    static Status decode(const Value& val, Ref& out) {
        if (auto* r = val.get_if<Ref>()) {
            out = *r;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<SetRef> {
    static std::string name() { return "setref"; }

    static Status decode(const Value& val, SetRef& out) {
        if (auto* s = val.get_if<SetRef>()) {
            out = *s;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<Value> {
    static std::string name() { return "value"; }

    static Status decode(const Value& val, Value& out) {
        out = val;
        return Status::ok();
    }
};

template <>
struct decoder<ValueMap> {
    static std::string name() { return "object"; }

    static Status decode(const Value& val, ValueMap& out) {
        if (auto* m = val.get_if<ValueMap>()) {
            out = *m;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

template <>
struct decoder<ValueVector> {
    static std::string name() { return "array"; }

    static Status decode(const Value& val, ValueVector& out) {
        if (auto* v = val.get_if<ValueVector>()) {
            out = *v;
            return Status::ok();
        }
        return detail::type_mismatch(name(), val);
    }
};

// ============================================================
// Composite descriptors
// ============================================================

template <Decodable T>
struct decoder<std::optional<T>> {
    static std::string name() { return "optional<" + destination_name<T>() + ">"; }

    static Status decode(const Value& val, std::optional<T>& out) {
        if (val.is_null()) {
            out.reset();
            return Status::ok();
        }
        T inner{};
        Status st = decoder<T>::decode(val, inner);
        if (!st) return st;
        out = std::move(inner);
        return Status::ok();
    }
};

template <Decodable T>
struct decoder<std::vector<T>> {
    static std::string name() { return "vector<" + destination_name<T>() + ">"; }

    static Status decode(const Value& val, std::vector<T>& out) {
        auto* arr = val.get_if<ValueVector>();
        if (!arr) return detail::type_mismatch(name(), val);

        std::vector<T> result;
        result.reserve(arr->size());
        for (std::size_t i = 0; i < arr->size(); ++i) {
            T elem{};
            Status st = faunadb::decode((*arr)[i].get(), elem);
            if (!st) return detail::nested_failure(std::move(st), detail::index_location(i));
            result.push_back(std::move(elem));
        }
        out = std::move(result);
        return Status::ok();
    }
};

namespace detail {

template <typename Mapping>
Status decode_mapping(const Value& val, Mapping& out, std::string_view requested)
{
    using mapped_type = typename Mapping::mapped_type;

    auto* obj = val.get_if<ValueMap>();
    if (!obj) return type_mismatch(requested, val);

    Mapping result;
    for (const auto& [key, box] : *obj) {
        mapped_type elem{};
        Status st = faunadb::decode(box.get(), elem);
        if (!st) return nested_failure(std::move(st), key_location(key));
        result.emplace(key, std::move(elem));
    }
    out = std::move(result);
    return Status::ok();
}

} // namespace detail

template <Decodable T>
struct decoder<std::map<std::string, T>> {
    static std::string name() { return "map<string, " + destination_name<T>() + ">"; }

    static Status decode(const Value& val, std::map<std::string, T>& out) {
        return detail::decode_mapping(val, out, name());
    }
};

template <Decodable T>
struct decoder<std::unordered_map<std::string, T>> {
    static std::string name() { return "map<string, " + destination_name<T>() + ">"; }

    static Status decode(const Value& val, std::unordered_map<std::string, T>& out) {
        return detail::decode_mapping(val, out, name());
    }
};

// ============================================================
// Records
// ============================================================

/// One named member of a record
template <typename Owner, typename Member>
struct record_field {
    std::string_view key;
    Member Owner::*member;
};

template <typename Owner, typename Member>
constexpr record_field<Owner, Member> field(std::string_view key, Member Owner::*member) noexcept
{
    return record_field<Owner, Member>{key, member};
}

/// Specialize with `static constexpr auto fields = std::make_tuple(field(...), ...);`
/// and optionally `static constexpr std::string_view name`.
template <typename T>
struct record_fields;

template <typename T>
concept Record = requires {
    std::tuple_size<std::remove_cvref_t<decltype(record_fields<T>::fields)>>::value;
};

template <Record T>
struct decoder<T> {
    static std::string name() {
        if constexpr (requires { record_fields<T>::name; }) {
            return std::string{record_fields<T>::name};
        } else {
            return "record";
        }
    }

    static Status decode(const Value& val, T& out) {
        auto* obj = val.get_if<ValueMap>();
        if (!obj) return detail::type_mismatch(name(), val);

        T result{};
        Status st = Status::ok();
        std::apply([&](const auto&... fields) {
            static_cast<void>((decode_field(*obj, result, fields, st) && ...));
        }, record_fields<T>::fields);
        if (!st) return st;

        out = std::move(result);
        return Status::ok();
    }

private:
    template <typename Member>
    static bool decode_field(const ValueMap& obj, T& result,
                             const record_field<T, Member>& f, Status& st) {
        auto* found = obj.find(std::string{f.key});
        if (!found) return true;  // absent keys keep their default

        Status field_st = faunadb::decode(found->get(), result.*(f.member));
        if (!field_st) {
            st = detail::nested_failure(std::move(field_st), detail::key_location(f.key));
            return false;
        }
        return true;
    }
};

// ============================================================
// Entry points declared in value.h and field.h
// ============================================================

template <typename T>
Status Value::get(T& out) const
{
    Status st = decode(*this, out);
    detail::log_status("Value::get", st);
    return st;
}

template <typename T>
Status FieldValue::get(T& out) const
{
    if (!success) {
        return Status::failure(error_code, error_message);
    }
    Status st = decode(value, out);
    detail::log_status("FieldValue::get", st);
    return st;
}

} // namespace faunadb
