// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file decode.cpp
/// @brief Non-template parts of the generic decoder: numeric rules and messages.

#include <faunadb/decode.h>

#include <cmath>

namespace faunadb::detail {

namespace {

// 2^63 and 2^64 are exactly representable; every finite double below them
// converts to int64/uint64 without overflow.
constexpr double two_pow_63 = 9223372036854775808.0;
constexpr double two_pow_64 = 18446744073709551616.0;

Status precision_loss(std::string_view requested, double d)
{
    return Status::failure(ErrorCode::PrecisionLoss,
                           "cannot decode Double " + std::to_string(d) + " into " +
                           std::string{requested} + " without losing its fractional part");
}

} // anonymous namespace

Status type_mismatch(std::string_view requested, const Value& actual)
{
    return Status::failure(ErrorCode::TypeMismatch,
                           "cannot decode " + std::string{type_name(actual)} + " into " +
                           std::string{requested});
}

Status out_of_range(std::string_view requested, const Value& actual)
{
    return Status::failure(ErrorCode::OutOfRange,
                           "value " + value_to_string(actual) + " is out of range for " +
                           std::string{requested});
}

std::string index_location(std::size_t index)
{
    return "[" + std::to_string(index) + "]";
}

std::string key_location(std::string_view key)
{
    return "." + std::string{key};
}

Status nested_failure(Status inner, std::string_view location)
{
    // Nested locations concatenate: "[3]" + ".name: ..." -> "[3].name: ..."
    const auto& msg = inner.error_message;
    if (!msg.empty() && (msg.front() == '[' || msg.front() == '.')) {
        inner.error_message = std::string{location} + msg;
    } else {
        inner.error_message = std::string{location} + ": " + msg;
    }
    return inner;
}

Status decode_int64(const Value& val, std::int64_t& out, std::string_view requested)
{
    if (auto* i = val.get_if<std::int64_t>()) {
        out = *i;
        return Status::ok();
    }
    if (auto* d = val.get_if<double>()) {
        if (!std::isfinite(*d)) return out_of_range(requested, val);
        if (std::trunc(*d) != *d) return precision_loss(requested, *d);
        if (*d < -two_pow_63 || *d >= two_pow_63) return out_of_range(requested, val);
        out = static_cast<std::int64_t>(*d);
        return Status::ok();
    }
    return type_mismatch(requested, val);
}

Status decode_uint64(const Value& val, std::uint64_t& out, std::string_view requested)
{
    if (auto* i = val.get_if<std::int64_t>()) {
        if (*i < 0) return out_of_range(requested, val);
        out = static_cast<std::uint64_t>(*i);
        return Status::ok();
    }
    if (auto* d = val.get_if<double>()) {
        if (!std::isfinite(*d)) return out_of_range(requested, val);
        if (std::trunc(*d) != *d) return precision_loss(requested, *d);
        if (*d < 0.0 || *d >= two_pow_64) return out_of_range(requested, val);
        out = static_cast<std::uint64_t>(*d);
        return Status::ok();
    }
    return type_mismatch(requested, val);
}

Status decode_double(const Value& val, double& out, std::string_view requested)
{
    if (auto* d = val.get_if<double>()) {
        out = *d;
        return Status::ok();
    }
    if (auto* i = val.get_if<std::int64_t>()) {
        out = static_cast<double>(*i);
        return Status::ok();
    }
    return type_mismatch(requested, val);
}

} // namespace faunadb::detail
