// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field.h
/// @brief Field paths: reach a nested Value without manual branching.
///
/// A Field is a stateless list of steps, each either an object key or an
/// array index. Applying it to a Value yields a FieldValue holding either the
/// resolved Value or a Traversal error that names the failing step.
///
/// ```cpp
/// std::string first_email;
/// Value profile = client.query(Value::ref("classes/profile/43")).get();
/// Status st = profile.at(obj_key("data", "emails").at_index(0)).get(first_email);
/// ```

#pragma once

#include "value.h"

#include <concepts>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace faunadb {

/// A single path element: either an object key or an array index
using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Convert a Path to dot notation (e.g. ".data.emails[0]"); "/" for the empty path
[[nodiscard]] FAUNADB_API std::string path_to_string(const Path& path);

class FAUNADB_API Field {
public:
    /// Empty path: resolves to the root value itself
    Field() = default;
    explicit Field(Path path) : path_(std::move(path)) {}

    [[nodiscard]] Field at_key(std::string key) const {
        Field result = *this;
        result.path_.emplace_back(std::move(key));
        return result;
    }

    [[nodiscard]] Field at_index(std::size_t index) const {
        Field result = *this;
        result.path_.emplace_back(index);
        return result;
    }

    /// Append another field's steps after this one's
    [[nodiscard]] Field at(const Field& next) const {
        Field result = *this;
        result.path_.insert(result.path_.end(), next.path_.begin(), next.path_.end());
        return result;
    }

    [[nodiscard]] const Path& path() const noexcept { return path_; }
    [[nodiscard]] bool empty() const noexcept { return path_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return path_.size(); }
    [[nodiscard]] std::string to_string() const { return path_to_string(path_); }

    /// Walk the path against a value
    [[nodiscard]] FieldValue get(const Value& root) const;

    bool operator==(const Field&) const = default;

private:
    Path path_;
};

/// Field descending through one or more object keys
template <typename... Keys>
    requires (sizeof...(Keys) > 0 && (std::convertible_to<Keys, std::string> && ...))
[[nodiscard]] Field obj_key(Keys&&... keys)
{
    Path path;
    path.reserve(sizeof...(Keys));
    (path.emplace_back(std::in_place_type<std::string>, std::forward<Keys>(keys)), ...);
    return Field{std::move(path)};
}

/// Field descending through one or more array indexes
template <typename... Indexes>
    requires (sizeof...(Indexes) > 0 && (std::integral<Indexes> && ...))
[[nodiscard]] Field arr_index(Indexes... indexes)
{
    Path path;
    path.reserve(sizeof...(Indexes));
    (path.emplace_back(std::in_place_type<std::size_t>, static_cast<std::size_t>(indexes)), ...);
    return Field{std::move(path)};
}

// ============================================================
// FieldValue - result of applying a Field to a Value
// ============================================================

struct FAUNADB_API FieldValue {
    Value value;                    // The resolved value (null on error)
    bool success = false;
    ErrorCode error_code = ErrorCode::Success;
    std::string error_message;      // Human-readable error description
    Path resolved_path;             // The portion of path that was successfully resolved
    std::size_t failed_at_index = 0;

    explicit operator bool() const noexcept { return success; }

    [[nodiscard]] ErrorCategory category() const noexcept { return error_category(error_code); }

    [[nodiscard]] Status status() const {
        return success ? Status::ok() : Status::failure(error_code, error_message);
    }

    /// Resolved value, or throws faunadb::Error carrying the traversal error
    const Value& get() const {
        if (!success) {
            throw Error(error_code, error_message);
        }
        return value;
    }

    Value get_or(Value default_val) const {
        return success ? value : std::move(default_val);
    }

    /// Decode the resolved value. A failed traversal reports its own error.
    /// Defined in decode.h.
    template <typename T>
    [[nodiscard]] Status get(T& out) const;

    /// Continue traversing from the resolved value
    [[nodiscard]] FieldValue at(const Field& field) const;
};

} // namespace faunadb
