// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file field.cpp
/// @brief Field path traversal with structured error reporting.

#include <faunadb/field.h>

namespace faunadb {

std::string path_to_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                result += "." + v;
            } else {
                result += "[" + std::to_string(v) + "]";
            }
        }, elem);
    }
    return result.empty() ? "/" : result;
}

namespace {

std::string describe_element(const PathElement& elem)
{
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "key \"" + v + "\"";
        } else {
            return "index " + std::to_string(v);
        }
    }, elem);
}

std::string get_error_message(ErrorCode code, const Value& current, const PathElement& elem, std::size_t index)
{
    auto elem_str = describe_element(elem);

    switch (code) {
        case ErrorCode::KeyNotFound:
            return "Key not found: " + elem_str + " at path position " + std::to_string(index);
        case ErrorCode::IndexOutOfRange:
            return "Index out of range: " + elem_str + " at path position " + std::to_string(index) +
                   " (array size " + std::to_string(current.size()) + ")";
        case ErrorCode::NotTraversable:
            return "Not transversable: " + std::string{type_name(current)} + " cannot be traversed with " +
                   elem_str + " (path position " + std::to_string(index) + ")";
        default:
            return "Unknown error";
    }
}

/// Try to access a single path element
std::pair<Value, ErrorCode> try_get_element(const Value& current, const PathElement& elem)
{
    return std::visit([&current](const auto& key) -> std::pair<Value, ErrorCode> {
        using T = std::decay_t<decltype(key)>;

        if constexpr (std::is_same_v<T, std::string>) {
            if (auto* map = current.get_if<ValueMap>()) {
                if (auto* found = map->find(key)) {
                    return {found->get(), ErrorCode::Success};
                }
                return {Value{}, ErrorCode::KeyNotFound};
            }
        } else {
            if (auto* vec = current.get_if<ValueVector>()) {
                if (key < vec->size()) {
                    return {(*vec)[key].get(), ErrorCode::Success};
                }
                return {Value{}, ErrorCode::IndexOutOfRange};
            }
        }
        // A key on an Array, an index on an Object, or any step on a leaf
        return {Value{}, ErrorCode::NotTraversable};
    }, elem);
}

/// Walk path from root; positions in messages are offset by the steps already resolved
FieldValue traverse(const Value& root, const Path& path, Path resolved)
{
    FieldValue result;
    const std::size_t offset = resolved.size();
    result.resolved_path = std::move(resolved);

    Value current = root;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const auto& elem = path[i];
        auto [next_val, error_code] = try_get_element(current, elem);

        if (error_code != ErrorCode::Success) {
            result.success = false;
            result.error_code = error_code;
            result.error_message = get_error_message(error_code, current, elem, offset + i);
            result.failed_at_index = offset + i;
            result.value = Value{};
            detail::log_error("Field::get", error_code, result.error_message);
            return result;
        }

        result.resolved_path.push_back(elem);
        current = std::move(next_val);
    }

    result.success = true;
    result.error_code = ErrorCode::Success;
    result.value = std::move(current);
    return result;
}

} // anonymous namespace

FieldValue Field::get(const Value& root) const
{
    return traverse(root, path_, Path{});
}

FieldValue Value::at(const Field& field) const
{
    return field.get(*this);
}

FieldValue FieldValue::at(const Field& field) const
{
    if (!success) {
        return *this;
    }
    return traverse(value, field.path(), resolved_path);
}

} // namespace faunadb
