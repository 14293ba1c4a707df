// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builders for O(n) construction of Object, Array and SetRef values.
///
/// Usage:
/// @code
///   #include <faunadb/builders.h>
///
///   Value spell = ObjectBuilder()
///       .set("name", "Fire")
///       .set("cost", 10)
///       .set("owner", Value::ref("classes/characters/181388642114077184"))
///       .finish();
///
///   Value costs = ArrayBuilder()
///       .push_back(10)
///       .push_back(15)
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace faunadb {

/// Builder for Object (and SetRef parameter) maps
class ObjectBuilder {
public:
    using transient_type = ValueMap::transient_type;

    ObjectBuilder() : transient_(ValueMap{}.transient()) {}
    explicit ObjectBuilder(const ValueMap& existing) : transient_(existing.transient()) {}

    ObjectBuilder(ObjectBuilder&&) noexcept = default;
    ObjectBuilder& operator=(ObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    ObjectBuilder(const ObjectBuilder&) = delete;
    ObjectBuilder& operator=(const ObjectBuilder&) = delete;

    /// Set a key; a repeated key replaces the earlier value
    ObjectBuilder& set(const std::string& key, Value val) {
        transient_.set(key, ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish as an Object value
    /// Note: After calling finish(), the builder is in an undefined state
    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    /// Finish as a SetRef whose parameters are the collected entries
    [[nodiscard]] Value finish_set_ref() {
        return Value{SetRef{transient_.persistent()}};
    }

    [[nodiscard]] ValueMap finish_map() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

/// Builder for Array values
class ArrayBuilder {
public:
    using transient_type = ValueVector::transient_type;

    ArrayBuilder() : transient_(ValueVector{}.transient()) {}
    explicit ArrayBuilder(const ValueVector& existing) : transient_(existing.transient()) {}

    ArrayBuilder(ArrayBuilder&&) noexcept = default;
    ArrayBuilder& operator=(ArrayBuilder&&) noexcept = default;

    ArrayBuilder(const ArrayBuilder&) = delete;
    ArrayBuilder& operator=(const ArrayBuilder&) = delete;

    ArrayBuilder& push_back(Value val) {
        transient_.push_back(ValueBox{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] Value finish() {
        return Value{transient_.persistent()};
    }

    [[nodiscard]] ValueVector finish_vector() {
        return transient_.persistent();
    }

private:
    transient_type transient_;
};

} // namespace faunadb
