// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Value containers.
///
/// Usage:
/// @code
///   #include <jsonunit/builders.h>
///
///   Value order = ObjectBuilder()
///       .set("id", 1042)
///       .set("paid", true)
///       .set("lines", ArrayBuilder().push_back("book").push_back("pen").finish())
///       .finish();
/// @endcode

#pragma once

#include <jsonunit/value.h>

#include <immer/map_transient.hpp>
#include <immer/vector_transient.hpp>

namespace jsonunit {

/// Builder for JSON objects. Keys keep the order of their first set().
template <typename MemoryPolicy>
class BasicObjectBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_box    = BasicValueBox<MemoryPolicy>;
    using value_object = BasicValueObject<MemoryPolicy>;

    BasicObjectBuilder()
        : keys_(typename value_object::key_vector{}.transient())
        , fields_(typename value_object::field_map{}.transient())
    {}

    BasicObjectBuilder(BasicObjectBuilder&&) noexcept = default;
    BasicObjectBuilder& operator=(BasicObjectBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicObjectBuilder(const BasicObjectBuilder&) = delete;
    BasicObjectBuilder& operator=(const BasicObjectBuilder&) = delete;

    /// Set a field; setting an existing key replaces its value in place
    BasicObjectBuilder& set(const std::string& key, value_type val) {
        if (fields_.count(key) == 0) {
            keys_.push_back(key);
        }
        fields_.set(key, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return fields_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return keys_.size();
    }

    /// Finish building and return the immutable Value
    /// @note The builder must not be used after this call
    [[nodiscard]] value_type finish() {
        return value_type{value_object{keys_.persistent(), fields_.persistent()}};
    }

private:
    typename value_object::key_vector::transient_type keys_;
    typename value_object::field_map::transient_type fields_;
};

/// Builder for JSON arrays
template <typename MemoryPolicy>
class BasicArrayBuilder {
public:
    using value_type   = BasicValue<MemoryPolicy>;
    using value_box    = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;

    BasicArrayBuilder() : transient_(value_vector{}.transient()) {}

    BasicArrayBuilder(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder& operator=(BasicArrayBuilder&&) noexcept = default;
    BasicArrayBuilder(const BasicArrayBuilder&) = delete;
    BasicArrayBuilder& operator=(const BasicArrayBuilder&) = delete;

    BasicArrayBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// @note The builder must not be used after this call
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    typename value_vector::transient_type transient_;
};

using ObjectBuilder = BasicObjectBuilder<immer::default_memory_policy>;
using ArrayBuilder  = BasicArrayBuilder<immer::default_memory_policy>;

} // namespace jsonunit
