// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Canonical immutable JSON value used by the comparison engine.
///
/// A Value is one of:
/// - Null (std::monostate)
/// - Boolean
/// - Number (arbitrary-precision decimal, boxed to keep the variant small)
/// - Text (std::string)
/// - Array (immer::vector of boxed values)
/// - Object (ordered field map: immer::map for lookup plus an immer::vector
///   remembering insertion order)
///
/// Values are immutable; copying shares structure. The type is templated on
/// an immer memory policy like the underlying containers.

#pragma once

#include <jsonunit/config.h>
#include <jsonunit/api.h>
#include <jsonunit/number.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <iosfwd>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace jsonunit {

/// The six JSON kinds, in the order of the Value variant alternatives
enum class Kind : std::uint8_t { Null, Boolean, Number, Text, Array, Object };

// Forward declaration
template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BoxedNumber = immer::box<Number, MemoryPolicy>;

// ============================================================
// BasicValueObject - JSON object with insertion-ordered keys
//
// Lookup goes through the hash map, iteration through keys() which
// keeps the order fields were first inserted. Equality ignores order.
// ============================================================

template <typename MemoryPolicy>
class BasicValueObject {
public:
    using value_box  = BasicValueBox<MemoryPolicy>;
    using field_map  = immer::map<std::string,
                                  value_box,
                                  std::hash<std::string>,
                                  std::equal_to<std::string>,
                                  MemoryPolicy>;
    using key_vector = immer::vector<std::string, MemoryPolicy>;

    BasicValueObject() = default;

    /// @pre every key in keys is present in fields and vice versa
    BasicValueObject(key_vector keys, field_map fields)
        : keys_(std::move(keys))
        , fields_(std::move(fields))
    {}

    [[nodiscard]] const value_box* find(const std::string& key) const { return fields_.find(key); }
    [[nodiscard]] bool contains(const std::string& key) const { return fields_.count(key) > 0; }
    [[nodiscard]] std::size_t size() const { return keys_.size(); }
    [[nodiscard]] bool empty() const { return keys_.empty(); }

    /// Field names in insertion order
    [[nodiscard]] const key_vector& keys() const { return keys_; }

    /// New object with key set. A new key is appended; an existing key keeps its position.
    [[nodiscard]] BasicValueObject set(const std::string& key, value_box val) const {
        auto keys = contains(key) ? keys_ : keys_.push_back(key);
        return BasicValueObject{std::move(keys), fields_.set(key, std::move(val))};
    }

    friend bool operator==(const BasicValueObject& a, const BasicValueObject& b) {
        return a.fields_ == b.fields_;
    }

private:
    key_vector keys_;
    field_map fields_;
};

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;
    using value_object  = BasicValueObject<MemoryPolicy>;
    using boxed_number  = BoxedNumber<MemoryPolicy>;

    // Alternative order must match Kind
    std::variant<std::monostate,
                 bool,
                 boxed_number,
                 std::string,
                 value_vector,
                 value_object>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(v) {}

    template <std::integral T>
        requires (!std::same_as<T, bool>)
    BasicValue(T v) : data(boxed_number{Number{v}}) {}

    template <std::floating_point T>
    BasicValue(T v) : data(boxed_number{number_from_double(static_cast<double>(v))}) {}

    BasicValue(const Number& v) : data(boxed_number{v}) {}
    BasicValue(boxed_number v) : data(std::move(v)) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_object v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        value_object result;
        for (const auto& [key, val] : init) {
            result = result.set(key, value_box{val});
        }
        return BasicValue{std::move(result)};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<boxed_number>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_object>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    [[nodiscard]] const Number* get_number() const {
        if (auto* n = get_if<boxed_number>()) return &n->get();
        return nullptr;
    }

    /// Field lookup; nullptr if this is not an object or has no such field
    [[nodiscard]] const BasicValue* find(const std::string& key) const {
        if (auto* o = get_if<value_object>()) {
            if (auto* found = o->find(key)) return &found->get();
        }
        return nullptr;
    }

    /// Element lookup; nullptr if this is not an array or index is out of range
    [[nodiscard]] const BasicValue* find(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return &(*v)[index].get();
        }
        return nullptr;
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] Number as_number(Number default_val = Number{0}) const {
        if (auto* p = get_number()) return *p;
        return default_val;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* o = get_if<value_object>()) return o->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }
};

// ============================================================
// Value Type Aliases
//
// Value uses immer's default (thread-safe) memory policy so one tree
// can be compared from several threads at once.
// ============================================================

using Value       = BasicValue<immer::default_memory_policy>;
using ValueBox    = Value::value_box;
using ValueVector = Value::value_vector;
using ValueObject = Value::value_object;

// ============================================================
// UnsafeValue - single-threaded Value
//
// Non-atomic reference counting and no locks. A tree built with this
// policy must stay on one thread; compare() takes Value only.
// ============================================================

using unsafe_memory_policy = immer::memory_policy<
    immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
    immer::unsafe_refcount_policy,
    immer::no_lock_policy
>;

using UnsafeValue       = BasicValue<unsafe_memory_policy>;
using UnsafeValueBox    = UnsafeValue::value_box;
using UnsafeValueVector = UnsafeValue::value_vector;
using UnsafeValueObject = UnsafeValue::value_object;

/// Deep equality; object field order and number representation are irrelevant
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

// ============================================================
// Utility functions
// ============================================================

/// Lowercase kind name used in messages ("number", "object", ...)
[[nodiscard]] JSONUNIT_API std::string_view kind_name(Kind kind) noexcept;

/// Render as JSON text
/// @param compact If true, no whitespace; otherwise pretty-printed with two-space indentation
[[nodiscard]] JSONUNIT_API std::string to_json(const Value& val, bool compact = true);

/// Writes compact JSON
JSONUNIT_API std::ostream& operator<<(std::ostream& os, const Value& val);

extern template class BasicValueObject<immer::default_memory_policy>;
extern template struct BasicValue<immer::default_memory_policy>;

} // namespace jsonunit
