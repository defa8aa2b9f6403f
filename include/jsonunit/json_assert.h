// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_assert.h
/// @brief Assertions for comparing JSON values in tests.
///
/// The comparison ignores the order of object fields. Each assertion throws
/// AssertionError carrying the difference report when the documents differ.
/// Engine errors (bad path, bad options) propagate unchanged.
///
/// @code
///   assert_json_equals(Value::object({{"a", 1}}), actual);
///   assert_json_part_equals(Value{"y"}, document, "root.items[1].name");
/// @endcode

#pragma once

#include <jsonunit/api.h>
#include <jsonunit/options.h>
#include <jsonunit/value.h>

#include <stdexcept>
#include <string_view>

namespace jsonunit {

/// Raised by the assertion functions; deliberately not an engine Error
class JSONUNIT_API AssertionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Compares two documents
JSONUNIT_API void assert_json_equals(const Value& expected,
                                     const Value& actual,
                                     const Options& options = default_options());

/// Compares part of a document. Path has the format "root.array[0].value".
JSONUNIT_API void assert_json_part_equals(const Value& expected,
                                          const Value& full_json,
                                          std::string_view path,
                                          const Options& options = default_options());

/// Compares the structures of two documents
JSONUNIT_API void assert_json_structure_equals(const Value& expected,
                                               const Value& actual,
                                               const Options& options = default_options());

/// Compares the structure of part of a document
JSONUNIT_API void assert_json_part_structure_equals(const Value& expected,
                                                    const Value& full_json,
                                                    std::string_view path,
                                                    const Options& options = default_options());

} // namespace jsonunit
