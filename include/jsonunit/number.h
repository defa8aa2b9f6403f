// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file number.h
/// @brief Arbitrary-precision decimal numbers held by Value.
///
/// JSON numbers are kept as exact rationals built from their decimal text,
/// so "1.0" and "1" compare equal, no digit is ever rounded away, and
/// tolerance arithmetic has no binary rounding error.

#pragma once

#include <jsonunit/config.h>
#include <jsonunit/api.h>

#include <boost/multiprecision/cpp_int.hpp>

#include <string>
#include <string_view>

namespace jsonunit {

using Number = boost::multiprecision::cpp_rational;

/// Largest accepted decimal exponent magnitude in number_from_string()
inline constexpr long max_decimal_exponent = 100000;

/// Parse a decimal literal ("1.005", "-2e10") exactly, whatever its length.
/// @throws std::runtime_error if the text is not a number or its exponent
///         exceeds max_decimal_exponent
[[nodiscard]] JSONUNIT_API Number number_from_string(std::string_view text);

/// Convert a double through its shortest round-trip decimal representation,
/// so 1.005 becomes exactly 1.005 rather than its binary approximation.
[[nodiscard]] JSONUNIT_API Number number_from_double(double value);

/// Plain decimal text for a Number ("1.005", "42", "-0.25"), no exponent.
/// A value with no finite decimal expansion renders as "p/q".
[[nodiscard]] JSONUNIT_API std::string number_to_string(const Number& value);

} // namespace jsonunit
