// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file options.h
/// @brief Immutable comparison configuration.
///
/// Options are a value: every with_*() call returns a modified copy, so a
/// comparison always works on the snapshot it was handed.
///
/// @code
///   auto opts = default_options()
///       .with_tolerance(0.01)
///       .with_extra_fields(ExtraFieldPolicy::Lenient);
///   auto result = compare(expected, actual, opts);
/// @endcode

#pragma once

#include <jsonunit/api.h>
#include <jsonunit/number.h>
#include <jsonunit/tolerance.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace jsonunit {

enum class ComparisonMode : std::uint8_t {
    Value,      ///< Full equality
    Structure   ///< Shape and key presence only, leaf values ignored
};

/// What to do with fields present only in the actual document
enum class ExtraFieldPolicy : std::uint8_t {
    Strict,     ///< Report each as an ExtraField difference
    Lenient     ///< Ignore them
};

inline constexpr std::string_view default_ignore_marker = "${json-unit.ignore}";

class JSONUNIT_API Options {
public:
    Options();

    [[nodiscard]] const std::string& ignore_marker() const noexcept { return ignore_marker_; }
    [[nodiscard]] const Tolerance& tolerance() const noexcept { return tolerance_; }
    [[nodiscard]] ExtraFieldPolicy extra_fields() const noexcept { return extra_fields_; }

    [[nodiscard]] Options with_ignore_marker(std::string marker) const;

    /// @throws ConfigurationError if tolerance is negative
    [[nodiscard]] Options with_tolerance(const Number& tolerance) const;

    /// Converted through the shortest decimal form, so 0.01 is exactly 0.01
    /// @throws ConfigurationError if tolerance is negative
    [[nodiscard]] Options with_tolerance(double tolerance) const;

    [[nodiscard]] Options without_tolerance() const;
    [[nodiscard]] Options with_extra_fields(ExtraFieldPolicy policy) const;


private:
    std::string ignore_marker_;
    Tolerance tolerance_;
    ExtraFieldPolicy extra_fields_ = ExtraFieldPolicy::Strict;
};

/// Process-wide defaults: marker "${json-unit.ignore}", exact numbers, strict
/// extra fields. Built once on first use and read-only afterwards.
[[nodiscard]] JSONUNIT_API const Options& default_options();

} // namespace jsonunit
