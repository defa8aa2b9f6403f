// tolerance.h - Numeric equality under an optional absolute tolerance

#pragma once

#include <jsonunit/api.h>
#include <jsonunit/number.h>

#include <optional>

namespace jsonunit {

/// Maximum allowed absolute difference; std::nullopt requires an exact match
using Tolerance = std::optional<Number>;

/// @throws ConfigurationError if the tolerance is negative
JSONUNIT_API void validate_tolerance(const Tolerance& tolerance);

/// Without tolerance: exact mathematical equality (1.0 == 1).
/// With tolerance t: |expected - actual| <= t.
/// @throws ConfigurationError if the tolerance is negative
[[nodiscard]] JSONUNIT_API bool numbers_equal(const Number& expected,
                                              const Number& actual,
                                              const Tolerance& tolerance);

} // namespace jsonunit
