// tolerance.cpp - Numeric comparison with optional tolerance

#include <jsonunit/tolerance.h>
#include <jsonunit/errors.h>
#include <jsonunit/log.h>

#include <string>

namespace jsonunit {

void validate_tolerance(const Tolerance& tolerance)
{
    if (tolerance && *tolerance < 0) {
        const std::string message = "tolerance must not be negative, got " + number_to_string(*tolerance);
        detail::log_config_error("validate_tolerance", message);
        throw ConfigurationError(message);
    }
}

bool numbers_equal(const Number& expected, const Number& actual, const Tolerance& tolerance)
{
    validate_tolerance(tolerance);

    if (!tolerance) {
        return expected == actual;
    }
    const Number difference = expected - actual;
    return (difference < 0 ? Number{-difference} : difference) <= *tolerance;
}

} // namespace jsonunit
