// number.cpp - Decimal number conversions

#include <jsonunit/number.h>

#include <algorithm>
#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace jsonunit {

namespace {

using boost::multiprecision::cpp_int;

[[noreturn]] void throw_malformed(std::string_view text, const std::string& reason)
{
    throw std::runtime_error("invalid number \"" + std::string(text) + "\": " + reason);
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

cpp_int power_of_ten(unsigned exponent)
{
    return boost::multiprecision::pow(cpp_int(10), exponent);
}

} // anonymous namespace

Number number_from_string(std::string_view text)
{
    std::size_t pos = 0;
    bool negative = false;
    if (pos < text.size() && (text[pos] == '-' || text[pos] == '+')) {
        negative = text[pos] == '-';
        ++pos;
    }

    // Significand digits without the decimal point
    std::string digits;
    while (pos < text.size() && is_digit(text[pos])) {
        digits += text[pos++];
    }
    long fraction_digits = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        while (pos < text.size() && is_digit(text[pos])) {
            digits += text[pos++];
            ++fraction_digits;
        }
    }
    if (digits.empty()) {
        throw_malformed(text, "no digits");
    }

    long exponent = 0;
    if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
        ++pos;
        if (pos < text.size() && text[pos] == '+') {
            ++pos;
        }
        const char* first = text.data() + pos;
        const char* last = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(first, last, exponent);
        if (ec == std::errc::result_out_of_range) {
            throw_malformed(text, "exponent out of range");
        }
        if (ec != std::errc{} || ptr != last) {
            throw_malformed(text, "malformed exponent");
        }
        pos = text.size();
    }
    if (pos != text.size()) {
        throw_malformed(text, std::string("unexpected character '") + text[pos] + "'");
    }
    if (exponent > max_decimal_exponent || exponent < -max_decimal_exponent) {
        throw_malformed(text, "exponent out of range");
    }

    // cpp_int reads a leading '0' as an octal prefix
    digits.erase(0, std::min(digits.find_first_not_of('0'), digits.size()));
    const cpp_int significand = digits.empty() ? cpp_int(0) : cpp_int(digits.c_str());

    // value = significand * 10^scale
    const long scale = exponent - fraction_digits;
    Number result;
    if (scale >= 0) {
        result = Number{cpp_int(significand * power_of_ten(static_cast<unsigned>(scale)))};
    } else {
        result = Number{significand} / Number{power_of_ten(static_cast<unsigned>(-scale))};
    }
    return negative ? Number{-result} : result;
}

Number number_from_double(double value)
{
    char buffer[64];
    const auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    if (ec != std::errc{}) {
        throw std::runtime_error("number_from_double: cannot format value");
    }
    // nan and inf come out as text number_from_string() rejects
    return number_from_string(std::string_view(buffer, static_cast<std::size_t>(end - buffer)));
}

std::string number_to_string(const Number& value)
{
    const cpp_int numerator = boost::multiprecision::numerator(value);
    const cpp_int denominator = boost::multiprecision::denominator(value);

    // A finite decimal expansion exists only when the reduced denominator is 2^a * 5^b
    unsigned twos = 0;
    unsigned fives = 0;
    cpp_int rest = denominator;
    while (rest % 2 == 0) {
        rest /= 2;
        ++twos;
    }
    while (rest % 5 == 0) {
        rest /= 5;
        ++fives;
    }
    if (rest != 1) {
        return value.str();
    }

    const unsigned scale = std::max(twos, fives);
    const cpp_int magnitude = numerator < 0 ? cpp_int(-numerator) : numerator;
    std::string digits = cpp_int(magnitude * power_of_ten(scale) / denominator).str();
    if (scale > 0) {
        if (digits.size() <= scale) {
            digits.insert(0, scale + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - scale, 1, '.');
    }
    return numerator < 0 ? "-" + digits : digits;
}

} // namespace jsonunit
