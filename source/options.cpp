// options.cpp - Comparison options

#include <jsonunit/options.h>

#include <utility>

namespace jsonunit {

Options::Options()
    : ignore_marker_(default_ignore_marker)
{}

Options Options::with_ignore_marker(std::string marker) const
{
    Options copy = *this;
    copy.ignore_marker_ = std::move(marker);
    return copy;
}

Options Options::with_tolerance(const Number& tolerance) const
{
    validate_tolerance(tolerance);
    Options copy = *this;
    copy.tolerance_ = tolerance;
    return copy;
}

Options Options::with_tolerance(double tolerance) const
{
    return with_tolerance(number_from_double(tolerance));
}

Options Options::without_tolerance() const
{
    Options copy = *this;
    copy.tolerance_.reset();
    return copy;
}

Options Options::with_extra_fields(ExtraFieldPolicy policy) const
{
    Options copy = *this;
    copy.extra_fields_ = policy;
    return copy;
}

const Options& default_options()
{
    static const Options defaults;
    return defaults;
}

} // namespace jsonunit
