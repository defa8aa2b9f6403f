// json_assert.cpp - Assertion facade over compare()

#include <jsonunit/json_assert.h>
#include <jsonunit/value_diff.h>

namespace jsonunit {

void assert_json_equals(const Value& expected, const Value& actual, const Options& options)
{
    assert_json_part_equals(expected, actual, std::string_view{}, options);
}

void assert_json_part_equals(const Value& expected,
                             const Value& full_json,
                             std::string_view path,
                             const Options& options)
{
    const DiffResult diff = compare(expected, full_json, path, options);
    if (!diff.similar()) {
        throw AssertionError(diff.to_string());
    }
}

void assert_json_structure_equals(const Value& expected, const Value& actual, const Options& options)
{
    assert_json_part_structure_equals(expected, actual, std::string_view{}, options);
}

void assert_json_part_structure_equals(const Value& expected,
                                       const Value& full_json,
                                       std::string_view path,
                                       const Options& options)
{
    const DiffResult diff = compare(expected, full_json, path, options);
    if (!diff.similar_structure()) {
        throw AssertionError(diff.structure_differences());
    }
}

} // namespace jsonunit
