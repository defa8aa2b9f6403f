// value_diff.cpp - DifferenceCollector, DiffResult and compare()

#include <jsonunit/value_diff.h>
#include <jsonunit/tolerance.h>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace jsonunit {

std::string_view difference_kind_name(Difference::Kind kind) noexcept
{
    switch (kind) {
        case Difference::Kind::TypeMismatch:  return "TypeMismatch";
        case Difference::Kind::MissingField:  return "MissingField";
        case Difference::Kind::ExtraField:    return "ExtraField";
        case Difference::Kind::ArrayLength:   return "ArrayLength";
        case Difference::Kind::ValueMismatch: return "ValueMismatch";
    }
    return "Unknown";
}

namespace {

/// "number 1", "text \"x\"", "object {\"a\":1}"
std::string describe(const Value& val)
{
    return std::string(kind_name(val.kind())) + " " + to_json(val);
}

} // anonymous namespace

// ============================================================
// DifferenceCollector Implementation
// ============================================================

DifferenceCollector::DifferenceCollector(ComparisonMode mode, Options options)
    : mode_(mode)
    , options_(std::move(options))
{}

void DifferenceCollector::diff(const Value& expected, const Value& actual)
{
    diffs_.clear();

    Path root_path;
    root_path.reserve(16);  // Typical nesting depth
    diff_value(expected, actual, root_path);
}

std::vector<Difference> DifferenceCollector::take_diffs()
{
    std::vector<Difference> result = std::move(diffs_);
    diffs_.clear();
    return result;
}

void DifferenceCollector::clear()
{
    diffs_.clear();
}

bool DifferenceCollector::is_ignored(const Value& expected) const
{
    auto* text = expected.get_if<std::string>();
    return text && *text == options_.ignore_marker();
}

void DifferenceCollector::diff_value(const Value& expected, const Value& actual, Path& current_path)
{
    // The marker matches anything, so it is checked before kinds or values
    if (is_ignored(expected)) {
        return;
    }

    const Kind expected_kind = expected.kind();
    const Kind actual_kind = actual.kind();
    if (expected_kind != actual_kind) {
        if (mode_ == ComparisonMode::Structure && !expected.is_container() && !actual.is_container()) {
            return;
        }
        diffs_.emplace_back(Difference::Kind::TypeMismatch, current_path,
                            "Different type. Expected " + describe(expected) +
                            ", got " + describe(actual) + ".");
        return;
    }

    std::visit([&](const auto& expected_arg) {
        using T = std::decay_t<decltype(expected_arg)>;

        if constexpr (std::is_same_v<T, ValueObject>) {
            diff_object(expected_arg, std::get<ValueObject>(actual.data), current_path);
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            diff_array(expected_arg, std::get<ValueVector>(actual.data), current_path);
        } else {
            diff_leaf(expected, actual, current_path);
        }
    }, expected.data);
}

void DifferenceCollector::diff_object(const ValueObject& expected, const ValueObject& actual, Path& current_path)
{
    for (const auto& key : expected.keys()) {
        current_path.push_back(key);
        const Value& expected_field = expected.find(key)->get();
        if (auto* actual_field = actual.find(key)) {
            diff_value(expected_field, actual_field->get(), current_path);
        } else {
            diffs_.emplace_back(Difference::Kind::MissingField, current_path,
                                "Missing field. Expected " + describe(expected_field) + ".");
        }
        current_path.pop_back();
    }

    if (options_.extra_fields() == ExtraFieldPolicy::Lenient) {
        return;
    }

    for (const auto& key : actual.keys()) {
        if (expected.contains(key)) {
            continue;
        }
        current_path.push_back(key);
        diffs_.emplace_back(Difference::Kind::ExtraField, current_path,
                            "Unexpected field with " + describe(actual.find(key)->get()) + ".");
        current_path.pop_back();
    }
}

void DifferenceCollector::diff_array(const ValueVector& expected, const ValueVector& actual, Path& current_path)
{
    const std::size_t expected_size = expected.size();
    const std::size_t actual_size = actual.size();

    if (expected_size != actual_size) {
        diffs_.emplace_back(Difference::Kind::ArrayLength, current_path,
                            "Array has different length. Expected " + std::to_string(expected_size) +
                            ", got " + std::to_string(actual_size) + ".");
    }

    // Reported once above; elements are still compared up to the shorter length
    const std::size_t common_size = std::min(expected_size, actual_size);
    for (std::size_t i = 0; i < common_size; ++i) {
        current_path.push_back(i);
        diff_value(*expected[i], *actual[i], current_path);
        current_path.pop_back();
    }
}

void DifferenceCollector::diff_leaf(const Value& expected, const Value& actual, Path& current_path)
{
    if (mode_ == ComparisonMode::Structure) {
        return;
    }

    if (auto* expected_number = expected.get_number()) {
        const Number& actual_number = *actual.get_number();
        if (numbers_equal(*expected_number, actual_number, options_.tolerance())) {
            return;
        }
        std::string description = "Different value. Expected " + number_to_string(*expected_number) +
                                  ", got " + number_to_string(actual_number);
        if (options_.tolerance()) {
            description += " (tolerance " + number_to_string(*options_.tolerance()) + ")";
        }
        diffs_.emplace_back(Difference::Kind::ValueMismatch, current_path, description + ".");
        return;
    }

    if (expected != actual) {
        diffs_.emplace_back(Difference::Kind::ValueMismatch, current_path,
                            "Different value. Expected " + to_json(expected) +
                            ", got " + to_json(actual) + ".");
    }
}

// ============================================================
// DiffResult Implementation
// ============================================================

namespace {

std::string render_report(const Path& start_path, const std::vector<Difference>& diffs)
{
    if (diffs.empty()) {
        return "JSON documents are similar.";
    }

    std::string result = "JSON documents are different";
    if (!start_path.empty()) {
        result += " (compared at \"" + path_to_string(start_path) + "\")";
    }
    result += ":\n";

    for (const auto& d : diffs) {
        const std::string path = d.path_string();
        result += path.empty() ? "<root>" : path;
        result += ": ";
        result += d.description;
        result += '\n';
    }
    return result;
}

} // anonymous namespace

DiffResult::DiffResult(Path start_path,
                       std::vector<Difference> value_diffs,
                       std::vector<Difference> structure_diffs)
    : start_path_(std::move(start_path))
    , value_diffs_(std::move(value_diffs))
    , structure_diffs_(std::move(structure_diffs))
{}

std::string DiffResult::to_string() const
{
    return render_report(start_path_, value_diffs_);
}

std::string DiffResult::structure_differences() const
{
    return render_report(start_path_, structure_diffs_);
}

// ============================================================
// compare()
// ============================================================

DiffResult compare(const Value& expected,
                   const Value& document,
                   std::string_view path,
                   const Options& options)
{
    Path start_path = parse_path(path);
    const Value actual = resolve(document, start_path);

    DifferenceCollector value_collector{ComparisonMode::Value, options};
    value_collector.diff(expected, actual);

    DifferenceCollector structure_collector{ComparisonMode::Structure, options};
    structure_collector.diff(expected, actual);

    return DiffResult{std::move(start_path), value_collector.take_diffs(), structure_collector.take_diffs()};
}

DiffResult compare(const Value& expected, const Value& actual, const Options& options)
{
    return compare(expected, actual, std::string_view{}, options);
}

} // namespace jsonunit
