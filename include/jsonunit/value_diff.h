// value_diff.h - Comparison of expected and actual Value trees

#pragma once

#include <jsonunit/api.h>
#include <jsonunit/options.h>
#include <jsonunit/path.h>
#include <jsonunit/value.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace jsonunit {

struct Difference {
    enum class Kind : std::uint8_t {
        TypeMismatch,   ///< Nodes of different JSON kinds
        MissingField,   ///< Field present in expected only
        ExtraField,     ///< Field present in actual only
        ArrayLength,    ///< Arrays of different length
        ValueMismatch   ///< Leaves of the same kind with different values
    };

    Kind kind;
    Path path;                  // Relative to the comparison's starting node
    std::string description;

    Difference(Kind k, const Path& p, std::string d)
        : kind(k), path(p), description(std::move(d)) {}

    /// ".a.b[0]"; the starting node itself is ""
    [[nodiscard]] std::string path_string() const { return path_to_relative_string(path); }
};

[[nodiscard]] JSONUNIT_API std::string_view difference_kind_name(Difference::Kind kind) noexcept;

// ============================================================
// DifferenceCollector
//
// Walks expected and actual depth-first, pre-order, and records one
// Difference per mismatch. Objects are visited in expected's key order,
// followed by fields only the actual object has. Arrays are compared by
// index. Content mismatches never throw.
// ============================================================

class JSONUNIT_API DifferenceCollector {
public:
    DifferenceCollector(ComparisonMode mode, Options options);

    /// Compare and replace the collected differences
    void diff(const Value& expected, const Value& actual);

    [[nodiscard]] const std::vector<Difference>& get_diffs() const { return diffs_; }

    /// Move the collected differences out, leaving the collector empty
    [[nodiscard]] std::vector<Difference> take_diffs();

    void clear();
    [[nodiscard]] bool has_changes() const { return !diffs_.empty(); }
    [[nodiscard]] ComparisonMode mode() const { return mode_; }

private:
    std::vector<Difference> diffs_;
    ComparisonMode mode_;
    Options options_;

    // Path is passed by reference and extended with push_back/pop_back
    void diff_value(const Value& expected, const Value& actual, Path& current_path);
    void diff_object(const ValueObject& expected, const ValueObject& actual, Path& current_path);
    void diff_array(const ValueVector& expected, const ValueVector& actual, Path& current_path);
    void diff_leaf(const Value& expected, const Value& actual, Path& current_path);

    [[nodiscard]] bool is_ignored(const Value& expected) const;
};

// ============================================================
// DiffResult - outcome of one comparison call
//
// Holds the differences found in both comparison modes so a single
// result answers similar() and similar_structure().
// ============================================================

class JSONUNIT_API DiffResult {
public:
    DiffResult(Path start_path,
               std::vector<Difference> value_diffs,
               std::vector<Difference> structure_diffs);

    /// No differences in Value mode
    [[nodiscard]] bool similar() const noexcept { return value_diffs_.empty(); }

    /// No differences in Structure mode
    [[nodiscard]] bool similar_structure() const noexcept { return structure_diffs_.empty(); }

    [[nodiscard]] const std::vector<Difference>& differences() const noexcept { return value_diffs_; }
    [[nodiscard]] const std::vector<Difference>& structure_difference_list() const noexcept { return structure_diffs_; }

    /// Path the actual node was resolved from (empty for the whole document)
    [[nodiscard]] const Path& start_path() const noexcept { return start_path_; }

    /// Value-mode report, one "<path>: <description>" line per difference
    [[nodiscard]] std::string to_string() const;

    /// Structure-mode report in the same format
    [[nodiscard]] std::string structure_differences() const;

private:
    Path start_path_;
    std::vector<Difference> value_diffs_;
    std::vector<Difference> structure_diffs_;
};

/// Compare expected against the node of document addressed by path.
/// @throws PathSyntaxError, PathNotFoundError
[[nodiscard]] JSONUNIT_API DiffResult compare(const Value& expected,
                                              const Value& document,
                                              std::string_view path,
                                              const Options& options = default_options());

/// Compare expected against the whole actual document
[[nodiscard]] JSONUNIT_API DiffResult compare(const Value& expected,
                                              const Value& actual,
                                              const Options& options = default_options());

} // namespace jsonunit
