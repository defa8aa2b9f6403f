// test_diff.cpp - Tests for the difference collector and compare()
// Module 4: NodeComparator and DiffResult

#include <catch2/catch_all.hpp>
#include <jsonunit/errors.h>
#include <jsonunit/value.h>
#include <jsonunit/value_diff.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace jsonunit;

// ============================================================
// Helper Functions
// ============================================================

namespace {

Value ignore() {
    return Value{std::string{default_ignore_marker}};
}

Value create_order() {
    return Value::object({
        {"id", 1042},
        {"customer", Value::object({
            {"name", "Alice"},
            {"vip", true}
        })},
        {"lines", Value::array({
            Value::object({{"sku", "A-1"}, {"qty", 2}}),
            Value::object({{"sku", "B-7"}, {"qty", 1}})
        })},
        {"note", nullptr}
    });
}

std::vector<std::string> paths_of(const std::vector<Difference>& diffs) {
    std::vector<std::string> result;
    for (const auto& d : diffs) {
        result.push_back(d.path_string());
    }
    return result;
}

} // namespace

// ============================================================
// Basic scenarios
// ============================================================

TEST_CASE("compare ignores object field order", "[diff][object]") {
    auto expected = Value::object({{"a", 1}, {"b", 2}});
    auto actual = Value::object({{"b", 2}, {"a", 1}});

    auto result = compare(expected, actual);
    REQUIRE(result.similar());
    REQUIRE(result.similar_structure());
    REQUIRE(result.differences().empty());
}

TEST_CASE("compare reports extra fields", "[diff][object]") {
    auto expected = Value::object({{"a", 1}});
    auto actual = Value::object({{"a", 1}, {"b", 2}});

    SECTION("strict policy (default)") {
        auto result = compare(expected, actual);
        REQUIRE_FALSE(result.similar());
        REQUIRE(result.differences().size() == 1);

        const auto& d = result.differences()[0];
        REQUIRE(d.kind == Difference::Kind::ExtraField);
        REQUIRE(d.path_string() == ".b");
        REQUIRE(d.description == "Unexpected field with number 2.");
    }

    SECTION("lenient policy") {
        auto opts = default_options().with_extra_fields(ExtraFieldPolicy::Lenient);
        auto result = compare(expected, actual, opts);
        REQUIRE(result.similar());
        REQUIRE(result.similar_structure());
    }

    SECTION("lenient policy still reports missing fields") {
        auto opts = default_options().with_extra_fields(ExtraFieldPolicy::Lenient);
        auto result = compare(actual, expected, opts);
        REQUIRE(result.differences().size() == 1);
        REQUIRE(result.differences()[0].kind == Difference::Kind::MissingField);
        REQUIRE(result.differences()[0].description == "Missing field. Expected number 2.");
    }
}

TEST_CASE("compare with ignore marker", "[diff][ignore]") {
    SECTION("field value") {
        auto result = compare(Value::object({{"a", ignore()}}), Value::object({{"a", 42}}));
        REQUIRE(result.similar());
    }

    SECTION("against containers and null") {
        REQUIRE(compare(Value::object({{"a", ignore()}}),
                        Value::object({{"a", Value::object({{"deep", Value::array({1, 2})}})}})).similar());
        REQUIRE(compare(Value::object({{"a", ignore()}}), Value::object({{"a", nullptr}})).similar());
    }

    SECTION("at the root") {
        REQUIRE(compare(ignore(), create_order()).similar());
        REQUIRE(compare(ignore(), create_order()).similar_structure());
    }

    SECTION("inside arrays") {
        auto expected = Value::array({1, ignore(), 3});
        REQUIRE(compare(expected, Value::array({1, "anything", 3})).similar());
        REQUIRE_FALSE(compare(expected, Value::array({1, "anything", 4})).similar());
    }

    SECTION("deeply nested") {
        auto expected = Value::object({
            {"a", Value::object({{"b", Value::array({Value::object({{"c", ignore()}})})}})}
        });
        auto actual = Value::object({
            {"a", Value::object({{"b", Value::array({Value::object({{"c", Value::array({})}})})}})}
        });
        REQUIRE(compare(expected, actual).similar());
    }

    SECTION("marker on the actual side is plain text") {
        auto result = compare(Value::object({{"a", 42}}), Value::object({{"a", ignore()}}));
        REQUIRE_FALSE(result.similar());
        REQUIRE(result.differences()[0].kind == Difference::Kind::TypeMismatch);
    }

    SECTION("field must still be present") {
        auto result = compare(Value::object({{"a", ignore()}}), Value::object({}));
        REQUIRE(result.differences().size() == 1);
        REQUIRE(result.differences()[0].kind == Difference::Kind::MissingField);
    }

    SECTION("custom marker") {
        auto opts = default_options().with_ignore_marker("*");
        REQUIRE(compare(Value::object({{"a", "*"}}), Value::object({{"a", 1}}), opts).similar());
        REQUIRE_FALSE(compare(Value::object({{"a", ignore()}}), Value::object({{"a", 1}}), opts).similar());
    }
}

TEST_CASE("compare numbers with tolerance", "[diff][tolerance]") {
    auto expected = Value::object({{"a", 1.0}});
    auto opts = default_options().with_tolerance(0.01);

    REQUIRE(compare(expected, Value::object({{"a", 1.005}}), opts).similar());
    REQUIRE(compare(expected, Value::object({{"a", 1.01}}), opts).similar());

    auto result = compare(expected, Value::object({{"a", 1.02}}), opts);
    REQUIRE_FALSE(result.similar());
    REQUIRE(result.differences()[0].kind == Difference::Kind::ValueMismatch);
    REQUIRE(result.differences()[0].description == "Different value. Expected 1, got 1.02 (tolerance 0.01).");

    SECTION("without tolerance numbers must be equal") {
        REQUIRE_FALSE(compare(expected, Value::object({{"a", 1.005}})).similar());
        REQUIRE(compare(expected, Value::object({{"a", 1}})).similar());
    }
}

TEST_CASE("compare part of a document", "[diff][path]") {
    auto document = Value::object({
        {"root", Value::object({
            {"items", Value::array({
                Value::object({{"name", "x"}}),
                Value::object({{"name", "y"}})
            })}
        })}
    });

    SECTION("leaf") {
        auto result = compare(Value{"y"}, document, "root.items[1].name");
        REQUIRE(result.similar());
        REQUIRE(path_to_string(result.start_path()) == "root.items[1].name");
    }

    SECTION("subtree") {
        REQUIRE(compare(Value::object({{"name", "x"}}), document, "root.items[0]").similar());
    }

    SECTION("mismatch paths are relative to the start node") {
        auto result = compare(Value::object({{"name", "z"}}), document, "root.items[0]");
        REQUIRE(paths_of(result.differences()) == std::vector<std::string>{".name"});
    }

    SECTION("empty path compares the whole document") {
        REQUIRE(compare(document, document, "").similar());
    }

    SECTION("bad syntax") {
        REQUIRE_THROWS_AS(compare(Value{"y"}, document, "root..items"), PathSyntaxError);
    }

    SECTION("missing node") {
        REQUIRE_THROWS_AS(compare(Value{"y"}, document, "root.items[2].name"), PathNotFoundError);
        REQUIRE_THROWS_AS(compare(Value{"y"}, document, "root.missing"), PathNotFoundError);
    }
}

// ============================================================
// Structure mode
// ============================================================

TEST_CASE("structure comparison ignores leaf values", "[diff][structure]") {
    auto expected = Value::object({{"a", 1}, {"b", Value::array({1, 2})}});
    auto actual = Value::object({{"a", 99}, {"b", Value::array({5, 6})}});

    auto result = compare(expected, actual);
    REQUIRE(result.similar_structure());
    REQUIRE_FALSE(result.similar());
    REQUIRE(result.differences().size() == 3);
}

TEST_CASE("structure comparison leaf kinds", "[diff][structure]") {
    SECTION("different leaf kinds match") {
        auto result = compare(Value::object({{"a", 1}}), Value::object({{"a", "one"}}));
        REQUIRE(result.similar_structure());
        REQUIRE_FALSE(result.similar());
        REQUIRE(result.differences()[0].kind == Difference::Kind::TypeMismatch);
    }

    SECTION("null against leaf matches") {
        REQUIRE(compare(Value::object({{"a", nullptr}}), Value::object({{"a", true}})).similar_structure());
    }

    SECTION("leaf against container differs") {
        auto result = compare(Value::object({{"a", 1}}), Value::object({{"a", Value::array({1})}}));
        REQUIRE_FALSE(result.similar_structure());
        REQUIRE(result.structure_difference_list()[0].kind == Difference::Kind::TypeMismatch);
    }

    SECTION("object against array differs") {
        REQUIRE_FALSE(compare(Value::object({}), Value::array({})).similar_structure());
    }

    SECTION("missing keys differ") {
        auto result = compare(Value::object({{"a", 1}, {"b", 2}}), Value::object({{"a", 5}}));
        REQUIRE_FALSE(result.similar_structure());
        REQUIRE(paths_of(result.structure_difference_list()) == std::vector<std::string>{".b"});
    }
}

// ============================================================
// Arrays
// ============================================================

TEST_CASE("arrays are order sensitive", "[diff][array]") {
    auto expected = Value::array({1, 2, 3});
    REQUIRE(compare(expected, Value::array({1, 2, 3})).similar());

    auto result = compare(expected, Value::array({2, 1, 3}));
    REQUIRE_FALSE(result.similar());
    REQUIRE(paths_of(result.differences()) == std::vector<std::string>{"[0]", "[1]"});
}

TEST_CASE("arrays of different length", "[diff][array]") {
    auto expected = Value::object({{"list", Value::array({1, 2, 3})}});
    auto actual = Value::object({{"list", Value::array({1, 5})}});

    auto result = compare(expected, actual);

    SECTION("length reported once, common prefix compared") {
        const auto& diffs = result.differences();
        REQUIRE(diffs.size() == 2);
        REQUIRE(diffs[0].kind == Difference::Kind::ArrayLength);
        REQUIRE(diffs[0].path_string() == ".list");
        REQUIRE(diffs[0].description == "Array has different length. Expected 3, got 2.");
        REQUIRE(diffs[1].kind == Difference::Kind::ValueMismatch);
        REQUIRE(diffs[1].path_string() == ".list[1]");
    }

    SECTION("length is structural") {
        REQUIRE_FALSE(result.similar_structure());
        REQUIRE(result.structure_difference_list().size() == 1);
        REQUIRE(result.structure_difference_list()[0].kind == Difference::Kind::ArrayLength);
    }
}

// ============================================================
// Properties
// ============================================================

TEST_CASE("compare is reflexive", "[diff][property]") {
    auto order = create_order();
    auto result = compare(order, order);
    REQUIRE(result.similar());
    REQUIRE(result.similar_structure());
}

TEST_CASE("compare does not depend on actual field order", "[diff][property]") {
    auto reordered = Value::object({
        {"note", nullptr},
        {"lines", Value::array({
            Value::object({{"qty", 2}, {"sku", "A-1"}}),
            Value::object({{"qty", 1}, {"sku", "B-7"}})
        })},
        {"customer", Value::object({{"vip", true}, {"name", "Alice"}})},
        {"id", 1042}
    });
    REQUIRE(compare(create_order(), reordered).similar());
}

TEST_CASE("differences are reported in discovery order", "[diff][order]") {
    auto expected = Value::object({
        {"a", 1},
        {"b", Value::object({{"c", 1}})},
        {"d", 1}
    });
    auto actual = Value::object({
        {"e", 1},
        {"b", Value::object({{"c", 2}})},
        {"a", 2}
    });

    auto result = compare(expected, actual);
    REQUIRE(paths_of(result.differences()) == std::vector<std::string>{".a", ".b.c", ".d", ".e"});

    const auto& diffs = result.differences();
    REQUIRE(diffs[0].kind == Difference::Kind::ValueMismatch);
    REQUIRE(diffs[1].kind == Difference::Kind::ValueMismatch);
    REQUIRE(diffs[2].kind == Difference::Kind::MissingField);
    REQUIRE(diffs[3].kind == Difference::Kind::ExtraField);
}

TEST_CASE("type mismatch description", "[diff][type]") {
    auto result = compare(Value::object({{"a", 1}}), Value::object({{"a", "1"}}));
    REQUIRE(result.differences().size() == 1);
    REQUIRE(result.differences()[0].description == "Different type. Expected number 1, got text \"1\".");
}

// ============================================================
// Reports
// ============================================================

TEST_CASE("DiffResult reports", "[diff][report]") {
    SECTION("similar") {
        auto result = compare(Value{1}, Value{1});
        REQUIRE(result.to_string() == "JSON documents are similar.");
        REQUIRE(result.structure_differences() == "JSON documents are similar.");
    }

    SECTION("one line per difference") {
        auto result = compare(Value::object({{"a", 1}, {"b", true}}),
                              Value::object({{"a", 2}, {"b", false}}));
        REQUIRE(result.to_string() ==
                "JSON documents are different:\n"
                ".a: Different value. Expected 1, got 2.\n"
                ".b: Different value. Expected true, got false.\n");
    }

    SECTION("root difference and start path") {
        auto document = Value::object({{"root", Value::object({{"name", "y"}})}});
        auto result = compare(Value{"x"}, document, "root.name");
        REQUIRE(result.to_string() ==
                "JSON documents are different (compared at \"root.name\"):\n"
                "<root>: Different value. Expected \"x\", got \"y\".\n");
    }

    SECTION("structure report") {
        auto result = compare(Value::array({1}), Value::array({1, 2}));
        REQUIRE(result.structure_differences() ==
                "JSON documents are different:\n"
                "<root>: Array has different length. Expected 1, got 2.\n");
    }
}

TEST_CASE("difference_kind_name", "[diff][kind]") {
    REQUIRE(difference_kind_name(Difference::Kind::TypeMismatch) == "TypeMismatch");
    REQUIRE(difference_kind_name(Difference::Kind::MissingField) == "MissingField");
    REQUIRE(difference_kind_name(Difference::Kind::ExtraField) == "ExtraField");
    REQUIRE(difference_kind_name(Difference::Kind::ArrayLength) == "ArrayLength");
    REQUIRE(difference_kind_name(Difference::Kind::ValueMismatch) == "ValueMismatch");
}

// ============================================================
// DifferenceCollector
// ============================================================

TEST_CASE("DifferenceCollector", "[diff][collector]") {
    DifferenceCollector collector{ComparisonMode::Value, default_options()};
    REQUIRE(collector.mode() == ComparisonMode::Value);
    REQUIRE_FALSE(collector.has_changes());

    collector.diff(Value::array({1}), Value::array({2}));
    REQUIRE(collector.has_changes());
    REQUIRE(collector.get_diffs().size() == 1);

    SECTION("diff replaces previous results") {
        collector.diff(Value{1}, Value{1});
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("take_diffs empties the collector") {
        auto diffs = collector.take_diffs();
        REQUIRE(diffs.size() == 1);
        REQUIRE_FALSE(collector.has_changes());
    }

    SECTION("clear") {
        collector.clear();
        REQUIRE(collector.get_diffs().empty());
    }
}

// ============================================================
// Errors and concurrency
// ============================================================

TEST_CASE("negative tolerance is rejected while building options", "[diff][error]") {
    const Options base = default_options().with_tolerance(0.5);

    REQUIRE_THROWS_AS(base.with_tolerance(-1.0), ConfigurationError);
    REQUIRE_THROWS_AS(base.with_tolerance(number_from_string("-0.0000001")), ConfigurationError);

    // The failed call leaves the original options usable
    REQUIRE(*base.tolerance() == number_from_string("0.5"));
    REQUIRE(compare(Value{1}, Value{1.4}, base).similar());
}

TEST_CASE("concurrent comparisons are independent", "[diff][thread]") {
    const Value expected = create_order();
    const int num_threads = 8;
    const int compares_per_thread = 50;

    std::atomic<int> similar_count{0};
    std::atomic<int> different_count{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            auto opts = default_options().with_tolerance(t % 2 == 0 ? 0.5 : 0.0);
            for (int i = 0; i < compares_per_thread; ++i) {
                auto actual = Value::object({
                    {"id", 1042.25},
                    {"customer", Value::object({{"name", "Alice"}, {"vip", true}})},
                    {"lines", *expected.find("lines")},
                    {"note", nullptr}
                });
                if (compare(expected, actual, opts).similar()) {
                    ++similar_count;
                } else {
                    ++different_count;
                }
            }
        });
    }

    for (auto& th : threads) {
        th.join();
    }

    REQUIRE(similar_count.load() == num_threads / 2 * compares_per_thread);
    REQUIRE(different_count.load() == num_threads / 2 * compares_per_thread);
}
