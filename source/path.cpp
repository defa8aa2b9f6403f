// path.cpp
// Path expression parsing, rendering and resolution

#include <jsonunit/path.h>
#include <jsonunit/errors.h>
#include <jsonunit/log.h>

#include <charconv>
#include <string>
#include <type_traits>
#include <system_error>

namespace jsonunit {

// ============================================================
// Path expression parsing
// ============================================================

namespace {

bool is_identifier_start(char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_identifier_char(char c)
{
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

class PathParser {
public:
    explicit PathParser(std::string_view expression) : expression_(expression) {}

    Path parse() {
        Path path;
        if (expression_.empty()) {
            return path;
        }

        path.push_back(parse_identifier());
        while (pos_ < expression_.size()) {
            const char c = expression_[pos_];
            if (c == '.') {
                ++pos_;
                path.push_back(parse_identifier());
            } else if (c == '[') {
                ++pos_;
                path.push_back(parse_index());
            } else if (c == ']') {
                fail("unbalanced ']'");
            } else {
                fail(std::string("unexpected character '") + c + "'");
            }
        }
        return path;
    }

private:
    std::string_view expression_;
    std::size_t pos_ = 0;

    [[noreturn]] void fail(const std::string& reason) const {
        throw PathSyntaxError(std::string(expression_), pos_, reason);
    }

    std::string parse_identifier() {
        if (pos_ >= expression_.size() || expression_[pos_] == '.' || expression_[pos_] == '[') {
            fail("empty segment");
        }
        if (!is_identifier_start(expression_[pos_])) {
            fail(std::string("invalid character '") + expression_[pos_] + "' at start of segment");
        }
        const std::size_t start = pos_;
        while (pos_ < expression_.size() && is_identifier_char(expression_[pos_])) {
            ++pos_;
        }
        return std::string(expression_.substr(start, pos_ - start));
    }

    std::size_t parse_index() {
        const std::size_t start = pos_;
        while (pos_ < expression_.size() && is_digit(expression_[pos_])) {
            ++pos_;
        }
        if (pos_ == start) {
            if (pos_ >= expression_.size()) fail("unbalanced '['");
            if (expression_[pos_] == ']') fail("empty index");
            fail("non-numeric index");
        }
        if (pos_ >= expression_.size()) {
            fail("unbalanced '['");
        }
        if (expression_[pos_] != ']') {
            fail("non-numeric index");
        }

        std::size_t index = 0;
        const auto [ptr, ec] = std::from_chars(expression_.data() + start, expression_.data() + pos_, index);
        if (ec != std::errc{}) {
            pos_ = start;
            fail("index out of range");
        }
        ++pos_;  // ']'
        return index;
    }
};

std::string element_to_string(const PathElement& elem, bool leading_dot)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return leading_dot ? "." + *key : *key;
    }
    return "[" + std::to_string(std::get<std::size_t>(elem)) + "]";
}

[[noreturn]] void throw_not_found(const Path& path, std::size_t failed_at, const std::string& reason)
{
    const std::string full = path_to_string(path);
    const std::string segment = element_to_string(path[failed_at], false);
    detail::log_path_error("resolve", full, "not found at " + segment + ": " + reason);
    throw PathNotFoundError(full, segment, reason);
}

} // anonymous namespace

Path parse_path(std::string_view expression)
{
    return PathParser{expression}.parse();
}

std::string path_to_string(const Path& path)
{
    std::string result;
    for (std::size_t i = 0; i < path.size(); ++i) {
        result += element_to_string(path[i], i > 0);
    }
    return result;
}

std::string path_to_relative_string(const Path& path)
{
    std::string result;
    for (const auto& elem : path) {
        result += element_to_string(elem, true);
    }
    return result;
}

// ============================================================
// Resolution
// ============================================================

Value resolve(const Value& document, const Path& path)
{
    const Value* current = &document;

    for (std::size_t i = 0; i < path.size(); ++i) {
        const Value* next = std::visit([&](const auto& segment) -> const Value* {
            using T = std::decay_t<decltype(segment)>;
            if constexpr (std::is_same_v<T, std::string>) {
                if (!current->is_object()) {
                    throw_not_found(path, i, "expected an object but found " +
                                             std::string(kind_name(current->kind())));
                }
                if (auto* found = current->find(segment)) {
                    return found;
                }
                throw_not_found(path, i, "no such field");
            } else {
                if (!current->is_array()) {
                    throw_not_found(path, i, "expected an array but found " +
                                             std::string(kind_name(current->kind())));
                }
                if (auto* found = current->find(segment)) {
                    return found;
                }
                throw_not_found(path, i, "index out of range (size " +
                                         std::to_string(current->size()) + ")");
            }
        }, path[i]);
        current = next;
    }

    return *current;
}

Value resolve(const Value& document, std::string_view expression)
{
    return resolve(document, parse_path(expression));
}

} // namespace jsonunit
