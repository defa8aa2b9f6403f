// value.cpp - Value type utilities and JSON rendering

#include <jsonunit/value.h>

#include <cstdio>
#include <ostream>
#include <sstream>
#include <string>
#include <type_traits>

namespace jsonunit {

std::string_view kind_name(Kind kind) noexcept
{
    switch (kind) {
        case Kind::Null:    return "null";
        case Kind::Boolean: return "boolean";
        case Kind::Number:  return "number";
        case Kind::Text:    return "text";
        case Kind::Array:   return "array";
        case Kind::Object:  return "object";
    }
    return "unknown";
}

// ============================================================
// JSON Rendering
// ============================================================

namespace {

std::string json_escape_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    // Control characters as \uXXXX
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level) {
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, Value::boxed_number>) {
            oss << number_to_string(arg.get());
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueObject>) {
            if (arg.empty()) {
                oss << "{}";
            } else {
                oss << "{" << newline;
                bool first = true;
                for (const auto& key : arg.keys()) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent << "\"" << json_escape_string(key) << "\":" << space_after_colon;
                    to_json_impl(arg.find(key)->get(), oss, compact, indent_level + 1);
                }
                oss << newline << indent << "}";
            }
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
            } else {
                oss << "[" << newline;
                bool first = true;
                for (const auto& v : arg) {
                    if (!first) oss << "," << newline;
                    first = false;
                    oss << child_indent;
                    to_json_impl(*v, oss, compact, indent_level + 1);
                }
                oss << newline << indent << "]";
            }
        }
    }, val.data);
}

} // anonymous namespace

std::string to_json(const Value& val, bool compact) {
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << to_json(val);
}

// ============================================================
// Explicit Template Instantiations
//
// Paired with the 'extern template' declarations in value.h so the
// Value members are compiled once, here.
// ============================================================

template class BasicValueObject<immer::default_memory_policy>;
template struct BasicValue<immer::default_memory_policy>;

} // namespace jsonunit
