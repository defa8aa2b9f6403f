// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path.h
/// @brief Path expressions addressing a subtree of a Value.
///
/// Syntax (callers author these strings directly):
///
///   path    := segment ( "." segment | "[" digits "]" )*
///   segment := [A-Za-z_][A-Za-z0-9_]*
///
/// e.g. "root.array[0].value". The empty string denotes the document root.

#pragma once

#include <jsonunit/api.h>
#include <jsonunit/value.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace jsonunit {

/// A single path element: either a field name or a zero-based array index
using PathElement = std::variant<std::string, std::size_t>;
using Path        = std::vector<PathElement>;

/// Parse a path expression
/// @throws PathSyntaxError on unbalanced brackets, empty segments or non-numeric indices
[[nodiscard]] JSONUNIT_API Path parse_path(std::string_view expression);

/// Render a Path in expression syntax ("root.items[1].name"); round-trips with parse_path()
[[nodiscard]] JSONUNIT_API std::string path_to_string(const Path& path);

/// Render a Path relative to a starting node: every field gets a leading dot
/// (".items[1].name"). The empty path renders as "".
[[nodiscard]] JSONUNIT_API std::string path_to_relative_string(const Path& path);

/// Extract the subtree addressed by path. The document is not modified.
/// @throws PathNotFoundError if a field is missing, an index is out of range,
///         or a segment is applied to a node of the wrong kind
[[nodiscard]] JSONUNIT_API Value resolve(const Value& document, const Path& path);

/// Parse then resolve
/// @throws PathSyntaxError, PathNotFoundError
[[nodiscard]] JSONUNIT_API Value resolve(const Value& document, std::string_view expression);

} // namespace jsonunit
