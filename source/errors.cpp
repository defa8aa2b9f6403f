// errors.cpp - Exception message formatting

#include <jsonunit/errors.h>

#include <utility>

namespace jsonunit {

PathSyntaxError::PathSyntaxError(std::string path, std::size_t position, const std::string& reason)
    : Error("invalid path \"" + path + "\" at position " + std::to_string(position) + ": " + reason)
    , path_(std::move(path))
    , position_(position)
{}

PathNotFoundError::PathNotFoundError(std::string path, std::string segment, const std::string& reason)
    : Error("path \"" + path + "\" not found at segment " + segment + ": " + reason)
    , path_(std::move(path))
    , segment_(std::move(segment))
{}

} // namespace jsonunit
