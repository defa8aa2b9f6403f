// errors.h - Exception types raised by the comparison engine

#pragma once

#include <jsonunit/api.h>

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jsonunit {

/// Base class of every error the engine raises.
/// Content mismatches are never errors; they are reported through DiffResult.
class JSONUNIT_API Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The path string does not match `segment ("." segment | "[" digits "]")*`
class JSONUNIT_API PathSyntaxError : public Error {
public:
    PathSyntaxError(std::string path, std::size_t position, const std::string& reason);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// Zero-based offset of the offending character
    [[nodiscard]] std::size_t position() const noexcept { return position_; }

private:
    std::string path_;
    std::size_t position_;
};

/// A well-formed path references a field or index absent from the document
class JSONUNIT_API PathNotFoundError : public Error {
public:
    PathNotFoundError(std::string path, std::string segment, const std::string& reason);

    [[nodiscard]] const std::string& path() const noexcept { return path_; }

    /// The segment that could not be resolved, in path syntax ("name" or "[3]")
    [[nodiscard]] const std::string& segment() const noexcept { return segment_; }

private:
    std::string path_;
    std::string segment_;
};

/// Invalid comparison options, e.g. a negative tolerance
class JSONUNIT_API ConfigurationError : public Error {
public:
    using Error::Error;
};

} // namespace jsonunit
