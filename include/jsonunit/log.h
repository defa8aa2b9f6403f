// log.h - Diagnostic logging helpers

#pragma once

#include <jsonunit/config.h>

#include <iostream>
#include <source_location>
#include <string_view>

namespace jsonunit::detail {

inline void log_path_error(
    std::string_view func,
    std::string_view path,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONUNIT_VERBOSE_LOG
    std::cerr << "[" << func << "] path '" << path << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)path;
    (void)reason;
    (void)loc;
#endif
}

inline void log_config_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSONUNIT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

} // namespace jsonunit::detail
