#pragma once

/**
 * @file log_site.hpp
 * @brief Call site capture for the logging entry points
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */

#include <concepts>
#include <cstdint>
#include <source_location>
#include <string_view>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace rotolog
{

/**
 * @brief Format string bundled with the location of the log call
 *
 * The logging functions take this as their first parameter. A string literal
 * converts to it implicitly; the conversion checks the format string against
 * the argument types at compile time and records the caller's file and line
 * through the default argument, so no frame walking is needed to find the
 * caller.
 *
 * @code
 * sink->info("loaded {} items", count); // records "main.cpp:42"
 * @endcode
 */
template <typename... Args> struct located_format
{
    fmt::format_string<Args...> fmt;
    std::source_location loc;

    template <typename S>
        requires std::convertible_to<const S &, std::string_view>
    consteval located_format(const S &s, std::source_location l = std::source_location::current())
        : fmt(s), loc(l)
    {
    }

    std::string_view file() const { return loc.file_name(); }
    uint32_t line() const { return static_cast<uint32_t>(loc.line()); }
};

} // namespace rotolog
