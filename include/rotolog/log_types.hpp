/**
 * @file log_types.hpp
 * @brief Core type definitions and constants for the logging system
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <cctype>
#include <array>
#include <string>
#include <string_view>
#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace rotolog
{

// Sink defaults, applied by sink_config::with_defaults() for fields <= 0
inline constexpr int DEFAULT_BUFFER_LENGTH = 256 * 1024;               // Write buffer in front of the descriptor
inline constexpr auto DEFAULT_BUFFER_PERIOD = std::chrono::seconds(15); // Periodic flush/sync interval of the daemon
inline constexpr int DEFAULT_RECORD_LENGTH  = 2048;                     // Starting capacity of a record buffer
inline constexpr int DEFAULT_RECORD_FACTOR  = 10;                       // Records grown past length * factor are not pooled

// Record header: "YYYY-MM-DD HH:MM:SS LEVEL "
inline constexpr size_t HEADER_LENGTH      = 26;
inline constexpr size_t LEVEL_FIELD_OFFSET = 20;
inline constexpr size_t LEVEL_FIELD_WIDTH  = 5;

// Separator placed between frames of a stack trace
inline constexpr char STACK_FRAME_SEPARATOR = '|';

// Rotated file suffix is ".HHMMSS" followed by an optional ".N" on collision
inline constexpr size_t ROTATE_SUFFIX_LENGTH = 6;

// Destination identifiers (case insensitive)
inline constexpr std::string_view DESTINATION_STDOUT = "stdout";
inline constexpr std::string_view DESTINATION_STDERR = "stderr";

/**
 * @brief Enumeration of available log levels in ascending order of severity
 *
 * @c off is a pseudo-level used only as a minimum level; it never appears in
 * output.
 */
enum class log_level : uint8_t
{
    debug = 0, ///< Debugging information
    info  = 1, ///< General information
    warn  = 2, ///< Warning messages
    error = 3, ///< Error messages
    fatal = 4, ///< Critical errors
    off   = 5, ///< Emit nothing
};

/**
 * @brief Calendar granularity for cycle based rotation
 *
 * Each coarser cycle also checks the finer fields it lists, see
 * rotation_policy::should_rotate().
 */
enum class rotate_cycle : uint8_t
{
    off     = 0,
    hourly  = 1,
    daily   = 2,
    weekly  = 3,
    monthly = 4,
};

// Level names for the record header, five characters wide. Shorter names are
// left aligned and padded with trailing spaces ("INFO ", "WARN ") so the
// header is always HEADER_LENGTH bytes.
inline constexpr std::array<const char *, 5> log_level_names = {"DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

namespace detail
{

inline std::string to_lower(std::string_view str)
{
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace detail

/**
 * @brief Convert string to log_level
 * @param str Level name (case insensitive)
 * @return Corresponding log_level
 * @throws std::invalid_argument for unknown names
 *
 * Recognized values: "debug", "info", "warn", "warning", "error", "fatal", "off", "nolog", "none"
 */
inline log_level log_level_from_string(std::string_view str)
{
    std::string lower = detail::to_lower(str);

    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    if (lower == "off" || lower == "nolog" || lower == "none") return log_level::off;

    throw std::invalid_argument(fmt::format("invalid level value: {}", str));
}

/**
 * @brief Convert log_level to string
 * @param level The log level
 * @return Lower case name of the level
 */
inline const char *string_from_log_level(log_level level)
{
    switch (level)
    {
    case log_level::debug: return "debug";
    case log_level::info: return "info";
    case log_level::warn: return "warn";
    case log_level::error: return "error";
    case log_level::fatal: return "fatal";
    case log_level::off: return "off";
    default: return "unknown";
    }
}

/**
 * @brief Convert string to rotate_cycle
 * @param str Cycle name (case insensitive): "hourly", "daily", "weekly", "monthly", "off", "never"
 * @throws std::invalid_argument for unknown names
 */
inline rotate_cycle rotate_cycle_from_string(std::string_view str)
{
    std::string lower = detail::to_lower(str);

    if (lower == "hourly") return rotate_cycle::hourly;
    if (lower == "daily") return rotate_cycle::daily;
    if (lower == "weekly") return rotate_cycle::weekly;
    if (lower == "monthly") return rotate_cycle::monthly;
    if (lower == "off" || lower == "never") return rotate_cycle::off;

    throw std::invalid_argument(fmt::format("invalid cycle value: {}", str));
}

inline const char *string_from_rotate_cycle(rotate_cycle cycle)
{
    switch (cycle)
    {
    case rotate_cycle::off: return "off";
    case rotate_cycle::hourly: return "hourly";
    case rotate_cycle::daily: return "daily";
    case rotate_cycle::weekly: return "weekly";
    case rotate_cycle::monthly: return "monthly";
    default: return "unknown";
    }
}

} // namespace rotolog
