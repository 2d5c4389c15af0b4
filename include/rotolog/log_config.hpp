/**
 * @file log_config.hpp
 * @brief Sink configuration
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "log_types.hpp"

namespace rotolog
{

/**
 * @brief Configuration of one file_sink
 *
 * Read-only once a sink is constructed. Zero or negative sizes select the
 * defaults, see with_defaults().
 */
struct sink_config
{
    std::string file;                   ///< "stdout", "stderr" (case insensitive) or a file path
    log_level level = log_level::debug; ///< Minimum emitted level

    /// @name Rotation
    /// @{
    int64_t rotate_bytes = 0;                      ///< Rotate once the file would exceed this size (0 = disabled)
    rotolog::rotate_cycle rotate_cycle = rotolog::rotate_cycle::off; ///< Rotate when the calendar period changes
    /// @}

    /// @name Buffering
    /// @{
    int buffer_length = 0;                    ///< Write buffer size in bytes
    std::chrono::milliseconds buffer_period{0}; ///< Periodic flush interval of the daemon
    int record_length = 0;                    ///< Starting capacity of a record buffer
    int record_factor = 0;                    ///< Records larger than length * factor are not pooled
    /// @}

    /// @name Backpressure
    /// @{
    int discard_threshold = 0; ///< Discard queue capacity; 0 writes synchronously and never drops
    /// @}

    /**
     * @brief Copy of this configuration with unset fields replaced by defaults
     */
    sink_config with_defaults() const
    {
        sink_config c = *this;
        if (c.file.empty()) { c.file = std::string(DESTINATION_STDOUT); }
        if (c.buffer_length <= 0) { c.buffer_length = DEFAULT_BUFFER_LENGTH; }
        if (c.buffer_period.count() <= 0) { c.buffer_period = DEFAULT_BUFFER_PERIOD; }
        if (c.record_length <= 0) { c.record_length = DEFAULT_RECORD_LENGTH; }
        if (c.record_factor <= 0) { c.record_factor = DEFAULT_RECORD_FACTOR; }
        if (c.rotate_bytes < 0) { c.rotate_bytes = 0; }
        if (c.discard_threshold < 0) { c.discard_threshold = 0; }
        return c;
    }

    bool is_standard_stream() const
    {
        auto lower = detail::to_lower(file);
        return lower == DESTINATION_STDOUT || lower == DESTINATION_STDERR;
    }

    bool rotation_enabled() const
    {
        return !is_standard_stream() && (rotate_bytes > 0 || rotate_cycle != rotolog::rotate_cycle::off);
    }
};

} // namespace rotolog
