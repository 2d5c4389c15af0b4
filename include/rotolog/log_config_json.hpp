/**
 * @file log_config_json.hpp
 * @brief Reading sink_config from JSON
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Accepted document, every key optional:
 * @code
 * {
 *   "file": "/var/log/app.log",
 *   "level": "info",
 *   "rotate_bytes": 104857600,
 *   "rotate_cycle": "daily",
 *   "buffer_length": 262144,
 *   "buffer_period": "15s",
 *   "record_length": 2048,
 *   "record_factor": 10,
 *   "discard_threshold": 4096
 * }
 * @endcode
 *
 * "level" and "rotate_cycle" also accept their numeric values, "buffer_period"
 * accepts milliseconds or a string ending in ms, s, m or h.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

#include <tao/json/value.hpp>
#include <tao/json/from_string.hpp>
#include <tao/json/from_file.hpp>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_config.hpp"

namespace rotolog
{

namespace detail
{

inline int64_t json_integer(const std::string &key, const tao::json::value &v)
{
    if (v.is_signed()) return v.get_signed();
    if (v.is_unsigned())
    {
        auto u = v.get_unsigned();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        {
            throw std::invalid_argument(fmt::format("value of \"{}\" out of range", key));
        }
        return static_cast<int64_t>(u);
    }
    throw std::invalid_argument(fmt::format("\"{}\" must be an integer", key));
}

inline int json_int(const std::string &key, const tao::json::value &v)
{
    auto n = json_integer(key, v);
    if (n < std::numeric_limits<int>::min() || n > std::numeric_limits<int>::max())
    {
        throw std::invalid_argument(fmt::format("value of \"{}\" out of range", key));
    }
    return static_cast<int>(n);
}

inline const std::string &json_string(const std::string &key, const tao::json::value &v)
{
    if (!v.is_string()) { throw std::invalid_argument(fmt::format("\"{}\" must be a string", key)); }
    return v.get_string();
}

} // namespace detail

/**
 * @brief Parse a duration such as "250ms", "15s", "5m" or "1h"
 * @throws std::invalid_argument on malformed input
 */
inline std::chrono::milliseconds parse_duration(std::string_view text)
{
    size_t digits = 0;
    while (digits < text.size() && text[digits] >= '0' && text[digits] <= '9') { digits++; }
    if (digits == 0 || digits > 12) { throw std::invalid_argument(fmt::format("invalid duration value: {}", text)); }

    int64_t amount = 0;
    for (size_t i = 0; i < digits; ++i) { amount = amount * 10 + (text[i] - '0'); }

    auto unit = detail::to_lower(text.substr(digits));
    if (unit == "ms") return std::chrono::milliseconds(amount);
    if (unit == "s") return std::chrono::seconds(amount);
    if (unit == "m") return std::chrono::minutes(amount);
    if (unit == "h") return std::chrono::hours(amount);

    throw std::invalid_argument(fmt::format("invalid duration value: {}", text));
}

/**
 * @brief Build a sink_config from a parsed JSON object
 *
 * Missing keys keep the sink_config defaults; with_defaults() is not applied.
 *
 * @throws std::invalid_argument for unknown keys, wrong types or bad values
 */
inline sink_config sink_config_from_json(const tao::json::value &json)
{
    if (!json.is_object()) { throw std::invalid_argument("sink configuration must be a JSON object"); }

    sink_config config;

    for (const auto &[key, v] : json.get_object())
    {
        if (key == "file") { config.file = detail::json_string(key, v); }
        else if (key == "level")
        {
            if (v.is_string()) { config.level = log_level_from_string(v.get_string()); }
            else
            {
                auto n = detail::json_integer(key, v);
                if (n < 0 || n > static_cast<int64_t>(log_level::off)) { throw std::invalid_argument(fmt::format("invalid level value: {}", n)); }
                config.level = static_cast<log_level>(n);
            }
        }
        else if (key == "rotate_bytes") { config.rotate_bytes = detail::json_integer(key, v); }
        else if (key == "rotate_cycle")
        {
            if (v.is_string()) { config.rotate_cycle = rotate_cycle_from_string(v.get_string()); }
            else
            {
                auto n = detail::json_integer(key, v);
                if (n < 0 || n > static_cast<int64_t>(rotate_cycle::monthly)) { throw std::invalid_argument(fmt::format("invalid cycle value: {}", n)); }
                config.rotate_cycle = static_cast<rotate_cycle>(n);
            }
        }
        else if (key == "buffer_length") { config.buffer_length = detail::json_int(key, v); }
        else if (key == "buffer_period")
        {
            if (v.is_string()) { config.buffer_period = parse_duration(v.get_string()); }
            else { config.buffer_period = std::chrono::milliseconds(detail::json_integer(key, v)); }
        }
        else if (key == "record_length") { config.record_length = detail::json_int(key, v); }
        else if (key == "record_factor") { config.record_factor = detail::json_int(key, v); }
        else if (key == "discard_threshold") { config.discard_threshold = detail::json_int(key, v); }
        else { throw std::invalid_argument(fmt::format("unknown sink configuration key: {}", key)); }
    }

    return config;
}

// Parse errors from the JSON parser propagate as tao::pegtl::parse_error
inline sink_config parse_sink_config(std::string_view text) { return sink_config_from_json(tao::json::from_string(text)); }

inline sink_config load_sink_config(const std::string &path) { return sink_config_from_json(tao::json::from_file(path)); }

} // namespace rotolog
