/**
 * @file log_record.hpp
 * @brief A single formatted log entry
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iterator>
#include <string_view>
#include <utility>
#include <vector>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_stacktrace.hpp"

namespace rotolog
{

/**
 * @brief Reusable unit holding one fully formatted log entry
 *
 * The buffer only grows; reset() truncates it but keeps its capacity so a
 * pooled record can be refilled without allocating. The calendar fields are
 * captured by write_header() from the time the entry was produced and are what
 * cycle rotation compares against, no matter how long the record waited in the
 * discard queue.
 *
 * Layout of an entry:
 * @code
 * 2025-01-31 23:59:58 INFO  src/main.cpp:42 - message text
 * 2025-01-31 23:59:58 ERROR src/main.cpp:50 - failed
 * src/main.cpp:50|src/main.cpp:12|...
 * @endcode
 */
class log_record
{
  public:
    log_level level_{log_level::off};

    // Calendar fields captured by write_header()
    int month_{0};   ///< 1-12
    int weekday_{0}; ///< 0-6, Sunday = 0
    int day_{0};     ///< 1-31
    int hour_{0};    ///< 0-23
    int minute_{0};  ///< 0-59

  private:
    std::vector<char> buffer_;
    std::array<char, HEADER_LENGTH> header_{};

  public:
    explicit log_record(size_t capacity) { buffer_.reserve(capacity); }

    // Pooled objects are handed around by pointer
    log_record(const log_record &)            = delete;
    log_record &operator=(const log_record &) = delete;
    log_record(log_record &&)                 = delete;
    log_record &operator=(log_record &&)      = delete;

    size_t len() const noexcept { return buffer_.size(); }
    size_t capacity() const noexcept { return buffer_.capacity(); }
    const char *data() const noexcept { return buffer_.data(); }
    std::string_view get_text() const noexcept { return std::string_view(buffer_.data(), buffer_.size()); }

    // Reset buffer for reuse
    void reset() noexcept
    {
        buffer_.clear();
        level_ = log_level::off;
    }

    void write_header(log_level level) { write_header(level, std::chrono::system_clock::now()); }

    /**
     * @brief Render "YYYY-MM-DD HH:MM:SS LEVEL " for @p when in local time
     *
     * Digits are produced one by one; no formatting library is involved on
     * this path.
     */
    void write_header(log_level level, std::chrono::system_clock::time_point when)
    {
        static constexpr char digits[] = "0123456789";

        std::time_t t = std::chrono::system_clock::to_time_t(when);
        struct tm tm_local;
        localtime_r(&t, &tm_local);

        int yr = tm_local.tm_year + 1900;
        int mn = tm_local.tm_mon + 1;
        int dy = tm_local.tm_mday;
        int hr = tm_local.tm_hour;
        int mi = tm_local.tm_min;
        int ss = tm_local.tm_sec;

        level_   = level;
        month_   = mn;
        weekday_ = tm_local.tm_wday;
        day_     = dy;
        hour_    = hr;
        minute_  = mi;

        header_[0] = digits[(yr / 1000) % 10];
        yr %= 1000;
        header_[1] = digits[yr / 100];
        yr %= 100;
        header_[2]  = digits[yr / 10];
        header_[3]  = digits[yr % 10];
        header_[4]  = '-';
        header_[5]  = digits[mn / 10];
        header_[6]  = digits[mn % 10];
        header_[7]  = '-';
        header_[8]  = digits[dy / 10];
        header_[9]  = digits[dy % 10];
        header_[10] = ' ';
        header_[11] = digits[hr / 10];
        header_[12] = digits[hr % 10];
        header_[13] = ':';
        header_[14] = digits[mi / 10];
        header_[15] = digits[mi % 10];
        header_[16] = ':';
        header_[17] = digits[ss / 10];
        header_[18] = digits[ss % 10];
        header_[19] = ' ';

        auto index       = static_cast<size_t>(level);
        const char *name = index < log_level_names.size() ? log_level_names[index] : "<nil>";
        for (size_t i = 0; i < LEVEL_FIELD_WIDTH; ++i) { header_[LEVEL_FIELD_OFFSET + i] = name[i]; }
        header_[HEADER_LENGTH - 1] = ' ';

        buffer_.insert(buffer_.end(), header_.begin(), header_.end());
    }

    // "file:line - ", "???:1 - " when the location is unknown
    void write_location(std::string_view file, uint32_t line)
    {
        if (file.empty())
        {
            file = "???";
            line = 1;
        }
        write_raw(file);
        fmt::format_to(std::back_inserter(buffer_), ":{} - ", line);
    }

    // Message body followed by the line terminator
    template <typename... Args> void format(fmt::format_string<Args...> fmt, Args &&...args)
    {
        fmt::format_to(std::back_inserter(buffer_), fmt, std::forward<Args>(args)...);
        buffer_.push_back('\n');
    }

    void print(std::string_view text)
    {
        write_raw(text);
        buffer_.push_back('\n');
    }

    /**
     * @brief Append the caller's stack trace as one '|' separated line
     * @param skip Additional leading frames to leave out
     * @return Number of frames written
     */
    size_t write_stack(int skip)
    {
        size_t frames = append_stack_trace(buffer_, skip);
        if (frames > 0) { buffer_.push_back('\n'); }
        return frames;
    }

    void write_raw(std::string_view str) { buffer_.insert(buffer_.end(), str.begin(), str.end()); }
};

} // namespace rotolog
