/**
 * @file log_rotation.hpp
 * @brief Size and calendar based rotation decisions
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A rotation_policy decides, per written record, whether the active file must
 * be rolled over before the record's bytes are appended. The rollover itself
 * (flush, close, rename, reopen) is performed by file_sink.
 *
 * Rotated files are named after the active file plus the wall clock time at
 * which that file was opened:
 * @code
 * app.log            active file
 * app.log.093000     opened at 09:30:00, rotated later
 * app.log.093000.0   second file opened within the same second
 * @endcode
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>
#include <system_error>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_record.hpp"

namespace rotolog
{

class rotation_policy
{
    int64_t rotate_bytes_;
    rotate_cycle cycle_;
    int64_t remaining_bytes_;

    // Calendar snapshot of the moment the active file was opened
    int month_{0};
    int weekday_{0};
    int day_{0};
    int hour_{0};
    std::string suffix_;

  public:
    rotation_policy(int64_t rotate_bytes, rotate_cycle cycle,
                    std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
        : rotate_bytes_(rotate_bytes), cycle_(cycle), remaining_bytes_(rotate_bytes)
    {
        reset(now);
    }

    bool size_enabled() const { return rotate_bytes_ > 0; }
    bool cycle_enabled() const { return cycle_ != rotate_cycle::off; }
    bool enabled() const { return size_enabled() || cycle_enabled(); }

    /**
     * @brief Decide whether the file must roll over before @p r is written
     *
     * The calendar check runs first and compares the record's own timestamp
     * fields; each cycle also compares every coarser field (hourly checks
     * month, weekday, day and hour). When it triggers, the byte budget is left
     * alone. Otherwise the record length is charged against the byte budget
     * and the file rolls over once the budget goes negative, so the record
     * that crosses the limit is the first one written to the new file.
     */
    bool should_rotate(const log_record &r)
    {
        if (cycle_enabled() && calendar_changed(r)) { return true; }

        if (size_enabled())
        {
            remaining_bytes_ -= static_cast<int64_t>(r.len());
            if (remaining_bytes_ < 0) { return true; }
        }
        return false;
    }

    // Start a new period: refill the byte budget and take a new calendar snapshot
    void reset(std::chrono::system_clock::time_point now)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(now);
        struct tm tm_local;
        localtime_r(&t, &tm_local);

        month_   = tm_local.tm_mon + 1;
        weekday_ = tm_local.tm_wday;
        day_     = tm_local.tm_mday;
        hour_    = tm_local.tm_hour;
        suffix_  = fmt::format("{:02}{:02}{:02}", tm_local.tm_hour, tm_local.tm_min, tm_local.tm_sec);

        remaining_bytes_ = rotate_bytes_;
    }

    // "HHMMSS" of the moment the active file was opened
    const std::string &suffix() const { return suffix_; }
    int64_t remaining_bytes() const { return remaining_bytes_; }
    int64_t rotate_bytes() const { return rotate_bytes_; }
    rotate_cycle cycle() const { return cycle_; }

  private:
    bool calendar_changed(const log_record &r) const
    {
        switch (cycle_)
        {
        case rotate_cycle::monthly: return r.month_ != month_;
        case rotate_cycle::weekly: return r.month_ != month_ || r.weekday_ != weekday_;
        case rotate_cycle::daily: return r.month_ != month_ || r.weekday_ != weekday_ || r.day_ != day_;
        case rotate_cycle::hourly:
            return r.month_ != month_ || r.weekday_ != weekday_ || r.day_ != day_ || r.hour_ != hour_;
        default: return false;
        }
    }
};

/**
 * @brief Find a free name for the file being rotated away
 * @param base Path of the active file
 * @param suffix Suffix captured when the active file was opened
 * @return "<base>.<suffix>", or "<base>.<suffix>.<N>" with the smallest N not
 *         already taken
 */
inline std::string next_rotated_name(const std::string &base, const std::string &suffix)
{
    std::string candidate = fmt::format("{}.{}", base, suffix);

    std::error_code ec;
    if (!std::filesystem::exists(candidate, ec)) { return candidate; }

    for (unsigned count = 0;; ++count)
    {
        std::string numbered = fmt::format("{}.{}", candidate, count);
        if (!std::filesystem::exists(numbered, ec)) { return numbered; }
    }
}

} // namespace rotolog
