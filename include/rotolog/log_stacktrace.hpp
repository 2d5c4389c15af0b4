/**
 * @file log_stacktrace.hpp
 * @brief Stack trace capture for error_stack() records
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Frames are resolved with libbacktrace from the running executable's debug
 * information and rendered as "file:line" joined by STACK_FRAME_SEPARATOR.
 * Frames are walked outward from the caller; frames without source
 * information, frames inside the C++ runtime and frames inside rotolog's own
 * headers are not reported.
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <iterator>
#include <string_view>
#include <vector>

#include <backtrace.h>

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_diagnostics.hpp"

namespace rotolog
{

namespace detail
{

// Path fragments of frames that belong to the runtime or to this library
inline constexpr std::string_view internal_frame_markers[] = {
    "/include/c++/",
    "/libstdc++",
    "/glibc",
    "/csu/",
    "/libbacktrace/",
    "/rotolog/log_",
};

inline bool is_internal_frame(std::string_view file)
{
    for (auto marker : internal_frame_markers)
    {
        if (file.find(marker) != std::string_view::npos) return true;
    }
    return false;
}

inline void backtrace_error_callback(void *, const char *msg, int errnum)
{
    // A missing symbol table (-1) is reported once, not on every trace
    static std::atomic<bool> reported{false};
    if (reported.exchange(true, std::memory_order_relaxed)) return;

    if (errnum > 0) { report_error("stack trace unavailable: {}: {}", msg ? msg : "", get_error_string(errnum)); }
    else { report_error("stack trace unavailable: {}", msg ? msg : ""); }
}

inline backtrace_state *backtrace_state_instance()
{
    // libbacktrace states cannot be freed; one per process, created on first use
    static backtrace_state *state = backtrace_create_state(nullptr, 1, backtrace_error_callback, nullptr);
    return state;
}

struct stack_walk
{
    std::vector<char> *out;
    int skip;
    size_t frames;
};

inline int stack_frame_callback(void *data, uintptr_t, const char *file, int line, const char *)
{
    auto *walk = static_cast<stack_walk *>(data);

    if (!file || is_internal_frame(file)) return 0;

    if (walk->skip > 0)
    {
        walk->skip--;
        return 0;
    }

    if (walk->frames > 0) { walk->out->push_back(STACK_FRAME_SEPARATOR); }
    fmt::format_to(std::back_inserter(*walk->out), "{}:{}", file, line);
    walk->frames++;
    return 0;
}

} // namespace detail

/**
 * @brief Append the current call stack to @p out
 * @param out Destination buffer
 * @param skip Number of reportable frames to skip after the caller
 * @return Number of frames appended
 */
inline size_t append_stack_trace(std::vector<char> &out, int skip)
{
    auto *state = detail::backtrace_state_instance();
    if (!state) return 0;

    detail::stack_walk walk{&out, skip, 0};
    backtrace_full(state, 0, detail::stack_frame_callback, detail::backtrace_error_callback, &walk);
    return walk.frames;
}

} // namespace rotolog
