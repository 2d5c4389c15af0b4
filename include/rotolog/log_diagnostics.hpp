/**
 * @file log_diagnostics.hpp
 * @brief Side channel for failures inside the logging pipeline
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * Write, rotation and daemon failures are never returned to the code that
 * emitted a log line. They are reported here, on stderr, and never through a
 * sink, so a broken sink cannot feed errors back into itself.
 */
#pragma once

#include <cstdio>
#include <cstring>
#include <string>
#include <string.h>
#include <utility>

#include "fmt_config.hpp" // IWYU pragma: keep

namespace rotolog
{

// Thread-safe error string helper
inline std::string get_error_string(int err)
{
    char errbuf[256];

#ifdef _GNU_SOURCE
    // GNU version returns char* which may or may not use the buffer
    const char *msg = strerror_r(err, errbuf, sizeof(errbuf));
    return std::string(msg);
#else
    // POSIX version returns int and always uses the buffer
    int ret = strerror_r(err, errbuf, sizeof(errbuf));
    if (ret != 0) { return "Unknown error " + std::to_string(err); }
    return std::string(errbuf);
#endif
}

/**
 * @brief Report a pipeline failure on stderr
 *
 * Output is a single "[rotolog] <message>" line.
 */
template <typename... Args> void report_error(fmt::format_string<Args...> fmt, Args &&...args)
{
    auto message = fmt::format(fmt, std::forward<Args>(args)...);
    fmt::print(stderr, "[rotolog] {}\n", message);
    std::fflush(stderr);
}

} // namespace rotolog
