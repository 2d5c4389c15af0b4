/**
 * @file log.hpp
 * @brief Buffered, rotating, text file logging
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * This logging library provides:
 * - One line per entry with timestamp, level and caller location
 * - Compile-time checked fmt format strings
 * - Pooled record buffers, no allocation per log call in steady state
 * - Write buffering with periodic flush and fdatasync
 * - File rotation by size and/or calendar period (hourly, daily, weekly, monthly)
 * - Optional load shedding: a bounded queue that drops entries instead of
 *   blocking the caller, drained by a background thread
 * - A process-wide default sink behind free functions
 *
 * Basic Usage:
 * @code
 * // The default sink writes to stdout
 * rotolog::info("Application started");
 * // Output: 2025-03-14 09:26:53 INFO  main.cpp:12 - Application started
 *
 * rotolog::warn("Temperature {}°C exceeds threshold {}°C", temp, max_temp);
 * // Output: 2025-03-14 09:26:53 WARN  main.cpp:13 - Temperature 98°C exceeds threshold 95°C
 *
 * // error_stack() and fatal() append the call stack as a second line
 * rotolog::error_stack("lost connection to {}", peer);
 * // Output: 2025-03-14 09:26:54 ERROR net.cpp:88 - lost connection to 10.0.0.7
 * //         /src/net.cpp:88|/src/net.cpp:140|/src/main.cpp:31
 * @endcode
 *
 * Sink Configuration:
 * @code
 * rotolog::sink_config cfg;
 * cfg.file              = "/var/log/app.log";
 * cfg.level             = rotolog::log_level::info;
 * cfg.rotate_bytes      = 100 * 1024 * 1024;          // roll over at 100 MiB
 * cfg.rotate_cycle      = rotolog::rotate_cycle::daily; // and at midnight
 * cfg.discard_threshold = 4096;                         // drop instead of block
 *
 * auto sink = rotolog::file_sink::create(cfg); // throws if the file cannot be opened
 * sink->info("written to /var/log/app.log");
 *
 * // Or route the free functions to it
 * rotolog::install_default_sink(sink);
 * @endcode
 *
 * Configuration can also be read from JSON, see log_config_json.hpp:
 * @code
 * auto sink = rotolog::file_sink::create(rotolog::load_sink_config("/etc/app/log.json"));
 * @endcode
 *
 * Runtime Level Control:
 * @code
 * sink->set_level(rotolog::log_level::warn);
 * sink->info("suppressed");
 * if (sink->would_log(rotolog::log_level::debug)) { dump_state(); }
 * @endcode
 *
 * Rotation:
 * - Rotated files are renamed to "<file>.<HHMMSS>", the time the file was
 *   opened, with ".0", ".1", ... appended when that name exists
 * - The record that pushes a file past rotate_bytes is the first one written
 *   to the new file
 * - Calendar rotation compares the time each entry was produced, not the time
 *   it reached the file
 * - stdout and stderr are never rotated
 *
 * Shutdown:
 * - file_sink::close() (also run by the destructor) lets the background thread
 *   write out everything already queued, then flushes and closes the file
 * - Failures after construction are reported on stderr as "[rotolog] ..." and
 *   never thrown to the logging code
 */
#pragma once

#include "fmt_config.hpp"          // IWYU pragma: keep
#include "log_types.hpp"           // IWYU pragma: keep
#include "log_diagnostics.hpp"     // IWYU pragma: keep
#include "log_config.hpp"          // IWYU pragma: keep
#include "log_site.hpp"            // IWYU pragma: keep
#include "log_stacktrace.hpp"      // IWYU pragma: keep
#include "log_record.hpp"          // IWYU pragma: keep
#include "log_record_pool.hpp"     // IWYU pragma: keep
#include "log_buffered_writer.hpp" // IWYU pragma: keep
#include "log_rotation.hpp"        // IWYU pragma: keep
#include "log_sink.hpp"            // IWYU pragma: keep
#include "log_default.hpp"         // IWYU pragma: keep
#include "log_config_json.hpp"     // IWYU pragma: keep
#include "log_version.hpp"         // IWYU pragma: keep

#include "log_sink_impl.hpp" // IWYU pragma: keep
