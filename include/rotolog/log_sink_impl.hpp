/**
 * @file log_sink_impl.hpp
 * @brief Implementation of the file sink and its daemon thread
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <string>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

#include "log_sink.hpp"
#include "log_diagnostics.hpp"

namespace rotolog
{

namespace detail
{

// Returns a record to its pool when the write path is done with it
struct record_release_guard
{
    record_pool &pool;
    log_record *record;

    ~record_release_guard() { pool.release(record); }
};

inline int open_log_file(const std::string &path) { return ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644); }

} // namespace detail

inline int file_sink::open_destination(const sink_config &config)
{
    auto lower = detail::to_lower(config.file);
    if (lower == DESTINATION_STDOUT) return STDOUT_FILENO;
    if (lower == DESTINATION_STDERR) return STDERR_FILENO;

    int fd = detail::open_log_file(config.file);
    if (fd < 0) { throw std::runtime_error(fmt::format("Failed to open log file: {}: {}", config.file, get_error_string(errno))); }
    return fd;
}

inline file_sink::file_sink(sink_config config)
: config_(config.with_defaults()),
  level_(config_.level),
  records_(static_cast<size_t>(config_.record_length), static_cast<size_t>(config_.record_factor)),
  fd_(open_destination(config_)),
  owns_fd_(!config_.is_standard_stream()),
  writer_(fd_, static_cast<size_t>(config_.buffer_length)),
  rotate_(config_.rotation_enabled()),
  policy_(config_.rotate_bytes, config_.rotate_cycle),
  discard_queue_(static_cast<size_t>(std::max(config_.discard_threshold, 1)))
{
    if (config_.discard_threshold <= 0) return;

    try
    {
        daemon_thread_ = std::thread(&file_sink::daemon_thread_func, this);
    }
    catch (const std::system_error &)
    {
        if (owns_fd_) { ::close(fd_); }
        throw;
    }
}

inline file_sink::~file_sink() { close(); }

inline void file_sink::write_direct(log_record *r)
{
    detail::record_release_guard guard{records_, r};

    std::lock_guard<std::mutex> lock(mutex_);

    if (rotate_ && policy_.should_rotate(*r)) { rollover(); }

    // Left closed by a failed reopen or by close()
    if (fd_ < 0)
    {
        write_errors_.fetch_add(1, std::memory_order_relaxed);
        report_error("write error on {}: {}", config_.file, get_error_string(EBADF));
        return;
    }

    if (writer_.write(r->data(), r->len()) < 0)
    {
        int err = errno;
        write_errors_.fetch_add(1, std::memory_order_relaxed);
        report_error("write error on {}: {}", config_.file, get_error_string(err));
        return;
    }
    written_.fetch_add(1, std::memory_order_relaxed);
}

inline void file_sink::write_discard(log_record *r)
{
    // pending_ is reserved before the enqueue so the bound holds exactly
    if (pending_.fetch_add(1, std::memory_order_acq_rel) >= config_.discard_threshold)
    {
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        dropped_.fetch_add(1, std::memory_order_relaxed);
        records_.release(r);
        return;
    }

    if (!discard_queue_.enqueue(r))
    {
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        dropped_.fetch_add(1, std::memory_order_relaxed);
        records_.release(r);
    }
}

inline void file_sink::flush()
{
    std::lock_guard<std::mutex> lock(mutex_);
    flush_locked();
}

inline void file_sink::flush_locked()
{
    if (writer_.flush() < 0)
    {
        int err = errno;
        write_errors_.fetch_add(1, std::memory_order_relaxed);
        report_error("flush error on {}: {}", config_.file, get_error_string(err));
    }

    if (!owns_fd_ || fd_ < 0) return;

    if (writer_.sync() < 0)
    {
        int err = errno;
        write_errors_.fetch_add(1, std::memory_order_relaxed);
        report_error("sync error on {}: {}", config_.file, get_error_string(err));
    }
}

inline void file_sink::close()
{
    if (closed_.exchange(true, std::memory_order_acq_rel)) return;

    if (daemon_thread_.joinable())
    {
        // Null record is the shutdown sentinel
        discard_queue_.enqueue(nullptr);
        daemon_thread_.join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    flush_locked();

    if (owns_fd_ && fd_ >= 0)
    {
        if (::close(fd_) != 0) { report_error("close error on {}: {}", config_.file, get_error_string(errno)); }
    }
    fd_ = -1;
    writer_.reset(-1);
}

/**
 * @brief Roll the active file over, called with mutex_ held
 *
 * Flushes and closes the active file, renames it to
 * "<file>.<HHMMSS>[.N]" and opens a fresh file under the original name.
 * If the new file cannot be opened the sink keeps a closed descriptor and
 * the calendar snapshot is left as it was, so the next write tries again.
 * A failed rename is not a rotation: logging continues in the same file and
 * the next write tries again, unless the file was gone already, in which
 * case the newly created one starts a new period.
 */
inline void file_sink::rollover()
{
    if (writer_.flush() < 0)
    {
        int err = errno;
        write_errors_.fetch_add(1, std::memory_order_relaxed);
        report_error("flush error on {}: {}", config_.file, get_error_string(err));
    }

    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }

    auto rotated_name = next_rotated_name(config_.file, policy_.suffix());
    int rename_err    = 0;
    if (::rename(config_.file.c_str(), rotated_name.c_str()) != 0)
    {
        rename_err = errno;
        report_error("Failed to rename {} to {}: {}", config_.file, rotated_name, get_error_string(rename_err));
    }

    int fd = detail::open_log_file(config_.file);
    if (fd < 0)
    {
        report_error("Failed to open log file: {}: {}", config_.file, get_error_string(errno));
        writer_.reset(-1);
        return;
    }

    fd_ = fd;
    writer_.reset(fd);

    if (rename_err == 0) { rotations_.fetch_add(1, std::memory_order_relaxed); }
    if (rename_err == 0 || rename_err == ENOENT) { policy_.reset(std::chrono::system_clock::now()); }
}

inline void file_sink::daemon_thread_func()
{
    // Only the sentinel ends the daemon; a failed iteration is reported and restarted
    for (;;)
    {
        try
        {
            if (daemon_loop()) return;
        }
        catch (const std::exception &e)
        {
            daemon_faults_.fetch_add(1, std::memory_order_relaxed);
            report_error("daemon error: {}", e.what());
        }
        catch (...)
        {
            daemon_faults_.fetch_add(1, std::memory_order_relaxed);
            report_error("daemon error: unknown exception");
        }
    }
}

/**
 * @brief Consume the discard queue until the sentinel arrives
 * @return true once the sentinel was seen and the queue drained
 */
inline bool file_sink::daemon_loop()
{
    // Restarted after a fault while draining behind the sentinel
    if (stop_seen_)
    {
        drain_queue();
        return true;
    }

    const auto period = config_.buffer_period;
    auto next_flush   = std::chrono::steady_clock::now() + period;

    for (;;)
    {
        auto now = std::chrono::steady_clock::now();
        if (now >= next_flush)
        {
            flush();
            next_flush = now + period;
            continue;
        }

        log_record *r = nullptr;
        if (!discard_queue_.wait_dequeue_timed(r, std::chrono::duration_cast<std::chrono::microseconds>(next_flush - now)))
        {
            continue;
        }

        if (!r)
        {
            stop_seen_ = true;
            drain_queue();
            return true;
        }

        pending_.fetch_sub(1, std::memory_order_acq_rel);
        write_direct(r);
    }
}

// Records enqueued by other producers may still sit behind the sentinel
inline void file_sink::drain_queue()
{
    log_record *r = nullptr;
    while (discard_queue_.try_dequeue(r))
    {
        if (!r) continue;
        pending_.fetch_sub(1, std::memory_order_acq_rel);
        write_direct(r);
    }
}

} // namespace rotolog
