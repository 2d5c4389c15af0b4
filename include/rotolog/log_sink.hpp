/**
 * @file log_sink.hpp
 * @brief File sink: the write pipeline from formatted record to descriptor
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 *
 * A file_sink owns one destination (a file or a standard stream), the write
 * buffer in front of it, a record pool and the rotation bookkeeping. It is
 * created in one of two modes that stay fixed for its lifetime:
 *
 * - direct: every log call formats its record and appends it to the write
 *   buffer under the sink mutex. Nothing is ever lost, producers may block on
 *   the mutex and on a full buffer being written out.
 * - discard (discard_threshold > 0): log calls hand the record to a bounded
 *   queue and return at once. When the queue holds discard_threshold records
 *   new ones are dropped. A daemon thread drains the queue and flushes the
 *   buffer every buffer_period.
 *
 * Failures after construction are never thrown to the logging code; they are
 * reported on stderr (see log_diagnostics.hpp) and counted in stats.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <utility>

#include "moodycamel/blockingconcurrentqueue.h"

#include "fmt_config.hpp" // IWYU pragma: keep
#include "log_types.hpp"
#include "log_config.hpp"
#include "log_site.hpp"
#include "log_record.hpp"
#include "log_record_pool.hpp"
#include "log_buffered_writer.hpp"
#include "log_rotation.hpp"

namespace rotolog
{

class file_sink
{
  public:
    /**
     * @brief Sink statistics for monitoring and diagnostics
     */
    struct stats
    {
        uint64_t written;       ///< Records appended to the write buffer
        uint64_t dropped;       ///< Records dropped because the discard queue was full
        uint64_t rotations;     ///< Completed rollovers
        uint64_t write_errors;  ///< Failed writes, flushes and syncs, records with no open file
        uint64_t daemon_faults; ///< Daemon iterations aborted by an exception
        size_t pending;         ///< Records waiting in the discard queue
    };

  private:
    sink_config config_;
    std::atomic<log_level> level_;
    record_pool records_;

    std::mutex mutex_; // Guards fd_, writer_ and policy_
    int fd_;
    bool owns_fd_; // false for stdout/stderr
    buffered_writer writer_;
    bool rotate_;
    rotation_policy policy_;

    moodycamel::BlockingConcurrentQueue<log_record *> discard_queue_;
    std::atomic<int> pending_{0};
    std::thread daemon_thread_;
    std::atomic<bool> closed_{false};
    bool stop_seen_{false}; // Daemon thread only: the sentinel was dequeued

    std::atomic<uint64_t> written_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> rotations_{0};
    std::atomic<uint64_t> write_errors_{0};
    std::atomic<uint64_t> daemon_faults_{0};

  public:
    /**
     * @brief Open the destination and start the sink
     * @param config Sink configuration, unset fields take their defaults
     * @throws std::runtime_error if the destination cannot be opened
     */
    explicit file_sink(sink_config config);
    virtual ~file_sink();

    file_sink(const file_sink &)            = delete;
    file_sink &operator=(const file_sink &) = delete;

    static std::shared_ptr<file_sink> create(sink_config config) { return std::make_shared<file_sink>(std::move(config)); }

    /// @name Logging
    /// Each call is a no-op below the sink's level. The format string is
    /// checked at compile time and the caller's location is captured with it.
    /// @{
    template <typename... Args> void debug(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
    {
        emit<Args...>(log_level::debug, false, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void info(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
    {
        emit<Args...>(log_level::info, false, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void warn(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
    {
        emit<Args...>(log_level::warn, false, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args> void error(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
    {
        emit<Args...>(log_level::error, false, fmt, std::forward<Args>(args)...);
    }

    // ERROR record followed by the caller's stack trace
    template <typename... Args> void error_stack(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
    {
        emit<Args...>(log_level::error, true, fmt, std::forward<Args>(args)...);
    }

    // FATAL record with stack trace, then flush. The process keeps running.
    template <typename... Args> void fatal(located_format<std::type_identity_t<Args>...> fmt, Args &&...args)
    {
        emit<Args...>(log_level::fatal, true, fmt, std::forward<Args>(args)...);
        flush();
    }
    /// @}

    /**
     * @brief Hand a formatted record to the pipeline
     *
     * Forwards to write_direct() or write_discard(), whichever this sink was
     * created with. Takes ownership of @p r.
     */
    void write(log_record *r)
    {
        if (config_.discard_threshold > 0) { write_discard(r); }
        else { write_direct(r); }
    }

    /**
     * @brief Append @p r to the write buffer, rolling the file over first if needed
     *
     * Blocks on the sink mutex. The record is returned to the pool in every case.
     * The daemon delivers queued records through this call, so a derived sink
     * can intercept both paths here. A derived sink must close() in its own
     * destructor.
     */
    virtual void write_direct(log_record *r);

    /**
     * @brief Queue @p r for the daemon without blocking
     *
     * Drops the record, returning it to the pool, when discard_threshold
     * records are already waiting.
     */
    void write_discard(log_record *r);

    // Write out buffered bytes and sync file destinations
    void flush();

    /**
     * @brief Stop the daemon after it drained the queue, flush and close the file
     *
     * Idempotent. Standard streams are flushed but left open. Nothing may be
     * written to the sink afterwards.
     */
    void close();

    log_level level() const { return level_.load(std::memory_order_relaxed); }
    void set_level(log_level level) { level_.store(level, std::memory_order_relaxed); }

    bool would_log(log_level level) const { return level != log_level::off && level >= this->level(); }

    record_pool &records() { return records_; }
    const sink_config &config() const { return config_; }

    stats get_stats() const
    {
        stats s{};
        s.written       = written_.load(std::memory_order_relaxed);
        s.dropped       = dropped_.load(std::memory_order_relaxed);
        s.rotations     = rotations_.load(std::memory_order_relaxed);
        s.write_errors  = write_errors_.load(std::memory_order_relaxed);
        s.daemon_faults = daemon_faults_.load(std::memory_order_relaxed);
        s.pending       = static_cast<size_t>(pending_.load(std::memory_order_relaxed));
        return s;
    }

  private:
    template <typename... Args>
    void emit(log_level level, bool with_stack, const located_format<Args...> &fmt, Args &&...args)
    {
        if (!would_log(level)) return;

        log_record *r = records_.acquire();
        try
        {
            r->write_header(level);
            r->write_location(fmt.file(), fmt.line());
            r->format(fmt.fmt, std::forward<Args>(args)...);
            if (with_stack) { r->write_stack(0); }
        }
        catch (...)
        {
            records_.release(r);
            throw;
        }
        write(r);
    }

    void rollover();
    void flush_locked();
    void daemon_thread_func();
    bool daemon_loop();
    void drain_queue();

    static int open_destination(const sink_config &config);
};

} // namespace rotolog
