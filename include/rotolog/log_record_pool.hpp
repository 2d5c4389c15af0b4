/**
 * @file log_record_pool.hpp
 * @brief Recycling pool of log records
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>

#include "moodycamel/concurrentqueue.h"

#include "log_record.hpp"

namespace rotolog
{

/**
 * @brief Pool of reusable log_record objects, one per sink
 *
 * The pool is unbounded: acquire() never blocks and never fails, it allocates
 * a fresh record when nothing is available. release() keeps a record only
 * while its buffer capacity stays below record_length * record_factor, so a
 * single huge message does not pin a huge buffer forever.
 *
 * acquire() and release() are lock free and may be called from any thread.
 */
class record_pool
{
  public:
    /**
     * @brief Record pool statistics for monitoring and diagnostics
     */
    struct stats
    {
        uint64_t total_acquires;     ///< Total acquire operations
        uint64_t total_releases;     ///< Total release operations
        uint64_t allocations;        ///< Records created because the pool was empty
        uint64_t retained;           ///< Releases that went back into the pool
        uint64_t oversized_discards; ///< Releases that freed an outgrown record
        size_t available;            ///< Approximate number of pooled records
    };

  private:
    moodycamel::ConcurrentQueue<log_record *> available_records_;

    size_t record_length_;
    size_t threshold_; ///< record_length * record_factor

    std::atomic<uint64_t> total_acquires_{0};
    std::atomic<uint64_t> total_releases_{0};
    std::atomic<uint64_t> allocations_{0};
    std::atomic<uint64_t> retained_{0};
    std::atomic<uint64_t> oversized_discards_{0};

  public:
    record_pool(size_t record_length, size_t record_factor)
        : record_length_(record_length), threshold_(record_length * record_factor)
    {
    }

    ~record_pool()
    {
        log_record *record = nullptr;
        while (available_records_.try_dequeue(record)) { delete record; }
    }

    record_pool(const record_pool &)            = delete;
    record_pool &operator=(const record_pool &) = delete;

    /**
     * @brief Get an empty record
     * @return Record with len() == 0, owned by the caller until release()
     */
    log_record *acquire()
    {
        total_acquires_.fetch_add(1, std::memory_order_relaxed);

        log_record *record = nullptr;
        if (available_records_.try_dequeue(record))
        {
            record->reset();
            return record;
        }

        allocations_.fetch_add(1, std::memory_order_relaxed);
        return new log_record(record_length_);
    }

    /**
     * @brief Return a record to the pool
     *
     * Records whose buffer grew to record_length * record_factor or beyond
     * are freed instead of pooled.
     */
    void release(log_record *record)
    {
        if (!record) return;

        total_releases_.fetch_add(1, std::memory_order_relaxed);

        if (record->capacity() >= threshold_)
        {
            oversized_discards_.fetch_add(1, std::memory_order_relaxed);
            delete record;
            return;
        }

        if (!available_records_.enqueue(record))
        {
            // Queue could not grow, nothing else to do with it
            delete record;
            return;
        }
        retained_.fetch_add(1, std::memory_order_relaxed);
    }

    size_t record_length() const { return record_length_; }
    size_t threshold() const { return threshold_; }

    stats get_stats() const
    {
        stats s{};
        s.total_acquires     = total_acquires_.load(std::memory_order_relaxed);
        s.total_releases     = total_releases_.load(std::memory_order_relaxed);
        s.allocations        = allocations_.load(std::memory_order_relaxed);
        s.retained           = retained_.load(std::memory_order_relaxed);
        s.oversized_discards = oversized_discards_.load(std::memory_order_relaxed);
        s.available          = available_records_.size_approx();
        return s;
    }

    void reset_stats()
    {
        total_acquires_.store(0, std::memory_order_relaxed);
        total_releases_.store(0, std::memory_order_relaxed);
        allocations_.store(0, std::memory_order_relaxed);
        retained_.store(0, std::memory_order_relaxed);
        oversized_discards_.store(0, std::memory_order_relaxed);
    }
};

} // namespace rotolog
