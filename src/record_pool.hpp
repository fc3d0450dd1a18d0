/*
 * logview: Streaming log ingestion for the log viewer
 * Copyright (C) 2026  The logview authors
 *
 * This file is part of logview.
 *
 * logview is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * logview is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with logview.  If not, see <http://www.gnu.org/licenses/>.
 */

// Header guard
#pragma once
#ifndef LOGVIEW_RECORD_POOL_H
#define LOGVIEW_RECORD_POOL_H


// C headers
#include <cstddef>
#include <cstdint>

// Threading
#include <atomic>
#include <mutex>

// lock-free queue
#include <boost/lockfree/queue.hpp>

// logview components
#include "constants.hpp"
#include "record.hpp"

namespace logview {
struct pool_statistics {
    std::uint_least64_t total_gets = 0;
    std::uint_least64_t total_returns = 0;
    std::uint_least64_t pool_hits = 0;
    std::uint_least64_t pool_misses = 0;
    std::size_t current_pool_size = 0;
    std::size_t max_pool_size = 0;
    std::uint_least64_t total_instances_created = 0;
    std::uint_least64_t memory_saved_bytes = 0;

    double hit_ratio() const noexcept {
        return this->total_gets > 0 ? static_cast<double>(this->pool_hits) / this->total_gets : 0.0;
    }
};


// Recycles log_record instances to keep allocation rates flat while parsing large files.
// get and give_back may be called concurrently from any number of threads.
// Records that are checked out are owned by the caller; the pool never tracks them.
class record_pool {
private:
    const std::size_t capacity;

    // Idle records in FIFO order. idle_count reserves a slot before every push,
    // so it is never below the number of queued records and never above capacity.
    boost::lockfree::queue<log_record*> idle;
    std::atomic<std::size_t> idle_count{0};
    std::atomic<bool> is_disposed{false};

    mutable std::mutex stats_lock;
    pool_statistics stats;

    bool reserve_slot() noexcept;
    std::size_t drain() noexcept;

public:
    explicit record_pool(std::size_t max_capacity = DEFAULT_POOL_CAPACITY);
    record_pool(const record_pool& other) = delete;
    record_pool& operator=(const record_pool& other) = delete;
    ~record_pool();

    // Throws std::system_error (error::pool_disposed) after dispose()
    record_ptr get();

    // Resets the record and keeps it for reuse if there is room, otherwise frees it
    void give_back(record_ptr record);

    pool_statistics statistics() const;

    // Frees all idle records; checked out records are unaffected
    void clear();

    void dispose() noexcept;

    std::size_t available_count() const noexcept { return this->idle_count.load(std::memory_order_acquire); }
    std::size_t max_capacity() const noexcept { return this->capacity; }
    bool disposed() const noexcept { return this->is_disposed.load(std::memory_order_acquire); }
};
}  // namespace logview


#endif  // LOGVIEW_RECORD_POOL_H
