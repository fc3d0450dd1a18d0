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

// Forward declaration
#include "record_pool.hpp"

// Algorithms
#include <algorithm>

// Utility
#include <memory>
#include <utility>

// Logging
#include <spdlog/spdlog.h>

// logview components
#include "constants.hpp"
#include "error.hpp"


logview::record_pool::record_pool(std::size_t max_capacity) :
        capacity(std::max(max_capacity, logview::MIN_POOL_CAPACITY)), idle(capacity) {
    this->stats.max_pool_size = this->capacity;
    spdlog::debug("record_pool initialized with max capacity {}", this->capacity);
}

logview::record_pool::~record_pool() {
    this->dispose();

    // give_back calls racing with dispose() may still have pushed a record
    this->drain();
}

logview::record_ptr logview::record_pool::get() {
    if (this->disposed()) { logview::throw_error(logview::error::pool_disposed, "record_pool::get"); }

    log_record* rec = nullptr;
    if (this->idle.pop(rec)) {
        // A queued record always owns a reserved slot, so this can't underflow
        const auto available = this->idle_count.fetch_sub(1, std::memory_order_acq_rel) - 1;
        {
            std::lock_guard<std::mutex> lock(this->stats_lock);
            ++this->stats.total_gets;
            ++this->stats.pool_hits;
            this->stats.current_pool_size = available;
            this->stats.memory_saved_bytes = this->stats.pool_hits * logview::APPROX_RECORD_BYTES;
        }

        spdlog::trace("Retrieved record from pool, {} available", available);
        return record_ptr(rec);
    }

    std::uint_least64_t misses;  // NOLINT(cppcoreguidelines-init-variables): initialized below
    {
        std::lock_guard<std::mutex> lock(this->stats_lock);
        ++this->stats.total_gets;
        misses = ++this->stats.pool_misses;
        ++this->stats.total_instances_created;
    }

    spdlog::trace("Created new record, {} pool misses", misses);
    return std::make_unique<log_record>();
}

void logview::record_pool::give_back(logview::record_ptr record) {
    if (!record) {
        spdlog::warn("Attempted to return a null record to the pool");
        return;
    }
    if (this->disposed()) {
        spdlog::warn("Attempted to return a record to a disposed pool");
        return;
    }

    record->reset();
    {
        std::lock_guard<std::mutex> lock(this->stats_lock);
        ++this->stats.total_returns;
    }

    if (!this->reserve_slot()) {
        // Pool is full, record is freed when it goes out of scope
        spdlog::trace("Pool at capacity, discarding record");
        return;
    }

    if (!this->idle.push(record.get())) {
        this->idle_count.fetch_sub(1, std::memory_order_acq_rel);
        spdlog::trace("Failed to allocate queue node, discarding record");
        return;
    }
    record.release();

    const auto available = this->available_count();
    {
        std::lock_guard<std::mutex> lock(this->stats_lock);
        this->stats.current_pool_size = available;
    }
    spdlog::trace("Returned record to pool, {} available", available);
}

logview::pool_statistics logview::record_pool::statistics() const {
    std::lock_guard<std::mutex> lock(this->stats_lock);
    return this->stats;
}

void logview::record_pool::clear() {
    if (this->disposed()) { return; }

    const auto cleared = this->drain();
    spdlog::debug("Cleared {} records from pool", cleared);
}

void logview::record_pool::dispose() noexcept {
    if (this->is_disposed.exchange(true, std::memory_order_acq_rel)) { return; }

    spdlog::debug("Disposing record_pool with {} idle records", this->available_count());
    this->drain();

    const auto final_stats = this->statistics();
    spdlog::info("record_pool disposed. Gets: {}, returns: {}, hits: {}, misses: {}, "
                 "hit ratio: {:.2f}%, memory saved: {} bytes",
                 final_stats.total_gets, final_stats.total_returns, final_stats.pool_hits, final_stats.pool_misses,
                 final_stats.hit_ratio() * 100.0, final_stats.memory_saved_bytes);
}

bool logview::record_pool::reserve_slot() noexcept {
    auto cur = this->idle_count.load(std::memory_order_relaxed);
    do {
        if (cur >= this->capacity) { return false; }
    } while (!this->idle_count.compare_exchange_weak(cur, cur + 1, std::memory_order_acq_rel,
                                                      std::memory_order_relaxed));
    return true;
}

std::size_t logview::record_pool::drain() noexcept {
    const std::size_t cleared = this->idle.consume_all([](log_record* rec) { delete rec; });  // NOLINT(cppcoreguidelines-owning-memory)
    const auto available = this->idle_count.fetch_sub(cleared, std::memory_order_acq_rel) - cleared;

    std::lock_guard<std::mutex> lock(this->stats_lock);
    this->stats.current_pool_size = available;
    return cleared;
}
