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
#ifndef LOGVIEW_CANCELLATION_H
#define LOGVIEW_CANCELLATION_H


// Utility
#include <atomic>
#include <memory>
#include <utility>

// logview components
#include "error.hpp"

namespace logview {
// Observer side of a cancellation_source. A default constructed token is never cancelled.
class cancellation_token {
private:
    std::shared_ptr<const std::atomic<bool>> flag;

public:
    cancellation_token() noexcept = default;
    explicit cancellation_token(std::shared_ptr<const std::atomic<bool>> flag) noexcept : flag(std::move(flag)) {}

    bool is_cancellation_requested() const noexcept {
        return this->flag && this->flag->load(std::memory_order_acquire);
    }

    void throw_if_cancellation_requested() const {
        if (this->is_cancellation_requested()) {
            logview::throw_error(logview::error::cancelled, "Cancellation requested");
        }
    }
};

// cancel() only stores to a lock-free atomic, so it may be called from a signal handler
static_assert(ATOMIC_BOOL_LOCK_FREE == 2, "cancellation_source requires a lock-free std::atomic<bool>");

class cancellation_source {
private:
    std::shared_ptr<std::atomic<bool>> flag = std::make_shared<std::atomic<bool>>(false);

public:
    void cancel() noexcept { this->flag->store(true, std::memory_order_release); }
    bool is_cancellation_requested() const noexcept { return this->flag->load(std::memory_order_acquire); }

    cancellation_token token() const noexcept { return cancellation_token(this->flag); }
};
}  // namespace logview


#endif  // LOGVIEW_CANCELLATION_H
