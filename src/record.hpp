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
#ifndef LOGVIEW_RECORD_H
#define LOGVIEW_RECORD_H


// C headers
#include <cstdint>

// Containers
#include <string>
#include <vector>

// Utility
#include <memory>

// Boost
#include <boost/optional.hpp>
#include <boost/date_time/posix_time/ptime.hpp>

// logview components
#include "common.hpp"

namespace logview {
enum class severity : unsigned char {
    info,
    warning,
    error
};

// "INFO", "WARNING" or "ERROR"
const char* to_string(severity level) noexcept;

// Case-insensitive inverse of to_string
boost::optional<severity> severity_from_string(logview::string_view tag) noexcept;


struct log_record {
    // Naive wall-clock time as written in the log
    boost::posix_time::ptime timestamp;
    severity level = severity::info;
    std::string message;
    std::string source_file;

    // 1-based once populated by the parser
    std::uint_least64_t line_number = 0;

    // Filled in by downstream consumers (error detection, recommendations)
    std::string source;
    boost::optional<std::string> correlation_id;
    boost::optional<std::string> error_type;
    boost::optional<std::string> error_description;
    std::vector<std::string> error_recommendations;
    boost::optional<std::string> stack_trace;
    boost::optional<std::string> recommendation;

    // Restores the state of a default constructed record. Buffers keep their capacity.
    void reset() noexcept;

    bool is_error() const noexcept { return this->level == severity::error; }
};

using record_ptr = std::unique_ptr<log_record>;

// Keeps only ERROR records, preserving order
std::vector<const log_record*> filter_errors(const std::vector<record_ptr>& records);
}  // namespace logview


#endif  // LOGVIEW_RECORD_H
