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
#ifndef LOGVIEW_INGEST_H
#define LOGVIEW_INGEST_H


// C headers
#include <cstddef>
#include <cstdint>

// Containers
#include <string>
#include <vector>

// Threading
#include <mutex>

// Utility
#include <memory>
#include <chrono>

// logview components
#include "constants.hpp"
#include "cancellation.hpp"
#include "line_parser.hpp"
#include "reader.hpp"
#include "record.hpp"
#include "record_pool.hpp"

namespace logview {
struct parse_progress {
    std::uint_least64_t processed_lines = 0;
    // Caller supplied estimate, 0 if unknown
    std::uint_least64_t total_lines = 0;
    std::uint_least64_t records_emitted = 0;
    std::uint_least64_t bytes_processed = 0;
    std::uint_least64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    std::string current_file;
    std::string current_operation;
    bool finished = false;

    double percentage() const noexcept;
    double bytes_percentage() const noexcept;
    double lines_per_second() const noexcept;
};


namespace detail {
struct progress_slot {
    mutable std::mutex lock;
    std::shared_ptr<const parse_progress> latest = std::make_shared<const parse_progress>();

    void publish(const parse_progress& progress);
    std::shared_ptr<const parse_progress> load() const;
};
}  // namespace detail


// Lazy sequence of records produced by an ingestor. Each next() call reads raw lines until
// one of them parses; lines that don't are skipped. The record_pool must outlive the stream.
class record_stream {
private:
    std::shared_ptr<detail::progress_slot> slot;
    line_parser parser;
    reader::multi_line_cursor lines;
    cancellation_token token;
    std::uint_least64_t progress_interval;

    reader::tagged_line line;
    std::uint_least64_t file_line = 0;
    parse_progress cur;
    std::chrono::steady_clock::time_point start_time;
    enum { PENDING, RUNNING, DONE } state = PENDING;

    void publish(const char* operation);
    void finish(const char* operation);

public:
    record_stream(std::shared_ptr<detail::progress_slot> slot, record_pool& pool, reader::multi_line_cursor lines,
                  cancellation_token token, std::uint_least64_t progress_interval,
                  std::uint_least64_t expected_lines, std::uint_least64_t total_bytes);

    // Stores the next record in record and returns true, or returns false once all input is consumed.
    // Throws std::system_error with error::cancelled if cancellation was requested before a line
    // was read, and with error::file_not_found/io_failure if reading fails.
    bool next(record_ptr& record);

    // Snapshot of this stream's own counters
    const parse_progress& progress() const noexcept { return this->cur; }
};


class ingestor {
private:
    record_pool& pool;
    const std::uint_least64_t progress_interval;
    std::shared_ptr<detail::progress_slot> slot;

public:
    explicit ingestor(record_pool& pool, std::uint_least64_t progress_interval = DEFAULT_PROGRESS_INTERVAL);

    // Throws std::system_error (error::invalid_argument) for an empty path, (error::file_not_found)
    // if the file doesn't exist
    record_stream parse(const std::string& path, cancellation_token token = {},
                        std::uint_least64_t expected_lines = 0);

    // Line numbers restart at 1 for every file
    record_stream parse_files(std::vector<std::string> paths, cancellation_token token = {});

    record_stream parse_directory(const std::string& dir, const std::string& pattern = DEFAULT_PATTERN,
                                  std::size_t max_files = 0, cancellation_token token = {});

    // Counts lines the way the reader splits them. 0 for an empty or missing path.
    static std::uint_least64_t estimate_total_lines(const std::string& path);

    // Latest progress published by any stream of this ingestor
    std::shared_ptr<const parse_progress> progress() const;
};
}  // namespace logview


#endif  // LOGVIEW_INGEST_H
