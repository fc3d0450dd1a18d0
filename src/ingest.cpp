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
#include "ingest.hpp"

// Containers
#include <string>
#include <vector>

// Exceptions
#include <system_error>

// Algorithms
#include <algorithm>

// Utility
#include <chrono>
#include <memory>
#include <utility>

// Logging
#include <spdlog/spdlog.h>

// logview components
#include "error.hpp"
#include "os.hpp"


namespace {
std::uint_least64_t totalSize(const std::vector<std::string>& paths) noexcept {
    std::uint_least64_t res = 0;
    for (const auto& path : paths) { res += logview::os::fileSize(path).value_or(0); }
    return res;
}

void checkFile(const std::string& path) {
    if (path.empty()) { logview::throw_error(logview::error::invalid_argument, "File path must not be empty"); }
    if (logview::os::kindOf(path) == logview::os::file_kind::missing) {
        logview::throw_error(logview::error::file_not_found, path);
    }
}
}  // Anonymous namespace


double logview::parse_progress::percentage() const noexcept {
    if (this->total_lines == 0) { return 0.0; }
    return std::min(100.0, 100.0 * static_cast<double>(this->processed_lines) / this->total_lines);
}

double logview::parse_progress::bytes_percentage() const noexcept {
    if (this->total_bytes == 0) { return 0.0; }
    return std::min(100.0, 100.0 * static_cast<double>(this->bytes_processed) / this->total_bytes);
}

double logview::parse_progress::lines_per_second() const noexcept {
    const auto millis = this->elapsed.count();
    if (millis <= 0) { return 0.0; }
    return static_cast<double>(this->processed_lines) * 1000.0 / millis;
}


void logview::detail::progress_slot::publish(const logview::parse_progress& progress) {
    auto snapshot = std::make_shared<const parse_progress>(progress);
    std::lock_guard<std::mutex> guard(this->lock);
    this->latest = std::move(snapshot);
}

std::shared_ptr<const logview::parse_progress> logview::detail::progress_slot::load() const {
    std::lock_guard<std::mutex> guard(this->lock);
    return this->latest;
}


logview::record_stream::record_stream(std::shared_ptr<detail::progress_slot> slot, logview::record_pool& pool,
                                      logview::reader::multi_line_cursor lines, logview::cancellation_token token,
                                      std::uint_least64_t progress_interval, std::uint_least64_t expected_lines,
                                      std::uint_least64_t total_bytes) :
        slot(std::move(slot)), parser(pool), lines(std::move(lines)), token(std::move(token)),
        progress_interval(std::max<std::uint_least64_t>(progress_interval, 1)) {
    this->cur.total_lines = expected_lines;
    this->cur.total_bytes = total_bytes;
}

void logview::record_stream::publish(const char* operation) {
    this->cur.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - this->start_time);
    this->cur.current_operation = operation;
    this->slot->publish(this->cur);
}

void logview::record_stream::finish(const char* operation) {
    this->lines.close();
    this->state = DONE;
    this->cur.finished = true;
    this->publish(operation);

    spdlog::debug("{}: {} lines, {} records in {} ms", operation, this->cur.processed_lines,
                  this->cur.records_emitted, this->cur.elapsed.count());
}

bool logview::record_stream::next(logview::record_ptr& record) {
    if (this->state == DONE) { return false; }
    if (this->state == PENDING) {
        this->state = RUNNING;
        this->start_time = std::chrono::steady_clock::now();
        this->publish("Parsing");
    }

    for (;;) {
        if (this->token.is_cancellation_requested()) {
            this->finish("Cancelled");
            logview::throw_error(logview::error::cancelled, "Parsing cancelled after "
                                 + std::to_string(this->cur.processed_lines) + " lines");
        }

        bool has_line;  // NOLINT(cppcoreguidelines-init-variables): initialized below
        try {
            has_line = this->lines.next(this->line);
        } catch (const std::system_error&) {
            this->finish("Failed");
            throw;
        }

        if (!has_line) {
            this->finish("Completed");
            return false;
        }

        if (this->line.path != this->cur.current_file) {
            this->file_line = 0;
            this->cur.current_file = this->line.path;
        }

        ++this->file_line;
        ++this->cur.processed_lines;
        this->cur.bytes_processed = this->lines.bytes_read();

        record_ptr rec = this->parser.parse(this->line.text, this->file_line, this->line.path);
        if (this->cur.processed_lines % this->progress_interval == 0) { this->publish("Parsing"); }

        if (rec) {
            ++this->cur.records_emitted;
            record = std::move(rec);
            return true;
        }
    }
}


logview::ingestor::ingestor(logview::record_pool& pool, std::uint_least64_t progress_interval) :
        pool(pool), progress_interval(progress_interval), slot(std::make_shared<detail::progress_slot>()) {}

logview::record_stream logview::ingestor::parse(const std::string& path, logview::cancellation_token token,
                                                std::uint_least64_t expected_lines) {
    checkFile(path);
    spdlog::debug("Parsing {}", path);

    std::vector<std::string> paths{ path };
    const auto total_bytes = totalSize(paths);
    return record_stream(this->slot, this->pool, reader::loadLines(std::move(paths)), std::move(token),
                         this->progress_interval, expected_lines, total_bytes);
}

logview::record_stream logview::ingestor::parse_files(std::vector<std::string> paths,
                                                      logview::cancellation_token token) {
    for (const auto& path : paths) { checkFile(path); }
    spdlog::debug("Parsing {} files", paths.size());

    const auto total_bytes = totalSize(paths);
    return record_stream(this->slot, this->pool, reader::loadLines(std::move(paths)), std::move(token),
                         this->progress_interval, 0, total_bytes);
}

logview::record_stream logview::ingestor::parse_directory(const std::string& dir, const std::string& pattern,
                                                          std::size_t max_files, logview::cancellation_token token) {
    if (dir.empty()) { logview::throw_error(logview::error::invalid_argument, "Directory path must not be empty"); }
    return this->parse_files(reader::findFiles(dir, pattern, max_files), std::move(token));
}

std::uint_least64_t logview::ingestor::estimate_total_lines(const std::string& path) {
    if (path.empty() || logview::os::kindOf(path) != logview::os::file_kind::regular) { return 0; }

    reader::line_cursor cursor(path);
    std::string line;
    std::uint_least64_t count = 0;
    while (cursor.next(line)) { ++count; }
    return count;
}

std::shared_ptr<const logview::parse_progress> logview::ingestor::progress() const { return this->slot->load(); }
