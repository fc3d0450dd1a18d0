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
#ifndef LOGVIEW_LINE_PARSER_H
#define LOGVIEW_LINE_PARSER_H


// C headers
#include <cstdint>

// Containers
#include <string>

// Utility
#include <regex>

// Boost
#include <boost/date_time/posix_time/ptime.hpp>

// logview components
#include "common.hpp"
#include "record.hpp"
#include "record_pool.hpp"

namespace logview {
// Recognizes lines of the form "YYYY-MM-DD HH:MM:SS,mmm <message>" (',' or '.' before the millis)
// and turns them into pooled log_records. Malformed input never throws.
class line_parser {
private:
    record_pool& pool;

    // Line starts with a timestamp
    const std::regex time_regex;

    // Timestamp, whitespace and the remainder of the line
    const std::regex standard_regex;

public:
    explicit line_parser(record_pool& pool);

    bool is_log_line(const std::string& line) const;

    // Returns nullptr for blank lines and lines that are not in the standard format.
    // Throws std::system_error only if the pool has been disposed.
    record_ptr parse(const std::string& line, std::uint_least64_t line_number, const std::string& file_path) const;

    // Parses "YYYY-MM-DD HH:MM:SS[,.]mmm", falling back to the current local time
    static boost::posix_time::ptime parse_timestamp(std::string timestamp);

    // ERROR if the text mentions "error", else WARNING if it mentions "warning", else INFO.
    // Zero counts ("0 errors", "0 warnings") are not mentions.
    static severity classify(logview::string_view text);
};
}  // namespace logview


#endif  // LOGVIEW_LINE_PARSER_H
