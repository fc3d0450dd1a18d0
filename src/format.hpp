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
#ifndef LOGVIEW_FORMAT_H
#define LOGVIEW_FORMAT_H


// C headers
#include <cstdint>

// Streams
#include <sstream>
#include <iomanip>

// Containers
#include <string>

// Utility
#include <chrono>

// Boost
#include <boost/date_time/posix_time/posix_time.hpp>

// logview components
#include "record.hpp"

namespace logview {
namespace format {
inline std::string format_size(std::uint_least64_t bytes) {
    auto size = static_cast<long double>(bytes);
    const char* unit = "gigabyte";
    // NOLINTNEXTLINE(readability-qualified-auto): decreases readability
    for (const auto val : { "byte", "kilobyte", "megabyte" }) {
        if (size < 1000) {
            unit = val;
            break;
        }
        size /= 1000;
    }

    // Fixed notation without trailing zeros (and dot, if possible)
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size;

    std::string res = oss.str();
    while (res.back() == '0') { res.pop_back(); }
    if (res.back() == '.') { res.pop_back(); }

    // Plural unless size rounds to 1.00
    res.append(1, ' ').append(unit);
    // NOLINTNEXTLINE(readability-magic-numbers,cppcoreguidelines-avoid-magic-numbers): not magic
    if (size >= 1.005l || size < 0.995l) { res.append(1, 's'); }
    return res;
}

// 1h2m3s for long runs, 1.234s below a minute
template<class Rep, class Period>
inline std::string format_duration(const std::chrono::duration<Rep, Period>& dur) {
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(dur).count();

    bool neg = millis < 0;
    if (neg) { millis = -millis; }

    auto secs = millis / 1000;
    millis %= 1000;
    auto hours = secs / (60 * 60);
    secs %= (60 * 60);
    auto mins = secs / 60;
    secs %= 60;

    std::ostringstream oss;
    if (neg) { oss << '-'; }
    if (hours) { oss << hours << 'h'; }
    if (mins) { oss << mins << 'm'; }
    if (!hours && !mins) {
        oss << secs << '.' << std::setfill('0') << std::setw(3) << millis << 's';
    } else if (secs) {
        oss << secs << 's';
    }
    return oss.str();
}

// YYYY-MM-DD HH:MM:SS.mmm
inline std::string format_timestamp(const boost::posix_time::ptime& time) {
    if (time.is_special()) { return boost::posix_time::to_simple_string(time); }

    const auto date = time.date().year_month_day();
    const auto tod = time.time_of_day();
    const auto millis = tod.fractional_seconds() * 1000 / boost::posix_time::time_duration::ticks_per_second();

    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << static_cast<int>(date.year) << '-'
        << std::setw(2) << static_cast<int>(date.month) << '-' << std::setw(2) << static_cast<int>(date.day) << ' '
        << std::setw(2) << tod.hours() << ':' << std::setw(2) << tod.minutes() << ':'
        << std::setw(2) << tod.seconds() << '.' << std::setw(3) << millis;
    return oss.str();
}

// <timestamp> <LEVEL> <file>:<line> <message>
inline std::string format_record(const log_record& rec) {
    std::string res = format_timestamp(rec.timestamp);
    res.append(1, ' ').append(to_string(rec.level));
    res.append(1, ' ').append(rec.source_file).append(1, ':').append(std::to_string(rec.line_number));
    res.append(1, ' ').append(rec.message);
    return res;
}
}  // namespace format
}  // namespace logview


#endif  // LOGVIEW_FORMAT_H
