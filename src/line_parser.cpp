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
#include "line_parser.hpp"

// C headers
#include <cctype>

// Containers
#include <string>

// Exceptions
#include <exception>

// Algorithms
#include <algorithm>

// Utility
#include <regex>

// Boost
#include <boost/date_time/posix_time/posix_time.hpp>

// Logging
#include <spdlog/spdlog.h>


namespace {
// Poor man's operator ""sv
template<std::size_t len>
// NOLINTNEXTLINE(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
constexpr logview::string_view make_string_view(const char(&ptr)[len]) noexcept {
    static_assert(len >= 1, "String length must be at least 1 due to zero-termination");

    // Remove 1 from length to exclude zero terminator
    return { ptr, len - 1 };
}

constexpr auto error_word = make_string_view("error");
constexpr auto warning_word = make_string_view("warning");

// Summary lines like "0 errors" report the absence of errors.
// The '0' has to be a token of its own, so "10 errors" still counts.
bool is_zero_count(const std::string& lower, std::string::size_type pos) noexcept {
    if (pos < 2 || lower[pos - 1] != ' ' || lower[pos - 2] != '0') { return false; }
    return pos == 2 || !std::isalnum(static_cast<unsigned char>(lower[pos - 3]));
}

bool mentions(const std::string& lower, logview::string_view word) noexcept {
    for (auto pos = lower.find(word.data(), 0, word.size()); pos != std::string::npos;
         pos = lower.find(word.data(), pos + 1, word.size())) {
        if (!is_zero_count(lower, pos)) { return true; }
    }
    return false;
}
}  // Anonymous namespace


logview::line_parser::line_parser(logview::record_pool& pool) :
        pool(pool),
        time_regex(R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}[,.]\d{3})",
                   std::regex::optimize | std::regex::nosubs | std::regex::ECMAScript),
        // Only the first separator is matched, the rest of the whitespace and the message are
        // scanned by hand. Repetitions like "\s+" or "(.*)" make the backtracking matcher
        // recurse once per character.
        standard_regex(R"(^(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}[,.]\d{3})\s)",
                       std::regex::optimize | std::regex::ECMAScript) {}

bool logview::line_parser::is_log_line(const std::string& line) const {
    return std::regex_search(line, this->time_regex);
}

logview::record_ptr logview::line_parser::parse(const std::string& line, std::uint_least64_t line_number,
                                                const std::string& file_path) const {
    if (logview::is_blank(line) || !this->is_log_line(line)) { return nullptr; }

    std::smatch match;
    if (!std::regex_search(line, match, this->standard_regex)) { return nullptr; }

    record_ptr rec = this->pool.get();
    rec->timestamp = parse_timestamp(match.str(1));
    const auto msg_begin = std::find_if_not(match[0].second, line.end(), [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    rec->message.assign(msg_begin, line.end());
    rec->level = classify(rec->message);
    rec->source_file = file_path;
    rec->line_number = line_number;
    return rec;
}

boost::posix_time::ptime logview::line_parser::parse_timestamp(std::string timestamp) {
    // Boost.Date_Time only knows '.' as fractional separator
    std::replace(timestamp.begin(), timestamp.end(), ',', '.');

    try {
        const auto res = boost::posix_time::time_from_string(timestamp);
        if (!res.is_special()) { return res; }
        spdlog::trace("Timestamp '{}' does not denote a point in time", timestamp);
    } catch (const std::exception& ex) {
        // Out-of-range fields (e.g. month 13) end up here
        spdlog::trace("Failed to parse timestamp '{}': {}", timestamp, ex.what());
    }

    return boost::posix_time::microsec_clock::local_time();
}

logview::severity logview::line_parser::classify(logview::string_view text) {
    std::string lower(text.data(), text.size());
    std::transform(lower.begin(), lower.end(), lower.begin(), [](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });

    if (mentions(lower, error_word)) { return severity::error; }
    if (mentions(lower, warning_word)) { return severity::warning; }
    return severity::info;
}
