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
#include "record.hpp"

// C headers
#include <cctype>

// Containers
#include <array>
#include <vector>

// Boost
#include <boost/optional.hpp>
#include <boost/date_time/posix_time/ptime.hpp>


namespace {
bool iequals_ascii(logview::string_view lhs, logview::string_view rhs) noexcept {
    if (lhs.size() != rhs.size()) { return false; }
    for (logview::string_view::size_type idx = 0; idx < lhs.size(); ++idx) {
        const auto l = static_cast<unsigned char>(lhs[idx]);
        const auto r = static_cast<unsigned char>(rhs[idx]);
        if (std::tolower(l) != std::tolower(r)) { return false; }
    }
    return true;
}
}  // Anonymous namespace


const char* logview::to_string(logview::severity level) noexcept {
    switch (level) {
        case severity::warning:
            return "WARNING";

        case severity::error:
            return "ERROR";

        case severity::info:
        default:
            return "INFO";
    }
}

boost::optional<logview::severity> logview::severity_from_string(logview::string_view tag) noexcept {
    static constexpr std::array<severity, 3> levels = { severity::info, severity::warning, severity::error };
    for (const auto level : levels) {
        if (iequals_ascii(tag, to_string(level))) { return level; }
    }
    return boost::none;
}


void logview::log_record::reset() noexcept {
    this->timestamp = boost::posix_time::ptime();
    this->level = severity::info;
    this->message.clear();
    this->source_file.clear();
    this->line_number = 0;

    this->source.clear();
    this->correlation_id = boost::none;
    this->error_type = boost::none;
    this->error_description = boost::none;
    this->error_recommendations.clear();
    this->stack_trace = boost::none;
    this->recommendation = boost::none;
}


std::vector<const logview::log_record*> logview::filter_errors(const std::vector<logview::record_ptr>& records) {
    std::vector<const log_record*> res;
    for (const auto& rec : records) {
        if (rec && rec->is_error()) { res.push_back(rec.get()); }
    }
    return res;
}
