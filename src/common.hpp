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
#ifndef LOGVIEW_COMMON_H
#define LOGVIEW_COMMON_H


// Streams
#include <iostream>

// Containers
#include <string>

// Boost
#include <boost/utility/string_view.hpp>

namespace logview {
// Console streams used by the command line front end
static auto& cout = ::std::cout;  // NOLINT(clang-diagnostic-unused-variable)
static auto& cerr = ::std::cerr;  // NOLINT(clang-diagnostic-unused-variable)
constexpr char PATH_SEP = '/';

using string_view = boost::string_view;

inline bool is_blank(string_view str) noexcept {
    for (const char c : str) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\v' && c != '\f') { return false; }
    }
    return true;
}
}  // namespace logview


#endif  // LOGVIEW_COMMON_H
