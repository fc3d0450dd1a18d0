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
#ifndef LOGVIEW_ERROR_H
#define LOGVIEW_ERROR_H


// Containers
#include <string>

// Exceptions
#include <system_error>

// Utility
#include <type_traits>

namespace logview {
// logview error codes
enum class error : int {
    invalid_argument = 1,
    file_not_found = 2,
    io_failure = 3,
    pool_disposed = 4,
    cancelled = 5
};

class error_category : public std::error_category {
public:
    const char* name() const noexcept override { return "logview"; }

    std::string message(int code) const noexcept override {
        switch (static_cast<error>(code)) {
            case error::invalid_argument:
                return "Invalid argument";

            case error::file_not_found:
                return "File or directory not found";

            case error::io_failure:
                return "I/O error while reading input";

            case error::pool_disposed:
                return "Record pool has been disposed";

            case error::cancelled:
                return "Operation was cancelled";

            default:
                return "Unknown error code";
        }
    }
};

inline const std::error_category& logview_category() noexcept {
    static error_category instance;
    return instance;
}

inline std::error_code make_error_code(error code) noexcept {
    return { static_cast<int>(code), logview_category() };
}

// Throws std::system_error carrying code; detail is appended to the category message
[[noreturn]] inline void throw_error(error code, const std::string& detail) {
    throw std::system_error(make_error_code(code), detail);
}
}  // namespace logview


namespace std {
template<>
struct is_error_code_enum<logview::error> : public std::true_type {};
}  // namespace std


#endif  // LOGVIEW_ERROR_H
