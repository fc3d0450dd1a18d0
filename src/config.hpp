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
#ifndef LOGVIEW_CONFIG_H
#define LOGVIEW_CONFIG_H


// C headers
#include <cstddef>
#include <cstdint>

// Containers
#include <string>

// Boost
#include <boost/optional.hpp>

// logview components
#include "constants.hpp"

namespace logview {
struct settings {
    // Upper bound of idle records kept by the record_pool
    std::size_t pool_capacity = DEFAULT_POOL_CAPACITY;

    // Wildcard for log files when a directory is given
    std::string pattern = DEFAULT_PATTERN;

    // Maximum number of files taken from a directory, 0 for no limit
    std::size_t max_files = 0;

    // Lines between two progress reports
    std::uint_least64_t progress_interval = DEFAULT_PROGRESS_INTERVAL;

    // spdlog level name (trace, debug, info, warn, err, critical, off)
    std::string log_level = DEFAULT_LOG_LEVEL;

    // Only report ERROR records
    bool errors_only = false;
};

// INI style settings file ("key = value"). Missing files are created with the defaults on first use.
class config_service {
private:
    std::string file_path;
    boost::optional<settings> cached;

public:
    explicit config_service(std::string path);

    // Cached settings, loaded from disk on first use
    const settings& get();

    // Re-reads the file. Returns false and falls back to the defaults if the file is missing or malformed.
    bool load();

    // Writes s to disk and caches it. Throws std::system_error (error::io_failure) if the file can't be written.
    void save(const settings& s);

    const std::string& path() const noexcept { return this->file_path; }
};
}  // namespace logview


#endif  // LOGVIEW_CONFIG_H
