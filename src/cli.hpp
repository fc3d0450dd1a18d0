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
#ifndef LOGVIEW_CLI_H
#define LOGVIEW_CLI_H


// C headers
#include <cstddef>
#include <cstdint>

// Containers
#include <string>
#include <vector>

// logview components
#include "constants.hpp"

namespace logview {
namespace cli {
struct options {
    // Verbose mode: debug logging, report individual files
    bool verbose = false;

    // Print record pool statistics after the run
    bool stats = false;

    // Only print ERROR records
    bool errors_only = false;

    // Wildcard for files inside directories
    std::string pattern = DEFAULT_PATTERN;

    // Limit on files taken from each directory, 0 for none
    std::size_t max_files = 0;

    std::size_t pool_capacity = DEFAULT_POOL_CAPACITY;
    std::uint_least64_t progress_interval = DEFAULT_PROGRESS_INTERVAL;

    // spdlog level name
    std::string log_level = DEFAULT_LOG_LEVEL;

    // Log files and directories, in command line order
    std::vector<std::string> paths;
};

// Command line values take precedence over the config file.
// Exits the process after printing help or version information.
// NOLINTNEXTLINE(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
options parseArgs(int argc, char* argv[]);
}  // namespace cli
}  // namespace logview


#endif  // LOGVIEW_CLI_H
