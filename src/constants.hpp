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
#ifndef LOGVIEW_CONSTANTS_H
#define LOGVIEW_CONSTANTS_H


// C headers
#include <cstddef>
#include <cstdint>

namespace logview {
inline namespace constants {
// Config/CLI defaults
constexpr char CONFIG_FILE[] = "logview.cfg";  // NOLINT(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
constexpr char CONFIG_DIR[] = "logview";  // NOLINT(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
constexpr char DEFAULT_PATTERN[] = "*.log";  // NOLINT(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
constexpr char DEFAULT_LOG_LEVEL[] = "warn";  // NOLINT(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)

// Record pool
constexpr std::size_t DEFAULT_POOL_CAPACITY = 1000;
constexpr std::size_t MIN_POOL_CAPACITY = 10;

// Rough footprint of an idle log_record, used for the memory saved estimate
constexpr std::uint_least64_t APPROX_RECORD_BYTES = 200;

// Streaming reader
constexpr std::size_t READ_CHUNK_BYTES = 64 * 1024;

// Ingestion pipeline
constexpr std::uint_least64_t DEFAULT_PROGRESS_INTERVAL = 1000;
}  // namespace constants
}  // namespace logview


#endif  // LOGVIEW_CONSTANTS_H
