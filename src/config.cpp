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
#include "config.hpp"

// Streams
#include <fstream>

// Containers
#include <string>

// Exceptions
#include <system_error>

// Utility
#include <utility>

// Boost
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

// Logging
#include <spdlog/spdlog.h>

// logview components
#include "common.hpp"
#include "error.hpp"
#include "os.hpp"


namespace po = boost::program_options;

namespace {
po::options_description settingsOptions(logview::settings& s) {
    po::options_description cfg_options;
    cfg_options.add_options()
        ("pool-capacity", po::value(&s.pool_capacity)->default_value(s.pool_capacity))
        ("pattern", po::value(&s.pattern)->default_value(s.pattern))
        ("max-files", po::value(&s.max_files)->default_value(s.max_files))
        ("progress-interval", po::value(&s.progress_interval)->default_value(s.progress_interval))
        ("log-level", po::value(&s.log_level)->default_value(s.log_level))
        ("errors-only", po::value(&s.errors_only)->default_value(s.errors_only));
    return cfg_options;
}
}  // Anonymous namespace


logview::config_service::config_service(std::string path) : file_path(std::move(path)) {}

const logview::settings& logview::config_service::get() {
    if (this->cached) { return this->cached.get(); }

    const bool exists = logview::os::kindOf(this->file_path) != logview::os::file_kind::missing;
    if (!this->load() && !exists) {
        try {
            this->save(this->cached.get());
            spdlog::info("Created default configuration at {}", this->file_path);
        } catch (const std::system_error& e) {
            spdlog::warn("Could not create default configuration: {}", e.what());
        }
    }

    return this->cached.get();
}

bool logview::config_service::load() {
    this->cached = settings{};

    std::ifstream in(this->file_path);
    if (!in) {
        spdlog::debug("No configuration at {}, using defaults", this->file_path);
        return false;
    }

    settings s;
    try {
        po::variables_map vm;
        po::store(po::parse_config_file(in, settingsOptions(s)), vm);
        po::notify(vm);
    } catch (const po::error& e) {
        spdlog::error("Malformed configuration {}: {}", this->file_path, e.what());
        return false;
    }

    this->cached = std::move(s);
    return true;
}

void logview::config_service::save(const logview::settings& s) {
    const auto dir_end = this->file_path.rfind(logview::PATH_SEP);
    if (dir_end != std::string::npos && dir_end > 0) {
        const auto dir = this->file_path.substr(0, dir_end);
        if (!logview::os::createDirectories(dir)) {
            logview::throw_error(logview::error::io_failure, "Error creating directory " + dir);
        }
    }

    std::ofstream out(this->file_path, std::ofstream::trunc);
    out << "# logview configuration\n"
        << "pool-capacity = " << s.pool_capacity << "\n"
        << "pattern = " << s.pattern << "\n"
        << "max-files = " << s.max_files << "\n"
        << "progress-interval = " << s.progress_interval << "\n"
        << "log-level = " << s.log_level << "\n"
        << "errors-only = " << (s.errors_only ? "true" : "false") << "\n";
    out.close();

    if (!out) { logview::throw_error(logview::error::io_failure, "Error writing " + this->file_path); }
    this->cached = s;
}
