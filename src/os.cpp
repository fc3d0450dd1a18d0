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
#include "os.hpp"

// C headers
#include <cstdlib>

// Containers
#include <string>

// Boost
#include <boost/optional.hpp>

// logview components
#include "constants.hpp"
#include "deref_proxy.hpp"


boost::optional<std::string> logview::os::getConfigFile() {
    // Per the XDG base directory specification, relative paths are ignored
    std::string path;
    const char* xdg_home = std::getenv("XDG_CONFIG_HOME");  // NOLINT(concurrency-mt-unsafe): read during startup
    if (xdg_home && xdg_home[0] == logview::PATH_SEP) {
        path = xdg_home;
    } else {
        const char* home = std::getenv("HOME");  // NOLINT(concurrency-mt-unsafe): read during startup
        if (!home || !home[0]) { return boost::none; }
        path.append(home).append(1, logview::PATH_SEP).append(".config");
    }

    path.append(1, logview::PATH_SEP).append(logview::CONFIG_DIR);
    path.append(1, logview::PATH_SEP).append(logview::CONFIG_FILE);
    return path;
}


logview::os::dir_handle::iterator logview::os::dir_handle::begin() noexcept {
    return logview::os::dir_handle::iterator(this);
}

// NOLINTNEXTLINE(readability-convert-member-functions-to-static): iterator factories are generally not static
logview::os::dir_handle::iterator logview::os::dir_handle::end() noexcept {
    return logview::os::dir_handle::iterator();
}


logview::os::dir_iter::dir_iter(logview::os::dir_handle* hdl_ref) noexcept : hdl_ref(hdl_ref) {}

logview::os::dir_iter& logview::os::dir_iter::operator++() {
    if (this->hdl_ref) { this->hdl_ref->fetch_next(); }
    return *this;
}

logview::deref_proxy<logview::os::dir_iter::value_type> logview::os::dir_iter::operator++(int) {
    logview::deref_proxy<value_type> res(this->hdl_ref ? this->hdl_ref->cur_entry : value_type{});
    ++(*this);
    return res;
}

logview::os::dir_iter::reference logview::os::dir_iter::operator*() noexcept {
    return this->hdl_ref->cur_entry;
}

logview::os::dir_iter::pointer logview::os::dir_iter::operator->() noexcept {
    return &this->hdl_ref->cur_entry;
}

bool logview::os::dir_iter::handle_exhausted() const noexcept {
    // dir_handle is considered exhausted for end sentinel (hdl_ref == nullptr)
    // NOLINTNEXTLINE(readability-implicit-bool-conversion): false positive (pointer conversion is allowed)
    return !this->hdl_ref || (this->hdl_ref->status != logview::os::dir_handle::ACTIVE);
}


bool logview::os::operator==(const dir_iter& lhs, const dir_iter& rhs) noexcept {
    // 2 dir_iters compare equal iff both point to
    // the same dir_handle or both dir_handle's are exhausted
    return (lhs.hdl_ref == rhs.hdl_ref) || (lhs.handle_exhausted() && rhs.handle_exhausted());
}

bool logview::os::operator!=(const dir_iter& lhs, const dir_iter& rhs) noexcept { return !(lhs == rhs); }
