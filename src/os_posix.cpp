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
#include <cerrno>
#include <cstdint>

// Containers
#include <string>

// Exceptions
#include <system_error>

// Utility
#include <memory>
#include <utility>

// POSIX API
#include <dirent.h>
#include <fnmatch.h>
#include <sys/stat.h>
#include <sys/types.h>

// Boost
#include <boost/optional.hpp>


namespace {
struct entry_validator {
    bool enable_dirs : 1, enable_hidden : 1, enable_system : 1;

    // d_type is DT_UNKNOWN on some file systems, so the stat result decides
    bool operator()(const struct dirent* d_entry, const struct stat* d_stat) const {
        if (!d_entry || !d_stat) { return false; }

        // Inspect name for leading dot (hidden entry; includes "." and "..")
        // Directory entries always have at least 1 character
        const bool hidden = d_entry->d_name[0] == '.';
        if (hidden && (!this->enable_hidden || isDotOrDotDot(d_entry->d_name))) { return false; }

        if (S_ISREG(d_stat->st_mode)) { return true; }
        if (S_ISDIR(d_stat->st_mode)) { return this->enable_dirs; }

        // Anything but files and directories (sockets, pipes, devices, ...)
        return this->enable_system;
    }

    static bool isDotOrDotDot(const char* name) noexcept {
        return name[0] == '.' && (name[1] == '\0' || (name[1] == '.' && name[2] == '\0'));
    }
};

logview::os::dir_entry dir_entry_from_dirent_stat(const struct dirent* f_entry, const struct stat* f_stat) {
    if (!f_entry || !f_stat) { return {}; }
    return { std::string(f_entry->d_name), S_ISDIR(f_stat->st_mode) != 0,
             { static_cast<std::uint_least64_t>(f_stat->st_dev), static_cast<std::uint_least64_t>(f_stat->st_ino) } };
}

std::system_error errno_error(const std::string& what) {
    return std::system_error(errno, std::generic_category(), what);
}
}  // Anonymous namespace


logview::os::file_kind logview::os::kindOf(const std::string& path) noexcept {
    struct stat f_stat {};
    if (path.empty() || ::stat(path.c_str(), &f_stat) == -1) { return file_kind::missing; }

    if (S_ISREG(f_stat.st_mode)) { return file_kind::regular; }
    if (S_ISDIR(f_stat.st_mode)) { return file_kind::directory; }
    return file_kind::other;
}

boost::optional<logview::os::file_id> logview::os::fileId(const std::string& path) noexcept {
    struct stat f_stat {};
    if (path.empty() || ::stat(path.c_str(), &f_stat) == -1) { return boost::none; }
    return file_id{ static_cast<std::uint_least64_t>(f_stat.st_dev), static_cast<std::uint_least64_t>(f_stat.st_ino) };
}

boost::optional<std::uint_least64_t> logview::os::fileSize(const std::string& path) noexcept {
    struct stat f_stat {};
    if (path.empty() || ::stat(path.c_str(), &f_stat) == -1) { return boost::none; }
    return static_cast<std::uint_least64_t>(f_stat.st_size);
}

bool logview::os::matchesPattern(const std::string& name, const std::string& pattern) noexcept {
    return ::fnmatch(pattern.c_str(), name.c_str(), FNM_PERIOD) == 0;
}

bool logview::os::createDirectories(const std::string& path) noexcept {
    if (path.empty()) { return false; }

    std::string::size_type pos = 0;
    do {
        pos = path.find(logview::PATH_SEP, pos + 1);
        const std::string part = path.substr(0, pos);
        if (::mkdir(part.c_str(), 0755) == -1 && errno != EEXIST) { return false; }
    } while (pos != std::string::npos);

    return kindOf(path) == file_kind::directory;
}


struct logview::os::dir_handle::iter_state {
    entry_validator valid_entry;
    DIR* dirp;
    const struct dirent* entry;
    struct stat entry_stat;
};


logview::os::dir_handle::dir_handle() noexcept = default;

logview::os::dir_handle::dir_handle(const std::string& dir, bool enable_dirs,
                                    bool enable_hidden, bool enable_system) :
        status(ACTIVE), state(new iter_state{ { enable_dirs, enable_hidden, enable_system }, {}, {}, {} }) {
    this->state->dirp = ::opendir(dir.c_str());

    if (!this->state->dirp) {
        this->status = CLOSED;
        throw errno_error("Error opening directory " + dir);
    }

    this->fetch_next();
}

logview::os::dir_handle::dir_handle(logview::os::dir_handle&& other) noexcept :
        status(other.status), state(std::move(other.state)), cur_entry(std::move(other.cur_entry)) {
    other.status = CLOSED;
}

logview::os::dir_handle& logview::os::dir_handle::operator=(logview::os::dir_handle&& other) noexcept {
    this->close();

    this->status = other.status;
    this->state = std::move(other.state);
    this->cur_entry = std::move(other.cur_entry);

    other.status = CLOSED;
    return *this;
}

logview::os::dir_handle::~dir_handle() { this->close(); }

void logview::os::dir_handle::close() noexcept {
    if (this->status == CLOSED) { return; }

    ::closedir(this->state->dirp);
    this->status = CLOSED;
}

bool logview::os::dir_handle::fetch_next() {
    if (this->status != ACTIVE) { return false; }

    for (;;) {
        // Reset errno to 0 to distinguish between EOD and error
        errno = 0;
        this->state->entry = ::readdir(this->state->dirp);

        if (!this->state->entry) {
            if (errno) { throw errno_error("Error retrieving next entry in directory"); }

            this->status = EXHAUSTED;
            return false;
        }

        if (::fstatat(::dirfd(this->state->dirp), this->state->entry->d_name, &this->state->entry_stat, 0) == -1) {
            // Entry vanished between readdir and fstatat, or is a dangling symlink
            if (errno == ENOENT) { continue; }
            throw errno_error(std::string("Error stating ") + this->state->entry->d_name);
        }

        if (this->state->valid_entry(this->state->entry, &this->state->entry_stat)) { break; }
    }

    this->cur_entry = dir_entry_from_dirent_stat(this->state->entry, &this->state->entry_stat);
    return true;
}
