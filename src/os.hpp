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
#ifndef LOGVIEW_OS_H
#define LOGVIEW_OS_H


// C headers
#include <cstdint>

// Containers
#include <string>

// Utility
#include <memory>
#include <iterator>

// Boost
#include <boost/optional.hpp>

// logview components
#include "common.hpp"
#include "deref_proxy.hpp"

namespace logview {
namespace os {
enum class file_kind { missing, regular, directory, other };

// Identifies a file independent of the path used to reach it
struct file_id {
    std::uint_least64_t device = 0;
    std::uint_least64_t inode = 0;

    bool operator<(const file_id& other) const noexcept {
        return this->device < other.device || (this->device == other.device && this->inode < other.inode);
    }
};

file_kind kindOf(const std::string& path) noexcept;
boost::optional<file_id> fileId(const std::string& path) noexcept;
boost::optional<std::uint_least64_t> fileSize(const std::string& path) noexcept;

// Shell-style wildcard match ("*.log") against a file name
bool matchesPattern(const std::string& name, const std::string& pattern) noexcept;

// mkdir -p; returns false if a component can't be created
bool createDirectories(const std::string& path) noexcept;

// $XDG_CONFIG_HOME/logview/logview.cfg, or ~/.config/logview/logview.cfg
boost::optional<std::string> getConfigFile();

struct dir_entry {
    std::string name;
    bool is_dir = false;
    file_id id;
};

class dir_iter;
bool operator==(const dir_iter& lhs, const dir_iter& rhs) noexcept;
bool operator!=(const dir_iter& lhs, const dir_iter& rhs) noexcept;

class dir_handle {
private:
    struct iter_state;

    enum { CLOSED, ACTIVE, EXHAUSTED } status = CLOSED;
    std::unique_ptr<iter_state> state;
    dir_entry cur_entry;

    bool fetch_next();

public:
    friend class dir_iter;
    using iterator = dir_iter;

    dir_handle() noexcept;
    // Throws std::system_error with the errno of opendir
    explicit dir_handle(const std::string& dir, bool enable_dirs = false,
                        bool enable_hidden = false, bool enable_system = false);
    dir_handle(const dir_handle& other) = delete;
    dir_handle(dir_handle&& other) noexcept;

    dir_handle& operator=(const dir_handle& other) = delete;
    dir_handle& operator=(dir_handle&& other) noexcept;

    ~dir_handle();
    void close() noexcept;

    iterator begin() noexcept;
    iterator end() noexcept;
};

class dir_iter {
private:
    dir_handle* const hdl_ref;

    bool handle_exhausted() const noexcept;

    friend bool operator==(const dir_iter& lhs, const dir_iter& rhs) noexcept;
    friend bool operator!=(const dir_iter& lhs, const dir_iter& rhs) noexcept;

public:
    using difference_type = std::ptrdiff_t;
    using value_type = dir_entry;
    using pointer = const dir_entry*;
    using reference = const dir_entry&;
    using iterator_category = std::input_iterator_tag;

    explicit dir_iter(dir_handle* hdl_ref = nullptr) noexcept;

    dir_iter& operator++();
    logview::deref_proxy<value_type> operator++(int);

    reference operator*() noexcept;
    pointer operator->() noexcept;
};
}  // namespace os
}  // namespace logview


#endif  // LOGVIEW_OS_H
