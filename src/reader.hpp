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
#ifndef LOGVIEW_READER_H
#define LOGVIEW_READER_H


// C headers
#include <cstddef>
#include <cstdint>
#include <cstdio>

// Containers
#include <string>
#include <vector>

// Utility
#include <memory>
#include <iterator>

// Boost
#include <boost/optional.hpp>

// logview components
#include "common.hpp"
#include "constants.hpp"
#include "deref_proxy.hpp"

namespace logview {
namespace reader {
enum class text_encoding { utf8, utf16le, utf16be };

class line_iter;
bool operator==(const line_iter& lhs, const line_iter& rhs) noexcept;
bool operator!=(const line_iter& lhs, const line_iter& rhs) noexcept;

// Forward-only cursor over the lines of a single file. Only one chunk of the file
// is held in memory; next() decodes one line per call.
// Lines end at "\n", "\r\n" or a lone "\r". The terminator is not part of the line.
// A BOM selects UTF-8 or UTF-16 (LE/BE); UTF-16 is converted to UTF-8.
class line_cursor {
private:
    using file_ptr = std::unique_ptr<std::FILE, int (*)(std::FILE*)>;

    enum { CLOSED, ACTIVE, EXHAUSTED } status = CLOSED;
    std::string file_path;
    file_ptr file;
    text_encoding file_encoding = text_encoding::utf8;

    std::vector<char> buffer;
    std::size_t buf_pos = 0;
    std::size_t buf_len = 0;
    std::uint_least64_t bytes = 0;

    // UTF-16 unit read past a lone '\r'
    boost::optional<char16_t> pending_unit;

    // Current line for line_iter
    std::string cur_line;

    bool fill_buffer();
    bool fetch_byte(unsigned char& c);
    bool fetch_unit(char16_t& unit);
    void detect_encoding();
    bool next_utf8(std::string& line);
    bool next_utf16(std::string& line);
    bool advance();

public:
    friend class line_iter;
    using iterator = line_iter;

    line_cursor() noexcept;
    // Throws std::system_error (error::file_not_found) if path can't be opened
    explicit line_cursor(const std::string& path);
    line_cursor(const line_cursor& other) = delete;
    line_cursor(line_cursor&& other) noexcept;

    line_cursor& operator=(const line_cursor& other) = delete;
    line_cursor& operator=(line_cursor&& other) noexcept;

    ~line_cursor();

    // Stores the next line in line and returns true, or returns false at the end of the file.
    // The file is closed as soon as the end is reached.
    // Throws std::system_error (error::io_failure) if reading fails; the cursor is closed afterwards.
    bool next(std::string& line);

    void close() noexcept;
    bool is_open() const noexcept { return this->status == ACTIVE; }

    const std::string& path() const noexcept { return this->file_path; }
    text_encoding encoding() const noexcept { return this->file_encoding; }

    // Bytes consumed so far, including BOM and line terminators
    std::uint_least64_t bytes_read() const noexcept { return this->bytes; }

    // Single pass: begin() consumes the first line
    iterator begin();
    iterator end() noexcept;
};

class line_iter {
private:
    line_cursor* const cursor_ref;

    bool cursor_exhausted() const noexcept;

    friend bool operator==(const line_iter& lhs, const line_iter& rhs) noexcept;
    friend bool operator!=(const line_iter& lhs, const line_iter& rhs) noexcept;

public:
    using difference_type = std::ptrdiff_t;
    using value_type = std::string;
    using pointer = const std::string*;
    using reference = const std::string&;
    using iterator_category = std::input_iterator_tag;

    explicit line_iter(line_cursor* cursor_ref = nullptr) noexcept;

    line_iter& operator++();
    logview::deref_proxy<value_type> operator++(int);

    reference operator*() const noexcept;
    pointer operator->() const noexcept;
};


struct tagged_line {
    std::string path;
    std::string text;
};

// Concatenates the lines of several files in the given order. Each file is opened once it is reached.
class multi_line_cursor {
private:
    std::vector<std::string> file_paths;
    std::size_t next_file = 0;
    line_cursor current;
    std::uint_least64_t finished_bytes = 0;

public:
    explicit multi_line_cursor(std::vector<std::string> paths) noexcept;

    // Throws std::system_error (error::file_not_found) when a file can't be opened
    // and (error::io_failure) when reading fails
    bool next(tagged_line& line);

    void close() noexcept;

    const std::vector<std::string>& files() const noexcept { return this->file_paths; }
    std::uint_least64_t bytes_read() const noexcept;
};


line_cursor loadLines(const std::string& path);
multi_line_cursor loadLines(std::vector<std::string> paths);

// Regular files below dir whose name matches pattern, recursively, sorted by path.
// max_files == 0 means no limit.
// Throws std::system_error (error::file_not_found) if dir doesn't exist, (error::invalid_argument)
// if it is not a directory.
std::vector<std::string> findFiles(const std::string& dir, const std::string& pattern = DEFAULT_PATTERN,
                                   std::size_t max_files = 0);

multi_line_cursor loadLinesFromDirectory(const std::string& dir, const std::string& pattern = DEFAULT_PATTERN,
                                         std::size_t max_files = 0);
}  // namespace reader
}  // namespace logview


#endif  // LOGVIEW_READER_H
