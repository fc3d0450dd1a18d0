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
#include "reader.hpp"

// C headers
#include <cstdio>

// Containers
#include <string>
#include <vector>
#include <set>

// Exceptions
#include <system_error>

// Utility
#include <algorithm>
#include <utility>

// Boost
#include <boost/locale/encoding_utf.hpp>

// spdlog
#include <spdlog/spdlog.h>

// logview components
#include "common.hpp"
#include "error.hpp"
#include "os.hpp"


namespace {
bool isLineEnd(char c) noexcept { return c == '\n' || c == '\r'; }

void collectFiles(const std::string& dir, const std::string& pattern, std::set<logview::os::file_id>& visited,
                  std::vector<std::string>& out) {
    logview::os::dir_handle hdl(dir, true);

    std::string path = dir;
    if (path.empty() || path.back() != logview::PATH_SEP) { path.append(1, logview::PATH_SEP); }
    const auto base_end = path.length();

    for (const logview::os::dir_entry& entry : hdl) {
        path.replace(base_end, std::string::npos, entry.name);

        if (entry.is_dir) {
            // Symlinked directories may point back up the tree
            if (!visited.insert(entry.id).second) { continue; }

            try {
                collectFiles(path, pattern, visited, out);
            } catch (const std::system_error& e) {
                // Unreadable subdirectories are skipped, the root directory is not
                spdlog::warn("Skipping directory {}: {}", path, e.what());
            }
        } else if (logview::os::matchesPattern(entry.name, pattern)) {
            out.push_back(path);
        }
    }
}
}  // Anonymous namespace


logview::reader::line_cursor::line_cursor() noexcept : file(nullptr, &std::fclose) {}

logview::reader::line_cursor::line_cursor(const std::string& path) :
        file_path(path), file(nullptr, &std::fclose) {
    switch (logview::os::kindOf(path)) {
        case logview::os::file_kind::missing:
            logview::throw_error(logview::error::file_not_found, path);

        case logview::os::file_kind::directory:
            logview::throw_error(logview::error::invalid_argument, path + " is a directory");

        default:
            break;
    }

    this->file.reset(std::fopen(path.c_str(), "rb"));
    if (!this->file) { logview::throw_error(logview::error::io_failure, "Error opening " + path); }

    this->status = ACTIVE;
    this->buffer.resize(logview::READ_CHUNK_BYTES);
    this->detect_encoding();
    spdlog::debug("Opened {} for reading", path);
}

logview::reader::line_cursor::line_cursor(logview::reader::line_cursor&& other) noexcept :
        status(other.status), file_path(std::move(other.file_path)), file(std::move(other.file)),
        file_encoding(other.file_encoding), buffer(std::move(other.buffer)), buf_pos(other.buf_pos),
        buf_len(other.buf_len), bytes(other.bytes), pending_unit(other.pending_unit),
        cur_line(std::move(other.cur_line)) {
    other.status = CLOSED;
}

logview::reader::line_cursor& logview::reader::line_cursor::operator=(logview::reader::line_cursor&& other) noexcept {
    this->close();

    this->status = other.status;
    this->file_path = std::move(other.file_path);
    this->file = std::move(other.file);
    this->file_encoding = other.file_encoding;
    this->buffer = std::move(other.buffer);
    this->buf_pos = other.buf_pos;
    this->buf_len = other.buf_len;
    this->bytes = other.bytes;
    this->pending_unit = other.pending_unit;
    this->cur_line = std::move(other.cur_line);

    other.status = CLOSED;
    return *this;
}

logview::reader::line_cursor::~line_cursor() { this->close(); }

void logview::reader::line_cursor::close() noexcept {
    if (this->file) {
        this->file.reset();
        spdlog::trace("Closed {} after {} bytes", this->file_path, this->bytes);
    }

    if (this->status == ACTIVE) { this->status = EXHAUSTED; }
    this->buf_pos = this->buf_len = 0;
    this->pending_unit = boost::none;
}

bool logview::reader::line_cursor::fill_buffer() {
    if (!this->file) { return false; }

    const std::size_t n = std::fread(this->buffer.data(), 1, this->buffer.size(), this->file.get());
    if (n == 0) {
        if (std::ferror(this->file.get())) {
            this->close();
            logview::throw_error(logview::error::io_failure, "Error reading " + this->file_path);
        }
        return false;
    }

    this->buf_pos = 0;
    this->buf_len = n;
    return true;
}

bool logview::reader::line_cursor::fetch_byte(unsigned char& c) {
    if (this->buf_pos == this->buf_len && !this->fill_buffer()) { return false; }

    c = static_cast<unsigned char>(this->buffer[this->buf_pos++]);
    ++this->bytes;
    return true;
}

bool logview::reader::line_cursor::fetch_unit(char16_t& unit) {
    if (this->pending_unit) {
        unit = this->pending_unit.get();
        this->pending_unit = boost::none;
        return true;
    }

    unsigned char b0 = 0;
    unsigned char b1 = 0;
    // A trailing odd byte can't form a code unit and is dropped
    if (!this->fetch_byte(b0) || !this->fetch_byte(b1)) { return false; }

    if (this->file_encoding == text_encoding::utf16le) {
        unit = static_cast<char16_t>(b0 | (b1 << 8));
    } else {
        unit = static_cast<char16_t>((b0 << 8) | b1);
    }
    return true;
}

void logview::reader::line_cursor::detect_encoding() {
    if (!this->fill_buffer()) { return; }

    const auto* data = reinterpret_cast<const unsigned char*>(this->buffer.data());  // NOLINT: byte view
    if (this->buf_len >= 3 && data[0] == 0xEF && data[1] == 0xBB && data[2] == 0xBF) {
        this->buf_pos = 3;
    } else if (this->buf_len >= 2 && data[0] == 0xFF && data[1] == 0xFE) {
        this->file_encoding = text_encoding::utf16le;
        this->buf_pos = 2;
    } else if (this->buf_len >= 2 && data[0] == 0xFE && data[1] == 0xFF) {
        this->file_encoding = text_encoding::utf16be;
        this->buf_pos = 2;
    }

    this->bytes += this->buf_pos;
}

bool logview::reader::line_cursor::next_utf8(std::string& line) {
    bool got_data = false;

    for (;;) {
        if (this->buf_pos == this->buf_len) {
            if (!this->fill_buffer()) { return got_data; }
        }
        got_data = true;

        const char* begin = this->buffer.data() + this->buf_pos;
        const char* end = this->buffer.data() + this->buf_len;
        const char* it = std::find_if(begin, end, isLineEnd);

        const auto len = static_cast<std::size_t>(it - begin);
        line.append(begin, len);
        this->buf_pos += len;
        this->bytes += len;
        if (it == end) { continue; }

        // Consume terminator, "\r\n" counts as one
        ++this->buf_pos;
        ++this->bytes;
        if (*it == '\r') {
            if (this->buf_pos == this->buf_len && !this->fill_buffer()) { return true; }
            if (this->buffer[this->buf_pos] == '\n') {
                ++this->buf_pos;
                ++this->bytes;
            }
        }
        return true;
    }
}

bool logview::reader::line_cursor::next_utf16(std::string& line) {
    std::u16string units;
    bool got_data = false;

    char16_t unit = 0;
    while (this->fetch_unit(unit)) {
        got_data = true;
        if (unit == u'\n') { break; }
        if (unit == u'\r') {
            char16_t follow = 0;
            if (this->fetch_unit(follow) && follow != u'\n') { this->pending_unit = follow; }
            break;
        }
        units.push_back(unit);
    }

    if (!got_data) { return false; }
    line = boost::locale::conv::utf_to_utf<char>(units);
    return true;
}

bool logview::reader::line_cursor::next(std::string& line) {
    line.clear();
    if (this->status != ACTIVE) { return false; }

    const bool res = this->file_encoding == text_encoding::utf8 ? this->next_utf8(line) : this->next_utf16(line);
    if (!res) { this->close(); }
    return res;
}

bool logview::reader::line_cursor::advance() { return this->next(this->cur_line); }

logview::reader::line_cursor::iterator logview::reader::line_cursor::begin() {
    this->advance();
    return logview::reader::line_cursor::iterator(this);
}

// NOLINTNEXTLINE(readability-convert-member-functions-to-static): iterator factories are generally not static
logview::reader::line_cursor::iterator logview::reader::line_cursor::end() noexcept {
    return logview::reader::line_cursor::iterator();
}


logview::reader::line_iter::line_iter(logview::reader::line_cursor* cursor_ref) noexcept : cursor_ref(cursor_ref) {}

logview::reader::line_iter& logview::reader::line_iter::operator++() {
    if (this->cursor_ref) { this->cursor_ref->advance(); }
    return *this;
}

logview::deref_proxy<logview::reader::line_iter::value_type> logview::reader::line_iter::operator++(int) {
    logview::deref_proxy<value_type> res(this->cursor_ref ? this->cursor_ref->cur_line : value_type{});
    ++(*this);
    return res;
}

logview::reader::line_iter::reference logview::reader::line_iter::operator*() const noexcept {
    return this->cursor_ref->cur_line;
}

logview::reader::line_iter::pointer logview::reader::line_iter::operator->() const noexcept {
    return &this->cursor_ref->cur_line;
}

bool logview::reader::line_iter::cursor_exhausted() const noexcept {
    // NOLINTNEXTLINE(readability-implicit-bool-conversion): pointer conversion is allowed
    return !this->cursor_ref || (this->cursor_ref->status != logview::reader::line_cursor::ACTIVE);
}

bool logview::reader::operator==(const line_iter& lhs, const line_iter& rhs) noexcept {
    return (lhs.cursor_ref == rhs.cursor_ref) || (lhs.cursor_exhausted() && rhs.cursor_exhausted());
}

bool logview::reader::operator!=(const line_iter& lhs, const line_iter& rhs) noexcept { return !(lhs == rhs); }


logview::reader::multi_line_cursor::multi_line_cursor(std::vector<std::string> paths) noexcept :
        file_paths(std::move(paths)) {}

bool logview::reader::multi_line_cursor::next(logview::reader::tagged_line& line) {
    for (;;) {
        if (this->current.is_open()) {
            if (this->current.next(line.text)) {
                line.path = this->current.path();
                return true;
            }
            this->finished_bytes += this->current.bytes_read();
            this->current = line_cursor();
        }

        if (this->next_file >= this->file_paths.size()) { return false; }
        this->current = line_cursor(this->file_paths[this->next_file++]);
    }
}

void logview::reader::multi_line_cursor::close() noexcept {
    this->current.close();
    this->next_file = this->file_paths.size();
}

std::uint_least64_t logview::reader::multi_line_cursor::bytes_read() const noexcept {
    return this->finished_bytes + this->current.bytes_read();
}


logview::reader::line_cursor logview::reader::loadLines(const std::string& path) {
    return logview::reader::line_cursor(path);
}

logview::reader::multi_line_cursor logview::reader::loadLines(std::vector<std::string> paths) {
    return logview::reader::multi_line_cursor(std::move(paths));
}

std::vector<std::string> logview::reader::findFiles(const std::string& dir, const std::string& pattern,
                                                    std::size_t max_files) {
    switch (logview::os::kindOf(dir)) {
        case logview::os::file_kind::missing:
            logview::throw_error(logview::error::file_not_found, dir);

        case logview::os::file_kind::directory:
            break;

        default:
            logview::throw_error(logview::error::invalid_argument, dir + " is not a directory");
    }

    std::set<logview::os::file_id> visited;
    auto root_id = logview::os::fileId(dir);
    if (root_id) { visited.insert(root_id.get()); }

    std::vector<std::string> files;
    collectFiles(dir, pattern, visited, files);
    std::sort(files.begin(), files.end());

    if (max_files != 0 && files.size() > max_files) { files.resize(max_files); }
    spdlog::debug("Found {} files matching {} in {}", files.size(), pattern, dir);
    return files;
}

logview::reader::multi_line_cursor logview::reader::loadLinesFromDirectory(const std::string& dir,
                                                                           const std::string& pattern,
                                                                           std::size_t max_files) {
    return logview::reader::multi_line_cursor(logview::reader::findFiles(dir, pattern, max_files));
}
