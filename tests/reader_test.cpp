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

// Containers
#include <string>
#include <vector>

// Exceptions
#include <system_error>

// Utility
#include <utility>

// POSIX API
#include <unistd.h>

// GoogleTest
#include <gtest/gtest.h>

// logview components
#include "constants.hpp"
#include "error.hpp"
#include "reader.hpp"
#include "test_helpers.hpp"


namespace {
std::vector<std::string> readAll(logview::reader::line_cursor& cursor) {
    std::vector<std::string> lines;
    std::string line;
    while (cursor.next(line)) { lines.push_back(line); }
    return lines;
}

std::vector<std::string> readFile(const std::string& path) {
    auto cursor = logview::reader::loadLines(path);
    return readAll(cursor);
}

class ReaderTest : public ::testing::Test {
protected:
    logview::test::temp_dir tmp;
};
}  // Anonymous namespace


TEST_F(ReaderTest, SplitsOnAllTerminators) {
    const auto path = tmp.write("mixed.log", "unix\nwindows\r\nold mac\rlast");
    EXPECT_EQ(readFile(path), (std::vector<std::string>{ "unix", "windows", "old mac", "last" }));
}

TEST_F(ReaderTest, KeepsEmptyLinesAndNoTrailingEmptyLine) {
    const auto path = tmp.write("empty_lines.log", "a\n\n\nb\n");
    EXPECT_EQ(readFile(path), (std::vector<std::string>{ "a", "", "", "b" }));

    const auto crlf = tmp.write("crlf_only.log", "\r\n\r\n");
    EXPECT_EQ(readFile(crlf), (std::vector<std::string>{ "", "" }));
}

TEST_F(ReaderTest, EmptyFileYieldsNothing) {
    const auto path = tmp.write("empty.log", "");
    auto cursor = logview::reader::loadLines(path);

    std::string line = "untouched";
    EXPECT_FALSE(cursor.next(line));
    EXPECT_TRUE(line.empty());
    EXPECT_FALSE(cursor.is_open());
    EXPECT_EQ(cursor.bytes_read(), 0u);
}

TEST_F(ReaderTest, LinesLongerThanChunk) {
    const std::string big(logview::READ_CHUNK_BYTES * 2 + 17, 'x');
    const auto path = tmp.write("big.log", "first\n" + big + "\r\nlast\n");

    const auto lines = readFile(path);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "first");
    EXPECT_EQ(lines[1], big);
    EXPECT_EQ(lines[2], "last");
}

TEST_F(ReaderTest, CrLfSplitAcrossChunks) {
    // Places the '\r' as the last byte of the first chunk
    const std::string head(logview::READ_CHUNK_BYTES - 1, 'a');
    const auto path = tmp.write("boundary.log", head + "\r\nnext");

    const auto lines = readFile(path);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], head);
    EXPECT_EQ(lines[1], "next");
}

TEST_F(ReaderTest, CountsAllBytes) {
    const std::string content = "one\r\ntwo\nthree";
    const auto path = tmp.write("count.log", content);

    auto cursor = logview::reader::loadLines(path);
    std::string line;
    ASSERT_TRUE(cursor.next(line));
    EXPECT_EQ(cursor.bytes_read(), 5u);
    EXPECT_EQ(readAll(cursor).size(), 2u);
    EXPECT_EQ(cursor.bytes_read(), content.size());
}

TEST_F(ReaderTest, SkipsUtf8Bom) {
    const auto path = tmp.write("bom.log", "\xEF\xBB\xBF" "2024-01-15 10:30:45,123 caf\xC3\xA9\n");

    auto cursor = logview::reader::loadLines(path);
    EXPECT_EQ(cursor.encoding(), logview::reader::text_encoding::utf8);
    EXPECT_EQ(readAll(cursor), (std::vector<std::string>{ "2024-01-15 10:30:45,123 caf\xC3\xA9" }));
}

TEST_F(ReaderTest, DecodesUtf16LittleEndian) {
    const auto path = tmp.write("le.log", logview::test::utf16("first line\r\nsecond\rthird\n", true));

    auto cursor = logview::reader::loadLines(path);
    EXPECT_EQ(cursor.encoding(), logview::reader::text_encoding::utf16le);
    EXPECT_EQ(readAll(cursor), (std::vector<std::string>{ "first line", "second", "third" }));
}

TEST_F(ReaderTest, DecodesUtf16BigEndian) {
    // "é" (U+00E9) becomes the two byte UTF-8 sequence
    std::string content = logview::test::utf16("caf", false);
    content.append("\x00\xE9", 2);
    content.append(logview::test::utf16("\nend", false).substr(2));
    const auto path = tmp.write("be.log", content);

    auto cursor = logview::reader::loadLines(path);
    EXPECT_EQ(cursor.encoding(), logview::reader::text_encoding::utf16be);
    EXPECT_EQ(readAll(cursor), (std::vector<std::string>{ "caf\xC3\xA9", "end" }));
}

TEST_F(ReaderTest, RangeForIteration) {
    const auto path = tmp.write("range.log", "a\nb\nc");

    std::vector<std::string> lines;
    auto cursor = logview::reader::loadLines(path);
    for (const auto& line : cursor) { lines.push_back(line); }
    EXPECT_EQ(lines, (std::vector<std::string>{ "a", "b", "c" }));
    EXPECT_FALSE(cursor.is_open());
}

TEST_F(ReaderTest, CloseStopsIteration) {
    const auto path = tmp.write("close.log", "a\nb\n");

    auto cursor = logview::reader::loadLines(path);
    std::string line;
    ASSERT_TRUE(cursor.next(line));
    cursor.close();
    EXPECT_FALSE(cursor.is_open());
    EXPECT_FALSE(cursor.next(line));

    // Closing again is harmless
    cursor.close();
}

TEST_F(ReaderTest, MissingFileThrows) {
    try {
        (void) logview::reader::loadLines(tmp.file("nope.log"));
        FAIL() << "opening a missing file must throw";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code(), logview::error::file_not_found);
    }
}

TEST_F(ReaderTest, ReadErrorAbortsSequence) {
    // A regular file according to stat, but reading from offset 0 fails with EIO
    const std::string unreadable = "/proc/self/mem";
    try {
        auto cursor = logview::reader::loadLines(unreadable);
        std::string line;
        while (cursor.next(line)) {}
        FAIL() << "reading /proc/self/mem must fail";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code(), logview::error::io_failure);
    }
}

TEST_F(ReaderTest, MultiFileTagsLinesInOrder) {
    const auto first = tmp.write("b.log", "b1\nb2\n");
    const auto second = tmp.write("a.log", "a1");

    auto cursor = logview::reader::loadLines(std::vector<std::string>{ first, second });
    std::vector<std::pair<std::string, std::string>> lines;
    logview::reader::tagged_line line;
    while (cursor.next(line)) { lines.emplace_back(line.path, line.text); }

    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], std::make_pair(first, std::string("b1")));
    EXPECT_EQ(lines[1], std::make_pair(first, std::string("b2")));
    EXPECT_EQ(lines[2], std::make_pair(second, std::string("a1")));
    EXPECT_EQ(cursor.bytes_read(), 8u);
}

TEST_F(ReaderTest, MultiFileMissingFileThrowsWhenReached) {
    const auto first = tmp.write("ok.log", "fine\n");
    auto cursor = logview::reader::loadLines(std::vector<std::string>{ first, tmp.file("gone.log") });

    logview::reader::tagged_line line;
    ASSERT_TRUE(cursor.next(line));
    EXPECT_EQ(line.text, "fine");
    EXPECT_THROW(cursor.next(line), std::system_error);
}

TEST_F(ReaderTest, DirectoryIsSearchedRecursivelyInPathOrder) {
    tmp.mkdir("sub");
    tmp.mkdir("sub/deeper");
    tmp.write("z.log", "z\n");
    tmp.write("a.log", "a\n");
    tmp.write("notes.txt", "ignored\n");
    tmp.write(".hidden.log", "ignored\n");
    tmp.write("sub/m.log", "m\n");
    tmp.write("sub/deeper/b.log", "b\n");

    const auto files = logview::reader::findFiles(tmp.path());
    EXPECT_EQ(files, (std::vector<std::string>{ tmp.file("a.log"), tmp.file("sub/deeper/b.log"), tmp.file("sub/m.log"),
                                                tmp.file("z.log") }));

    auto cursor = logview::reader::loadLinesFromDirectory(tmp.path());
    std::vector<std::string> texts;
    logview::reader::tagged_line line;
    while (cursor.next(line)) { texts.push_back(line.text); }
    EXPECT_EQ(texts, (std::vector<std::string>{ "a", "b", "m", "z" }));
}

TEST_F(ReaderTest, DirectoryPatternAndLimit) {
    tmp.write("app.txt", "1\n");
    tmp.write("web.txt", "2\n");
    tmp.write("db.txt", "3\n");
    tmp.write("app.log", "4\n");

    EXPECT_EQ(logview::reader::findFiles(tmp.path(), "*.txt").size(), 3u);
    EXPECT_EQ(logview::reader::findFiles(tmp.path(), "*.txt", 2),
              (std::vector<std::string>{ tmp.file("app.txt"), tmp.file("db.txt") }));
    EXPECT_TRUE(logview::reader::findFiles(tmp.path(), "*.csv").empty());
}

TEST_F(ReaderTest, DirectorySymlinkLoopIsVisitedOnce) {
    tmp.mkdir("sub");
    tmp.write("sub/x.log", "x\n");
    ASSERT_EQ(::symlink(tmp.path().c_str(), tmp.file("sub/loop").c_str()), 0);

    EXPECT_EQ(logview::reader::findFiles(tmp.path()), (std::vector<std::string>{ tmp.file("sub/x.log") }));
}

TEST_F(ReaderTest, DirectoryErrors) {
    try {
        (void) logview::reader::findFiles(tmp.file("missing"));
        FAIL() << "a missing directory must throw";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code(), logview::error::file_not_found);
    }

    const auto file = tmp.write("plain.log", "x\n");
    try {
        (void) logview::reader::loadLinesFromDirectory(file);
        FAIL() << "a regular file is not a directory";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code(), logview::error::invalid_argument);
    }
}
