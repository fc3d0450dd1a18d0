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

// C headers
#include <cstdint>

// Containers
#include <string>
#include <vector>

// Exceptions
#include <system_error>

// Threading
#include <atomic>
#include <thread>

// Utility
#include <chrono>
#include <utility>

// GoogleTest
#include <gtest/gtest.h>

// logview components
#include "cancellation.hpp"
#include "error.hpp"
#include "ingest.hpp"
#include "record.hpp"
#include "record_pool.hpp"
#include "test_helpers.hpp"


namespace {
constexpr char SAMPLE_LOG[] =  // NOLINT(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
    "2024-01-15 10:30:45,123 INFO Application started\n"
    "2024-01-15 10:30:46,456 ERROR Database connection failed\n"
    "Traceback (most recent call last):\n"
    "  File \"app.py\", line 3\n"
    "\n"
    "2024-01-15 10:30:47.789 WARNING Retrying in 5 seconds\n"
    "2024-01-15 10:30:48,000 Build finished: 0 errors\n";

std::vector<logview::record_ptr> drain(logview::record_stream& stream) {
    std::vector<logview::record_ptr> records;
    logview::record_ptr rec;
    while (stream.next(rec)) { records.push_back(std::move(rec)); }
    return records;
}

template<class Fn>
void expectError(Fn&& fn, logview::error code) {
    try {
        fn();
        ADD_FAILURE() << "expected std::system_error";
    } catch (const std::system_error& ex) {
        EXPECT_EQ(ex.code(), code);
    }
}

class IngestTest : public ::testing::Test {
protected:
    logview::test::temp_dir tmp;
    logview::record_pool pool;
    logview::ingestor ingest{ pool, 2 };
};
}  // Anonymous namespace


TEST_F(IngestTest, YieldsParsedRecordsWithRawLineNumbers) {
    const auto path = tmp.write("app.log", SAMPLE_LOG);

    auto stream = ingest.parse(path);
    const auto records = drain(stream);

    ASSERT_EQ(records.size(), 4u);
    EXPECT_EQ(records[0]->line_number, 1u);
    EXPECT_EQ(records[0]->level, logview::severity::info);
    EXPECT_EQ(records[0]->message, "INFO Application started");

    EXPECT_EQ(records[1]->line_number, 2u);
    EXPECT_EQ(records[1]->level, logview::severity::error);

    // Lines 3 to 5 don't parse, numbering keeps counting raw lines
    EXPECT_EQ(records[2]->line_number, 6u);
    EXPECT_EQ(records[2]->level, logview::severity::warning);

    EXPECT_EQ(records[3]->line_number, 7u);
    EXPECT_EQ(records[3]->level, logview::severity::info);

    for (const auto& rec : records) { EXPECT_EQ(rec->source_file, path); }

    const auto errors = logview::filter_errors(records);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0]->message, "ERROR Database connection failed");
}

TEST_F(IngestTest, RecordsComeFromPool) {
    const auto path = tmp.write("app.log", SAMPLE_LOG);

    {
        auto stream = ingest.parse(path);
        for (auto& rec : drain(stream)) { pool.give_back(std::move(rec)); }
    }
    EXPECT_EQ(pool.available_count(), 4u);

    auto stream = ingest.parse(path);
    const auto records = drain(stream);
    const auto stats = pool.statistics();
    EXPECT_EQ(stats.total_gets, 8u);
    EXPECT_EQ(stats.pool_hits, 4u);
    EXPECT_EQ(records[0]->line_number, 1u);
}

TEST_F(IngestTest, ProgressIsPublished) {
    const auto path = tmp.write("app.log", SAMPLE_LOG);
    EXPECT_EQ(ingest.progress()->processed_lines, 0u);
    EXPECT_FALSE(ingest.progress()->finished);

    auto stream = ingest.parse(path, {}, 7);
    logview::record_ptr rec;
    ASSERT_TRUE(stream.next(rec));

    auto started = ingest.progress();
    EXPECT_EQ(started->total_lines, 7u);
    EXPECT_FALSE(started->finished);

    drain(stream);
    const auto done = ingest.progress();
    EXPECT_TRUE(done->finished);
    EXPECT_EQ(done->processed_lines, 7u);
    EXPECT_EQ(done->records_emitted, 4u);
    EXPECT_EQ(done->total_bytes, sizeof(SAMPLE_LOG) - 1);
    EXPECT_EQ(done->bytes_processed, done->total_bytes);
    EXPECT_EQ(done->current_file, path);
    EXPECT_EQ(done->current_operation, "Completed");
    EXPECT_DOUBLE_EQ(done->percentage(), 100.0);
    EXPECT_DOUBLE_EQ(done->bytes_percentage(), 100.0);

    // Snapshots taken earlier are not modified
    EXPECT_FALSE(started->finished);
}

TEST_F(IngestTest, ProgressDerivedValues) {
    logview::parse_progress progress;
    EXPECT_DOUBLE_EQ(progress.percentage(), 0.0);
    EXPECT_DOUBLE_EQ(progress.bytes_percentage(), 0.0);
    EXPECT_DOUBLE_EQ(progress.lines_per_second(), 0.0);

    progress.processed_lines = 500;
    progress.total_lines = 1000;
    progress.bytes_processed = 25;
    progress.total_bytes = 100;
    progress.elapsed = std::chrono::milliseconds(2000);
    EXPECT_DOUBLE_EQ(progress.percentage(), 50.0);
    EXPECT_DOUBLE_EQ(progress.bytes_percentage(), 25.0);
    EXPECT_DOUBLE_EQ(progress.lines_per_second(), 250.0);

    // Estimates can be too low
    progress.processed_lines = 1500;
    EXPECT_DOUBLE_EQ(progress.percentage(), 100.0);
}

TEST_F(IngestTest, RejectsBadPaths) {
    expectError([this] { (void) ingest.parse(""); }, logview::error::invalid_argument);
    expectError([this] { (void) ingest.parse(tmp.file("missing.log")); }, logview::error::file_not_found);
    expectError([this] { (void) ingest.parse_files({ tmp.write("ok.log", ""), tmp.file("missing.log") }); },
                logview::error::file_not_found);
    expectError([this] { (void) ingest.parse_directory(tmp.file("nodir")); }, logview::error::file_not_found);
}

TEST_F(IngestTest, ReadErrorFailsStream) {
    auto stream = ingest.parse("/proc/self/mem");
    logview::record_ptr rec;
    expectError([&] { stream.next(rec); }, logview::error::io_failure);
    EXPECT_FALSE(rec);

    const auto progress = ingest.progress();
    EXPECT_TRUE(progress->finished);
    EXPECT_EQ(progress->current_operation, "Failed");

    // The stream is finished afterwards
    EXPECT_FALSE(stream.next(rec));
}

TEST_F(IngestTest, CancellationBeforeFirstLine) {
    const auto path = tmp.write("app.log", SAMPLE_LOG);
    logview::cancellation_source source;
    source.cancel();

    auto stream = ingest.parse(path, source.token());
    logview::record_ptr rec;
    expectError([&] { stream.next(rec); }, logview::error::cancelled);
    EXPECT_FALSE(rec);
    EXPECT_EQ(pool.statistics().total_gets, 0u);

    // The stream is finished afterwards
    EXPECT_FALSE(stream.next(rec));
    EXPECT_EQ(ingest.progress()->current_operation, "Cancelled");
}

TEST_F(IngestTest, CancellationBetweenRecords) {
    const auto path = tmp.write("app.log", SAMPLE_LOG);
    logview::cancellation_source source;

    auto stream = ingest.parse(path, source.token());
    logview::record_ptr rec;
    ASSERT_TRUE(stream.next(rec));
    EXPECT_EQ(rec->line_number, 1u);

    source.cancel();
    logview::record_ptr next;
    expectError([&] { stream.next(next); }, logview::error::cancelled);
    EXPECT_FALSE(next);
    EXPECT_EQ(stream.progress().processed_lines, 1u);
}

TEST_F(IngestTest, DefaultTokenNeverCancels) {
    logview::cancellation_token token;
    EXPECT_FALSE(token.is_cancellation_requested());
    EXPECT_NO_THROW(token.throw_if_cancellation_requested());

    logview::cancellation_source source;
    const auto observer = source.token();
    EXPECT_FALSE(observer.is_cancellation_requested());
    source.cancel();
    EXPECT_TRUE(observer.is_cancellation_requested());
    EXPECT_THROW(observer.throw_if_cancellation_requested(), std::system_error);
}

TEST_F(IngestTest, LineNumbersRestartPerFile) {
    const auto first = tmp.write("a.log", "noise\n2024-01-15 10:00:00,000 first file\n");
    const auto second = tmp.write("b.log", "2024-01-15 11:00:00,000 second file\n");

    auto stream = ingest.parse_files({ first, second });
    const auto records = drain(stream);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]->source_file, first);
    EXPECT_EQ(records[0]->line_number, 2u);
    EXPECT_EQ(records[1]->source_file, second);
    EXPECT_EQ(records[1]->line_number, 1u);
}

TEST_F(IngestTest, ParsesDirectory) {
    tmp.mkdir("logs");
    tmp.write("logs/b.log", "2024-01-15 10:00:01,000 from b\n");
    tmp.write("logs/a.log", "2024-01-15 10:00:02,000 from a\n");
    tmp.write("logs/skip.txt", "2024-01-15 10:00:03,000 not a log file\n");

    auto stream = ingest.parse_directory(tmp.file("logs"));
    const auto records = drain(stream);

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0]->message, "from a");
    EXPECT_EQ(records[1]->message, "from b");
}

TEST_F(IngestTest, EstimatesLineCount) {
    EXPECT_EQ(logview::ingestor::estimate_total_lines(""), 0u);
    EXPECT_EQ(logview::ingestor::estimate_total_lines(tmp.file("missing.log")), 0u);
    EXPECT_EQ(logview::ingestor::estimate_total_lines(tmp.write("empty.log", "")), 0u);
    EXPECT_EQ(logview::ingestor::estimate_total_lines(tmp.write("app.log", SAMPLE_LOG)), 7u);
    EXPECT_EQ(logview::ingestor::estimate_total_lines(tmp.write("open.log", "a\r\nb\rc")), 3u);
}

TEST_F(IngestTest, CancellationWhileSkippingLines) {
    // No line matches, so next() only returns once it is cancelled or the input ends
    constexpr std::uint_least64_t line_count = 4000000;
    std::string content;
    content.reserve(line_count * 2);
    for (std::uint_least64_t i = 0; i < line_count; ++i) { content += "x\n"; }
    const auto path = tmp.write("noise.log", content);

    logview::cancellation_source source;
    auto stream = ingest.parse(path, source.token());

    std::thread canceller([this, &source] {
        while (ingest.progress()->processed_lines == 0) { std::this_thread::yield(); }
        source.cancel();
    });

    logview::record_ptr rec;
    expectError([&] { stream.next(rec); }, logview::error::cancelled);
    canceller.join();

    EXPECT_FALSE(rec);
    const auto progress = ingest.progress();
    EXPECT_EQ(progress->current_operation, "Cancelled");
    EXPECT_LT(progress->processed_lines, line_count);
}

TEST_F(IngestTest, ProgressReadConcurrently) {
    std::string content;
    for (int i = 0; i < 20000; ++i) { content += SAMPLE_LOG; }
    const auto path = tmp.write("app.log", content);

    std::atomic<bool> done{false};
    std::atomic<int> inconsistent{0};
    std::thread observer([this, &done, &inconsistent] {
        std::uint_least64_t last_lines = 0;
        while (!done.load()) {
            const auto snapshot = ingest.progress();
            if (snapshot->processed_lines < last_lines) { ++inconsistent; }
            if (snapshot->records_emitted > snapshot->processed_lines) { ++inconsistent; }
            if (snapshot->bytes_processed > snapshot->total_bytes) { ++inconsistent; }
            last_lines = snapshot->processed_lines;
        }
    });

    auto stream = ingest.parse(path);
    const auto records = drain(stream);
    done.store(true);
    observer.join();

    EXPECT_EQ(inconsistent.load(), 0);
    EXPECT_EQ(records.size(), 80000u);

    const auto final_progress = ingest.progress();
    EXPECT_TRUE(final_progress->finished);
    EXPECT_EQ(final_progress->processed_lines, 140000u);
    EXPECT_EQ(final_progress->records_emitted, 80000u);
}
