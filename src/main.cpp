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
#include <csignal>
#include <cstdint>

// Containers
#include <string>
#include <vector>

// Exceptions
#include <exception>
#include <system_error>

// Threading
#include <atomic>
#include <future>
#include <thread>

// Utility
#include <functional>
#include <chrono>
#include <utility>

// Boost
#include <boost/program_options/errors.hpp>

// lock-free queue
#include <readerwriterqueue.h>

// Logging
#include <spdlog/spdlog.h>

// logview components
#include "common.hpp"
#include "constants.hpp"
#include "cancellation.hpp"
#include "cli.hpp"
#include "error.hpp"
#include "format.hpp"
#include "ingest.hpp"
#include "os.hpp"
#include "reader.hpp"
#include "record.hpp"
#include "record_pool.hpp"


namespace {
constexpr std::size_t MAX_QUEUE_ENTRIES = 256;
using queue_t = moodycamel::BlockingReaderWriterQueue<logview::record_ptr>;

// Source cancelled by SIGINT. The parser checks its token before every line, so an
// interrupt takes effect even while no record is emitted.
std::atomic<logview::cancellation_source*> interrupt_source{nullptr};  // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

extern "C" void onInterrupt(int /* signal */) {
    logview::cancellation_source* source = interrupt_source.load();
    if (source) { source->cancel(); }
}

struct print_stat {
    std::uint_least64_t printed = 0;
    std::uint_least64_t infos = 0;
    std::uint_least64_t warnings = 0;
    std::uint_least64_t errors = 0;
};

// Runs in its own thread: prints records and hands them back to the pool.
// A null record marks the end of input.
print_stat run_printer(queue_t& queue, logview::record_pool& pool, bool errors_only) {
    print_stat res{};

    logview::record_ptr rec;
    for (;;) {
        queue.wait_dequeue(rec);
        if (!rec) { break; }

        switch (rec->level) {
            case logview::severity::info:
                ++res.infos;
                break;
            case logview::severity::warning:
                ++res.warnings;
                break;
            case logview::severity::error:
                ++res.errors;
                break;
        }

        if (!errors_only || rec->is_error()) {
            logview::cout << logview::format::format_record(*rec) << '\n';
            ++res.printed;
        }

        pool.give_back(std::move(rec));
    }

    logview::cout << std::flush;
    return res;
}

std::vector<std::string> collect_inputs(const logview::cli::options& args) {
    std::vector<std::string> files;
    for (const auto& path : args.paths) {
        if (logview::os::kindOf(path) == logview::os::file_kind::directory) {
            auto found = logview::reader::findFiles(path, args.pattern, args.max_files);
            if (found.empty()) { spdlog::warn("No files matching {} in {}", args.pattern, path); }
            files.insert(files.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
        } else {
            files.push_back(path);
        }
    }

    if (args.verbose) {
        logview::cerr << "Files to parse:\n";
        for (const auto& file : files) { logview::cerr << "  " << file << '\n'; }
        logview::cerr << std::flush;
    }
    return files;
}

void print_pool_stats(const logview::pool_statistics& stats) {
    std::string saved = logview::format::format_size(stats.memory_saved_bytes);
    logview::cerr << "\nRecord pool statistics:\n"
                  << "  gets: " << stats.total_gets << ", returns: " << stats.total_returns << '\n'
                  << "  hits: " << stats.pool_hits << ", misses: " << stats.pool_misses
                  << " (hit ratio " << static_cast<int>(stats.hit_ratio() * 100) << "%)\n"
                  << "  idle: " << stats.current_pool_size << " of " << stats.max_pool_size << '\n'
                  << "  instances created: " << stats.total_instances_created << '\n'
                  << "  memory saved: " << saved.c_str() << std::endl;
}


int run_logview(const logview::cli::options& args) {
    spdlog::set_level(spdlog::level::from_str(args.log_level));

    const auto files = collect_inputs(args);
    if (files.empty()) {
        logview::cerr << "ERROR: No log files found" << std::endl;
        return 1;
    }

    logview::record_pool pool(args.pool_capacity);
    logview::ingestor ingest(pool, args.progress_interval);
    logview::cancellation_source cancel;
    interrupt_source.store(&cancel);
    if (std::signal(SIGINT, onInterrupt) == SIG_ERR) { spdlog::warn("Could not install SIGINT handler"); }

    // Print records asynchronously, parse in main thread
    queue_t queue(MAX_QUEUE_ENTRIES);
    auto printer_fut = std::async(std::launch::async, run_printer, std::ref(queue), std::ref(pool), args.errors_only);

    bool err_res = false;
    try {
        logview::record_stream stream = ingest.parse_files(files, cancel.token());

        logview::record_ptr rec;
        while (stream.next(rec)) {
            // Queue is bounded, spin until the printer catches up
            // NOLINTNEXTLINE(bugprone-use-after-move): only moved on success
            while (!queue.try_enqueue(std::move(rec))) { std::this_thread::yield(); }
        }
    } catch (const std::system_error& ex) {
        if (ex.code() == logview::error::cancelled) {
            logview::cerr << "Interrupted" << std::endl;
        } else {
            logview::cerr << "ERROR: " << ex.what() << std::endl;
        }
        err_res = true;
    } catch (const std::exception& ex) {
        logview::cerr << "UNEXPECTED ERROR: " << ex.what() << std::endl;
        err_res = true;
    }

    // Parsing is over, restore default Ctrl-C behavior before cancel goes out of scope
    if (std::signal(SIGINT, SIG_DFL) == SIG_ERR) { spdlog::warn("Could not restore SIGINT handler"); }
    interrupt_source.store(nullptr);

    // Null record terminates the printer
    queue.enqueue(logview::record_ptr());
    const print_stat printed = printer_fut.get();

    const auto progress = ingest.progress();
    std::string bytes_read = logview::format::format_size(progress->bytes_processed);
    std::string dur = logview::format::format_duration(progress->elapsed);
    logview::cerr << "\nParsed " << progress->records_emitted << " records (" << printed.errors << " errors, "
                  << printed.warnings << " warnings) from " << progress->processed_lines << " lines and "
                  << files.size() << " files (" << bytes_read.c_str() << ") within " << dur.c_str() << std::endl;

    if (args.stats) { print_pool_stats(pool.statistics()); }
    return static_cast<int>(err_res);
}
}  // Anonymous namespace


// NOLINTNEXTLINE(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
int main(int argc, char* argv[]) {
    try {
        logview::cli::options args = logview::cli::parseArgs(argc, argv);
        return run_logview(args);
    } catch (const boost::program_options::error& ex) {
        logview::cerr << "ERROR: " << ex.what() << std::endl;
        logview::cout << "See -h/--help for allowed options" << std::endl;
    } catch (const std::system_error& ex) {
        logview::cerr << "ERROR: " << ex.what() << std::endl;
    } catch (const std::exception& ex) {
        logview::cerr << "UNEXPECTED ERROR: " << ex.what() << std::endl;
    }
    return 1;
}
