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
#include "cli.hpp"

// C headers
#include <cstdlib>

// Streams
#include <sstream>

// Containers
#include <string>
#include <vector>

// Utility
#include <utility>

// Boost
#include <boost/optional.hpp>
#include <boost/utility/string_view.hpp>
#include <boost/program_options.hpp>

// logview components
#include "common.hpp"
#include "constants.hpp"
#include "config.hpp"
#include "os.hpp"
#include "buildinfo.hpp"


namespace po = boost::program_options;

namespace {
void printInfo(boost::string_view path, bool ver, bool help, const po::options_description& visible_options) {
    if (ver) {
        // GIT_SHA1 may be empty (i.e., only contains \0), in which case it's not reported
        logview::cout << path << " " << logview::VERSION << " built at " << logview::BUILD_TIME << "\n";
        if (logview::GIT_SHA1[0]) { logview::cout << "Git commit SHA1: " << logview::GIT_SHA1 << "\n\n"; }

        logview::cout << "Copyright (C) 2026  The logview authors\n"
                      << "This program comes with ABSOLUTELY NO WARRANTY.\n"
                      << "This is free software, and you are welcome to redistribute it under certain conditions."
                      << std::endl;
    }

    if (help) {
        if (ver) { logview::cout << "\n"; }

        std::stringstream ss;
        ss << visible_options;
        std::string desc = ss.str();
        desc.pop_back();

        logview::cout << "Usage: " << path << " [OPTION]... PATH...\n"
                      << "Parse log files (or all matching files below directories) and print their records.\n\n"
                      << desc.c_str() << std::endl;
    }
}
}  // Anonymous namespace


// NOLINTNEXTLINE(modernize-avoid-c-arrays,cppcoreguidelines-avoid-c-arrays)
logview::cli::options logview::cli::parseArgs(int argc, char* argv[]) {
    const std::string default_config = logview::os::getConfigFile().value_or(logview::CONFIG_FILE);

    // Unset values fall back to the config file
    boost::optional<std::string> pattern;
    boost::optional<std::size_t> max_files, pool_capacity;

    po::options_description visible_options("Allowed options");
    visible_options.add_options()
        ("help,h", po::bool_switch(), "display this help message and exit")
        ("version,V", po::bool_switch(), "display version information and exit")
        ("verbose,v", po::bool_switch(), "enable debug logging and list parsed files")
        ("config,c", po::value<std::string>()->default_value(default_config), "config file")
        ("pattern,p", po::value(&pattern), "wildcard for files inside directories (default: *.log)")
        ("max-files,n", po::value(&max_files), "maximum number of files per directory (0 = unlimited)")
        ("errors-only,e", po::bool_switch(), "only print ERROR records")
        ("stats,s", po::bool_switch(), "print record pool statistics")
        ("pool-capacity", po::value(&pool_capacity), "maximum number of idle records kept for reuse");

    // Options parsed from the CLI (including positional ones)
    po::options_description cli_options;
    cli_options.add(visible_options);
    cli_options.add_options()("path", po::value<std::vector<std::string>>());

    po::positional_options_description pos_options;
    pos_options.add("path", -1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(cli_options).positional(pos_options).run(), vm);
    po::notify(vm);

    bool ver = vm["version"].as<bool>(), help = vm["help"].as<bool>();
    if (ver || help) {
        // Remove path to executable if present (compact output)
        boost::string_view path(argv[0]);
        const auto path_end = path.rfind(logview::PATH_SEP);
        if (path_end != boost::string_view::npos) { path.remove_prefix(path_end + 1); }

        printInfo(path, ver, help, visible_options);
        std::exit(0);
    }

    const auto paths_iter = vm.find("path");
    if (paths_iter == vm.end()) { throw po::error("no log file or directory given"); }

    logview::config_service config(vm["config"].as<std::string>());
    const logview::settings& cfg = config.get();

    options res;
    res.verbose = vm["verbose"].as<bool>();
    res.stats = vm["stats"].as<bool>();
    res.errors_only = vm["errors-only"].as<bool>() || cfg.errors_only;
    res.pattern = pattern.value_or(cfg.pattern);
    res.max_files = max_files.value_or(cfg.max_files);
    res.pool_capacity = pool_capacity.value_or(cfg.pool_capacity);
    res.progress_interval = cfg.progress_interval;
    res.log_level = res.verbose ? "debug" : cfg.log_level;
    res.paths = paths_iter->second.as<std::vector<std::string>>();
    return res;
}
