/*
 * File:        ropmon_cli.cpp
 * Module:      ropmon-cli
 * Purpose:     CLI application with subcommands
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "command_render.h"
#include "command_replay.h"
#include "command_rops.h"
#include "monitor_config.h"
#include "logging.h"

#include <charconv>
#include <iostream>
#include <optional>
#include <string>
#include <unistd.h>

using namespace ropmon;

namespace {

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [options] <command> [arguments]\n";
    std::cerr << "\n";
    std::cerr << "Run and monitor Houdini batch renders.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  render <job-file>              Render the job described in a YAML job file\n";
    std::cerr << "  render --hip FILE --out NODE   Render a ROP directly\n";
    std::cerr << "         [--start N --end N] [--step N] [--skip-existing] [--no-rop-query]\n";
    std::cerr << "  replay <log-file>              Feed a captured render log through the monitor\n";
    std::cerr << "         [--start N --end N] [--step N]\n";
    std::cerr << "  rops <hip-file>                List render nodes and their frame ranges\n";
    std::cerr << "  recent [--home DIR]            List recently opened scenes\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  --config FILE                  Load configuration from a YAML file\n";
    std::cerr << "  --log-level LEVEL              Set logging verbosity\n";
    std::cerr << "                                 (trace, debug, info, warn, error, critical, off)\n";
    std::cerr << "                                 Default: info\n";
    std::cerr << "  --log-file FILE                Write logs to specified file\n";
    std::cerr << "  --show-log                     Echo every renderer log line\n";
    std::cerr << "  --no-color                     Plain text output\n";
    std::cerr << "  --no-status                    Don't draw the live progress line\n";
    std::cerr << "\n";
    std::cerr << "While rendering, Ctrl-C once finishes the current frame and stops;\n";
    std::cerr << "Ctrl-C again stops immediately.\n";
    std::cerr << "\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " render shot010.yaml\n";
    std::cerr << "  " << program_name << " render --hip shot010.hip --out /out/Redshift_ROP1 --start 1 --end 48\n";
    std::cerr << "  " << program_name << " --log-level debug replay render.log\n";
}

std::optional<int32_t> parse_frame(const std::string& text) {
    int32_t value = 0;
    const char* begin = text.data();
    const char* end = begin + text.size();
    auto result = std::from_chars(begin, end, value);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return value;
}

// --start/--end/--step collected from the command line
struct RangeArgs {
    std::optional<int32_t> start;
    std::optional<int32_t> end;
    std::optional<int32_t> step;

    bool any() const { return start || end || step; }
};

// Returns false (after printing why) if the range arguments are inconsistent
bool resolve_range(const RangeArgs& args, std::optional<FrameRange>& range) {
    if (!args.any()) {
        return true;
    }
    if (!args.start || !args.end) {
        std::cerr << "Error: --start and --end must be given together\n";
        return false;
    }
    FrameRange r{*args.start, *args.end, args.step.value_or(1)};
    if (r.step <= 0) {
        std::cerr << "Error: --step must be positive\n";
        return false;
    }
    if (r.end < r.start) {
        std::cerr << "Error: --end is before --start\n";
        return false;
    }
    range = r;
    return true;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::string command;
    std::string positional;
    std::string config_path;
    std::string log_level;
    std::string log_file;

    RangeArgs range_args;
    std::string hip_path;
    std::string out_node;
    std::string home_directory;
    bool skip_existing = false;
    bool query_rop_range = true;

    cli::PrinterOptions printer;
    printer.color = ::isatty(STDOUT_FILENO) != 0;
    printer.status_line = ::isatty(STDERR_FILENO) != 0;

    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto frame_value = [&](std::optional<int32_t>& target) {
            if (i + 1 >= argc) {
                std::cerr << "Error: " << arg << " needs a value\n";
                return false;
            }
            target = parse_frame(argv[++i]);
            if (!target) {
                std::cerr << "Error: " << arg << " expects an integer, got '" << argv[i] << "'\n";
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else if (arg == "--show-log") {
            printer.show_log = true;
        } else if (arg == "--no-color") {
            printer.color = false;
        } else if (arg == "--no-status") {
            printer.status_line = false;
        } else if (arg == "--hip" && i + 1 < argc) {
            hip_path = argv[++i];
        } else if (arg == "--out" && i + 1 < argc) {
            out_node = argv[++i];
        } else if (arg == "--home" && i + 1 < argc) {
            home_directory = argv[++i];
        } else if (arg == "--start") {
            if (!frame_value(range_args.start)) return 1;
        } else if (arg == "--end") {
            if (!frame_value(range_args.end)) return 1;
        } else if (arg == "--step") {
            if (!frame_value(range_args.step)) return 1;
        } else if (arg == "--skip-existing") {
            skip_existing = true;
        } else if (arg == "--no-rop-query") {
            query_rop_range = false;
        } else if (!arg.empty() && arg[0] != '-') {
            if (command.empty()) {
                command = arg;
            } else if (positional.empty()) {
                positional = arg;
            } else {
                std::cerr << "Error: Unexpected argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (command.empty()) {
        std::cerr << "Error: No command specified\n";
        print_usage(argv[0]);
        return 1;
    }

    try {
        MonitorConfig config;
        if (!config_path.empty()) {
            config = load_config(config_path);
        }

        // Command line wins over the configuration file
        ropmon::init_logging(log_level.empty() ? config.logging.level : log_level,
                             "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v",
                             log_file.empty() ? config.logging.file : log_file);

        if (command == "render") {
            cli::RenderOptions options;
            options.config = config;
            options.printer = printer;
            options.query_rop_range = query_rop_range;

            if (!positional.empty()) {
                if (!hip_path.empty() || !out_node.empty()) {
                    std::cerr << "Error: Give either a job file or --hip/--out, not both\n";
                    return 1;
                }
                options.job = load_job(positional);
            } else {
                if (hip_path.empty() || out_node.empty()) {
                    std::cerr << "Error: render needs a job file or both --hip and --out\n";
                    print_usage(argv[0]);
                    return 1;
                }
                options.job.hip_path = hip_path;
                options.job.out_node_path = out_node;
            }

            if (skip_existing) {
                options.job.skip_existing = true;
            }
            if (range_args.any()) {
                options.job.frame_range.reset();
                if (!resolve_range(range_args, options.job.frame_range)) {
                    return 1;
                }
            }
            return cli::render_command(options);
        } else if (command == "replay") {
            if (positional.empty()) {
                std::cerr << "Error: replay needs a log file\n";
                return 1;
            }
            cli::ReplayOptions options;
            options.config = config;
            options.log_path = positional;
            options.printer = printer;
            if (!resolve_range(range_args, options.frame_range)) {
                return 1;
            }
            return cli::replay_command(options);
        } else if (command == "rops") {
            if (positional.empty()) {
                std::cerr << "Error: rops needs a hip file\n";
                return 1;
            }
            cli::RopsOptions options;
            options.config = config;
            options.hip_path = positional;
            return cli::rops_command(options);
        } else if (command == "recent") {
            cli::RecentOptions options;
            options.home_directory = home_directory;
            return cli::recent_command(options);
        }

        std::cerr << "Error: Unknown command: " << command << "\n";
        print_usage(argv[0]);
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\nFATAL ERROR: " << e.what() << "\n";
        return 1;
    }
}
