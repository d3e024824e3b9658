/*
 * File:        test_monitor_config.cpp
 * Module:      ropmon-tests
 * Purpose:     Configuration, job file and render command tests
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "monitor_config.h"
#include "render_command.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <unistd.h>

using namespace ropmon;
namespace fs = std::filesystem;

namespace {

class TempFile {
public:
    explicit TempFile(const std::string& name, const std::string& content = "") {
        path_ = (fs::temp_directory_path()
                 / ("ropmon_cfg_" + std::to_string(::getpid()) + "_" + name)).string();
        std::ofstream out(path_);
        out << content;
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

template <typename F>
bool throws_runtime_error(F&& f, const std::string& expected_fragment) {
    try {
        f();
    } catch (const std::runtime_error& e) {
        return std::string(e.what()).find(expected_fragment) != std::string::npos;
    }
    return false;
}

} // anonymous namespace

void test_defaults() {
    MonitorConfig config;
    assert(config.render.hython == "hython");
    assert(config.render.script == default_share_directory() + "/render_rop.py");
    assert(config.render.query_script == default_share_directory() + "/query_rops.py");
    assert(config.monitor.read_timeout_ms == 100);
    assert(config.monitor.refresh_interval_ms == 500);
    assert(config.monitor.inference_margin == 5);
    assert(config.logging.level == "info");
    assert(config.logging.file.empty());

    std::cout << "test_defaults: PASSED\n";
}

void test_load_partial_config() {
    TempFile file("partial.yaml",
        "render:\n"
        "  hython: /opt/hfs20.0/bin/hython\n"
        "monitor:\n"
        "  refresh_interval_ms: 250\n"
        "  strip_prefixes: [\"[RS] \"]\n"
        "logging:\n"
        "  level: debug\n");

    MonitorConfig config = load_config(file.path());
    assert(config.render.hython == "/opt/hfs20.0/bin/hython");
    assert(config.render.script == default_share_directory() + "/render_rop.py");
    assert(config.monitor.refresh_interval_ms == 250);
    assert(config.monitor.read_timeout_ms == 100);
    assert(config.monitor.strip_prefixes.size() == 1);
    assert(config.monitor.strip_prefixes[0] == "[RS] ");
    assert(config.logging.level == "debug");

    std::cout << "test_load_partial_config: PASSED\n";
}

void test_empty_config() {
    TempFile file("empty.yaml");
    MonitorConfig config = load_config(file.path());
    assert(config.render.hython == "hython");

    std::cout << "test_empty_config: PASSED\n";
}

void test_config_round_trip() {
    MonitorConfig config;
    config.render.hython = "/usr/bin/hython";
    config.monitor.graceful_exit_timeout_ms = 2500;
    config.monitor.min_seconds_per_frame_guess = 1.5;
    config.monitor.strip_prefixes = {"[Redshift] ", "[Karma] "};
    config.logging.file = "/tmp/ropmon.log";

    TempFile file("saved.yaml");
    save_config(config, file.path());
    MonitorConfig loaded = load_config(file.path());

    assert(loaded.render.hython == config.render.hython);
    assert(loaded.monitor.graceful_exit_timeout_ms == 2500);
    assert(loaded.monitor.min_seconds_per_frame_guess == 1.5);
    assert(loaded.monitor.strip_prefixes == config.monitor.strip_prefixes);
    assert(loaded.logging.file == "/tmp/ropmon.log");

    std::cout << "test_config_round_trip: PASSED\n";
}

void test_invalid_config() {
    TempFile bad_type("bad_type.yaml", "monitor:\n  read_timeout_ms: soon\n");
    assert(throws_runtime_error([&] { load_config(bad_type.path()); }, "monitor.read_timeout_ms"));

    TempFile zero("zero.yaml", "monitor:\n  refresh_interval_ms: 0\n");
    assert(throws_runtime_error([&] { load_config(zero.path()); }, "greater than zero"));

    TempFile list("list.yaml", "- a\n- b\n");
    assert(throws_runtime_error([&] { load_config(list.path()); }, "top level must be a map"));

    TempFile broken("broken.yaml", "render: [unclosed\n");
    assert(throws_runtime_error([&] { load_config(broken.path()); }, "Failed to parse YAML file"));

    assert(throws_runtime_error([] { load_config("/nonexistent/ropmon.yaml"); }, "Failed to parse YAML file"));

    std::cout << "test_invalid_config: PASSED\n";
}

void test_load_job() {
    TempFile file("job.yaml",
        "job:\n"
        "  hip: /projects/shot010/shot010.hip\n"
        "  out_node: /out/Redshift_ROP1\n"
        "  range: { start: 1001, end: 1100, step: 2 }\n"
        "  skip_existing: true\n");

    RenderJob job = load_job(file.path());
    assert(job.hip_path == "/projects/shot010/shot010.hip");
    assert(job.out_node_path == "/out/Redshift_ROP1");
    assert(job.skip_existing);
    assert(job.frame_range);
    assert((*job.frame_range == FrameRange{1001, 1100, 2}));

    TempFile open_range("open.yaml", "job:\n  hip: a.hip\n  out_node: /out/rop\n");
    RenderJob open_job = load_job(open_range.path());
    assert(!open_job.frame_range);
    assert(!open_job.skip_existing);

    std::cout << "test_load_job: PASSED\n";
}

void test_job_round_trip() {
    RenderJob job;
    job.hip_path = "/projects/a.hip";
    job.out_node_path = "/out/mantra1";
    job.frame_range = FrameRange{5, 25, 5};

    TempFile file("saved_job.yaml");
    save_job(job, file.path());
    RenderJob loaded = load_job(file.path());
    assert(loaded.hip_path == job.hip_path);
    assert(loaded.out_node_path == job.out_node_path);
    assert(loaded.frame_range == job.frame_range);
    assert(!loaded.skip_existing);

    std::cout << "test_job_round_trip: PASSED\n";
}

void test_invalid_job() {
    TempFile no_section("nosection.yaml", "hip: a.hip\n");
    assert(throws_runtime_error([&] { load_job(no_section.path()); }, "'job' section"));

    TempFile no_out("noout.yaml", "job:\n  hip: a.hip\n");
    assert(throws_runtime_error([&] { load_job(no_out.path()); }, "'job.out_node' is required"));

    TempFile half_range("half.yaml", "job:\n  hip: a.hip\n  out_node: /out/r\n  range: { start: 1 }\n");
    assert(throws_runtime_error([&] { load_job(half_range.path()); }, "needs start and end"));

    TempFile backwards("back.yaml", "job:\n  hip: a.hip\n  out_node: /out/r\n  range: { start: 9, end: 1 }\n");
    assert(throws_runtime_error([&] { load_job(backwards.path()); }, "before"));

    TempFile zero_step("step.yaml", "job:\n  hip: a.hip\n  out_node: /out/r\n  range: { start: 1, end: 9, step: 0 }\n");
    assert(throws_runtime_error([&] { load_job(zero_step.path()); }, "must be positive"));

    std::cout << "test_invalid_job: PASSED\n";
}

void test_frame_range_helpers() {
    FrameRange range{1, 10, 3};
    assert(range.count() == 4);
    assert(range.last_frame() == 10);
    assert((range.frames() == std::vector<int32_t>{1, 4, 7, 10}));
    assert(range.contains(7));
    assert(!range.contains(8));
    assert(range.index_of(10) == 3);

    FrameRange ragged{1, 10, 4};
    assert(ragged.count() == 3);
    assert(ragged.last_frame() == 9);
    assert(!ragged.contains(10));

    FrameRange bad{1, 10, 0};
    assert(bad.count() == 0);
    assert(!bad.contains(1));

    std::cout << "test_frame_range_helpers: PASSED\n";
}

void test_render_command() {
    RenderSettings settings;
    settings.hython = "/opt/hfs/bin/hython";
    settings.script = "/usr/share/ropmon/render_rop.py";

    RenderJob job;
    job.hip_path = "/projects/shot.hip";
    job.out_node_path = "/out/Redshift_ROP1";
    job.frame_range = FrameRange{10, 20, 2};
    job.skip_existing = true;

    RenderCommand command = build_render_command(settings, job);
    assert(command.program == "/opt/hfs/bin/hython");
    std::vector<std::string> expected{
        "/usr/share/ropmon/render_rop.py", "-i", "/projects/shot.hip", "-o", "/out/Redshift_ROP1",
        "-s", "10", "-e", "20", "-u", "True", "-r", "True", "-t", "2"};
    assert(command.args == expected);
    assert(command.to_string() == "/opt/hfs/bin/hython /usr/share/ropmon/render_rop.py -i /projects/shot.hip "
                                  "-o /out/Redshift_ROP1 -s 10 -e 20 -u True -r True -t 2");

    // No range: the ROP's own range is used
    job.frame_range.reset();
    job.skip_existing = false;
    RenderCommand node_range = build_render_command(settings, job);
    assert(node_range.args[10] == "False");   // -u
    assert(node_range.args[12] == "False");   // -r

    RenderJob incomplete;
    incomplete.hip_path = "/projects/shot.hip";
    bool thrown = false;
    try {
        build_render_command(settings, incomplete);
    } catch (const std::invalid_argument&) {
        thrown = true;
    }
    assert(thrown);

    std::cout << "test_render_command: PASSED\n";
}

int main() {
    std::cout << "Running configuration tests...\n";

    test_defaults();
    test_load_partial_config();
    test_empty_config();
    test_config_round_trip();
    test_invalid_config();
    test_load_job();
    test_job_round_trip();
    test_invalid_job();
    test_frame_range_helpers();
    test_render_command();

    std::cout << "All configuration tests passed!\n";
    return 0;
}
