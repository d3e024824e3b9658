/*
 * File:        test_render_monitor.cpp
 * Module:      ropmon-tests
 * Purpose:     Monitor loop tests against shell-scripted render processes
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "render_monitor.h"
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace ropmon;

namespace {

MonitorSettings fast_settings() {
    MonitorSettings settings;
    settings.read_timeout_ms = 50;
    settings.refresh_interval_ms = 100;
    settings.graceful_exit_timeout_ms = 5000;
    return settings;
}

template <typename T>
std::vector<T> only(const std::vector<RenderEvent>& events) {
    std::vector<T> result;
    for (const auto& event : events) {
        if (const T* e = std::get_if<T>(&event)) {
            result.push_back(*e);
        }
    }
    return result;
}

// Every job ends with zero remaining followed by exactly one JobFinished
void assert_closed_cleanly(const std::vector<RenderEvent>& events) {
    assert(events.size() >= 2);
    assert(only<render_event::JobFinished>(events).size() == 1);
    assert(std::holds_alternative<render_event::JobFinished>(events.back()));

    const auto* labels = std::get_if<render_event::TimeLabels>(&events[events.size() - 2]);
    assert(labels);
    assert(labels->times.remaining == 0.0);
}

// Fails on the given line number, as a broken parser or sink would
class FailingSession : public RenderSession {
public:
    FailingSession(int fail_at, const MonitorSettings& settings, EventChannel<RenderEvent>& events)
        : RenderSession(FrameRange{1, 3, 1}, settings, events), fail_at_(fail_at) {}

    LineOutcome process_line(const std::string& line, Clock::time_point now) override {
        if (++lines_ == fail_at_) {
            throw std::runtime_error("cannot process line: " + line);
        }
        return RenderSession::process_line(line, now);
    }

    int lines() const { return lines_; }

private:
    int fail_at_;
    int lines_ = 0;
};

} // anonymous namespace

void test_runs_job_to_completion() {
    MonitorSettings settings = fast_settings();
    EventChannel<RenderEvent> channel;
    RenderSession session(FrameRange{1, 1, 1}, settings, channel);
    CancelFlags flags;

    ProcessSupervisor process;
    process.start("/bin/sh", {"-c",
        "echo \"[Redshift] 'Redshift_ROP1' rendering frame 1\";"
        "echo '[Redshift] Loading RS rendering options';"
        "echo 'ROP node endRender';"
        "echo '[Redshift] Rendering time: 1s (1 GPU(s) used) scene extraction time 0.1 sec, total time 2 sec';"
        "exit 0"});

    RenderMonitor monitor(process, session, settings, flags);
    assert(monitor.phase() == MonitorPhase::Starting);
    monitor.run();

    assert(monitor.phase() == MonitorPhase::Finished);
    assert(session.finished());
    assert(!process.is_running());

    auto events = channel.drain();
    assert_closed_cleanly(events);

    auto done = only<render_event::JobFinished>(events);
    assert(!done[0].killed);
    assert(done[0].exit_code == 0);

    auto finished = only<render_event::FrameFinished>(events);
    assert(finished.size() == 1 && finished[0].frame == 1);
    assert(finished[0].duration_seconds == 2.0);

    std::cout << "test_runs_job_to_completion: PASSED\n";
}

void test_failure_in_loop_still_finishes() {
    MonitorSettings settings = fast_settings();
    EventChannel<RenderEvent> channel;
    FailingSession session(2, settings, channel);
    CancelFlags flags;

    ProcessSupervisor process;
    process.start("/bin/sh", {"-c",
        "echo \"'Redshift_ROP1' rendering frame 1\";"
        "echo 'Loading RS rendering options';"
        "sleep 30"});

    auto started = std::chrono::steady_clock::now();
    RenderMonitor monitor(process, session, settings, flags);
    monitor.run();

    // The process is not left running and the loop did not wait for it
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(10));
    assert(!process.is_running());
    assert(session.lines() == 2);
    assert(session.finished());
    assert(monitor.phase() == MonitorPhase::Finished);

    auto events = channel.drain();
    assert_closed_cleanly(events);
    assert(only<render_event::JobFinished>(events)[0].killed);

    std::cout << "test_failure_in_loop_still_finishes: PASSED\n";
}

void test_kill_flag_ends_loop() {
    MonitorSettings settings = fast_settings();
    EventChannel<RenderEvent> channel;
    RenderSession session(FrameRange{1, 5, 1}, settings, channel);
    CancelFlags flags;

    ProcessSupervisor process;
    process.start("/bin/sh", {"-c", "sleep 30"});

    RenderMonitor monitor(process, session, settings, flags);
    std::thread worker([&monitor] { monitor.run(); });

    for (int i = 0; i < 100 && monitor.phase() != MonitorPhase::Monitoring; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    assert(monitor.phase() == MonitorPhase::Monitoring);

    flags.killed = true;
    worker.join();

    assert(monitor.phase() == MonitorPhase::Finished);
    assert(!process.is_running());
    assert(process.state() == ProcessState::Killed);

    auto events = channel.drain();
    assert_closed_cleanly(events);
    assert(only<render_event::JobFinished>(events)[0].killed);

    std::cout << "test_kill_flag_ends_loop: PASSED\n";
}

void test_phase_names() {
    assert(std::string(monitor_phase_name(MonitorPhase::Starting)) == "starting");
    assert(std::string(monitor_phase_name(MonitorPhase::GracefulStopRequested)) == "graceful-stop-requested");
    assert(std::string(monitor_phase_name(MonitorPhase::Finished)) == "finished");

    std::cout << "test_phase_names: PASSED\n";
}

int main() {
    std::cout << "Running render monitor tests...\n";

    test_runs_job_to_completion();
    test_failure_in_loop_still_finishes();
    test_kill_flag_ends_loop();
    test_phase_names();

    std::cout << "All render monitor tests passed!\n";
    return 0;
}
