/*
 * File:        command_render.cpp
 * Module:      ropmon-cli
 * Purpose:     Render command
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "command_render.h"
#include "render_controller.h"
#include "rop_metadata.h"
#include "logging.h"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>

namespace fs = std::filesystem;

namespace ropmon {
namespace cli {

namespace {

std::atomic<int> g_interrupt_count{0};

extern "C" void handle_sigint(int) {
    g_interrupt_count.fetch_add(1);
}

// Installs the Ctrl-C handler for the lifetime of the render
class SigintGuard {
public:
    SigintGuard() {
        struct sigaction action {};
        action.sa_handler = handle_sigint;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        installed_ = ::sigaction(SIGINT, &action, &previous_) == 0;
        if (!installed_) {
            ROPMON_LOG_WARN("Unable to install Ctrl-C handler; interrupt will terminate ropmon");
        }
    }

    ~SigintGuard() {
        if (installed_) {
            ::sigaction(SIGINT, &previous_, nullptr);
        }
    }

    SigintGuard(const SigintGuard&) = delete;
    SigintGuard& operator=(const SigintGuard&) = delete;

private:
    struct sigaction previous_ {};
    bool installed_ = false;
};

} // anonymous namespace

int render_command(const RenderOptions& options) {
    const RenderJob& job = options.job;

    if (!fs::exists(job.hip_path)) {
        ROPMON_LOG_ERROR("Hip file not found: {}", job.hip_path);
        return 1;
    }

    std::unique_ptr<RopMetadataProvider> rop_provider;
    if (options.query_rop_range && !job.frame_range) {
        rop_provider = std::make_unique<HythonRopMetadataProvider>(options.config.render);
    }

    RenderController controller(options.config, rop_provider.get());
    EventPrinter printer(std::cout, std::cerr, options.printer);

    ROPMON_LOG_INFO("Rendering {} from {}", job.out_node_path, job.hip_path);
    if (job.frame_range) {
        ROPMON_LOG_INFO("Frame range {}-{} step {} ({} frames)", job.frame_range->start,
                        job.frame_range->end, job.frame_range->step, job.frame_range->count());
    }

    g_interrupt_count = 0;
    SigintGuard sigint_guard;

    if (!controller.start(job)) {
        ROPMON_LOG_ERROR("Render could not be started");
        return 1;
    }

    int handled_interrupts = 0;
    while (!printer.job_finished()) {
        int requested = g_interrupt_count.load();
        while (handled_interrupts < requested) {
            ++handled_interrupts;
            if (handled_interrupts == 1) {
                controller.interrupt();
            } else {
                controller.kill();
            }
        }

        if (auto event = controller.events().wait_pop(std::chrono::milliseconds(100))) {
            printer.print(*event);
        }
    }

    controller.wait();
    for (const auto& event : controller.events().drain()) {
        printer.print(event);
    }

    const auto& finished = printer.finished();
    ROPMON_LOG_INFO("{} frame(s) rendered, {} skipped, {} failed", printer.frames_completed(),
                    printer.frames_skipped(), printer.frames_failed());

    if (finished->killed) {
        return 1;
    }
    if (finished->exit_code && *finished->exit_code != 0) {
        ROPMON_LOG_ERROR("Render process exited with code {}", *finished->exit_code);
        return 1;
    }
    return 0;
}

} // namespace cli
} // namespace ropmon
