/*
 * File:        monitor_config.cpp
 * Module:      ropmon-core
 * Purpose:     Monitor configuration and job files (YAML)
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#include "monitor_config.h"
#include "logging.h"

#include <yaml-cpp/yaml.h>
#include <fstream>
#include <stdexcept>

#ifndef ROPMON_SHARE_DIR
#define ROPMON_SHARE_DIR "/usr/local/share/ropmon"
#endif

namespace ropmon {

namespace {

YAML::Node load_yaml(const std::string& filename) {
    try {
        return YAML::LoadFile(filename);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse YAML file '" + filename + "': " + e.what());
    }
}

// Read an optional scalar, keeping the current value when the key is absent
template <typename T>
void read_value(const YAML::Node& section, const char* key, T& value,
                const std::string& filename, const std::string& section_name) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        value = node.as<T>();
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid value for '" + section_name + "." + key + "' in '" + filename
                                 + "': " + e.what());
    }
}

void require_positive(int32_t value, const char* key, const std::string& filename) {
    if (value <= 0) {
        throw std::runtime_error("Invalid value for '" + std::string(key) + "' in '" + filename
                                 + "': must be greater than zero");
    }
}

void write_file(const YAML::Emitter& out, const std::string& filename, const char* header) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file for writing: " + filename);
    }
    file << header;
    file << out.c_str() << "\n";
    file.close();
}

} // anonymous namespace

RenderSettings::RenderSettings()
    : script(default_share_directory() + "/render_rop.py")
    , query_script(default_share_directory() + "/query_rops.py")
{
}

std::string default_share_directory() {
    return ROPMON_SHARE_DIR;
}

MonitorConfig load_config(const std::string& filename) {
    YAML::Node root = load_yaml(filename);
    MonitorConfig config;

    if (root.IsNull()) {
        ROPMON_LOG_DEBUG("Configuration file '{}' is empty, using defaults", filename);
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Invalid configuration file '" + filename + "': top level must be a map");
    }

    if (const YAML::Node render = root["render"]) {
        read_value(render, "hython", config.render.hython, filename, "render");
        read_value(render, "script", config.render.script, filename, "render");
        read_value(render, "query_script", config.render.query_script, filename, "render");
    }

    if (const YAML::Node monitor = root["monitor"]) {
        MonitorSettings& m = config.monitor;
        read_value(monitor, "read_timeout_ms", m.read_timeout_ms, filename, "monitor");
        read_value(monitor, "refresh_interval_ms", m.refresh_interval_ms, filename, "monitor");
        read_value(monitor, "graceful_exit_timeout_ms", m.graceful_exit_timeout_ms, filename, "monitor");
        read_value(monitor, "inference_margin", m.inference_margin, filename, "monitor");
        read_value(monitor, "min_seconds_per_frame_guess", m.min_seconds_per_frame_guess, filename, "monitor");
        read_value(monitor, "strip_prefixes", m.strip_prefixes, filename, "monitor");

        require_positive(m.read_timeout_ms, "monitor.read_timeout_ms", filename);
        require_positive(m.refresh_interval_ms, "monitor.refresh_interval_ms", filename);
        if (m.graceful_exit_timeout_ms < 0 || m.inference_margin < 0 || m.min_seconds_per_frame_guess < 0.0) {
            throw std::runtime_error("Invalid configuration file '" + filename
                                     + "': monitor timeouts, margins and guesses must not be negative");
        }
    }

    if (const YAML::Node logging = root["logging"]) {
        read_value(logging, "level", config.logging.level, filename, "logging");
        read_value(logging, "file", config.logging.file, filename, "logging");
    }

    ROPMON_LOG_DEBUG("Loaded configuration from '{}'", filename);
    return config;
}

void save_config(const MonitorConfig& config, const std::string& filename) {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "render" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "hython" << YAML::Value << config.render.hython;
    out << YAML::Key << "script" << YAML::Value << config.render.script;
    out << YAML::Key << "query_script" << YAML::Value << config.render.query_script;
    out << YAML::EndMap;

    const MonitorSettings& m = config.monitor;
    out << YAML::Key << "monitor" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "read_timeout_ms" << YAML::Value << m.read_timeout_ms;
    out << YAML::Key << "refresh_interval_ms" << YAML::Value << m.refresh_interval_ms;
    out << YAML::Key << "graceful_exit_timeout_ms" << YAML::Value << m.graceful_exit_timeout_ms;
    out << YAML::Key << "inference_margin" << YAML::Value << m.inference_margin;
    out << YAML::Key << "min_seconds_per_frame_guess" << YAML::Value << m.min_seconds_per_frame_guess;
    out << YAML::Key << "strip_prefixes" << YAML::Value << YAML::BeginSeq;
    for (const auto& prefix : m.strip_prefixes) {
        out << YAML::DoubleQuoted << prefix;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;

    out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "level" << YAML::Value << config.logging.level;
    out << YAML::Key << "file" << YAML::Value << config.logging.file;
    out << YAML::EndMap;

    out << YAML::EndMap;

    write_file(out, filename, "# ropmon configuration\n\n");
}

RenderJob load_job(const std::string& filename) {
    YAML::Node root = load_yaml(filename);

    const YAML::Node job_yaml = root["job"];
    if (!job_yaml || !job_yaml.IsMap()) {
        throw std::runtime_error("Invalid job file '" + filename + "': missing required 'job' section");
    }

    RenderJob job;
    read_value(job_yaml, "hip", job.hip_path, filename, "job");
    read_value(job_yaml, "out_node", job.out_node_path, filename, "job");
    read_value(job_yaml, "skip_existing", job.skip_existing, filename, "job");

    if (job.hip_path.empty()) {
        throw std::runtime_error("Invalid job file '" + filename + "': 'job.hip' is required");
    }
    if (job.out_node_path.empty()) {
        throw std::runtime_error("Invalid job file '" + filename + "': 'job.out_node' is required");
    }

    if (const YAML::Node range_yaml = job_yaml["range"]) {
        if (!range_yaml["start"] || !range_yaml["end"]) {
            throw std::runtime_error("Invalid job file '" + filename + "': 'job.range' needs start and end");
        }
        FrameRange range;
        read_value(range_yaml, "start", range.start, filename, "job.range");
        read_value(range_yaml, "end", range.end, filename, "job.range");
        read_value(range_yaml, "step", range.step, filename, "job.range");
        if (range.step <= 0) {
            throw std::runtime_error("Invalid job file '" + filename + "': 'job.range.step' must be positive");
        }
        if (range.end < range.start) {
            throw std::runtime_error("Invalid job file '" + filename + "': 'job.range.end' is before 'job.range.start'");
        }
        job.frame_range = range;
    }

    return job;
}

void save_job(const RenderJob& job, const std::string& filename) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "job" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "hip" << YAML::Value << job.hip_path;
    out << YAML::Key << "out_node" << YAML::Value << job.out_node_path;
    if (job.frame_range) {
        out << YAML::Key << "range" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "start" << YAML::Value << job.frame_range->start;
        out << YAML::Key << "end" << YAML::Value << job.frame_range->end;
        out << YAML::Key << "step" << YAML::Value << job.frame_range->step;
        out << YAML::EndMap;
    }
    out << YAML::Key << "skip_existing" << YAML::Value << job.skip_existing;
    out << YAML::EndMap;
    out << YAML::EndMap;

    write_file(out, filename, "# ropmon render job\n\n");
}

} // namespace ropmon
