/*
 * File:        rop_metadata.h
 * Module:      ropmon-core
 * Purpose:     Frame range and skip settings configured on ROP nodes
 *
 * SPDX-License-Identifier: GPL-3.0-or-later
 * SPDX-FileCopyrightText: 2025-2026 Simon Inns
 */

#ifndef ROPMON_CORE_ROP_METADATA_H
#define ROPMON_CORE_ROP_METADATA_H

#include "monitor_config.h"
#include "render_job.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace ropmon {

/// Settings of one ROP as configured in the scene
struct RopSettings {
    int32_t start_frame = 1;
    int32_t end_frame = 1;
    int32_t step = 1;
    bool skip_existing = false;

    FrameRange range() const { return FrameRange{start_frame, end_frame, step}; }
};

struct RopInfo {
    std::string node_path;
    std::optional<RopSettings> settings;
};

/**
 * @brief Source of ROP settings for a scene
 *
 * Only consulted when the job has no explicit range.
 */
class RopMetadataProvider {
public:
    virtual ~RopMetadataProvider() = default;

    /// Render nodes under /out with their settings
    virtual std::vector<RopInfo> list_rops(const std::string& hip_path) = 0;

    /// Settings of one node, nullopt if the node is unknown
    virtual std::optional<RopSettings> query(const std::string& hip_path, const std::string& node_path);
};

/**
 * @brief Asks hython to load the scene and report its ROPs
 *
 * Runs "hython <query_script> <hip>" and parses lines of the form
 *   NODE:/out/Redshift_ROP1
 *   SETTINGS:{"f1": 1, "f2": 240, "f3": 1, "skip_rendered": 0}
 * Everything else the scene load prints is ignored.
 */
class HythonRopMetadataProvider : public RopMetadataProvider {
public:
    explicit HythonRopMetadataProvider(RenderSettings settings,
                                       std::chrono::milliseconds timeout = std::chrono::minutes(5));

    std::vector<RopInfo> list_rops(const std::string& hip_path) override;

private:
    RenderSettings settings_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Parse the output of the query script
 *
 * A SETTINGS line applies to the NODE line before it. Malformed settings
 * leave that node without settings.
 */
std::vector<RopInfo> parse_rop_listing(const std::vector<std::string>& lines);

/// Parse the payload of a SETTINGS: line
std::optional<RopSettings> parse_rop_settings(const std::string& payload);

} // namespace ropmon

#endif // ROPMON_CORE_ROP_METADATA_H
