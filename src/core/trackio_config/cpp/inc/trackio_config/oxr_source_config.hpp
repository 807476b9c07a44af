// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trackio/policy.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace trackio
{

// Settings of the OpenXR-backed device service
struct OxrSourceConfig
{
    std::string app_name = "TrackIO";

    // Extensions requested in addition to the ones the service always needs
    std::vector<std::string> extensions;

    // Period of the event poll / joint locate loop
    int poll_interval_ms = 10;

    // Delay between attempts to reach the runtime while it is unavailable
    int retry_interval_ms = 1000;

    // Policies set as soon as the service is created
    std::vector<Policy> policies;
};

/**
 * @brief Load an OxrSourceConfig from a YAML file.
 *
 * Keys that are absent keep their default value. Recognized keys:
 * @code
 *     app_name: MyApp
 *     extensions: [XR_FB_hand_tracking_aim]
 *     poll_interval_ms: 10
 *     retry_interval_ms: 1000
 *     policies: [BackgroundFrames, OptimizeHmd]
 * @endcode
 *
 * @throws std::runtime_error if the file cannot be read or holds invalid values.
 */
OxrSourceConfig load_oxr_source_config(const std::string& path);

// Parses a policy name as printed by to_string(Policy)
// @throws std::invalid_argument for an unknown name
Policy policy_from_string(std::string_view name);

} // namespace trackio
