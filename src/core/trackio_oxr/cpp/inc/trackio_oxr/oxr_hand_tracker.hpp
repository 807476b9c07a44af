// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "oxr_session.hpp"

#include <trackio/frame.hpp>

#include <vector>

namespace trackio
{

// Left and right XR_EXT_hand_tracking trackers of one session
class OxrHandTracker
{
public:
    // @throws std::runtime_error if the system has no hand tracking or the trackers cannot be created
    explicit OxrHandTracker(const OxrSession& session);
    ~OxrHandTracker();

    OxrHandTracker(const OxrHandTracker&) = delete;
    OxrHandTracker& operator=(const OxrHandTracker&) = delete;

    // Locates the joints of both hands at @p time. Hands the runtime could not
    // locate are reported inactive.
    std::vector<Hand> locate(XrTime time) const;

private:
    XrHandTrackerEXT create_hand(XrHandEXT hand_type);
    Hand locate_hand(XrHandTrackerEXT tracker, HandSide side, XrTime time) const;

    const OxrSession& session_;

    XrHandTrackerEXT left_hand_tracker_;
    XrHandTrackerEXT right_hand_tracker_;

    PFN_xrCreateHandTrackerEXT pfn_create_hand_tracker_;
    PFN_xrDestroyHandTrackerEXT pfn_destroy_hand_tracker_;
    PFN_xrLocateHandJointsEXT pfn_locate_hand_joints_;
};

} // namespace trackio
