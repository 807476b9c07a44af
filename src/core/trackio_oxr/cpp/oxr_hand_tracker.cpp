// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio_oxr/oxr_hand_tracker.hpp"

#include <stdexcept>
#include <string>

namespace trackio
{

static_assert(Hand::NUM_JOINTS == XR_HAND_JOINT_COUNT_EXT, "Hand joint layout must match XR_EXT_hand_tracking");

OxrHandTracker::OxrHandTracker(const OxrSession& session)
    : session_(session),
      left_hand_tracker_(XR_NULL_HANDLE),
      right_hand_tracker_(XR_NULL_HANDLE),
      pfn_create_hand_tracker_(nullptr),
      pfn_destroy_hand_tracker_(nullptr),
      pfn_locate_hand_joints_(nullptr)
{
    XrSystemHandTrackingPropertiesEXT hand_tracking_props{ XR_TYPE_SYSTEM_HAND_TRACKING_PROPERTIES_EXT };
    XrSystemProperties system_props{ XR_TYPE_SYSTEM_PROPERTIES };
    system_props.next = &hand_tracking_props;

    XrResult result = xrGetSystemProperties(session_.instance(), session_.system_id(), &system_props);
    if (XR_SUCCEEDED(result) && !hand_tracking_props.supportsHandTracking)
    {
        throw std::runtime_error("Hand tracking not supported by this system");
    }

    xrGetInstanceProcAddr(session_.instance(), "xrCreateHandTrackerEXT",
                          reinterpret_cast<PFN_xrVoidFunction*>(&pfn_create_hand_tracker_));
    xrGetInstanceProcAddr(session_.instance(), "xrDestroyHandTrackerEXT",
                          reinterpret_cast<PFN_xrVoidFunction*>(&pfn_destroy_hand_tracker_));
    xrGetInstanceProcAddr(session_.instance(), "xrLocateHandJointsEXT",
                          reinterpret_cast<PFN_xrVoidFunction*>(&pfn_locate_hand_joints_));

    if (!pfn_create_hand_tracker_ || !pfn_destroy_hand_tracker_ || !pfn_locate_hand_joints_)
    {
        throw std::runtime_error("Failed to get hand tracking function pointers");
    }

    left_hand_tracker_ = create_hand(XR_HAND_LEFT_EXT);
    try
    {
        right_hand_tracker_ = create_hand(XR_HAND_RIGHT_EXT);
    }
    catch (const std::runtime_error&)
    {
        pfn_destroy_hand_tracker_(left_hand_tracker_);
        throw;
    }
}

OxrHandTracker::~OxrHandTracker()
{
    if (left_hand_tracker_ != XR_NULL_HANDLE)
    {
        pfn_destroy_hand_tracker_(left_hand_tracker_);
    }
    if (right_hand_tracker_ != XR_NULL_HANDLE)
    {
        pfn_destroy_hand_tracker_(right_hand_tracker_);
    }
}

XrHandTrackerEXT OxrHandTracker::create_hand(XrHandEXT hand_type)
{
    XrHandTrackerCreateInfoEXT create_info{ XR_TYPE_HAND_TRACKER_CREATE_INFO_EXT };
    create_info.hand = hand_type;
    create_info.handJointSet = XR_HAND_JOINT_SET_DEFAULT_EXT;

    XrHandTrackerEXT tracker = XR_NULL_HANDLE;
    XrResult result = pfn_create_hand_tracker_(session_.session(), &create_info, &tracker);
    if (XR_FAILED(result))
    {
        throw std::runtime_error("Failed to create hand tracker: " + std::to_string(result));
    }
    return tracker;
}

std::vector<Hand> OxrHandTracker::locate(XrTime time) const
{
    return { locate_hand(left_hand_tracker_, HandSide::Left, time),
             locate_hand(right_hand_tracker_, HandSide::Right, time) };
}

Hand OxrHandTracker::locate_hand(XrHandTrackerEXT tracker, HandSide side, XrTime time) const
{
    Hand hand;
    hand.side = side;

    XrHandJointsLocateInfoEXT locate_info{ XR_TYPE_HAND_JOINTS_LOCATE_INFO_EXT };
    locate_info.baseSpace = session_.space();
    locate_info.time = time;

    XrHandJointLocationEXT joint_locations[XR_HAND_JOINT_COUNT_EXT];

    XrHandJointLocationsEXT locations{ XR_TYPE_HAND_JOINT_LOCATIONS_EXT };
    locations.jointCount = XR_HAND_JOINT_COUNT_EXT;
    locations.jointLocations = joint_locations;

    XrResult result = pfn_locate_hand_joints_(tracker, &locate_info, &locations);
    if (XR_FAILED(result))
    {
        return hand;
    }

    hand.is_active = locations.isActive;
    for (uint32_t i = 0; i < XR_HAND_JOINT_COUNT_EXT; ++i)
    {
        const auto& joint_loc = joint_locations[i];
        auto& joint = hand.joints[i];

        joint.position[0] = joint_loc.pose.position.x;
        joint.position[1] = joint_loc.pose.position.y;
        joint.position[2] = joint_loc.pose.position.z;

        joint.orientation[0] = joint_loc.pose.orientation.x;
        joint.orientation[1] = joint_loc.pose.orientation.y;
        joint.orientation[2] = joint_loc.pose.orientation.z;
        joint.orientation[3] = joint_loc.pose.orientation.w;

        joint.radius = joint_loc.radius;
        joint.is_valid = (joint_loc.locationFlags & XR_SPACE_LOCATION_POSITION_VALID_BIT) &&
                         (joint_loc.locationFlags & XR_SPACE_LOCATION_ORIENTATION_VALID_BIT);
    }

    return hand;
}

} // namespace trackio
