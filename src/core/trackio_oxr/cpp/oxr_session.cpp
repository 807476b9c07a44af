// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio_oxr/oxr_session.hpp"

#include <cstring>
#include <initializer_list>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>

namespace trackio
{

namespace
{

// XR_TYPE_SESSION_CREATE_INFO_OVERLAY_EXTX; the experimental extension ships no header
constexpr XrStructureType kOverlayCreateInfoType = static_cast<XrStructureType>(1000033000);

struct OverlayCreateInfo
{
    XrStructureType type;
    const void* next;
    uint32_t create_flags;
    uint32_t session_layers_placement;
};

void check(XrResult result, const char* what)
{
    if (XR_FAILED(result))
    {
        throw std::runtime_error(std::string("OxrSession: ") + what + " failed with code " + std::to_string(result));
    }
}

} // namespace

OxrSession::OxrSession()
    : instance_(XR_NULL_HANDLE),
      system_id_(XR_NULL_SYSTEM_ID),
      session_(XR_NULL_HANDLE),
      space_(XR_NULL_HANDLE),
      pfn_convert_timespec_(nullptr)
{
}

OxrSession::~OxrSession()
{
    // Children before parents; each handle may be null after a failed Create()
    if (space_ != XR_NULL_HANDLE)
    {
        xrDestroySpace(space_);
    }
    if (session_ != XR_NULL_HANDLE)
    {
        xrDestroySession(session_);
    }
    if (instance_ != XR_NULL_HANDLE)
    {
        xrDestroyInstance(instance_);
    }
}

std::unique_ptr<OxrSession> OxrSession::Create(const std::string& app_name, const std::vector<std::string>& extensions)
{
    std::unique_ptr<OxrSession> session(new OxrSession());
    session->create_instance(app_name, extensions);
    session->open_session();
    return session;
}

bool OxrSession::poll_event(XrEventDataBuffer& event)
{
    event = XrEventDataBuffer{ XR_TYPE_EVENT_DATA_BUFFER };
    const XrResult result = xrPollEvent(instance_, &event);
    if (result == XR_EVENT_UNAVAILABLE)
    {
        return false;
    }
    check(result, "xrPollEvent");
    return true;
}

XrTime OxrSession::now() const
{
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);

    XrTime time = 0;
    check(pfn_convert_timespec_(instance_, &ts, &time), "xrConvertTimespecTimeToTimeKHR");
    return time;
}

void OxrSession::create_instance(const std::string& app_name, const std::vector<std::string>& extensions)
{
    // Headless overlay mode, hand tracking and time conversion are always required
    std::set<std::string> names(extensions.begin(), extensions.end());
    for (const char* required : { "XR_MND_headless", "XR_EXTX_overlay", XR_EXT_HAND_TRACKING_EXTENSION_NAME,
                                  XR_KHR_CONVERT_TIMESPEC_TIME_EXTENSION_NAME })
    {
        names.insert(required);
    }

    std::vector<const char*> name_ptrs;
    for (const auto& name : names)
    {
        name_ptrs.push_back(name.c_str());
    }

    XrInstanceCreateInfo create_info{ XR_TYPE_INSTANCE_CREATE_INFO };
    create_info.applicationInfo.apiVersion = XR_CURRENT_API_VERSION;
    strncpy(create_info.applicationInfo.applicationName, app_name.c_str(), XR_MAX_APPLICATION_NAME_SIZE - 1);
    strncpy(create_info.applicationInfo.engineName, "TrackIO", XR_MAX_ENGINE_NAME_SIZE - 1);
    create_info.enabledExtensionCount = static_cast<uint32_t>(name_ptrs.size());
    create_info.enabledExtensionNames = name_ptrs.data();
    check(xrCreateInstance(&create_info, &instance_), "xrCreateInstance");

    check(xrGetInstanceProcAddr(instance_, "xrConvertTimespecTimeToTimeKHR",
                                reinterpret_cast<PFN_xrVoidFunction*>(&pfn_convert_timespec_)),
          "xrGetInstanceProcAddr(xrConvertTimespecTimeToTimeKHR)");

    std::cout << "OxrSession: Created OpenXR instance with " << names.size() << " extensions" << std::endl;
}

void OxrSession::open_session()
{
    XrSystemGetInfo system_info{ XR_TYPE_SYSTEM_GET_INFO };
    system_info.formFactor = XR_FORM_FACTOR_HEAD_MOUNTED_DISPLAY;
    check(xrGetSystem(instance_, &system_info, &system_id_), "xrGetSystem");

    OverlayCreateInfo overlay_info{ kOverlayCreateInfoType, nullptr, 0, 0 };
    XrSessionCreateInfo session_info{ XR_TYPE_SESSION_CREATE_INFO };
    session_info.next = &overlay_info;
    session_info.systemId = system_id_;
    check(xrCreateSession(instance_, &session_info, &session_), "xrCreateSession");

    // Joint poses are reported in the stage space
    XrReferenceSpaceCreateInfo space_info{ XR_TYPE_REFERENCE_SPACE_CREATE_INFO };
    space_info.referenceSpaceType = XR_REFERENCE_SPACE_TYPE_STAGE;
    space_info.poseInReferenceSpace.orientation.w = 1.0f;
    check(xrCreateReferenceSpace(session_, &space_info, &space_), "xrCreateReferenceSpace");

    // A headless session renders no views, so the view configuration is nominal
    XrSessionBeginInfo begin_info{ XR_TYPE_SESSION_BEGIN_INFO };
    begin_info.primaryViewConfigurationType = XR_VIEW_CONFIGURATION_TYPE_PRIMARY_STEREO;
    check(xrBeginSession(session_, &begin_info), "xrBeginSession");

    std::cout << "OxrSession: Began headless session" << std::endl;
}

} // namespace trackio
