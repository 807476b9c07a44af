// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <time.h>

// XR_USE_TIMESPEC is defined by the build for the time conversion entry points
#include <openxr/openxr.h>
#include <openxr/openxr_platform.h>

#include <memory>
#include <string>
#include <vector>

namespace trackio
{

// Headless OpenXR session used as the connection to the tracking runtime
class OxrSession
{
public:
    ~OxrSession();

    OxrSession(const OxrSession&) = delete;
    OxrSession& operator=(const OxrSession&) = delete;

    // Creates, configures and begins a session.
    // @throws std::runtime_error if any OpenXR call fails
    static std::unique_ptr<OxrSession> Create(const std::string& app_name,
                                              const std::vector<std::string>& extensions = {});

    // Pops the next runtime event. Returns false when the queue is empty.
    // @throws std::runtime_error if the runtime reports an error
    bool poll_event(XrEventDataBuffer& event);

    // Current runtime time, for locating spaces without a frame loop
    XrTime now() const;

    XrInstance instance() const
    {
        return instance_;
    }

    XrSystemId system_id() const
    {
        return system_id_;
    }

    XrSession session() const
    {
        return session_;
    }

    XrSpace space() const
    {
        return space_;
    }

private:
    OxrSession();

    void create_instance(const std::string& app_name, const std::vector<std::string>& extensions);

    // Gets the system, creates the session and its stage space, and begins it
    void open_session();

    XrInstance instance_;
    XrSystemId system_id_;
    XrSession session_;
    XrSpace space_;

    PFN_xrConvertTimespecTimeToTimeKHR pfn_convert_timespec_;
};

} // namespace trackio
