// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "frame.hpp"
#include "image.hpp"
#include "policy.hpp"
#include "timestamp.hpp"

namespace trackio
{

class IEventSource;

/**
 * @brief Borrowed view of a device session.
 *
 * Exposes the query and configuration surface of a Controller without the
 * listener bookkeeping. Listener hooks receive one that is valid only for the
 * duration of the call; do not keep references to it.
 */
class ControllerRef
{
public:
    explicit ControllerRef(IEventSource& source) : source_(&source)
    {
    }

    ControllerRef(const ControllerRef&) = delete;
    ControllerRef& operator=(const ControllerRef&) = delete;

    // Whether the connection to the device service is established
    bool is_service_connected() const;

    // Whether a tracking device is connected
    bool is_connected() const;

    // Whether this application currently has device focus
    bool has_focus() const;

    // Current service timestamp
    Timestamp now() const;

    // Most recent frame of tracking data
    Frame frame() const;

    /**
     * @brief Frame of the given age.
     *
     * 0 selects the most recent frame, 1 the one before it, and so on up to
     * kMaxFrameHistory. Any other value yields an invalid frame.
     */
    Frame frame(int history) const;

    // Most recent set of captured images (requires Policy::Images)
    ImageList images() const;

    /**
     * @brief Request a policy from the service.
     *
     * Set policies after a device is connected, otherwise they might not take
     * effect. Policies are applied asynchronously, so is_policy_set() can stay
     * false for a while after this call.
     */
    void set_policy(Policy policy) const;
    void clear_policy(Policy policy) const;
    bool is_policy_set(Policy policy) const;

    // Enabled gestures are reported in frames
    void enable_gesture(GestureType gesture) const;
    void disable_gesture(GestureType gesture) const;
    bool is_gesture_enabled(GestureType gesture) const;

protected:
    IEventSource& source() const
    {
        return *source_;
    }

private:
    IEventSource* source_;
};

} // namespace trackio
