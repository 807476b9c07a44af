// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "controller_ref.hpp"

namespace trackio
{

/**
 * @brief Receives device service events.
 *
 * Override the hooks of interest; every hook defaults to doing nothing. Hooks
 * are called on the service's thread, not on the thread that registered the
 * listener, so implementations must be thread-safe. Hooks should return
 * quickly: the service does not deliver further events until they do.
 *
 * An exception escaping a hook terminates the process.
 */
class Listener
{
public:
    virtual ~Listener() = default;

    // Called once, when the listener is added to a Controller
    virtual void on_init(const ControllerRef& controller)
    {
    }

    virtual void on_connect(const ControllerRef& controller)
    {
    }

    virtual void on_disconnect(const ControllerRef& controller)
    {
    }

    // Called once, when the listener is removed or its Controller is destroyed.
    // No other hook is called afterwards.
    virtual void on_exit(const ControllerRef& controller)
    {
    }

    // New tracking data is available
    virtual void on_frame(const ControllerRef& controller)
    {
    }

    virtual void on_focus_gained(const ControllerRef& controller)
    {
    }

    virtual void on_focus_lost(const ControllerRef& controller)
    {
    }

    virtual void on_service_connect(const ControllerRef& controller)
    {
    }

    virtual void on_service_disconnect(const ControllerRef& controller)
    {
    }

    // A device was plugged in or removed, or its configuration changed
    virtual void on_device_change(const ControllerRef& controller)
    {
    }

    // A new set of camera images is available
    virtual void on_images(const ControllerRef& controller)
    {
    }
};

} // namespace trackio
