// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "event.hpp"
#include "frame.hpp"
#include "image.hpp"
#include "policy.hpp"
#include "timestamp.hpp"

#include <cstddef>

namespace trackio
{

class IEventSource;

/**
 * @brief Callback table handed to the device service when a listener is registered.
 *
 * The service calls exactly one entry per event occurrence, passing back the
 * opaque token it was given and itself as the session. The table and the token
 * stay valid until remove_listener() for the same token has returned.
 */
struct ListenerCallbacks
{
    using Callback = void (*)(void* token, IEventSource* session);

    Callback on_init = nullptr;
    Callback on_connect = nullptr;
    Callback on_disconnect = nullptr;
    Callback on_exit = nullptr;
    Callback on_frame = nullptr;
    Callback on_focus_gained = nullptr;
    Callback on_focus_lost = nullptr;
    Callback on_service_connect = nullptr;
    Callback on_service_disconnect = nullptr;
    Callback on_device_change = nullptr;
    Callback on_images = nullptr;

    void* token = nullptr;
};

// Calls the entry of @p callbacks matching @p kind. Used by event sources.
void deliver(const ListenerCallbacks& callbacks, EventKind kind, IEventSource& session);

/**
 * @brief Interface of the device service (the event source).
 *
 * Implementations own the connection to the device and one or more threads on
 * which events are delivered. Contract:
 *  - add_listener() delivers Init synchronously, before returning and before
 *    any other event for that listener. It must not be called from inside a
 *    delivery.
 *  - Deliveries to a single listener are serialized and in the order the
 *    service raised them.
 *  - remove_listener() waits for any in-flight delivery to that listener,
 *    delivers Exit exactly once and delivers nothing afterwards. It must not be
 *    called from inside a delivery.
 *  - remove_all() detaches every listener at once: each gets Exit, and no
 *    event is delivered to any of them once the first Exit has been delivered.
 *  - Level-triggered state (is_connected(), has_focus(), is_service_connected())
 *    is updated before the corresponding event is delivered.
 *  - Queries and configuration calls never block and are safe from any thread.
 */
class IEventSource
{
public:
    virtual ~IEventSource() = default;

    // Returns false if the service rejects the registration
    virtual bool add_listener(const ListenerCallbacks& callbacks) = 0;

    // Returns false if no listener with callbacks.token is registered
    virtual bool remove_listener(const ListenerCallbacks& callbacks) = 0;

    // Returns the number of listeners removed
    virtual size_t remove_all() = 0;

    virtual bool is_service_connected() const = 0;
    virtual bool is_connected() const = 0;
    virtual bool has_focus() const = 0;

    virtual Timestamp now() const = 0;

    // history is in [0, kMaxFrameHistory]; returns Frame::invalid() if that much
    // history is not available
    virtual Frame frame(int history) const = 0;
    virtual ImageList images() const = 0;

    virtual void set_policy(Policy policy) = 0;
    virtual void clear_policy(Policy policy) = 0;
    virtual bool is_policy_set(Policy policy) const = 0;

    virtual void enable_gesture(GestureType gesture, bool enable) = 0;
    virtual bool is_gesture_enabled(GestureType gesture) const = 0;
};

} // namespace trackio
