// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/dispatch_bridge.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <utility>

namespace trackio
{

namespace
{

[[noreturn]] void abort_on_hook_failure(EventKind kind, const char* what) noexcept
{
    std::cerr << "ListenerRegistration: unrecoverable failure in " << to_string(kind) << " hook: " << what
              << ", aborting" << std::endl;
    std::abort();
}

// Entry point called by the service for one event kind. Must never throw.
template <EventKind Kind, void (Listener::*Hook)(const ControllerRef&)>
void dispatch(void* token, IEventSource* session) noexcept
{
    auto* registration = static_cast<ListenerRegistration*>(token);
    try
    {
        const ControllerRef controller(*session);
        (registration->listener().get()->*Hook)(controller);
    }
    catch (const std::exception& e)
    {
        abort_on_hook_failure(Kind, e.what());
    }
    catch (...)
    {
        abort_on_hook_failure(Kind, "unknown exception");
    }
}

} // namespace

ListenerRegistration::ListenerRegistration(std::shared_ptr<Listener> listener) : listener_(std::move(listener))
{
    callbacks_.on_init = &dispatch<EventKind::Init, &Listener::on_init>;
    callbacks_.on_connect = &dispatch<EventKind::Connect, &Listener::on_connect>;
    callbacks_.on_disconnect = &dispatch<EventKind::Disconnect, &Listener::on_disconnect>;
    callbacks_.on_exit = &dispatch<EventKind::Exit, &Listener::on_exit>;
    callbacks_.on_frame = &dispatch<EventKind::Frame, &Listener::on_frame>;
    callbacks_.on_focus_gained = &dispatch<EventKind::FocusGained, &Listener::on_focus_gained>;
    callbacks_.on_focus_lost = &dispatch<EventKind::FocusLost, &Listener::on_focus_lost>;
    callbacks_.on_service_connect = &dispatch<EventKind::ServiceConnect, &Listener::on_service_connect>;
    callbacks_.on_service_disconnect = &dispatch<EventKind::ServiceDisconnect, &Listener::on_service_disconnect>;
    callbacks_.on_device_change = &dispatch<EventKind::DeviceChange, &Listener::on_device_change>;
    callbacks_.on_images = &dispatch<EventKind::Images, &Listener::on_images>;
    callbacks_.token = this;
}

void deliver(const ListenerCallbacks& callbacks, EventKind kind, IEventSource& session)
{
    ListenerCallbacks::Callback callback = nullptr;
    switch (kind)
    {
    case EventKind::Init:
        callback = callbacks.on_init;
        break;
    case EventKind::Connect:
        callback = callbacks.on_connect;
        break;
    case EventKind::Disconnect:
        callback = callbacks.on_disconnect;
        break;
    case EventKind::Exit:
        callback = callbacks.on_exit;
        break;
    case EventKind::Frame:
        callback = callbacks.on_frame;
        break;
    case EventKind::FocusGained:
        callback = callbacks.on_focus_gained;
        break;
    case EventKind::FocusLost:
        callback = callbacks.on_focus_lost;
        break;
    case EventKind::ServiceConnect:
        callback = callbacks.on_service_connect;
        break;
    case EventKind::ServiceDisconnect:
        callback = callbacks.on_service_disconnect;
        break;
    case EventKind::DeviceChange:
        callback = callbacks.on_device_change;
        break;
    case EventKind::Images:
        callback = callbacks.on_images;
        break;
    }

    if (callback)
    {
        callback(callbacks.token, &session);
    }
}

} // namespace trackio
