// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "controller_ref.hpp"
#include "dispatch_bridge.hpp"
#include "event_source.hpp"
#include "listener.hpp"

#include <memory>
#include <mutex>
#include <vector>

namespace trackio
{

/**
 * @brief A connection to the device service. Main entry point of the library.
 *
 * Owns the event source and every listener registered through it. Destroying
 * the Controller first delivers on_exit to each listener (in registration
 * order, with no other event in between), then releases the event source, then
 * releases the listeners.
 *
 * See ManagedController for blocking waits on top of this.
 */
class Controller : public ControllerRef
{
public:
    /**
     * @brief Take ownership of @p source. Connecting to the device is up to the
     *        source and happens in the background; this never blocks.
     * @throws std::invalid_argument if @p source is null.
     */
    explicit Controller(std::unique_ptr<IEventSource> source);

    virtual ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    /**
     * @brief Register a listener to be notified of service events.
     *
     * Hooks are invoked from the service's thread. On success on_init has been
     * delivered by the time this returns. Registering the same listener object
     * more than once is not supported. Must not be called from inside a hook.
     *
     * @return false if the service rejected the registration. The listener is
     *         then not retained and receives no hooks.
     * @throws std::invalid_argument if @p listener is null.
     * @throws std::logic_error if called on the service's dispatch thread.
     */
    bool add_listener(std::shared_ptr<Listener> listener);

    /**
     * @brief Unregister a listener. on_exit is delivered before this returns.
     * @return false if @p listener is not registered with this Controller.
     */
    bool remove_listener(const std::shared_ptr<Listener>& listener);

    size_t listener_count() const;

private:
    static IEventSource& checked(const std::unique_ptr<IEventSource>& source);

    std::unique_ptr<IEventSource> source_;

    mutable std::mutex listeners_mutex_;
    std::vector<std::unique_ptr<ListenerRegistration>> registrations_;
};

} // namespace trackio
