// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "event_source.hpp"

#include <mutex>
#include <vector>

namespace trackio
{

/**
 * @brief Registered callback tables of an event source.
 *
 * Holds one lock across registration, removal and each broadcast, so every
 * listener sees Init first, Exit last, and events one at a time in the order
 * they were broadcast. Event sources own one of these and call broadcast() from
 * their dispatch thread after updating their state.
 */
class ListenerSet
{
public:
    // Delivers Init to @p callbacks, then registers them
    void add(const ListenerCallbacks& callbacks, IEventSource& session);

    // Unregisters the entry with the same token and delivers Exit to it.
    // Returns false if no such entry is registered.
    bool remove(const ListenerCallbacks& callbacks, IEventSource& session);

    // Unregisters every entry and delivers Exit to each, in registration order,
    // without letting a broadcast in between. Returns the number removed.
    size_t remove_all(IEventSource& session);

    // Delivers @p kind to every registered listener, in registration order
    void broadcast(EventKind kind, IEventSource& session);

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<ListenerCallbacks> entries_;
};

} // namespace trackio
