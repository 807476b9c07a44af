// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/listener_set.hpp"

#include <algorithm>

namespace trackio
{

void ListenerSet::add(const ListenerCallbacks& callbacks, IEventSource& session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    deliver(callbacks, EventKind::Init, session);
    entries_.push_back(callbacks);
}

bool ListenerSet::remove(const ListenerCallbacks& callbacks, IEventSource& session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const ListenerCallbacks& entry) { return entry.token == callbacks.token; });
    if (it == entries_.end())
    {
        return false;
    }

    const ListenerCallbacks removed = *it;
    entries_.erase(it);
    deliver(removed, EventKind::Exit, session);
    return true;
}

size_t ListenerSet::remove_all(IEventSource& session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ListenerCallbacks> removed;
    removed.swap(entries_);
    for (const auto& entry : removed)
    {
        deliver(entry, EventKind::Exit, session);
    }
    return removed.size();
}

void ListenerSet::broadcast(EventKind kind, IEventSource& session)
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_)
    {
        deliver(entry, kind, session);
    }
}

size_t ListenerSet::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace trackio
