// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "event_source.hpp"
#include "listener.hpp"

#include <memory>

namespace trackio
{

/**
 * @brief Binds one Listener to the callback table handed to the device service.
 *
 * The callback table's token is the registration's own address, so a
 * registration must not move while the service may call it; it is neither
 * copyable nor movable and is always heap-allocated by its owner.
 *
 * Every callback runs the matching Listener hook inside a failure boundary: if
 * the hook throws, the failure is logged and the process is aborted, so nothing
 * unwinds into the service's frames and the service never resumes above a
 * failed hook.
 */
class ListenerRegistration
{
public:
    explicit ListenerRegistration(std::shared_ptr<Listener> listener);

    ListenerRegistration(const ListenerRegistration&) = delete;
    ListenerRegistration& operator=(const ListenerRegistration&) = delete;
    ListenerRegistration(ListenerRegistration&&) = delete;
    ListenerRegistration& operator=(ListenerRegistration&&) = delete;

    const ListenerCallbacks& callbacks() const
    {
        return callbacks_;
    }

    const std::shared_ptr<Listener>& listener() const
    {
        return listener_;
    }

private:
    std::shared_ptr<Listener> listener_;
    ListenerCallbacks callbacks_;
};

} // namespace trackio
