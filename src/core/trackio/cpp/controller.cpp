// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/controller.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace trackio
{

IEventSource& Controller::checked(const std::unique_ptr<IEventSource>& source)
{
    if (!source)
    {
        throw std::invalid_argument("Controller: event source cannot be null");
    }
    return *source;
}

Controller::Controller(std::unique_ptr<IEventSource> source) : ControllerRef(checked(source)), source_(std::move(source))
{
}

Controller::~Controller()
{
    std::vector<std::unique_ptr<ListenerRegistration>> registrations;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        registrations.swap(registrations_);
    }

    // Every listener gets on_exit while the session is still alive, and none
    // sees another event once the first on_exit has been delivered
    const size_t removed = source_->remove_all();
    if (removed != registrations.size())
    {
        std::cerr << "Controller: Warning - event source removed " << removed << " listeners, expected "
                  << registrations.size() << std::endl;
    }

    source_.reset();

    // Listeners are released last, when `registrations` goes out of scope
}

bool Controller::add_listener(std::shared_ptr<Listener> listener)
{
    if (!listener)
    {
        throw std::invalid_argument("Controller: cannot add a null listener");
    }

    // Heap-allocated so the token handed to the source never moves
    auto registration = std::make_unique<ListenerRegistration>(std::move(listener));

    // Not under listeners_mutex_: on_init runs inside this call and may query
    // the controller
    if (!source_->add_listener(registration->callbacks()))
    {
        std::cerr << "Controller: Event source rejected listener registration" << std::endl;
        return false;
    }

    std::lock_guard<std::mutex> lock(listeners_mutex_);
    registrations_.push_back(std::move(registration));
    return true;
}

bool Controller::remove_listener(const std::shared_ptr<Listener>& listener)
{
    std::unique_ptr<ListenerRegistration> registration;
    {
        std::lock_guard<std::mutex> lock(listeners_mutex_);
        auto it = std::find_if(registrations_.begin(), registrations_.end(),
                               [&](const std::unique_ptr<ListenerRegistration>& r)
                               { return r->listener() == listener; });
        if (it == registrations_.end())
        {
            return false;
        }
        registration = std::move(*it);
        registrations_.erase(it);
    }

    // The registration stays alive until the source has delivered on_exit and
    // stopped calling into it
    if (!source_->remove_listener(registration->callbacks()))
    {
        std::cerr << "Controller: Warning - event source did not know a registered listener" << std::endl;
    }
    return true;
}

size_t Controller::listener_count() const
{
    std::lock_guard<std::mutex> lock(listeners_mutex_);
    return registrations_.size();
}

} // namespace trackio
