// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trackio/controller_ref.hpp>
#include <trackio/event.hpp>
#include <trackio/listener.hpp>

#include <algorithm>
#include <mutex>
#include <vector>

namespace trackio_test
{

// What a hook observed about the session when it ran
struct Observation
{
    trackio::EventKind kind;
    bool service_connected;
    bool connected;
    bool focus;
};

// Listener that records every delivered event
class RecordingListener : public trackio::Listener
{
public:
    void on_init(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::Init, c);
    }
    void on_connect(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::Connect, c);
    }
    void on_disconnect(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::Disconnect, c);
    }
    void on_exit(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::Exit, c);
    }
    void on_frame(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::Frame, c);
    }
    void on_focus_gained(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::FocusGained, c);
    }
    void on_focus_lost(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::FocusLost, c);
    }
    void on_service_connect(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::ServiceConnect, c);
    }
    void on_service_disconnect(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::ServiceDisconnect, c);
    }
    void on_device_change(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::DeviceChange, c);
    }
    void on_images(const trackio::ControllerRef& c) override
    {
        record(trackio::EventKind::Images, c);
    }

    std::vector<trackio::EventKind> kinds() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<trackio::EventKind> result;
        for (const auto& o : observations_)
        {
            result.push_back(o.kind);
        }
        return result;
    }

    std::vector<Observation> observations() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return observations_;
    }

    size_t count(trackio::EventKind kind) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return static_cast<size_t>(std::count_if(
            observations_.begin(), observations_.end(), [kind](const Observation& o) { return o.kind == kind; }));
    }

private:
    void record(trackio::EventKind kind, const trackio::ControllerRef& c)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        observations_.push_back(Observation{ kind, c.is_service_connected(), c.is_connected(), c.has_focus() });
    }

    mutable std::mutex mutex_;
    std::vector<Observation> observations_;
};

} // namespace trackio_test
