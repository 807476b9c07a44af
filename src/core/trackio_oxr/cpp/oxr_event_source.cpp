// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio_oxr/oxr_event_source.hpp"

#include "inc/trackio_oxr/oxr_hand_tracker.hpp"
#include "inc/trackio_oxr/oxr_session.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

namespace trackio
{

OxrEventSource::OxrEventSource(const OxrSourceConfig& config)
    : config_(config), start_time_(std::chrono::steady_clock::now())
{
    for (Policy policy : config_.policies)
    {
        set_policy(policy);
    }

    worker_ = std::thread(&OxrEventSource::run, this);
}

OxrEventSource::~OxrEventSource()
{
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
        stop_requested_ = true;
    }
    stop_cv_.notify_all();

    if (worker_.joinable())
    {
        worker_.join();
    }

    // Trackers must be destroyed while the session is still valid
    hand_tracker_.reset();
    session_.reset();
}

// ============================================================================
// Worker thread
// ============================================================================

void OxrEventSource::run()
{
    const std::chrono::milliseconds retry_interval(config_.retry_interval_ms);
    const std::chrono::milliseconds poll_interval(config_.poll_interval_ms);

    while (true)
    {
        if (!session_ && !connect_service())
        {
            if (!wait_interval(retry_interval))
                break;
            continue;
        }

        if (!hand_tracker_ && !connect_device())
        {
            if (!wait_interval(retry_interval))
                break;
            continue;
        }

        try
        {
            process_runtime_events();
            if (session_)
            {
                sample_frame();
            }
        }
        catch (const std::runtime_error& e)
        {
            std::cerr << "OxrEventSource: Runtime error, reconnecting: " << e.what() << std::endl;
            teardown();
        }

        if (!wait_interval(session_ ? poll_interval : retry_interval))
            break;
    }
}

bool OxrEventSource::wait_interval(std::chrono::milliseconds interval)
{
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, interval, [this] { return stop_requested_; });
}

bool OxrEventSource::connect_service()
{
    try
    {
        session_ = OxrSession::Create(config_.app_name, config_.extensions);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "OxrEventSource: OpenXR runtime not available, retrying in " << config_.retry_interval_ms
                  << "ms: " << e.what() << std::endl;
        return false;
    }

    session_state_ = XR_SESSION_STATE_UNKNOWN;
    std::cout << "OxrEventSource: Connected to OpenXR runtime" << std::endl;
    transition(service_connected_, true, EventKind::ServiceConnect);
    return true;
}

bool OxrEventSource::connect_device()
{
    try
    {
        hand_tracker_ = std::make_unique<OxrHandTracker>(*session_);
    }
    catch (const std::runtime_error& e)
    {
        std::cerr << "OxrEventSource: Hand tracking unavailable, retrying in " << config_.retry_interval_ms
                  << "ms: " << e.what() << std::endl;
        return false;
    }

    std::cout << "OxrEventSource: Hand trackers created (left + right)" << std::endl;
    transition(connected_, true, EventKind::Connect);
    return true;
}

void OxrEventSource::process_runtime_events()
{
    XrEventDataBuffer event;
    while (session_ && session_->poll_event(event))
    {
        switch (event.type)
        {
        case XR_TYPE_EVENT_DATA_SESSION_STATE_CHANGED:
        {
            const auto& state_event = reinterpret_cast<const XrEventDataSessionStateChanged&>(event);
            session_state_ = state_event.state;

            if (session_state_ == XR_SESSION_STATE_FOCUSED)
            {
                transition(focus_, true, EventKind::FocusGained);
            }
            else
            {
                transition(focus_, false, EventKind::FocusLost);
            }

            if (session_state_ == XR_SESSION_STATE_LOSS_PENDING || session_state_ == XR_SESSION_STATE_EXITING)
            {
                std::cerr << "OxrEventSource: Session exiting or loss pending" << std::endl;
                teardown();
            }
            break;
        }
        case XR_TYPE_EVENT_DATA_INTERACTION_PROFILE_CHANGED:
            listeners_.broadcast(EventKind::DeviceChange, *this);
            break;
        case XR_TYPE_EVENT_DATA_INSTANCE_LOSS_PENDING:
            std::cerr << "OxrEventSource: OpenXR instance loss pending" << std::endl;
            teardown();
            break;
        default:
            break;
        }
    }
}

void OxrEventSource::sample_frame()
{
    if (!hand_tracker_)
    {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!focus_ && (policies_ & policy_bit(Policy::BackgroundFrames)) == 0)
        {
            return;
        }
    }

    std::vector<Hand> hands = hand_tracker_->locate(session_->now());
    const Timestamp timestamp = now();

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        frames_.push(timestamp, std::move(hands));
    }

    listeners_.broadcast(EventKind::Frame, *this);
}

void OxrEventSource::teardown()
{
    transition(focus_, false, EventKind::FocusLost);

    hand_tracker_.reset();
    transition(connected_, false, EventKind::Disconnect);

    session_.reset();
    transition(service_connected_, false, EventKind::ServiceDisconnect);
}

void OxrEventSource::transition(bool& flag, bool value, EventKind kind)
{
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (flag == value)
        {
            return;
        }
        flag = value;
    }
    listeners_.broadcast(kind, *this);
}

// ============================================================================
// IEventSource
// ============================================================================

bool OxrEventSource::add_listener(const ListenerCallbacks& callbacks)
{
    check_not_dispatching("add_listener");
    listeners_.add(callbacks, *this);
    return true;
}

bool OxrEventSource::remove_listener(const ListenerCallbacks& callbacks)
{
    check_not_dispatching("remove_listener");
    return listeners_.remove(callbacks, *this);
}

size_t OxrEventSource::remove_all()
{
    check_not_dispatching("remove_all");
    return listeners_.remove_all(*this);
}

void OxrEventSource::check_not_dispatching(const char* operation) const
{
    if (std::this_thread::get_id() == worker_.get_id())
    {
        throw std::logic_error(std::string("OxrEventSource: ") + operation + "() called from inside a listener hook");
    }
}

bool OxrEventSource::is_service_connected() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return service_connected_;
}

bool OxrEventSource::is_connected() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connected_;
}

bool OxrEventSource::has_focus() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return focus_;
}

Timestamp OxrEventSource::now() const
{
    const auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return Timestamp::from_raw(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

Frame OxrEventSource::frame(int history) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return frames_.at(history);
}

ImageList OxrEventSource::images() const
{
    return ImageList();
}

void OxrEventSource::set_policy(Policy policy)
{
    if (policy == Policy::Images)
    {
        std::cerr << "OxrEventSource: Images policy is not supported by the OpenXR runtime, ignoring" << std::endl;
        return;
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    policies_ |= policy_bit(policy);
}

void OxrEventSource::clear_policy(Policy policy)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    policies_ &= ~policy_bit(policy);
}

bool OxrEventSource::is_policy_set(Policy policy) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return (policies_ & policy_bit(policy)) != 0;
}

void OxrEventSource::enable_gesture(GestureType gesture, bool enable)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (enable)
    {
        gestures_.insert(gesture);
    }
    else
    {
        gestures_.erase(gesture);
    }
}

bool OxrEventSource::is_gesture_enabled(GestureType gesture) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return gestures_.count(gesture) != 0;
}

} // namespace trackio
