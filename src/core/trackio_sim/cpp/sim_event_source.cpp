// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio_sim/sim_event_source.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace trackio
{

SimEventSource::SimEventSource(const SimConfig& config)
    : config_(config), start_time_(std::chrono::steady_clock::now())
{
    worker_ = std::thread(&SimEventSource::dispatch_loop, this);
}

SimEventSource::~SimEventSource()
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        running_ = false;
    }
    queue_cv_.notify_all();

    if (worker_.joinable())
    {
        worker_.join();
    }
}

// ============================================================================
// Scripting
// ============================================================================

void SimEventSource::emit(EventKind kind)
{
    if (kind == EventKind::Init || kind == EventKind::Exit)
    {
        throw std::invalid_argument("SimEventSource: " + std::string(to_string(kind)) +
                                    " is delivered by listener registration, not emitted");
    }
    push(PendingEvent{ kind, {} });
}

void SimEventSource::emit_frame(std::vector<Hand> hands)
{
    push(PendingEvent{ EventKind::Frame, std::move(hands) });
}

void SimEventSource::push(PendingEvent event)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

void SimEventSource::flush()
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return (queue_.empty() && !delivering_) || !running_; });
}

void SimEventSource::set_accept_listeners(bool accept)
{
    accept_listeners_ = accept;
}

size_t SimEventSource::listener_count() const
{
    return listeners_.size();
}

// ============================================================================
// Dispatch thread
// ============================================================================

void SimEventSource::dispatch_loop()
{
    while (true)
    {
        PendingEvent event;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return !queue_.empty() || !running_; });
            if (!running_)
            {
                break;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
            delivering_ = true;
        }

        apply(event);
        listeners_.broadcast(event.kind, *this);

        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            delivering_ = false;
        }
        idle_cv_.notify_all();
    }

    idle_cv_.notify_all();
}

void SimEventSource::apply(const PendingEvent& event)
{
    const Timestamp timestamp = now();
    ImageList images;
    if (event.kind == EventKind::Images)
    {
        images = make_images(timestamp);
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    switch (event.kind)
    {
    case EventKind::Connect:
        connected_ = true;
        break;
    case EventKind::Disconnect:
        connected_ = false;
        break;
    case EventKind::ServiceConnect:
        service_connected_ = true;
        break;
    case EventKind::ServiceDisconnect:
        service_connected_ = false;
        break;
    case EventKind::FocusGained:
        focus_ = true;
        break;
    case EventKind::FocusLost:
        focus_ = false;
        break;
    case EventKind::Frame:
        frames_.push(timestamp, event.hands);
        break;
    case EventKind::Images:
        images_ = std::move(images);
        break;
    case EventKind::DeviceChange:
    case EventKind::Init:
    case EventKind::Exit:
        break;
    }
}

ImageList SimEventSource::make_images(Timestamp timestamp)
{
    const size_t width = config_.image_width;
    const size_t height = config_.image_height;

    // Horizontal gradient, identical for both cameras
    auto pixels = std::make_shared<std::vector<uint8_t>>(width * height);
    for (size_t y = 0; y < height; ++y)
    {
        for (size_t x = 0; x < width; ++x)
        {
            (*pixels)[y * width + x] = static_cast<uint8_t>((x * 255) / std::max<size_t>(width - 1, 1));
        }
    }

    // Undistorted mapping: each entry points at its own normalized position
    auto distortion = std::make_shared<std::vector<float>>(Image::kDistortionStride * Image::kDistortionHeight);
    for (size_t y = 0; y < Image::kDistortionHeight; ++y)
    {
        for (size_t x = 0; x < Image::kDistortionWidth; ++x)
        {
            (*distortion)[y * Image::kDistortionStride + x * 2] =
                static_cast<float>(x) / static_cast<float>(Image::kDistortionWidth - 1);
            (*distortion)[y * Image::kDistortionStride + x * 2 + 1] =
                static_cast<float>(y) / static_cast<float>(Image::kDistortionHeight - 1);
        }
    }

    const int64_t sequence = next_image_sequence_++;
    std::vector<Image> list;
    list.emplace_back(sequence, Camera::Left, timestamp, width, height, 1, pixels, distortion);
    list.emplace_back(sequence, Camera::Right, timestamp, width, height, 1, pixels, distortion);
    return ImageList(std::move(list));
}

// ============================================================================
// Listener registration
// ============================================================================

bool SimEventSource::add_listener(const ListenerCallbacks& callbacks)
{
    check_not_dispatching("add_listener");
    if (!accept_listeners_)
    {
        return false;
    }

    listeners_.add(callbacks, *this);
    return true;
}

bool SimEventSource::remove_listener(const ListenerCallbacks& callbacks)
{
    check_not_dispatching("remove_listener");
    return listeners_.remove(callbacks, *this);
}

size_t SimEventSource::remove_all()
{
    check_not_dispatching("remove_all");
    return listeners_.remove_all(*this);
}

void SimEventSource::check_not_dispatching(const char* operation) const
{
    if (std::this_thread::get_id() == worker_.get_id())
    {
        throw std::logic_error(std::string("SimEventSource: ") + operation + "() called from inside a listener hook");
    }
}

// ============================================================================
// Session queries
// ============================================================================

bool SimEventSource::is_service_connected() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return service_connected_;
}

bool SimEventSource::is_connected() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return connected_;
}

bool SimEventSource::has_focus() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return focus_;
}

Timestamp SimEventSource::now() const
{
    const auto elapsed = std::chrono::steady_clock::now() - start_time_;
    return Timestamp::from_raw(std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count());
}

Frame SimEventSource::frame(int history) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return frames_.at(history);
}

ImageList SimEventSource::images() const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return images_;
}

void SimEventSource::set_policy(Policy policy)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    policies_ |= policy_bit(policy);
}

void SimEventSource::clear_policy(Policy policy)
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    policies_ &= ~policy_bit(policy);
}

bool SimEventSource::is_policy_set(Policy policy) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return (policies_ & policy_bit(policy)) != 0;
}

void SimEventSource::enable_gesture(GestureType gesture, bool enable)
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

bool SimEventSource::is_gesture_enabled(GestureType gesture) const
{
    std::lock_guard<std::mutex> lock(state_mutex_);
    return gestures_.count(gesture) != 0;
}

} // namespace trackio
