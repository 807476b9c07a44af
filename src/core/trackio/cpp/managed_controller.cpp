// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/managed_controller.hpp"

#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace trackio
{

// A boolean property whose current value lives in the session. The mutex orders
// a waiter's check of the property against the listener's notification.
struct LevelSignal
{
    std::mutex mutex;
    std::condition_variable became_true;
    std::condition_variable became_false;
};

// Occurrences of an event class
struct EdgeCounter
{
    std::mutex mutex;
    uint64_t count = 0;
    std::condition_variable advanced;
};

// One lock per condition family, so waiters on unrelated conditions never wake
// each other
struct SharedWaitState
{
    LevelSignal service;
    LevelSignal device;
    LevelSignal focus;

    EdgeCounter frame;
    EdgeCounter images;
    EdgeCounter device_change;
};

namespace
{

void notify(LevelSignal& signal, std::condition_variable& condition)
{
    std::lock_guard<std::mutex> lock(signal.mutex);
    condition.notify_all();
}

void advance(EdgeCounter& counter)
{
    std::lock_guard<std::mutex> lock(counter.mutex);
    ++counter.count;
    counter.advanced.notify_all();
}

uint64_t read(EdgeCounter& counter)
{
    std::lock_guard<std::mutex> lock(counter.mutex);
    return counter.count;
}

template <typename Predicate>
void wait_for_level(LevelSignal& signal, std::condition_variable& condition, Predicate predicate)
{
    std::unique_lock<std::mutex> lock(signal.mutex);
    condition.wait(lock, predicate);
}

template <typename Predicate>
bool wait_for_level(LevelSignal& signal,
                    std::condition_variable& condition,
                    Predicate predicate,
                    std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(signal.mutex);
    return condition.wait_for(lock, timeout, predicate);
}

void wait_for_advance(EdgeCounter& counter)
{
    std::unique_lock<std::mutex> lock(counter.mutex);
    const uint64_t old = counter.count;
    counter.advanced.wait(lock, [&] { return counter.count != old; });
}

bool wait_for_advance(EdgeCounter& counter, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(counter.mutex);
    const uint64_t old = counter.count;
    return counter.advanced.wait_for(lock, timeout, [&] { return counter.count != old; });
}

// Feeds service events into the shared wait state. Property hooks only signal:
// the session has already updated the property when the hook runs.
class ManagedListener : public Listener
{
public:
    explicit ManagedListener(std::shared_ptr<SharedWaitState> shared) : shared_(std::move(shared))
    {
    }

    void on_connect(const ControllerRef&) override
    {
        notify(shared_->device, shared_->device.became_true);
    }

    void on_disconnect(const ControllerRef&) override
    {
        notify(shared_->device, shared_->device.became_false);
    }

    void on_service_connect(const ControllerRef&) override
    {
        notify(shared_->service, shared_->service.became_true);
    }

    void on_service_disconnect(const ControllerRef&) override
    {
        notify(shared_->service, shared_->service.became_false);
    }

    void on_focus_gained(const ControllerRef&) override
    {
        notify(shared_->focus, shared_->focus.became_true);
    }

    void on_focus_lost(const ControllerRef&) override
    {
        notify(shared_->focus, shared_->focus.became_false);
    }

    void on_frame(const ControllerRef&) override
    {
        advance(shared_->frame);
    }

    void on_images(const ControllerRef&) override
    {
        advance(shared_->images);
    }

    void on_device_change(const ControllerRef&) override
    {
        advance(shared_->device_change);
    }

private:
    std::shared_ptr<SharedWaitState> shared_;
};

} // namespace

ManagedController::ManagedController(std::unique_ptr<IEventSource> source)
    : Controller(std::move(source)), shared_(std::make_shared<SharedWaitState>())
{
    if (!add_listener(std::make_shared<ManagedListener>(shared_)))
    {
        throw std::runtime_error("ManagedController: event source rejected the internal listener");
    }
}

ManagedController::~ManagedController() = default;

void ManagedController::wait_until_service_connected()
{
    wait_for_level(shared_->service, shared_->service.became_true, [this] { return is_service_connected(); });
}

bool ManagedController::wait_until_service_connected(std::chrono::milliseconds timeout)
{
    return wait_for_level(
        shared_->service, shared_->service.became_true, [this] { return is_service_connected(); }, timeout);
}

void ManagedController::wait_until_service_disconnected()
{
    wait_for_level(shared_->service, shared_->service.became_false, [this] { return !is_service_connected(); });
}

bool ManagedController::wait_until_service_disconnected(std::chrono::milliseconds timeout)
{
    return wait_for_level(
        shared_->service, shared_->service.became_false, [this] { return !is_service_connected(); }, timeout);
}

void ManagedController::wait_until_device_connected()
{
    wait_for_level(shared_->device, shared_->device.became_true, [this] { return is_connected(); });
}

bool ManagedController::wait_until_device_connected(std::chrono::milliseconds timeout)
{
    return wait_for_level(shared_->device, shared_->device.became_true, [this] { return is_connected(); }, timeout);
}

void ManagedController::wait_until_device_disconnected()
{
    wait_for_level(shared_->device, shared_->device.became_false, [this] { return !is_connected(); });
}

bool ManagedController::wait_until_device_disconnected(std::chrono::milliseconds timeout)
{
    return wait_for_level(shared_->device, shared_->device.became_false, [this] { return !is_connected(); }, timeout);
}

void ManagedController::wait_until_focus_gained()
{
    wait_for_level(shared_->focus, shared_->focus.became_true, [this] { return has_focus(); });
}

bool ManagedController::wait_until_focus_gained(std::chrono::milliseconds timeout)
{
    return wait_for_level(shared_->focus, shared_->focus.became_true, [this] { return has_focus(); }, timeout);
}

void ManagedController::wait_until_focus_lost()
{
    wait_for_level(shared_->focus, shared_->focus.became_false, [this] { return !has_focus(); });
}

bool ManagedController::wait_until_focus_lost(std::chrono::milliseconds timeout)
{
    return wait_for_level(shared_->focus, shared_->focus.became_false, [this] { return !has_focus(); }, timeout);
}

void ManagedController::wait_until_device_change()
{
    wait_for_advance(shared_->device_change);
}

bool ManagedController::wait_until_device_change(std::chrono::milliseconds timeout)
{
    return wait_for_advance(shared_->device_change, timeout);
}

void ManagedController::wait_until_frame()
{
    wait_for_advance(shared_->frame);
}

bool ManagedController::wait_until_frame(std::chrono::milliseconds timeout)
{
    return wait_for_advance(shared_->frame, timeout);
}

void ManagedController::wait_until_images()
{
    wait_for_advance(shared_->images);
}

bool ManagedController::wait_until_images(std::chrono::milliseconds timeout)
{
    return wait_for_advance(shared_->images, timeout);
}

uint64_t ManagedController::frame_count() const
{
    return read(shared_->frame);
}

uint64_t ManagedController::images_count() const
{
    return read(shared_->images);
}

uint64_t ManagedController::device_change_count() const
{
    return read(shared_->device_change);
}

} // namespace trackio
