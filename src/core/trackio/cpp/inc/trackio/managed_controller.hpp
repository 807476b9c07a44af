// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "controller.hpp"

#include <chrono>
#include <cstdint>
#include <memory>

namespace trackio
{

struct SharedWaitState;

/**
 * @brief A Controller with blocking waits for service events.
 *
 * Registers an internal Listener at construction; the waits below work from any
 * thread without the caller implementing a Listener.
 *
 * Waits on properties (connected, focus, ...) return as soon as the property
 * has the requested value, including immediately if it already has it. Waits on
 * events (frame, images, device change) return once at least one such event has
 * been delivered after the wait started; several events delivered before the
 * waiter wakes up release it only once.
 *
 * Each wait has a bounded overload that gives up after @p timeout and returns
 * false. The unbounded waits cannot be cancelled.
 *
 * Destroying the ManagedController while another thread is blocked in a wait is
 * not allowed.
 */
class ManagedController : public Controller
{
public:
    /**
     * @throws std::invalid_argument if @p source is null.
     * @throws std::runtime_error if the source rejects the internal listener.
     */
    explicit ManagedController(std::unique_ptr<IEventSource> source);

    ~ManagedController() override;

    // Blocks until is_service_connected() is true
    void wait_until_service_connected();
    bool wait_until_service_connected(std::chrono::milliseconds timeout);

    // Blocks until is_service_connected() is false
    void wait_until_service_disconnected();
    bool wait_until_service_disconnected(std::chrono::milliseconds timeout);

    // Blocks until is_connected() is true
    void wait_until_device_connected();
    bool wait_until_device_connected(std::chrono::milliseconds timeout);

    // Blocks until is_connected() is false
    void wait_until_device_disconnected();
    bool wait_until_device_disconnected(std::chrono::milliseconds timeout);

    // Blocks until has_focus() is true
    void wait_until_focus_gained();
    bool wait_until_focus_gained(std::chrono::milliseconds timeout);

    // Blocks until has_focus() is false
    void wait_until_focus_lost();
    bool wait_until_focus_lost(std::chrono::milliseconds timeout);

    /**
     * @brief Blocks until the device configuration changes.
     *
     * Configuration changes include a device being plugged in or removed, a
     * tracking mode being toggled, or the image capture rate changing.
     */
    void wait_until_device_change();
    bool wait_until_device_change(std::chrono::milliseconds timeout);

    // Blocks until new tracking data is available
    void wait_until_frame();
    bool wait_until_frame(std::chrono::milliseconds timeout);

    // Blocks until a new set of camera images is available
    void wait_until_images();
    bool wait_until_images(std::chrono::milliseconds timeout);

    // Number of events of each class delivered so far
    uint64_t frame_count() const;
    uint64_t images_count() const;
    uint64_t device_change_count() const;

private:
    // Shared with the internal listener, which may outlive this object's members
    // until the base Controller has delivered on_exit
    std::shared_ptr<SharedWaitState> shared_;
};

} // namespace trackio
