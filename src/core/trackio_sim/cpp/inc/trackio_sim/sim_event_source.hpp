// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trackio/event_source.hpp>
#include <trackio/listener_set.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace trackio
{

/**
 * @brief Configuration for the simulated device service
 */
struct SimConfig
{
    size_t image_width = 640;
    size_t image_height = 240;
};

/**
 * @brief Scripted, in-process device service.
 *
 * Events are queued with emit() and delivered in order on a dispatch thread
 * owned by the source. Before an event is delivered, its effect on the
 * session is applied (device/service/focus flags, a new frame in the history,
 * a new pair of camera images), so listeners observe the new state from their
 * hooks, exactly as with a real device.
 *
 * Usage:
 * @code
 *     auto source = std::make_unique<SimEventSource>();
 *     SimEventSource* sim = source.get();
 *     ManagedController controller(std::move(source));
 *     sim->emit(EventKind::Connect);
 *     controller.wait_until_device_connected();
 * @endcode
 */
class SimEventSource : public IEventSource
{
public:
    explicit SimEventSource(const SimConfig& config = SimConfig());

    // Stops the dispatch thread; queued events that were not delivered are dropped
    ~SimEventSource() override;

    SimEventSource(const SimEventSource&) = delete;
    SimEventSource& operator=(const SimEventSource&) = delete;

    /**
     * @brief Queue an event for delivery to every registered listener.
     * @throws std::invalid_argument for EventKind::Init and EventKind::Exit, which
     *         are delivered by add_listener() and remove_listener().
     */
    void emit(EventKind kind);

    // Queue a Frame event whose frame carries @p hands
    void emit_frame(std::vector<Hand> hands);

    // Blocks until every event queued so far has been delivered
    void flush();

    // When false, add_listener() rejects every registration
    void set_accept_listeners(bool accept);

    size_t listener_count() const;

    // IEventSource
    bool add_listener(const ListenerCallbacks& callbacks) override;
    bool remove_listener(const ListenerCallbacks& callbacks) override;
    size_t remove_all() override;

    bool is_service_connected() const override;
    bool is_connected() const override;
    bool has_focus() const override;

    Timestamp now() const override;

    Frame frame(int history) const override;
    ImageList images() const override;

    void set_policy(Policy policy) override;
    void clear_policy(Policy policy) override;
    bool is_policy_set(Policy policy) const override;

    void enable_gesture(GestureType gesture, bool enable) override;
    bool is_gesture_enabled(GestureType gesture) const override;

private:
    struct PendingEvent
    {
        EventKind kind = EventKind::Frame;
        std::vector<Hand> hands;
    };

    void dispatch_loop();
    void apply(const PendingEvent& event);
    void push(PendingEvent event);
    ImageList make_images(Timestamp timestamp);

    // Throws std::logic_error when called on the dispatch thread
    void check_not_dispatching(const char* operation) const;

    SimConfig config_;
    std::chrono::steady_clock::time_point start_time_;

    // Session state
    mutable std::mutex state_mutex_;
    bool service_connected_ = false;
    bool connected_ = false;
    bool focus_ = false;
    uint32_t policies_ = 0;
    std::set<GestureType> gestures_;
    FrameHistory frames_;
    ImageList images_;
    int64_t next_image_sequence_ = 0;

    ListenerSet listeners_;
    std::atomic<bool> accept_listeners_{ true };

    // Event queue
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<PendingEvent> queue_;
    bool delivering_ = false;
    bool running_ = true;

    std::thread worker_;
};

} // namespace trackio
