// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <trackio/event_source.hpp>
#include <trackio/listener_set.hpp>
#include <trackio_config/oxr_source_config.hpp>

#include <openxr/openxr.h>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

namespace trackio
{

class OxrSession;
class OxrHandTracker;

/**
 * @brief Device service backed by an OpenXR runtime with XR_EXT_hand_tracking.
 *
 * Construction never blocks on the runtime: a worker thread keeps trying to
 * reach it every retry_interval_ms and reports ServiceConnect once the session
 * exists and Connect once the hand trackers are created. While connected it
 * polls runtime events and locates the hand joints every poll_interval_ms,
 * delivering a Frame for each sample taken while focused (or always, with the
 * BackgroundFrames policy). Losing the session reports Disconnect and
 * ServiceDisconnect, then the worker starts over.
 *
 * The runtime exposes no camera images: the Images policy is never set and no
 * Images event is ever delivered. Gesture flags are stored only.
 */
class OxrEventSource : public IEventSource
{
public:
    explicit OxrEventSource(const OxrSourceConfig& config = OxrSourceConfig());
    ~OxrEventSource() override;

    OxrEventSource(const OxrEventSource&) = delete;
    OxrEventSource& operator=(const OxrEventSource&) = delete;

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
    void run();
    bool connect_service();
    bool connect_device();
    void process_runtime_events();
    void sample_frame();
    void teardown();
    void check_not_dispatching(const char* operation) const;

    // Updates one flag under the state lock, then broadcasts @p kind if it changed
    void transition(bool& flag, bool value, EventKind kind);

    // Sleeps for @p interval unless stop is requested; returns false on stop
    bool wait_interval(std::chrono::milliseconds interval);

    OxrSourceConfig config_;
    std::chrono::steady_clock::time_point start_time_;

    // Owned by the worker thread
    std::unique_ptr<OxrSession> session_;
    std::unique_ptr<OxrHandTracker> hand_tracker_;
    XrSessionState session_state_ = XR_SESSION_STATE_UNKNOWN;

    mutable std::mutex state_mutex_;
    bool service_connected_ = false;
    bool connected_ = false;
    bool focus_ = false;
    uint32_t policies_ = 0;
    std::set<GestureType> gestures_;
    FrameHistory frames_;

    ListenerSet listeners_;

    std::mutex stop_mutex_;
    std::condition_variable stop_cv_;
    bool stop_requested_ = false;

    std::thread worker_;
};

} // namespace trackio
