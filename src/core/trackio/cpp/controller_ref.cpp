// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/controller_ref.hpp"

#include "inc/trackio/event_source.hpp"

namespace trackio
{

bool ControllerRef::is_service_connected() const
{
    return source_->is_service_connected();
}

bool ControllerRef::is_connected() const
{
    return source_->is_connected();
}

bool ControllerRef::has_focus() const
{
    return source_->has_focus();
}

Timestamp ControllerRef::now() const
{
    return source_->now();
}

Frame ControllerRef::frame() const
{
    return frame(0);
}

Frame ControllerRef::frame(int history) const
{
    // The service only keeps kMaxFrameHistory frames of history
    if (history < 0 || history > kMaxFrameHistory)
    {
        return Frame::invalid();
    }
    return source_->frame(history);
}

ImageList ControllerRef::images() const
{
    return source_->images();
}

void ControllerRef::set_policy(Policy policy) const
{
    source_->set_policy(policy);
}

void ControllerRef::clear_policy(Policy policy) const
{
    source_->clear_policy(policy);
}

bool ControllerRef::is_policy_set(Policy policy) const
{
    return source_->is_policy_set(policy);
}

void ControllerRef::enable_gesture(GestureType gesture) const
{
    source_->enable_gesture(gesture, true);
}

void ControllerRef::disable_gesture(GestureType gesture) const
{
    source_->enable_gesture(gesture, false);
}

bool ControllerRef::is_gesture_enabled(GestureType gesture) const
{
    return source_->is_gesture_enabled(gesture);
}

} // namespace trackio
