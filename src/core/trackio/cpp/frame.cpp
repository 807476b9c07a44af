// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/frame.hpp"

#include <utility>

namespace trackio
{

Frame::Frame(int64_t id, Timestamp timestamp, float frames_per_second, std::vector<Hand> hands)
    : id_(id), timestamp_(timestamp), frames_per_second_(frames_per_second), valid_(true), hands_(std::move(hands))
{
}

Frame Frame::invalid()
{
    return Frame();
}

const Hand* Frame::hand(HandSide side) const
{
    for (const auto& h : hands_)
    {
        if (h.side == side)
        {
            return &h;
        }
    }
    return nullptr;
}

const Frame& FrameHistory::push(Timestamp timestamp, std::vector<Hand> hands)
{
    float fps = 0.0f;
    if (!frames_.empty())
    {
        const int64_t delta = timestamp.as_raw() - frames_.front().timestamp().as_raw();
        if (delta > 0)
        {
            fps = 1'000'000.0f / static_cast<float>(delta);
        }
    }

    frames_.emplace_front(next_id_++, timestamp, fps, std::move(hands));
    while (frames_.size() > static_cast<size_t>(kMaxFrameHistory) + 1)
    {
        frames_.pop_back();
    }
    return frames_.front();
}

Frame FrameHistory::at(int history) const
{
    if (history < 0 || static_cast<size_t>(history) >= frames_.size())
    {
        return Frame::invalid();
    }
    return frames_[static_cast<size_t>(history)];
}

} // namespace trackio
