// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include "timestamp.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace trackio
{

// Maximum age accepted by ControllerRef::frame(). The service keeps the current
// frame plus 59 older ones.
constexpr int kMaxFrameHistory = 59;

enum class HandSide
{
    Left,
    Right,
};

// Hand joint data structure
struct JointPose
{
    float position[3] = { 0.0f, 0.0f, 0.0f }; // x, y, z in meters
    float orientation[4] = { 0.0f, 0.0f, 0.0f, 1.0f }; // x, y, z, w (quaternion)
    float radius = 0.0f;
    bool is_valid = false;
};

// Tracking data for a single hand
struct Hand
{
    static constexpr size_t NUM_JOINTS = 26; // XR_HAND_JOINT_COUNT_EXT

    HandSide side = HandSide::Left;
    std::array<JointPose, NUM_JOINTS> joints{};
    bool is_active = false;
};

/**
 * @brief A frame of tracking data.
 *
 * Frames are values copied out of the device service when they are requested,
 * so holding on to one never extends the lifetime of the service's own buffers.
 * Check is_valid() before using the contents: requests for history the service
 * does not have (or beyond kMaxFrameHistory) yield an invalid frame.
 */
class Frame
{
public:
    Frame(int64_t id, Timestamp timestamp, float frames_per_second, std::vector<Hand> hands = {});

    // An invalid frame (id -1, no hands)
    static Frame invalid();

    // Unique ID, incremented for every reported frame
    int64_t id() const
    {
        return id_;
    }

    // Time at which this frame was captured
    Timestamp timestamp() const
    {
        return timestamp_;
    }

    // Instantaneous frame rate at which this frame was captured
    float frames_per_second() const
    {
        return frames_per_second_;
    }

    bool is_valid() const
    {
        return valid_;
    }

    const std::vector<Hand>& hands() const
    {
        return hands_;
    }

    // Returns nullptr if the frame holds no data for that hand
    const Hand* hand(HandSide side) const;

private:
    Frame() = default;

    int64_t id_ = -1;
    Timestamp timestamp_;
    float frames_per_second_ = 0.0f;
    bool valid_ = false;
    std::vector<Hand> hands_;
};

/**
 * @brief The most recent frames of an event source.
 *
 * Assigns frame ids and instantaneous frame rates, and keeps the current frame
 * plus kMaxFrameHistory older ones. Not synchronized: sources guard it with
 * their state lock.
 */
class FrameHistory
{
public:
    // Appends a frame captured at @p timestamp and returns it
    const Frame& push(Timestamp timestamp, std::vector<Hand> hands);

    // Frame from @p history frames ago; Frame::invalid() if not available
    Frame at(int history) const;

    size_t size() const
    {
        return frames_.size();
    }

private:
    std::deque<Frame> frames_; // front is the most recent
    int64_t next_id_ = 0;
};

} // namespace trackio
