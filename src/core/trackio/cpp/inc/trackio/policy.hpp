// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

namespace trackio
{

// Device service policies. Values match the service's policy bit flags.
enum class Policy : uint32_t
{
    // Receive frames even when the application does not have focus
    BackgroundFrames = 1u << 0,

    // Receive raw camera images
    Images = 1u << 1,

    // Optimize tracking for a head-mounted device instead of a desktop mount
    OptimizeHmd = 1u << 2,
};

// Gestures the device service can detect and report in frames
enum class GestureType : int32_t
{
    Swipe = 1,
    Circle = 4,
    ScreenTap = 5,
    KeyTap = 6,
};

// Progression of a detected gesture
enum class GestureState : int32_t
{
    Start = 1,
    Update = 2,
    Stop = 3,
};

inline constexpr uint32_t policy_bit(Policy policy)
{
    return static_cast<uint32_t>(policy);
}

inline std::string_view to_string(Policy policy)
{
    switch (policy)
    {
    case Policy::BackgroundFrames:
        return "BackgroundFrames";
    case Policy::Images:
        return "Images";
    case Policy::OptimizeHmd:
        return "OptimizeHmd";
    }
    return "Unknown";
}

inline std::string_view to_string(GestureType gesture)
{
    switch (gesture)
    {
    case GestureType::Swipe:
        return "Swipe";
    case GestureType::Circle:
        return "Circle";
    case GestureType::ScreenTap:
        return "ScreenTap";
    case GestureType::KeyTap:
        return "KeyTap";
    }
    return "Unknown";
}

inline std::string_view to_string(GestureState state)
{
    switch (state)
    {
    case GestureState::Start:
        return "Start";
    case GestureState::Update:
        return "Update";
    case GestureState::Stop:
        return "Stop";
    }
    return "Unknown";
}

} // namespace trackio
