// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string_view>

namespace trackio
{

// Kinds of occurrences the device service reports to listeners.
// Events carry no payload; handlers query the session for current state.
enum class EventKind
{
    Init,
    Connect,
    Disconnect,
    Exit,
    Frame,
    FocusGained,
    FocusLost,
    ServiceConnect,
    ServiceDisconnect,
    DeviceChange,
    Images,
};

inline std::string_view to_string(EventKind kind)
{
    switch (kind)
    {
    case EventKind::Init:
        return "Init";
    case EventKind::Connect:
        return "Connect";
    case EventKind::Disconnect:
        return "Disconnect";
    case EventKind::Exit:
        return "Exit";
    case EventKind::Frame:
        return "Frame";
    case EventKind::FocusGained:
        return "FocusGained";
    case EventKind::FocusLost:
        return "FocusLost";
    case EventKind::ServiceConnect:
        return "ServiceConnect";
    case EventKind::ServiceDisconnect:
        return "ServiceDisconnect";
    case EventKind::DeviceChange:
        return "DeviceChange";
    case EventKind::Images:
        return "Images";
    }
    return "Unknown";
}

} // namespace trackio
