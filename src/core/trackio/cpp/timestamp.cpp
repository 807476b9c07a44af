// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include "inc/trackio/timestamp.hpp"

#include <stdexcept>
#include <string>

namespace trackio
{

std::chrono::microseconds Timestamp::duration_since(const Timestamp& earlier) const
{
    if (earlier.raw_ > raw_)
    {
        throw std::invalid_argument("Timestamp::duration_since: " + std::to_string(earlier.raw_) +
                                    "us is later than " + std::to_string(raw_) + "us");
    }
    return std::chrono::microseconds(raw_ - earlier.raw_);
}

std::ostream& operator<<(std::ostream& os, const Timestamp& timestamp)
{
    return os << timestamp.as_raw() << "µs";
}

} // namespace trackio
