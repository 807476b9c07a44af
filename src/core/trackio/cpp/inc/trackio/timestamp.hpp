// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>

namespace trackio
{

/**
 * @brief A timestamp reported by the device service, in microseconds.
 *
 * The epoch is defined by the service; only differences between two
 * timestamps from the same service are meaningful.
 */
class Timestamp
{
public:
    constexpr Timestamp() = default;

    static constexpr Timestamp from_raw(int64_t raw)
    {
        return Timestamp(raw);
    }

    constexpr int64_t as_raw() const
    {
        return raw_;
    }

    /**
     * @brief Time elapsed between @p earlier and this timestamp.
     * @throws std::invalid_argument if @p earlier is later than this timestamp.
     */
    std::chrono::microseconds duration_since(const Timestamp& earlier) const;

    constexpr bool operator==(const Timestamp& other) const
    {
        return raw_ == other.raw_;
    }
    constexpr bool operator!=(const Timestamp& other) const
    {
        return raw_ != other.raw_;
    }
    constexpr bool operator<(const Timestamp& other) const
    {
        return raw_ < other.raw_;
    }

private:
    explicit constexpr Timestamp(int64_t raw) : raw_(raw)
    {
    }

    int64_t raw_ = 0;
};

std::ostream& operator<<(std::ostream& os, const Timestamp& timestamp);

} // namespace trackio
