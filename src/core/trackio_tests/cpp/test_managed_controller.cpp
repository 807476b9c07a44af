// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Unit tests for ManagedController blocking waits

#include <catch2/catch_test_macros.hpp>
#include <trackio/managed_controller.hpp>
#include <trackio_sim/sim_event_source.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace trackio;
using namespace std::chrono_literals;

namespace
{

struct Fixture
{
    Fixture()
    {
        auto source = std::make_unique<SimEventSource>();
        sim = source.get();
        controller = std::make_unique<ManagedController>(std::move(source));
    }

    SimEventSource* sim = nullptr;
    std::unique_ptr<ManagedController> controller;
};

// Long enough to never fire on a healthy run
constexpr auto kGenerous = 5s;

// Short enough to keep the suite fast when a wait is expected to time out
constexpr auto kShort = 50ms;

// Calls @p emit until @p waiter has returned, so the waiter cannot miss the
// event by starting its wait late
template <typename Emit>
bool emit_until_released(std::future<bool>& waiter, Emit emit)
{
    while (waiter.wait_for(10ms) != std::future_status::ready)
    {
        emit();
    }
    return waiter.get();
}

// Starts @p wait on another thread, lets it block, then emits exactly one event
// with @p emit. Returns true if that single delivery released the waiter.
template <typename Wait, typename Emit>
bool released_by_single_delivery(SimEventSource& sim, Wait wait, Emit emit)
{
    auto waiter = std::async(std::launch::async, wait);
    if (waiter.wait_for(100ms) != std::future_status::timeout)
    {
        return false;
    }

    emit();
    sim.flush();
    return waiter.wait_for(kGenerous) == std::future_status::ready && waiter.get();
}

} // anonymous namespace

TEST_CASE("ManagedController fails when the service rejects its listener", "[managed_controller]")
{
    auto source = std::make_unique<SimEventSource>();
    source->set_accept_listeners(false);
    CHECK_THROWS_AS(ManagedController(std::move(source)), std::runtime_error);
}

TEST_CASE("ManagedController registers one internal listener", "[managed_controller]")
{
    Fixture f;
    CHECK(f.controller->listener_count() == 1);
    CHECK(f.sim->listener_count() == 1);
}

// =============================================================================
// Level-triggered waits
// =============================================================================

TEST_CASE("Level waits return once the property holds", "[managed_controller][level]")
{
    Fixture f;

    SECTION("device")
    {
        CHECK_FALSE(f.controller->wait_until_device_connected(kShort));
        f.sim->emit(EventKind::Connect);
        f.controller->wait_until_device_connected();
        CHECK(f.controller->is_connected());

        f.sim->emit(EventKind::Disconnect);
        CHECK(f.controller->wait_until_device_disconnected(kGenerous));
        CHECK_FALSE(f.controller->is_connected());
    }

    SECTION("service")
    {
        f.sim->emit(EventKind::ServiceConnect);
        CHECK(f.controller->wait_until_service_connected(kGenerous));
        f.sim->emit(EventKind::ServiceDisconnect);
        f.controller->wait_until_service_disconnected();
        CHECK_FALSE(f.controller->is_service_connected());
    }

    SECTION("focus")
    {
        f.sim->emit(EventKind::FocusGained);
        f.controller->wait_until_focus_gained();
        CHECK(f.controller->has_focus());
        f.sim->emit(EventKind::FocusLost);
        CHECK(f.controller->wait_until_focus_lost(kGenerous));
    }
}

TEST_CASE("Level waits return immediately when the property already holds", "[managed_controller][level]")
{
    Fixture f;
    f.sim->emit(EventKind::Connect);
    f.sim->flush();

    // No further event will arrive, so only the current value can satisfy these
    CHECK(f.controller->wait_until_device_connected(kShort));
    CHECK(f.controller->wait_until_device_connected(kShort));
    CHECK(f.controller->wait_until_focus_lost(kShort));
    CHECK(f.controller->wait_until_service_disconnected(kShort));
}

TEST_CASE("Level waits never miss a change racing the wait", "[managed_controller][level]")
{
    Fixture f;

    for (int i = 0; i < 200; ++i)
    {
        f.sim->emit(EventKind::Connect);
        REQUIRE(f.controller->wait_until_device_connected(kGenerous));
        f.sim->emit(EventKind::Disconnect);
        REQUIRE(f.controller->wait_until_device_disconnected(kGenerous));
    }
}

TEST_CASE("Level waiters on another thread are woken", "[managed_controller][level]")
{
    Fixture f;

    auto waiter = std::async(std::launch::async, [&] { return f.controller->wait_until_focus_gained(kGenerous); });
    std::this_thread::sleep_for(10ms);
    f.sim->emit(EventKind::FocusGained);

    CHECK(waiter.get());
}

// =============================================================================
// Edge-triggered waits
// =============================================================================

TEST_CASE("Frame waits need a frame delivered after the call", "[managed_controller][edge]")
{
    Fixture f;
    f.sim->emit_frame({});
    f.sim->flush();
    REQUIRE(f.controller->frame_count() == 1);

    // The frame above was delivered before this wait started
    CHECK_FALSE(f.controller->wait_until_frame(kShort));

    auto waiter = std::async(std::launch::async, [&] { return f.controller->wait_until_frame(kGenerous); });
    CHECK(emit_until_released(waiter, [&] { f.sim->emit_frame({}); }));
    CHECK(f.controller->frame_count() >= 2);
}

TEST_CASE("Untimed frame wait returns after the next frame", "[managed_controller][edge]")
{
    Fixture f;

    std::atomic<bool> stop{ false };
    std::thread producer(
        [&]
        {
            while (!stop)
            {
                f.sim->emit_frame({});
                std::this_thread::sleep_for(1ms);
            }
        });

    f.controller->wait_until_frame();
    CHECK(f.controller->frame().is_valid());

    stop = true;
    producer.join();
}

TEST_CASE("Edge counters count every delivered event", "[managed_controller][edge]")
{
    Fixture f;

    for (int i = 0; i < 25; ++i)
    {
        f.sim->emit_frame({});
    }
    f.sim->emit(EventKind::Images);
    f.sim->emit(EventKind::Images);
    f.sim->emit(EventKind::DeviceChange);
    f.sim->flush();

    CHECK(f.controller->frame_count() == 25);
    CHECK(f.controller->images_count() == 2);
    CHECK(f.controller->device_change_count() == 1);
}

TEST_CASE("Concurrent frame waiters are all released", "[managed_controller][edge]")
{
    Fixture f;
    constexpr int kWaiters = 4;

    std::atomic<int> ready{ 0 };
    std::vector<std::future<bool>> waiters;
    for (int i = 0; i < kWaiters; ++i)
    {
        waiters.push_back(std::async(std::launch::async,
                                     [&]
                                     {
                                         ++ready;
                                         return f.controller->wait_until_frame(kGenerous);
                                     }));
    }

    while (ready < kWaiters)
    {
        std::this_thread::yield();
    }

    for (auto& waiter : waiters)
    {
        CHECK(emit_until_released(waiter, [&] { f.sim->emit_frame({}); }));
    }
    CHECK(f.controller->frame_count() >= 1);
}

TEST_CASE("Frame counter is monotonic while observed concurrently", "[managed_controller][edge]")
{
    Fixture f;
    constexpr int kFrames = 500;

    std::atomic<bool> done{ false };
    std::atomic<bool> monotonic{ true };
    std::thread observer(
        [&]
        {
            uint64_t last = 0;
            while (!done)
            {
                const uint64_t current = f.controller->frame_count();
                if (current < last)
                {
                    monotonic = false;
                }
                last = current;
            }
        });

    for (int i = 0; i < kFrames; ++i)
    {
        f.sim->emit_frame({});
    }
    f.sim->flush();
    done = true;
    observer.join();

    CHECK(monotonic);
    CHECK(f.controller->frame_count() == kFrames);
}

TEST_CASE("Images and device change waits", "[managed_controller][edge]")
{
    Fixture f;

    SECTION("images")
    {
        auto waiter = std::async(std::launch::async, [&] { return f.controller->wait_until_images(kGenerous); });
        CHECK(emit_until_released(waiter, [&] { f.sim->emit(EventKind::Images); }));
        CHECK(f.controller->images().size() == 2);
    }

    SECTION("device change")
    {
        CHECK_FALSE(f.controller->wait_until_device_change(kShort));
        auto waiter =
            std::async(std::launch::async, [&] { return f.controller->wait_until_device_change(kGenerous); });
        CHECK(emit_until_released(waiter, [&] { f.sim->emit(EventKind::DeviceChange); }));
    }
}

TEST_CASE("A single delivery releases a blocked edge waiter", "[managed_controller][edge]")
{
    Fixture f;

    SECTION("frame")
    {
        CHECK(released_by_single_delivery(
            *f.sim, [&] { return f.controller->wait_until_frame(kGenerous); }, [&] { f.sim->emit_frame({}); }));
        CHECK(f.controller->frame_count() == 1);
    }

    SECTION("images")
    {
        CHECK(released_by_single_delivery(
            *f.sim, [&] { return f.controller->wait_until_images(kGenerous); },
            [&] { f.sim->emit(EventKind::Images); }));
        CHECK(f.controller->images_count() == 1);
    }

    SECTION("device change")
    {
        CHECK(released_by_single_delivery(
            *f.sim, [&] { return f.controller->wait_until_device_change(kGenerous); },
            [&] { f.sim->emit(EventKind::DeviceChange); }));
        CHECK(f.controller->device_change_count() == 1);
    }
}
