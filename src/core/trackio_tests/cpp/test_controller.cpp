// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Unit tests for Controller and ControllerRef over the simulated device service

#include "child_process.hpp"
#include "recording_listener.hpp"

#include <catch2/catch_test_macros.hpp>
#include <trackio/controller.hpp>
#include <trackio/dispatch_bridge.hpp>
#include <trackio_sim/sim_event_source.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

using namespace trackio;
using trackio_test::RecordingListener;
using trackio_test::run_in_child;

namespace
{

// Controller together with a handle to script its service
struct Fixture
{
    Fixture()
    {
        auto source = std::make_unique<SimEventSource>();
        sim = source.get();
        controller = std::make_unique<Controller>(std::move(source));
    }

    SimEventSource* sim = nullptr;
    std::unique_ptr<Controller> controller;
};

// Shared between the listeners and the frame producer of the teardown test
struct TeardownState
{
    std::atomic<bool> exit_started{ false };
    std::atomic<bool> stop_producer{ false };
    std::atomic<bool> producer_done{ false };
    std::atomic<int> frames{ 0 };
    std::atomic<int> frames_after_exit{ 0 };
    std::atomic<int> exits{ 0 };
};

// Holds the teardown open in on_exit until the producer has stopped
class SlowExitListener : public Listener
{
public:
    explicit SlowExitListener(TeardownState& state) : state_(state)
    {
    }

    void on_exit(const ControllerRef&) override
    {
        state_.exit_started = true;
        ++state_.exits;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        state_.stop_producer = true;
        while (!state_.producer_done)
        {
            std::this_thread::yield();
        }
    }

private:
    TeardownState& state_;
};

// Counts frames, and separately those delivered after teardown began
class FrameCountingListener : public Listener
{
public:
    explicit FrameCountingListener(TeardownState& state) : state_(state)
    {
    }

    void on_frame(const ControllerRef&) override
    {
        ++state_.frames;
        if (state_.exit_started)
        {
            ++state_.frames_after_exit;
        }
    }

    void on_exit(const ControllerRef&) override
    {
        ++state_.exits;
    }

private:
    TeardownState& state_;
};

// Registers another listener from inside on_connect
class RegisteringListener : public Listener
{
public:
    explicit RegisteringListener(Controller& controller) : controller_(controller)
    {
    }

    void on_connect(const ControllerRef&) override
    {
        controller_.add_listener(std::make_shared<RecordingListener>());
    }

private:
    Controller& controller_;
};

// Reads the controller's listener count from on_init
class InitCountListener : public Listener
{
public:
    explicit InitCountListener(const Controller& controller) : controller_(controller)
    {
    }

    void on_init(const ControllerRef&) override
    {
        count_at_init = controller_.listener_count();
    }

    size_t count_at_init = 0;

private:
    const Controller& controller_;
};

} // anonymous namespace

// =============================================================================
// Construction and registration
// =============================================================================

TEST_CASE("Controller requires an event source", "[controller]")
{
    CHECK_THROWS_AS(Controller(nullptr), std::invalid_argument);
}

TEST_CASE("Controller add_listener", "[controller]")
{
    Fixture f;
    auto listener = std::make_shared<RecordingListener>();

    SECTION("delivers Init before returning")
    {
        CHECK(f.controller->add_listener(listener));
        CHECK(listener->kinds() == std::vector<EventKind>{ EventKind::Init });
        CHECK(f.controller->listener_count() == 1);
        CHECK(f.sim->listener_count() == 1);
    }

    SECTION("returns false when the service rejects the listener")
    {
        f.sim->set_accept_listeners(false);
        CHECK_FALSE(f.controller->add_listener(listener));
        CHECK(listener->kinds().empty());
        CHECK(f.controller->listener_count() == 0);
    }

    SECTION("rejects a null listener")
    {
        CHECK_THROWS_AS(f.controller->add_listener(nullptr), std::invalid_argument);
    }

    SECTION("on_init may query the controller")
    {
        REQUIRE(f.controller->add_listener(listener));
        auto querying = std::make_shared<InitCountListener>(*f.controller);
        CHECK(f.controller->add_listener(querying));
        CHECK(querying->count_at_init == 1);
        CHECK(f.controller->listener_count() == 2);
    }
}

TEST_CASE("Registering a listener from inside a hook terminates the process", "[controller]")
{
    const int status = run_in_child(
        []
        {
            Fixture f;
            f.controller->add_listener(std::make_shared<RegisteringListener>(*f.controller));
            f.sim->emit(EventKind::Connect);
            f.sim->flush();
        });

    // A deadlock would instead end in SIGALRM
    REQUIRE(WIFSIGNALED(status));
    CHECK(WTERMSIG(status) == SIGABRT);
}

TEST_CASE("remove_all detaches every listener at once", "[controller][sim]")
{
    SimEventSource sim;
    auto first = std::make_shared<RecordingListener>();
    auto second = std::make_shared<RecordingListener>();
    ListenerRegistration first_registration(first);
    ListenerRegistration second_registration(second);

    CHECK(sim.remove_all() == 0);

    REQUIRE(sim.add_listener(first_registration.callbacks()));
    REQUIRE(sim.add_listener(second_registration.callbacks()));
    CHECK(sim.remove_all() == 2);
    CHECK(sim.listener_count() == 0);
    CHECK_FALSE(sim.remove_listener(first_registration.callbacks()));

    sim.emit(EventKind::Connect);
    sim.flush();
    CHECK(first->kinds() == std::vector<EventKind>{ EventKind::Init, EventKind::Exit });
    CHECK(second->kinds() == std::vector<EventKind>{ EventKind::Init, EventKind::Exit });
}

TEST_CASE("Controller remove_listener", "[controller]")
{
    Fixture f;
    auto listener = std::make_shared<RecordingListener>();
    REQUIRE(f.controller->add_listener(listener));

    CHECK(f.controller->remove_listener(listener));
    CHECK(listener->count(EventKind::Exit) == 1);
    CHECK(f.controller->listener_count() == 0);

    SECTION("nothing is delivered after removal")
    {
        f.sim->emit(EventKind::Connect);
        f.sim->flush();
        CHECK(listener->kinds() == std::vector<EventKind>{ EventKind::Init, EventKind::Exit });
    }

    SECTION("removing an unknown listener returns false")
    {
        CHECK_FALSE(f.controller->remove_listener(listener));
        CHECK_FALSE(f.controller->remove_listener(std::make_shared<RecordingListener>()));
        CHECK(listener->count(EventKind::Exit) == 1);
    }
}

TEST_CASE("Controller destruction delivers Exit exactly once to every listener", "[controller]")
{
    auto first = std::make_shared<RecordingListener>();
    auto second = std::make_shared<RecordingListener>();
    auto removed = std::make_shared<RecordingListener>();

    {
        Fixture f;
        REQUIRE(f.controller->add_listener(first));
        REQUIRE(f.controller->add_listener(second));
        REQUIRE(f.controller->add_listener(removed));
        REQUIRE(f.controller->remove_listener(removed));

        f.sim->emit(EventKind::Connect);
        f.sim->flush();
    }

    CHECK(first->count(EventKind::Exit) == 1);
    CHECK(second->count(EventKind::Exit) == 1);
    CHECK(removed->count(EventKind::Exit) == 1);
    CHECK(first->kinds().back() == EventKind::Exit);
    CHECK(second->kinds().back() == EventKind::Exit);
}

TEST_CASE("No frame reaches any listener once teardown has started", "[controller]")
{
    TeardownState state;
    Fixture f;
    REQUIRE(f.controller->add_listener(std::make_shared<SlowExitListener>(state)));
    REQUIRE(f.controller->add_listener(std::make_shared<FrameCountingListener>(state)));

    SimEventSource* sim = f.sim;
    std::thread producer(
        [&state, sim]
        {
            while (!state.stop_producer)
            {
                sim->emit_frame({});
                std::this_thread::sleep_for(std::chrono::microseconds(200));
            }
            state.producer_done = true;
        });

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (state.frames < 10 && std::chrono::steady_clock::now() < deadline)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    const bool frames_flowing = state.frames >= 10;

    // The producer keeps emitting until the first on_exit has been running for a while
    f.controller.reset();
    producer.join();

    REQUIRE(frames_flowing);
    CHECK(state.exits == 2);
    CHECK(state.frames_after_exit == 0);
}

TEST_CASE("Controller releases listeners it no longer holds", "[controller]")
{
    auto listener = std::make_shared<RecordingListener>();
    {
        Fixture f;
        REQUIRE(f.controller->add_listener(listener));
        CHECK(listener.use_count() == 2);
    }
    CHECK(listener.use_count() == 1);
}

// =============================================================================
// Event delivery
// =============================================================================

TEST_CASE("Events arrive in order with state already updated", "[controller]")
{
    Fixture f;
    auto listener = std::make_shared<RecordingListener>();
    REQUIRE(f.controller->add_listener(listener));

    f.sim->emit(EventKind::ServiceConnect);
    f.sim->emit(EventKind::Connect);
    f.sim->emit(EventKind::FocusGained);
    f.sim->emit_frame({});
    f.sim->emit_frame({});
    f.sim->emit(EventKind::DeviceChange);
    f.sim->emit(EventKind::Images);
    f.sim->emit(EventKind::FocusLost);
    f.sim->emit(EventKind::Disconnect);
    f.sim->emit(EventKind::ServiceDisconnect);
    f.sim->flush();

    const std::vector<EventKind> expected = {
        EventKind::Init,         EventKind::ServiceConnect, EventKind::Connect,   EventKind::FocusGained,
        EventKind::Frame,        EventKind::Frame,          EventKind::DeviceChange, EventKind::Images,
        EventKind::FocusLost,    EventKind::Disconnect,     EventKind::ServiceDisconnect,
    };
    REQUIRE(listener->kinds() == expected);

    const auto observations = listener->observations();
    CHECK(observations[1].service_connected);
    CHECK(observations[2].connected);
    CHECK(observations[3].focus);
    CHECK_FALSE(observations[8].focus);
    CHECK_FALSE(observations[9].connected);
    CHECK_FALSE(observations[10].service_connected);
}

TEST_CASE("Listener lifecycle from registration to removal", "[controller]")
{
    Fixture f;
    auto listener = std::make_shared<RecordingListener>();
    REQUIRE(f.controller->add_listener(listener));

    f.sim->emit(EventKind::Connect);
    f.sim->emit_frame({});
    f.sim->emit(EventKind::Images);
    f.sim->emit(EventKind::Disconnect);
    f.sim->flush();
    REQUIRE(f.controller->remove_listener(listener));

    CHECK(listener->kinds() == std::vector<EventKind>{ EventKind::Init, EventKind::Connect, EventKind::Frame,
                                                       EventKind::Images, EventKind::Disconnect, EventKind::Exit });
}

TEST_CASE("Every listener receives each event in registration order", "[controller]")
{
    Fixture f;
    std::vector<std::shared_ptr<RecordingListener>> listeners;
    for (int i = 0; i < 3; ++i)
    {
        listeners.push_back(std::make_shared<RecordingListener>());
        REQUIRE(f.controller->add_listener(listeners.back()));
    }

    f.sim->emit(EventKind::Connect);
    f.sim->emit_frame({});
    f.sim->flush();

    for (const auto& listener : listeners)
    {
        CHECK(listener->kinds() == std::vector<EventKind>{ EventKind::Init, EventKind::Connect, EventKind::Frame });
    }
}

TEST_CASE("Init and Exit cannot be emitted", "[controller][sim]")
{
    SimEventSource sim;
    CHECK_THROWS_AS(sim.emit(EventKind::Init), std::invalid_argument);
    CHECK_THROWS_AS(sim.emit(EventKind::Exit), std::invalid_argument);
}

// =============================================================================
// Frames and images
// =============================================================================

TEST_CASE("Frame history", "[controller][frame]")
{
    Fixture f;

    SECTION("no frame yet")
    {
        CHECK_FALSE(f.controller->frame().is_valid());
        CHECK(f.controller->frame().id() == -1);
    }

    SECTION("history bounds")
    {
        for (int i = 0; i < kMaxFrameHistory + 5; ++i)
        {
            f.sim->emit_frame({});
        }
        f.sim->flush();

        const Frame latest = f.controller->frame();
        REQUIRE(latest.is_valid());
        CHECK(latest.id() == kMaxFrameHistory + 4);
        CHECK(f.controller->frame(0).id() == latest.id());

        for (int history = 0; history <= kMaxFrameHistory; ++history)
        {
            const Frame frame = f.controller->frame(history);
            REQUIRE(frame.is_valid());
            CHECK(frame.id() == latest.id() - history);
        }

        CHECK_FALSE(f.controller->frame(kMaxFrameHistory + 1).is_valid());
        CHECK_FALSE(f.controller->frame(-1).is_valid());
    }

    SECTION("older frames are not newer")
    {
        f.sim->emit_frame({});
        f.sim->emit_frame({});
        f.sim->flush();

        CHECK_FALSE(f.controller->frame(0).timestamp() < f.controller->frame(1).timestamp());
        CHECK_FALSE(f.controller->frame(2).is_valid());
    }
}

TEST_CASE("Frames carry the hands they were emitted with", "[controller][frame]")
{
    Fixture f;

    Hand right;
    right.side = HandSide::Right;
    right.is_active = true;
    right.joints[1].position[0] = 0.25f;
    right.joints[1].is_valid = true;

    f.sim->emit_frame({ right });
    f.sim->flush();

    const Frame frame = f.controller->frame();
    REQUIRE(frame.hands().size() == 1);
    CHECK(frame.hand(HandSide::Left) == nullptr);

    const Hand* hand = frame.hand(HandSide::Right);
    REQUIRE(hand != nullptr);
    CHECK(hand->is_active);
    CHECK(hand->joints[1].is_valid);
    CHECK(hand->joints[1].position[0] == 0.25f);
}

TEST_CASE("Images are replaced on each Images event", "[controller][image]")
{
    Fixture f;
    CHECK(f.controller->images().empty());

    f.sim->emit(EventKind::Images);
    f.sim->flush();

    const ImageList first = f.controller->images();
    REQUIRE(first.size() == 2);
    CHECK(first[0].camera() == Camera::Left);
    CHECK(first[1].camera() == Camera::Right);
    CHECK(first[0].width() == 640);
    CHECK(first[0].height() == 240);

    f.sim->emit(EventKind::Images);
    f.sim->flush();
    CHECK(f.controller->images()[0].sequence_id() == first[0].sequence_id() + 1);
}

// =============================================================================
// Configuration
// =============================================================================

TEST_CASE("Policies are set and cleared", "[controller][policy]")
{
    Fixture f;

    CHECK_FALSE(f.controller->is_policy_set(Policy::BackgroundFrames));
    f.controller->set_policy(Policy::BackgroundFrames);
    f.controller->set_policy(Policy::Images);
    CHECK(f.controller->is_policy_set(Policy::BackgroundFrames));
    CHECK(f.controller->is_policy_set(Policy::Images));
    CHECK_FALSE(f.controller->is_policy_set(Policy::OptimizeHmd));

    f.controller->clear_policy(Policy::BackgroundFrames);
    CHECK_FALSE(f.controller->is_policy_set(Policy::BackgroundFrames));
    CHECK(f.controller->is_policy_set(Policy::Images));
}

TEST_CASE("Gestures are enabled and disabled", "[controller][gesture]")
{
    Fixture f;

    f.controller->enable_gesture(GestureType::Swipe);
    CHECK(f.controller->is_gesture_enabled(GestureType::Swipe));
    CHECK_FALSE(f.controller->is_gesture_enabled(GestureType::Circle));

    f.controller->disable_gesture(GestureType::Swipe);
    CHECK_FALSE(f.controller->is_gesture_enabled(GestureType::Swipe));
}

TEST_CASE("now() does not go backwards", "[controller]")
{
    Fixture f;
    const Timestamp first = f.controller->now();
    const Timestamp second = f.controller->now();
    CHECK_FALSE(second < first);
}
