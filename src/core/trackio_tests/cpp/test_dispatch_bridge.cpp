// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

// Unit tests for ListenerRegistration: translation of service callbacks into listener hooks

#include "child_process.hpp"
#include "recording_listener.hpp"

#include <catch2/catch_test_macros.hpp>
#include <trackio/dispatch_bridge.hpp>
#include <trackio_sim/sim_event_source.hpp>

#include <csignal>
#include <memory>
#include <stdexcept>

using namespace trackio;
using trackio_test::RecordingListener;
using trackio_test::run_in_child;

namespace
{

class ThrowingListener : public Listener
{
public:
    void on_frame(const ControllerRef&) override
    {
        throw std::runtime_error("frame handler failed");
    }
};

} // anonymous namespace

TEST_CASE("ListenerRegistration token resolves to its own listener", "[dispatch_bridge]")
{
    SimEventSource session;
    auto first = std::make_shared<RecordingListener>();
    auto second = std::make_shared<RecordingListener>();

    ListenerRegistration first_registration(first);
    ListenerRegistration second_registration(second);

    CHECK(first_registration.callbacks().token == &first_registration);
    CHECK(second_registration.callbacks().token == &second_registration);
    CHECK(first_registration.listener() == first);

    const auto& callbacks = second_registration.callbacks();
    callbacks.on_frame(callbacks.token, &session);

    CHECK(first->kinds().empty());
    REQUIRE(second->kinds() == std::vector<EventKind>{ EventKind::Frame });
}

TEST_CASE("ListenerRegistration maps every callback to the matching hook", "[dispatch_bridge]")
{
    SimEventSource session;
    auto listener = std::make_shared<RecordingListener>();
    ListenerRegistration registration(listener);

    const std::vector<EventKind> all = { EventKind::Init,           EventKind::Connect,
                                         EventKind::Disconnect,     EventKind::Exit,
                                         EventKind::Frame,          EventKind::FocusGained,
                                         EventKind::FocusLost,      EventKind::ServiceConnect,
                                         EventKind::ServiceDisconnect, EventKind::DeviceChange,
                                         EventKind::Images };

    for (EventKind kind : all)
    {
        deliver(registration.callbacks(), kind, session);
    }

    CHECK(listener->kinds() == all);
}

TEST_CASE("Hooks observe the session they are delivered for", "[dispatch_bridge]")
{
    SimEventSource session;
    session.emit(EventKind::Connect);
    session.flush();

    auto listener = std::make_shared<RecordingListener>();
    ListenerRegistration registration(listener);
    deliver(registration.callbacks(), EventKind::Connect, session);

    const auto observations = listener->observations();
    REQUIRE(observations.size() == 1);
    CHECK(observations[0].connected);
    CHECK_FALSE(observations[0].service_connected);
}

TEST_CASE("Hooks that do not throw leave the process running", "[dispatch_bridge]")
{
    const int status = run_in_child([] {
        SimEventSource session;
        ListenerRegistration registration(std::make_shared<ThrowingListener>());
        deliver(registration.callbacks(), EventKind::Connect, session);
    });

    REQUIRE(WIFEXITED(status));
    CHECK(WEXITSTATUS(status) == 0);
}

TEST_CASE("A throwing hook terminates the process", "[dispatch_bridge]")
{
    const int status = run_in_child([] {
        SimEventSource session;
        ListenerRegistration registration(std::make_shared<ThrowingListener>());
        deliver(registration.callbacks(), EventKind::Frame, session);
    });

    REQUIRE(WIFSIGNALED(status));
    CHECK(WTERMSIG(status) == SIGABRT);
}
