// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <trackio/managed_controller.hpp>
#include <trackio_config/oxr_source_config.hpp>
#include <trackio_oxr/oxr_event_source.hpp>
#include <trackio_sim/sim_event_source.hpp>

#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace trackio;
using namespace std::chrono_literals;

// =============================================================================
// Signal handling
// =============================================================================

static std::atomic<bool> g_stop_requested{ false };

void signal_handler(int signal)
{
    if (signal == SIGINT || signal == SIGTERM)
    {
        g_stop_requested.store(true, std::memory_order_relaxed);
    }
}

// =============================================================================
// Listener
// =============================================================================

// Prints lifecycle events and a summary of every 100th frame
class PrintingListener : public Listener
{
public:
    void on_init(const ControllerRef&) override
    {
        std::cout << "Initialized" << std::endl;
    }

    void on_service_connect(const ControllerRef&) override
    {
        std::cout << "Service connected" << std::endl;
    }

    void on_service_disconnect(const ControllerRef&) override
    {
        std::cout << "Service disconnected" << std::endl;
    }

    void on_connect(const ControllerRef&) override
    {
        std::cout << "Device connected" << std::endl;
    }

    void on_disconnect(const ControllerRef&) override
    {
        std::cout << "Device disconnected" << std::endl;
    }

    void on_focus_gained(const ControllerRef&) override
    {
        std::cout << "Focus gained" << std::endl;
    }

    void on_focus_lost(const ControllerRef&) override
    {
        std::cout << "Focus lost" << std::endl;
    }

    void on_device_change(const ControllerRef&) override
    {
        std::cout << "Device configuration changed" << std::endl;
    }

    void on_exit(const ControllerRef&) override
    {
        std::cout << "Exited" << std::endl;
    }

    void on_frame(const ControllerRef& controller) override
    {
        const Frame frame = controller.frame();
        if (!frame.is_valid() || frame.id() % 100 != 0)
        {
            return;
        }

        std::cout << "Frame id: " << frame.id() << ", timestamp: " << frame.timestamp()
                  << ", fps: " << frame.frames_per_second() << ", hands: " << frame.hands().size() << std::endl;
        for (const Hand& hand : frame.hands())
        {
            const JointPose& palm = hand.joints[0];
            std::cout << "  " << (hand.side == HandSide::Left ? "Left" : "Right")
                      << (hand.is_active ? " (active)" : " (inactive)") << " palm: [" << palm.position[0] << ", "
                      << palm.position[1] << ", " << palm.position[2] << "]" << std::endl;
        }
    }

    void on_images(const ControllerRef& controller) override
    {
        const ImageList images = controller.images();
        if (!images.empty() && images[0].sequence_id() % 100 == 0)
        {
            std::cout << "Images: " << images.size() << " x " << images[0].width() << "x" << images[0].height()
                      << std::endl;
        }
    }
};

// =============================================================================
// Simulated device
// =============================================================================

// Plays a connected device with a hand moving in a circle until stopped
static void drive_simulation(SimEventSource& sim, bool images, const std::atomic<bool>& stop)
{
    sim.emit(EventKind::ServiceConnect);
    sim.emit(EventKind::Connect);
    sim.emit(EventKind::FocusGained);

    float angle = 0.0f;
    while (!stop.load(std::memory_order_relaxed))
    {
        Hand hand;
        hand.side = HandSide::Right;
        hand.is_active = true;
        for (auto& joint : hand.joints)
        {
            joint.position[0] = 0.1f * std::cos(angle);
            joint.position[1] = 1.2f;
            joint.position[2] = 0.1f * std::sin(angle) - 0.4f;
            joint.is_valid = true;
        }
        angle += 0.05f;

        sim.emit_frame({ hand });
        if (images)
        {
            sim.emit(EventKind::Images);
        }
        std::this_thread::sleep_for(11ms);
    }
}

// =============================================================================
// Usage
// =============================================================================

void print_usage(const char* program_name)
{
    std::cout << "Usage: " << program_name << " [options]\n"
              << "\nOptions:\n"
              << "  --sim               Use the simulated device service instead of OpenXR\n"
              << "  --config=PATH       OpenXR source configuration (YAML); defaults to $TRACKIO_CONFIG\n"
              << "  --policy=NAME       Set a policy (BackgroundFrames, Images, OptimizeHmd); repeatable\n"
              << "  --frames=N          Exit after N frames (default: run until Ctrl+C)\n"
              << "  --help              Show this help message\n";
}

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv)
try
{
    bool simulated = false;
    std::string config_path;
    std::vector<Policy> policies;
    uint64_t max_frames = 0;

    if (const char* env = std::getenv("TRACKIO_CONFIG"))
    {
        config_path = env;
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return 0;
        }
        else if (arg == "--sim")
        {
            simulated = true;
        }
        else if (arg.find("--config=") == 0)
        {
            config_path = arg.substr(9);
        }
        else if (arg.find("--policy=") == 0)
        {
            policies.push_back(policy_from_string(arg.substr(9)));
        }
        else if (arg.find("--frames=") == 0)
        {
            max_frames = std::stoull(arg.substr(9));
        }
        else
        {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::unique_ptr<IEventSource> source;
    SimEventSource* sim = nullptr;
    if (simulated)
    {
        auto sim_source = std::make_unique<SimEventSource>();
        sim = sim_source.get();
        source = std::move(sim_source);
    }
    else
    {
        OxrSourceConfig config;
        if (!config_path.empty())
        {
            std::cout << "Loading configuration from " << config_path << std::endl;
            config = load_oxr_source_config(config_path);
        }
        source = std::make_unique<OxrEventSource>(config);
    }

    ManagedController controller(std::move(source));

    std::atomic<bool> stop_simulation{ false };
    std::thread simulation;
    if (sim)
    {
        bool images = false;
        for (Policy policy : policies)
        {
            images = images || policy == Policy::Images;
        }
        simulation = std::thread(drive_simulation, std::ref(*sim), images, std::cref(stop_simulation));
    }

    std::cout << "Waiting for device. Press Ctrl+C to stop." << std::endl;
    while (!g_stop_requested.load(std::memory_order_relaxed) && !controller.wait_until_device_connected(100ms))
    {
    }

    for (Policy policy : policies)
    {
        controller.set_policy(policy);
        std::cout << "Policy " << to_string(policy) << (controller.is_policy_set(policy) ? " set" : " not supported")
                  << std::endl;
    }

    auto listener = std::make_shared<PrintingListener>();
    const bool registered = controller.add_listener(listener);
    if (!registered)
    {
        std::cerr << "Listener registration was rejected" << std::endl;
    }

    const uint64_t first_frame = controller.frame_count();
    while (registered && !g_stop_requested.load(std::memory_order_relaxed))
    {
        controller.wait_until_frame(100ms);
        if (max_frames > 0 && controller.frame_count() - first_frame >= max_frames)
        {
            break;
        }
    }

    std::cout << "Received " << controller.frame_count() - first_frame << " frames" << std::endl;

    stop_simulation = true;
    if (simulation.joinable())
    {
        simulation.join();
    }

    return registered ? 0 : 1;
}
catch (const std::exception& e)
{
    std::cerr << argv[0] << ": " << e.what() << std::endl;
    return 1;
}
