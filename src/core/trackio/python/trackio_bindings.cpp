// SPDX-FileCopyrightText: Copyright (c) 2026 NVIDIA CORPORATION & AFFILIATES. All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <pybind11/chrono.h>
#include <pybind11/numpy.h>
#include <pybind11/operators.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <trackio/controller.hpp>
#include <trackio/managed_controller.hpp>
#include <trackio_config/oxr_source_config.hpp>
#include <trackio_oxr/oxr_event_source.hpp>
#include <trackio_sim/sim_event_source.hpp>

#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace trackio;

namespace
{

// Forwards listener hooks to methods overridden in Python. Hooks run on the
// service's dispatch thread, so each one takes the GIL itself. A Python
// exception escapes as py::error_already_set and terminates the process like
// any other failing hook.
class PyListener : public Listener
{
public:
    using Listener::Listener;

    void on_init(const ControllerRef& controller) override
    {
        call("on_init", controller);
    }
    void on_connect(const ControllerRef& controller) override
    {
        call("on_connect", controller);
    }
    void on_disconnect(const ControllerRef& controller) override
    {
        call("on_disconnect", controller);
    }
    void on_exit(const ControllerRef& controller) override
    {
        call("on_exit", controller);
    }
    void on_frame(const ControllerRef& controller) override
    {
        call("on_frame", controller);
    }
    void on_focus_gained(const ControllerRef& controller) override
    {
        call("on_focus_gained", controller);
    }
    void on_focus_lost(const ControllerRef& controller) override
    {
        call("on_focus_lost", controller);
    }
    void on_service_connect(const ControllerRef& controller) override
    {
        call("on_service_connect", controller);
    }
    void on_service_disconnect(const ControllerRef& controller) override
    {
        call("on_service_disconnect", controller);
    }
    void on_device_change(const ControllerRef& controller) override
    {
        call("on_device_change", controller);
    }
    void on_images(const ControllerRef& controller) override
    {
        call("on_images", controller);
    }

private:
    void call(const char* name, const ControllerRef& controller)
    {
        py::gil_scoped_acquire gil;
        py::function override = py::get_override(static_cast<const Listener*>(this), name);
        if (override)
        {
            // ControllerRef is only valid for the duration of the hook
            override(py::cast(&controller, py::return_value_policy::reference));
        }
    }
};

// Owns a Controller for Python. Keeps the Python side of every registered
// listener alive until the controller has delivered its Exit, and releases the
// GIL around every call that can wait for a hook.
class PyController
{
public:
    PyController(std::unique_ptr<Controller> impl, SimEventSource* simulator)
        : impl_(std::move(impl)), simulator_(simulator)
    {
    }

    virtual ~PyController()
    {
        close();
    }

    bool add_listener(const py::object& listener)
    {
        auto native = listener.cast<std::shared_ptr<Listener>>();
        bool added = false;
        {
            py::gil_scoped_release release;
            added = controller().add_listener(native);
        }
        if (added)
        {
            listeners_.push_back(listener);
        }
        return added;
    }

    bool remove_listener(const py::object& listener)
    {
        auto native = listener.cast<std::shared_ptr<Listener>>();
        bool removed = false;
        {
            py::gil_scoped_release release;
            removed = controller().remove_listener(native);
        }
        for (auto it = listeners_.begin(); it != listeners_.end(); ++it)
        {
            if (it->is(listener))
            {
                listeners_.erase(it);
                break;
            }
        }
        return removed;
    }

    void close()
    {
        if (impl_)
        {
            py::gil_scoped_release release;
            impl_.reset();
            simulator_ = nullptr;
        }
        listeners_.clear();
    }

    Controller& controller() const
    {
        if (!impl_)
        {
            throw std::runtime_error("Controller has been closed");
        }
        return *impl_;
    }

    SimEventSource& simulator() const
    {
        controller();
        if (!simulator_)
        {
            throw std::runtime_error("Controller is not backed by the simulated service");
        }
        return *simulator_;
    }

protected:
    std::unique_ptr<Controller> impl_;
    SimEventSource* simulator_;
    std::vector<py::object> listeners_;
};

class PyManagedController : public PyController
{
public:
    using PyController::PyController;

    ManagedController& managed() const
    {
        return static_cast<ManagedController&>(controller());
    }

    // Binds an untimed and a timed wait under one Python name
    template <typename Class>
    static void bind_wait(Class& cls,
                          const char* name,
                          void (ManagedController::*wait)(),
                          bool (ManagedController::*timed_wait)(std::chrono::milliseconds))
    {
        cls.def(
            name,
            [wait, timed_wait](PyManagedController& self, std::optional<double> timeout_s)
            {
                ManagedController& managed = self.managed();
                py::gil_scoped_release release;
                if (!timeout_s)
                {
                    (managed.*wait)();
                    return true;
                }
                return (managed.*timed_wait)(
                    std::chrono::milliseconds(static_cast<int64_t>(*timeout_s * 1000.0)));
            },
            py::arg("timeout") = py::none(),
            "Block until the condition holds. With a timeout in seconds, returns False if it expired.");
    }
};

template <typename Controller_>
std::unique_ptr<Controller_> make_simulated(int image_width, int image_height, SimEventSource*& simulator)
{
    SimConfig config;
    config.image_width = static_cast<size_t>(image_width);
    config.image_height = static_cast<size_t>(image_height);
    auto source = std::make_unique<SimEventSource>(config);
    simulator = source.get();
    return std::make_unique<Controller_>(std::move(source));
}

template <typename Controller_>
std::unique_ptr<Controller_> make_openxr(const std::string& config_path)
{
    const OxrSourceConfig config = config_path.empty() ? OxrSourceConfig() : load_oxr_source_config(config_path);
    return std::make_unique<Controller_>(std::make_unique<OxrEventSource>(config));
}

py::array_t<float> as_array(const float* values, py::ssize_t count)
{
    return py::array_t<float>({ count }, { static_cast<py::ssize_t>(sizeof(float)) }, values);
}

// Query and configuration methods shared by ControllerRef and the controllers
template <typename Class, typename Get>
void bind_session_queries(Class& cls, Get get)
{
    cls.def_property_readonly("is_service_connected", [get](const typename Class::type& self)
                              { return get(self).is_service_connected(); })
        .def_property_readonly("is_connected", [get](const typename Class::type& self)
                               { return get(self).is_connected(); })
        .def_property_readonly("has_focus", [get](const typename Class::type& self) { return get(self).has_focus(); })
        .def("now", [get](const typename Class::type& self) { return get(self).now(); })
        .def(
            "frame", [get](const typename Class::type& self, int history) { return get(self).frame(history); },
            py::arg("history") = 0, "Frame from @history frames ago (0 is the most recent); invalid if unavailable")
        .def("images", [get](const typename Class::type& self) { return get(self).images(); })
        .def("set_policy", [get](const typename Class::type& self, Policy p) { get(self).set_policy(p); })
        .def("clear_policy", [get](const typename Class::type& self, Policy p) { get(self).clear_policy(p); })
        .def("is_policy_set", [get](const typename Class::type& self, Policy p) { return get(self).is_policy_set(p); })
        .def("enable_gesture", [get](const typename Class::type& self, GestureType g) { get(self).enable_gesture(g); })
        .def("disable_gesture",
             [get](const typename Class::type& self, GestureType g) { get(self).disable_gesture(g); })
        .def("is_gesture_enabled",
             [get](const typename Class::type& self, GestureType g) { return get(self).is_gesture_enabled(g); });
}

} // namespace

PYBIND11_MODULE(_trackio, m)
{
    m.doc() = "TrackIO - hand tracking device service client";

    py::enum_<EventKind>(m, "EventKind")
        .value("Init", EventKind::Init)
        .value("Connect", EventKind::Connect)
        .value("Disconnect", EventKind::Disconnect)
        .value("Exit", EventKind::Exit)
        .value("Frame", EventKind::Frame)
        .value("FocusGained", EventKind::FocusGained)
        .value("FocusLost", EventKind::FocusLost)
        .value("ServiceConnect", EventKind::ServiceConnect)
        .value("ServiceDisconnect", EventKind::ServiceDisconnect)
        .value("DeviceChange", EventKind::DeviceChange)
        .value("Images", EventKind::Images);

    py::enum_<Policy>(m, "Policy")
        .value("BackgroundFrames", Policy::BackgroundFrames)
        .value("Images", Policy::Images)
        .value("OptimizeHmd", Policy::OptimizeHmd);

    py::enum_<GestureType>(m, "GestureType")
        .value("Swipe", GestureType::Swipe)
        .value("Circle", GestureType::Circle)
        .value("ScreenTap", GestureType::ScreenTap)
        .value("KeyTap", GestureType::KeyTap);

    py::enum_<GestureState>(m, "GestureState")
        .value("Start", GestureState::Start)
        .value("Update", GestureState::Update)
        .value("Stop", GestureState::Stop);

    py::enum_<HandSide>(m, "HandSide").value("Left", HandSide::Left).value("Right", HandSide::Right);

    py::enum_<Camera>(m, "Camera").value("Left", Camera::Left).value("Right", Camera::Right);

    py::class_<Timestamp>(m, "Timestamp")
        .def_property_readonly("raw", &Timestamp::as_raw, "Microseconds on the service clock")
        .def("duration_since", &Timestamp::duration_since, py::arg("earlier"))
        .def(py::self == py::self)
        .def(py::self != py::self)
        .def(py::self < py::self)
        .def("__repr__",
             [](const Timestamp& self)
             {
                 std::ostringstream os;
                 os << "Timestamp(" << self << ")";
                 return os.str();
             });

    py::class_<JointPose>(m, "JointPose")
        .def_property_readonly("position", [](const JointPose& self) { return as_array(self.position, 3); })
        .def_property_readonly("orientation", [](const JointPose& self) { return as_array(self.orientation, 4); })
        .def_readonly("radius", &JointPose::radius)
        .def_readonly("is_valid", &JointPose::is_valid);

    py::class_<Hand>(m, "Hand")
        .def(py::init<>())
        .def_readwrite("side", &Hand::side)
        .def_readwrite("is_active", &Hand::is_active)
        .def_property_readonly("joints",
                               [](const Hand& self)
                               { return std::vector<JointPose>(self.joints.begin(), self.joints.end()); });

    py::class_<Frame>(m, "Frame")
        .def_property_readonly("id", &Frame::id)
        .def_property_readonly("timestamp", &Frame::timestamp)
        .def_property_readonly("frames_per_second", &Frame::frames_per_second)
        .def_property_readonly("is_valid", &Frame::is_valid)
        .def_property_readonly("hands", &Frame::hands)
        .def(
            "hand", [](const Frame& self, HandSide side) -> py::object
            {
                const Hand* hand = self.hand(side);
                return hand ? py::cast(*hand) : py::none();
            },
            py::arg("side"));

    py::class_<Image>(m, "Image")
        .def_property_readonly("sequence_id", &Image::sequence_id)
        .def_property_readonly("camera", &Image::camera)
        .def_property_readonly("timestamp", &Image::timestamp)
        .def_property_readonly("width", &Image::width)
        .def_property_readonly("height", &Image::height)
        .def_property_readonly("bytes_per_pixel", &Image::bytes_per_pixel)
        .def_property_readonly(
            "data",
            [](const Image& self)
            {
                const py::ssize_t row = static_cast<py::ssize_t>(self.width() * self.bytes_per_pixel());
                return py::array_t<uint8_t>({ static_cast<py::ssize_t>(self.height()), row }, { row, py::ssize_t(1) },
                                            self.raw_data().data());
            },
            "Pixel rows as a (height, width * bytes_per_pixel) uint8 array")
        .def_property_readonly(
            "distortion",
            [](const Image& self)
            {
                const auto height = static_cast<py::ssize_t>(Image::kDistortionHeight);
                const auto width = static_cast<py::ssize_t>(Image::kDistortionWidth);
                const auto item = static_cast<py::ssize_t>(sizeof(float));
                return py::array_t<float>({ height, width, py::ssize_t(2) },
                                          { static_cast<py::ssize_t>(Image::kDistortionStride) * item, 2 * item, item },
                                          self.raw_distortion().data());
            },
            "Distortion map as a (64, 64, 2) array of (u, v) pairs");

    py::class_<ImageList>(m, "ImageList")
        .def("__len__", &ImageList::size)
        .def("__getitem__", [](const ImageList& self, size_t index) { return self[index]; })
        .def(
            "__iter__", [](const ImageList& self) { return py::make_iterator(self.begin(), self.end()); },
            py::keep_alive<0, 1>());

    auto controller_ref = py::class_<ControllerRef>(m, "ControllerRef");
    bind_session_queries(controller_ref, [](const ControllerRef& self) -> const ControllerRef& { return self; });

    py::class_<Listener, PyListener, std::shared_ptr<Listener>>(m, "Listener")
        .def(py::init<>())
        .def("on_init", &Listener::on_init)
        .def("on_connect", &Listener::on_connect)
        .def("on_disconnect", &Listener::on_disconnect)
        .def("on_exit", &Listener::on_exit)
        .def("on_frame", &Listener::on_frame)
        .def("on_focus_gained", &Listener::on_focus_gained)
        .def("on_focus_lost", &Listener::on_focus_lost)
        .def("on_service_connect", &Listener::on_service_connect)
        .def("on_service_disconnect", &Listener::on_service_disconnect)
        .def("on_device_change", &Listener::on_device_change)
        .def("on_images", &Listener::on_images);

    py::class_<SimEventSource>(m, "SimEventSource")
        .def(
            "emit",
            [](SimEventSource& self, EventKind kind) { self.emit(kind); }, py::arg("kind"))
        .def("emit_frame", &SimEventSource::emit_frame, py::arg("hands") = std::vector<Hand>())
        .def("flush", &SimEventSource::flush, py::call_guard<py::gil_scoped_release>())
        .def("set_accept_listeners", &SimEventSource::set_accept_listeners, py::arg("accept"))
        .def_property_readonly("listener_count", &SimEventSource::listener_count);

    auto controller = py::class_<PyController>(m, "Controller");
    controller
        .def_static(
            "simulated",
            [](int image_width, int image_height)
            {
                SimEventSource* simulator = nullptr;
                auto impl = make_simulated<Controller>(image_width, image_height, simulator);
                return std::make_unique<PyController>(std::move(impl), simulator);
            },
            py::arg("image_width") = 640, py::arg("image_height") = 240,
            "Create a controller over an in-process simulated device service")
        .def_static(
            "openxr",
            [](const std::string& config_path)
            { return std::make_unique<PyController>(make_openxr<Controller>(config_path), nullptr); },
            py::arg("config_path") = "", "Create a controller over the OpenXR hand tracking runtime")
        .def("add_listener", &PyController::add_listener, py::arg("listener"))
        .def("remove_listener", &PyController::remove_listener, py::arg("listener"))
        .def_property_readonly("listener_count", [](const PyController& self) { return self.controller().listener_count(); })
        .def_property_readonly("simulator", &PyController::simulator, py::return_value_policy::reference_internal)
        .def("close", &PyController::close)
        .def("__enter__", [](PyController& self) -> PyController& { return self; })
        .def("__exit__", [](PyController& self, py::object, py::object, py::object) { self.close(); });
    bind_session_queries(controller, [](const PyController& self) -> const ControllerRef& { return self.controller(); });

    auto managed = py::class_<PyManagedController, PyController>(m, "ManagedController");
    managed
        .def_static(
            "simulated",
            [](int image_width, int image_height)
            {
                SimEventSource* simulator = nullptr;
                auto impl = make_simulated<ManagedController>(image_width, image_height, simulator);
                return std::make_unique<PyManagedController>(std::move(impl), simulator);
            },
            py::arg("image_width") = 640, py::arg("image_height") = 240)
        .def_static(
            "openxr",
            [](const std::string& config_path)
            { return std::make_unique<PyManagedController>(make_openxr<ManagedController>(config_path), nullptr); },
            py::arg("config_path") = "")
        .def_property_readonly("frame_count", [](const PyManagedController& self) { return self.managed().frame_count(); })
        .def_property_readonly("images_count",
                               [](const PyManagedController& self) { return self.managed().images_count(); })
        .def_property_readonly("device_change_count",
                               [](const PyManagedController& self) { return self.managed().device_change_count(); });

    PyManagedController::bind_wait(managed, "wait_until_service_connected", &ManagedController::wait_until_service_connected,
                                   &ManagedController::wait_until_service_connected);
    PyManagedController::bind_wait(managed, "wait_until_service_disconnected",
                                   &ManagedController::wait_until_service_disconnected,
                                   &ManagedController::wait_until_service_disconnected);
    PyManagedController::bind_wait(managed, "wait_until_device_connected", &ManagedController::wait_until_device_connected,
                                   &ManagedController::wait_until_device_connected);
    PyManagedController::bind_wait(managed, "wait_until_device_disconnected",
                                   &ManagedController::wait_until_device_disconnected,
                                   &ManagedController::wait_until_device_disconnected);
    PyManagedController::bind_wait(managed, "wait_until_focus_gained", &ManagedController::wait_until_focus_gained,
                                   &ManagedController::wait_until_focus_gained);
    PyManagedController::bind_wait(managed, "wait_until_focus_lost", &ManagedController::wait_until_focus_lost,
                                   &ManagedController::wait_until_focus_lost);
    PyManagedController::bind_wait(managed, "wait_until_device_change", &ManagedController::wait_until_device_change,
                                   &ManagedController::wait_until_device_change);
    PyManagedController::bind_wait(managed, "wait_until_frame", &ManagedController::wait_until_frame,
                                   &ManagedController::wait_until_frame);
    PyManagedController::bind_wait(managed, "wait_until_images", &ManagedController::wait_until_images,
                                   &ManagedController::wait_until_images);

    m.attr("MAX_FRAME_HISTORY") = kMaxFrameHistory;
    m.attr("NUM_JOINTS") = static_cast<int>(Hand::NUM_JOINTS);
}
