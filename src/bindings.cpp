#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/stl.h>
#include <memory>
#include <stdexcept>
#include "gesture_tracker.hpp"
#include "page_spread.hpp"

namespace py = pybind11;

namespace {

// (21, 2) array of normalized hand landmarks, or None
std::optional<HandObservation> toHand(const py::object& obj) {
    if (obj.is_none()) {
        return std::nullopt;
    }
    auto array = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(obj);
    if (!array || array.ndim() != 2 || array.shape(0) != HandObservation::NUM_LANDMARKS || array.shape(1) < 2) {
        throw std::invalid_argument("hand must be a (21, 2) array of normalized landmarks");
    }
    auto data = array.unchecked<2>();
    HandObservation hand;
    for (int i = 0; i < HandObservation::NUM_LANDMARKS; ++i) {
        hand.landmarks[i] = Eigen::Vector2d(data(i, 0), data(i, 1));
    }
    return hand;
}

// (2, 2) array of [upper lip, lower lip], or None
std::optional<FaceObservation> toFace(const py::object& obj) {
    if (obj.is_none()) {
        return std::nullopt;
    }
    auto array = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(obj);
    if (!array || array.ndim() != 2 || array.shape(0) != 2 || array.shape(1) < 2) {
        throw std::invalid_argument("face must be a (2, 2) array of upper and lower lip landmarks");
    }
    auto data = array.unchecked<2>();
    return FaceObservation(Eigen::Vector2d(data(0, 0), data(0, 1)),
                           Eigen::Vector2d(data(1, 0), data(1, 1)));
}

}  // namespace

PYBIND11_MODULE(page_turner_python, m) {
    py::enum_<GestureEvent>(m, "GestureEvent")
        .value("NONE", GestureEvent::None)
        .value("LEFT", GestureEvent::Left)
        .value("RIGHT", GestureEvent::Right);

    py::class_<ThresholdConfig>(m, "ThresholdConfig")
        .def(py::init<>())
        .def_readwrite("swipe_threshold_right", &ThresholdConfig::swipeThresholdRight)
        .def_readwrite("swipe_threshold_left", &ThresholdConfig::swipeThresholdLeft)
        .def_readwrite("fast_swipe_threshold", &ThresholdConfig::fastSwipeThreshold)
        .def_readwrite("min_frames", &ThresholdConfig::minFrames)
        .def_readwrite("max_frames", &ThresholdConfig::maxFrames)
        .def_readwrite("min_history_samples", &ThresholdConfig::minHistorySamples)
        .def_readwrite("noise_floor", &ThresholdConfig::noiseFloor)
        .def_readwrite("agreement_ratio_right", &ThresholdConfig::agreementRatioRight)
        .def_readwrite("agreement_ratio_left", &ThresholdConfig::agreementRatioLeft)
        .def_readwrite("consistency_right_fast", &ThresholdConfig::consistencyRightFast)
        .def_readwrite("consistency_right_slow", &ThresholdConfig::consistencyRightSlow)
        .def_readwrite("consistency_left_fast", &ThresholdConfig::consistencyLeftFast)
        .def_readwrite("consistency_left_slow", &ThresholdConfig::consistencyLeftSlow)
        .def_readwrite("priming_timeout", &ThresholdConfig::primingTimeout)
        .def_readwrite("cooldown_duration", &ThresholdConfig::cooldownDuration)
        .def_readwrite("lip_zone_radius", &ThresholdConfig::lipZoneRadius)
        .def_readwrite("pose_margin", &ThresholdConfig::poseMargin)
        .def_readwrite("pose_top_limit", &ThresholdConfig::poseTopLimit)
        .def_property("tracked_finger_tip",
            [](const ThresholdConfig& self) { return static_cast<int>(self.trackedFingerTip); },
            [](ThresholdConfig& self, int index) {
                if (index < 0 || index >= HandObservation::NUM_LANDMARKS) {
                    throw std::invalid_argument("tracked_finger_tip must be a hand landmark index (0-20)");
                }
                self.trackedFingerTip = static_cast<HandLandmark>(index);
            })
        .def_readwrite("priming_waives_cooldown", &ThresholdConfig::primingWaivesCooldown);

    py::class_<GestureTracker>(m, "GestureTracker")
        .def(py::init([](const ThresholdConfig& config) {
            return std::make_unique<GestureTracker>(config);
        }), py::arg("config") = ThresholdConfig())
        .def("process_frame", [](GestureTracker& self, const py::object& hand, const py::object& face) {
            return self.processFrame(toHand(hand), toFace(face));
        }, py::arg("hand"), py::arg("face") = py::none())
        .def("status", [](const GestureTracker& self) {
            GestureStatus status = self.status();
            py::dict py_status;
            py_status["state"] = gestureStateName(status.state);
            py_status["actively_priming"] = status.activelyPriming;
            py_status["just_armed"] = status.justArmed;
            py_status["priming_remaining"] = status.primingRemaining;
            py_status["cooldown_remaining"] = status.cooldownRemaining;
            py_status["buffered_samples"] = status.bufferedSamples;
            py_status["text"] = formatStatus(status);
            return py_status;
        })
        .def("reset", &GestureTracker::reset)
        .def_property_readonly("config", &GestureTracker::config);

    py::class_<PageSpread>(m, "PageSpread")
        .def(py::init<int>(), py::arg("page_count"))
        .def("next_spread", &PageSpread::nextSpread)
        .def("previous_spread", &PageSpread::previousSpread)
        .def("apply", &PageSpread::apply)
        .def("visible_pages", [](const PageSpread& self) {
            PageSpread::VisiblePages pages = self.visiblePages();
            py::object left = py::none();
            py::object right = py::none();
            if (pages.left) left = py::cast(*pages.left);
            if (pages.right) right = py::cast(*pages.right);
            return py::make_tuple(left, right);
        })
        .def_property_readonly("current_page", &PageSpread::currentPage)
        .def_property_readonly("page_count", &PageSpread::pageCount);
}
