#pragma once

// C++ Standard Library
#include <memory>
#include <optional>
#include <string>

// built by me
#include "gesture_config.hpp"
#include "landmarks.hpp"
#include "monotonic_clock.hpp"
#include "position_history.hpp"
#include "priming_detector.hpp"
#include "swipe_classifier.hpp"

enum class GestureState {
    Idle,       // waiting for priming
    Primed,     // priming achieved, swipe tracking eligible
    Tracking,   // a candidate swipe is accumulating
    Cooldown    // a swipe was just emitted
};

const char* gestureStateName(GestureState state);

// Everything the step function carries from one frame to the next.
// Priming and cooldown are two independent timers.
struct TrackerState {
    std::optional<double> primedAt;       // priming is active iff set
    std::optional<double> lastSwipeTime;
    bool wasPriming = false;              // hand was in the priming pose last frame
    bool justArmed = false;               // first frame after leaving the priming pose

    bool gestureStarted = false;
    std::optional<double> startX;
    int movementFrames = 0;
    PositionHistory fingerHistory;
    PositionHistory thumbHistory;

    bool primed() const { return primedAt.has_value(); }
};

struct FrameInput {
    double timestamp;  // seconds, monotonic
    std::optional<HandObservation> hand;
    std::optional<FaceObservation> face;

    FrameInput() : timestamp(0) {}
    FrameInput(double t, const std::optional<HandObservation>& h, const std::optional<FaceObservation>& f)
        : timestamp(t), hand(h), face(f) {}
};

// What happened during one step, for logging and the overlay
struct StepNotices {
    bool primingExpired = false;
    PrimingMethod primedBy = PrimingMethod::None;  // set on the rising edge only
    bool currentlyPriming = false;
    bool fingerAtLips = false;
    bool cooldownSuppressed = false;
    bool swipeDiscarded = false;                   // exceeded max frames
    std::optional<LipZone> lipZone;
    std::optional<SwipeDecision> swipe;
};

struct StepResult {
    TrackerState state;
    GestureEvent event = GestureEvent::None;
    StepNotices notices;
};

// Advance the gesture state by one frame. At most one event per call.
StepResult stepGesture(const TrackerState& state,
                       const FrameInput& input,
                       const ThresholdConfig& config);

struct GestureStatus {
    GestureState state = GestureState::Idle;
    bool activelyPriming = false;
    bool justArmed = false;
    double primingRemaining = 0;
    double cooldownRemaining = 0;
    std::size_t bufferedSamples = 0;
};

GestureStatus describeStatus(const TrackerState& state, double now, const ThresholdConfig& config);

// Overlay text for a status
std::string formatStatus(const GestureStatus& status);

class GestureTracker {
public:
    explicit GestureTracker(const ThresholdConfig& config = ThresholdConfig(),
                            std::shared_ptr<const MonotonicClock> clock = std::make_shared<SteadyClock>());

    GestureEvent processFrame(const std::optional<HandObservation>& hand,
                              const std::optional<FaceObservation>& face);

    // Status as of the most recent processFrame (or construction/reset)
    GestureStatus status() const;
    void reset();

    const TrackerState& state() const { return current; }
    const StepNotices& lastNotices() const { return notices; }
    const ThresholdConfig& config() const { return thresholds; }
    double lastStepTimestamp() const { return lastStepTime; }

private:
    void logStep(const StepNotices& step, GestureEvent event) const;

    ThresholdConfig thresholds;
    std::shared_ptr<const MonotonicClock> clock;
    TrackerState current;
    StepNotices notices;
    double lastStepTime = 0;
};
