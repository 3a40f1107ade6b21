// gesture_tracker.cpp
#include "gesture_tracker.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {

void resetTracking(TrackerState& state) {
    state.gestureStarted = false;
    state.startX.reset();
    state.movementFrames = 0;
    state.fingerHistory.clear();
    state.thumbHistory.clear();
}

}  // namespace

const char* gestureStateName(GestureState state) {
    switch (state) {
        case GestureState::Primed:
            return "primed";
        case GestureState::Tracking:
            return "tracking";
        case GestureState::Cooldown:
            return "cooldown";
        default:
            return "idle";
    }
}

StepResult stepGesture(const TrackerState& state,
                       const FrameInput& input,
                       const ThresholdConfig& config) {
    StepResult result;
    result.state = state;
    TrackerState& next = result.state;
    StepNotices& notices = result.notices;
    const double now = input.timestamp;

    next.justArmed = false;

    // Check if priming has expired
    if (next.primedAt && now - *next.primedAt > config.primingTimeout) {
        next.primedAt.reset();
        notices.primingExpired = true;
    }

    notices.lipZone = makeLipZone(input.face, config.lipZoneRadius);

    // No hand detected, reset gesture tracking but keep priming
    if (!input.hand) {
        resetTracking(next);
        return result;
    }
    const HandObservation& hand = *input.hand;

    PrimingResult priming = detectPriming(hand, notices.lipZone, config);
    notices.currentlyPriming = priming.priming;
    notices.fingerAtLips = priming.method == PrimingMethod::LipTouch;

    if (priming.priming) {
        next.wasPriming = true;
        if (!next.primedAt) {
            next.primedAt = now;
            if (config.primingWaivesCooldown) {
                next.lastSwipeTime.reset();
            }
            notices.primedBy = priming.method;
        }
    } else if (next.wasPriming && next.primed()) {
        // Just left the priming pose
        next.wasPriming = false;
        next.justArmed = true;
    }

    // Only track swipes when primed and not holding the priming pose
    if (!next.primed() || priming.priming) {
        resetTracking(next);
        return result;
    }

    const double finger_x = hand[config.trackedFingerTip].x();
    next.fingerHistory.push(finger_x);
    next.thumbHistory.push(hand[THUMB_TIP].x());

    // Start tracking a new gesture
    if (!next.gestureStarted) {
        next.gestureStarted = true;
        next.startX = finger_x;
        next.movementFrames = 0;
        return result;
    }

    next.movementFrames++;

    const std::size_t min_samples = static_cast<std::size_t>(config.minHistorySamples);

    if (next.lastSwipeTime && now - *next.lastSwipeTime <= config.cooldownDuration) {
        // Cooldown wins over any accumulated motion
        next.gestureStarted = false;
        next.fingerHistory.clear();
        next.thumbHistory.clear();
        notices.cooldownSuppressed = true;
    } else if (next.movementFrames >= config.minFrames &&
               next.fingerHistory.size() >= min_samples &&
               next.thumbHistory.size() >= min_samples) {
        SwipeDecision decision = classifySwipe(next.fingerHistory, next.thumbHistory, config);
        if (decision.direction != GestureEvent::None) {
            result.event = decision.direction;
            notices.swipe = decision;
            next.lastSwipeTime = now;
            next.primedAt.reset();  // priming is consumed by the swipe
            resetTracking(next);
            return result;
        }
    }

    // Too slow to be a swipe
    if (next.movementFrames > config.maxFrames) {
        resetTracking(next);
        notices.swipeDiscarded = true;
    }

    return result;
}

GestureStatus describeStatus(const TrackerState& state, double now, const ThresholdConfig& config) {
    GestureStatus status;

    bool in_cooldown = state.lastSwipeTime && now - *state.lastSwipeTime <= config.cooldownDuration;

    // Cooldown covers the whole window, even while a new candidate accumulates
    if (in_cooldown) {
        status.state = GestureState::Cooldown;
    } else if (state.gestureStarted) {
        status.state = GestureState::Tracking;
    } else if (state.primed()) {
        status.state = GestureState::Primed;
    } else {
        status.state = GestureState::Idle;
    }

    if (state.primed()) {
        status.primingRemaining = std::max(0.0, config.primingTimeout - (now - *state.primedAt));
    }
    if (in_cooldown) {
        status.cooldownRemaining = config.cooldownDuration - (now - *state.lastSwipeTime);
    }

    status.activelyPriming = state.wasPriming && state.primed();
    status.justArmed = state.justArmed;
    status.bufferedSamples = state.fingerHistory.size();
    return status;
}

std::string formatStatus(const GestureStatus& status) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(1);

    if (status.state == GestureState::Cooldown) {
        ss << "COOLDOWN";
    } else if (status.activelyPriming) {
        ss << "READY TO TURN PAGE";
    } else if (status.justArmed) {
        ss << "SWIPE NOW! (" << status.primingRemaining << "s)";
    } else if (status.state == GestureState::Primed || status.state == GestureState::Tracking) {
        ss << "Ready for " << status.primingRemaining << "s";
    } else {
        ss << "Lick finger to enable page turn";
    }
    return ss.str();
}

GestureTracker::GestureTracker(const ThresholdConfig& config,
                               std::shared_ptr<const MonotonicClock> time_source)
    : thresholds(config), clock(std::move(time_source)) {
    if (!clock) {
        throw std::invalid_argument("GestureTracker requires a clock");
    }
    lastStepTime = clock->now();
}

GestureEvent GestureTracker::processFrame(const std::optional<HandObservation>& hand,
                                          const std::optional<FaceObservation>& face) {
    lastStepTime = clock->now();
    StepResult result = stepGesture(current, FrameInput(lastStepTime, hand, face), thresholds);
    current = result.state;
    notices = result.notices;
    logStep(notices, result.event);
    return result.event;
}

GestureStatus GestureTracker::status() const {
    return describeStatus(current, lastStepTime, thresholds);
}

void GestureTracker::reset() {
    current = TrackerState();
    notices = StepNotices();
    lastStepTime = clock->now();
}

void GestureTracker::logStep(const StepNotices& step, GestureEvent event) const {
    if (step.primingExpired) {
        std::cout << "[GESTURE] Priming expired" << std::endl;
    }

    if (step.primedBy != PrimingMethod::None) {
        std::cout << "[GESTURE] Primed (" << primingMethodName(step.primedBy) << ")"
                  << ", ready to turn page"
                  << (thresholds.primingWaivesCooldown ? " (cooldown reset)" : "") << std::endl;
    }

    if (step.swipeDiscarded) {
        std::cout << "[GESTURE] Swipe took more than " << thresholds.maxFrames
                  << " frames, discarded" << std::endl;
    }

    if (event != GestureEvent::None && step.swipe) {
        const SwipeDecision& swipe = *step.swipe;
        std::string direction = event == GestureEvent::Right ? "RIGHT" : "LEFT";
        std::stringstream ss;
        ss << std::fixed << std::setprecision(3)
           << "[GESTURE] " << direction << (swipe.fast ? " FAST" : " normal")
           << " swipe (movement: " << swipe.fingerMovement
           << ", thumb: " << swipe.thumbMovement << ")";
        std::cout << ss.str() << std::endl;
    }
}
