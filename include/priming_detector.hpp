#pragma once

// C++ Standard Library
#include <optional>

#include "gesture_config.hpp"
#include "landmarks.hpp"

enum class PrimingMethod {
    None,
    Pose,       // index finger raised alone near the top of the frame
    LipTouch    // index fingertip inside the lip zone
};

struct PrimingResult {
    bool priming;
    PrimingMethod method;

    PrimingResult() : priming(false), method(PrimingMethod::None) {}
    explicit PrimingResult(PrimingMethod m) : priming(m != PrimingMethod::None), method(m) {}
};

// Index finger extended, in the top part of the frame, and higher than the
// middle, ring and pinky tips by at least the pose margin.
bool isPrimingPose(const HandObservation& hand, const ThresholdConfig& config);

// Index fingertip strictly inside the lip zone
bool isFingerAtLips(const HandObservation& hand, const LipZone& lips);

// Priming holds when either heuristic holds. Lip touch is reported first when
// both match. Without a lip zone only the pose heuristic is evaluated.
PrimingResult detectPriming(const HandObservation& hand,
                            const std::optional<LipZone>& lips,
                            const ThresholdConfig& config);

const char* primingMethodName(PrimingMethod method);
