// priming_detector.cpp
#include "priming_detector.hpp"

bool isPrimingPose(const HandObservation& hand, const ThresholdConfig& config) {
    const double margin = config.poseMargin;

    // Get landmark positions (y only, smaller is higher)
    double index_tip = hand[INDEX_TIP].y();
    double index_pip = hand[INDEX_PIP].y();
    double middle_tip = hand[MIDDLE_TIP].y();
    double ring_tip = hand[RING_TIP].y();
    double pinky_tip = hand[PINKY_TIP].y();

    // Index tip above its middle joint
    bool index_extended = index_tip < index_pip - margin;

    // Near mouth level
    bool index_near_top = index_tip < config.poseTopLimit;

    // Index is the highest finger
    bool index_most_extended = index_tip < middle_tip - margin &&
                               index_tip < ring_tip - margin &&
                               index_tip < pinky_tip - margin;

    return index_extended && index_near_top && index_most_extended;
}

bool isFingerAtLips(const HandObservation& hand, const LipZone& lips) {
    double distance = (hand[INDEX_TIP] - lips.center).norm();
    return distance < lips.radius;
}

PrimingResult detectPriming(const HandObservation& hand,
                            const std::optional<LipZone>& lips,
                            const ThresholdConfig& config) {
    if (lips && isFingerAtLips(hand, *lips)) {
        return PrimingResult(PrimingMethod::LipTouch);
    }
    if (isPrimingPose(hand, config)) {
        return PrimingResult(PrimingMethod::Pose);
    }
    return PrimingResult();
}

const char* primingMethodName(PrimingMethod method) {
    switch (method) {
        case PrimingMethod::Pose:
            return "finger lick pose";
        case PrimingMethod::LipTouch:
            return "finger touched lips";
        default:
            return "none";
    }
}
