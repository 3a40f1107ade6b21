// swipe_classifier.cpp
#include "swipe_classifier.hpp"

#include <cmath>

const char* gestureEventName(GestureEvent event) {
    switch (event) {
        case GestureEvent::Left:
            return "left";
        case GestureEvent::Right:
            return "right";
        default:
            return "none";
    }
}

DirectionVotes countDirectionVotes(const PositionHistory& history, double noise_floor) {
    DirectionVotes votes;
    for (std::size_t i = 1; i < history.size(); ++i) {
        double diff = history[i] - history[i - 1];
        if (diff > noise_floor) {
            votes.right++;
        } else if (diff < -noise_floor) {
            votes.left++;
        }
    }
    return votes;
}

SwipeDecision classifySwipe(const PositionHistory& finger,
                            const PositionHistory& thumb,
                            const ThresholdConfig& config) {
    SwipeDecision decision;

    const std::size_t min_samples = static_cast<std::size_t>(config.minHistorySamples);
    if (finger.size() < min_samples || thumb.size() < min_samples || finger.empty() || thumb.empty()) {
        return decision;
    }

    // First and last samples ignore small counter-movements in between
    decision.fingerMovement = finger.back() - finger.front();
    decision.thumbMovement = thumb.back() - thumb.front();

    DirectionVotes finger_votes = countDirectionVotes(finger, config.noiseFloor);
    DirectionVotes thumb_votes = countDirectionVotes(thumb, config.noiseFloor);

    // No directional signal on one of the streams
    if (finger_votes.total() == 0 || thumb_votes.total() == 0) {
        return decision;
    }

    decision.fingerRightRatio = finger_votes.rightRatio();
    decision.fingerLeftRatio = finger_votes.leftRatio();
    decision.thumbRightRatio = thumb_votes.rightRatio();
    decision.thumbLeftRatio = thumb_votes.leftRatio();

    bool agreement_right = decision.fingerRightRatio > config.agreementRatioRight &&
                           decision.thumbRightRatio > config.agreementRatioRight;
    bool agreement_left = decision.fingerLeftRatio > config.agreementRatioLeft &&
                          decision.thumbLeftRatio > config.agreementRatioLeft;

    decision.fast = std::abs(decision.fingerMovement) > config.fastSwipeThreshold;

    double required_right = decision.fast ? config.consistencyRightFast : config.consistencyRightSlow;
    double required_left = decision.fast ? config.consistencyLeftFast : config.consistencyLeftSlow;

    if (decision.fingerMovement > config.swipeThresholdRight &&
        decision.fingerRightRatio > required_right &&
        agreement_right) {
        decision.direction = GestureEvent::Right;
    } else if (decision.fingerMovement < -config.swipeThresholdLeft &&
               decision.fingerLeftRatio > required_left &&
               agreement_left) {
        decision.direction = GestureEvent::Left;
    }

    return decision;
}
