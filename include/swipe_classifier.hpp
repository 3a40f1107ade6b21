#pragma once

#include "gesture_config.hpp"
#include "position_history.hpp"

enum class GestureEvent {
    None,
    Left,
    Right
};

const char* gestureEventName(GestureEvent event);

struct SwipeDecision {
    GestureEvent direction;
    bool fast;
    double fingerMovement;   // last - first
    double thumbMovement;
    double fingerRightRatio;
    double fingerLeftRatio;
    double thumbRightRatio;
    double thumbLeftRatio;

    SwipeDecision()
        : direction(GestureEvent::None), fast(false),
          fingerMovement(0), thumbMovement(0),
          fingerRightRatio(0), fingerLeftRatio(0),
          thumbRightRatio(0), thumbLeftRatio(0) {}
};

// Per-step direction votes of one tracked point
struct DirectionVotes {
    int right;
    int left;

    DirectionVotes() : right(0), left(0) {}

    int total() const { return right + left; }
    double rightRatio() const { return total() > 0 ? static_cast<double>(right) / total() : 0.0; }
    double leftRatio() const { return total() > 0 ? static_cast<double>(left) / total() : 0.0; }
};

DirectionVotes countDirectionVotes(const PositionHistory& history, double noise_floor);

// Decide whether the finger and thumb histories describe a horizontal swipe.
// Requires net displacement past the direction's distance threshold, enough
// consistent finger votes (relaxed for fast swipes) and thumb/finger
// agreement. Right is checked before left.
SwipeDecision classifySwipe(const PositionHistory& finger,
                            const PositionHistory& thumb,
                            const ThresholdConfig& config);
