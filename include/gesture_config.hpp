#pragma once

#include "landmarks.hpp"

// Tuning for priming and swipe detection. Every field can be overridden
// before the tracker is constructed.
struct ThresholdConfig {
    // Swipe distance (fraction of frame width). Left is more sensitive.
    double swipeThresholdRight = 0.12;
    double swipeThresholdLeft = 0.10;
    double fastSwipeThreshold = 0.20;

    // Frames after tracking starts
    int minFrames = 3;
    int maxFrames = 25;
    int minHistorySamples = 5;

    // Per-frame deltas below this are not counted as votes
    double noiseFloor = 0.01;

    // Thumb/finger agreement
    double agreementRatioRight = 0.5;
    double agreementRatioLeft = 0.45;

    // Finger vote consistency, fast vs. slow swipes
    double consistencyRightFast = 0.5;
    double consistencyRightSlow = 0.6;
    double consistencyLeftFast = 0.45;
    double consistencyLeftSlow = 0.55;

    // Seconds
    double primingTimeout = 5.0;
    double cooldownDuration = 1.5;

    // Priming heuristics
    double lipZoneRadius = 0.08;
    double poseMargin = 0.05;
    double poseTopLimit = 0.5;

    HandLandmark trackedFingerTip = MIDDLE_TIP;

    // A fresh priming clears the cooldown timer
    bool primingWaivesCooldown = true;
};
