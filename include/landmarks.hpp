#pragma once

// C++ Standard Library
#include <array>
#include <optional>

// Third-party libraries
#include <Eigen/Core>

// MediaPipe hand landmark indices
enum HandLandmark : int {
    WRIST = 0,
    THUMB_CMC = 1,
    THUMB_MCP = 2,
    THUMB_IP = 3,
    THUMB_TIP = 4,
    INDEX_MCP = 5,
    INDEX_PIP = 6,
    INDEX_DIP = 7,
    INDEX_TIP = 8,
    MIDDLE_MCP = 9,
    MIDDLE_PIP = 10,
    MIDDLE_DIP = 11,
    MIDDLE_TIP = 12,
    RING_MCP = 13,
    RING_PIP = 14,
    RING_DIP = 15,
    RING_TIP = 16,
    PINKY_MCP = 17,
    PINKY_PIP = 18,
    PINKY_DIP = 19,
    PINKY_TIP = 20
};

// One detected hand, normalized image coordinates (y grows downward)
struct HandObservation {
    static constexpr int NUM_LANDMARKS = 21;

    std::array<Eigen::Vector2d, NUM_LANDMARKS> landmarks;

    HandObservation() {
        landmarks.fill(Eigen::Vector2d::Zero());
    }

    const Eigen::Vector2d& operator[](HandLandmark index) const {
        return landmarks[index];
    }

    Eigen::Vector2d& operator[](HandLandmark index) {
        return landmarks[index];
    }
};

// Lip centers of the face mesh (indices 13 and 14); nothing else is consumed
struct FaceObservation {
    Eigen::Vector2d upperLip;
    Eigen::Vector2d lowerLip;

    FaceObservation() : upperLip(Eigen::Vector2d::Zero()), lowerLip(Eigen::Vector2d::Zero()) {}
    FaceObservation(const Eigen::Vector2d& upper, const Eigen::Vector2d& lower)
        : upperLip(upper), lowerLip(lower) {}
};

struct LipZone {
    Eigen::Vector2d center;
    double radius;

    LipZone() : center(Eigen::Vector2d::Zero()), radius(0) {}
    LipZone(const Eigen::Vector2d& c, double r) : center(c), radius(r) {}
};

// Lip zone centered between the upper and lower lip
inline LipZone makeLipZone(const FaceObservation& face, double radius) {
    return LipZone((face.upperLip + face.lowerLip) / 2.0, radius);
}

inline std::optional<LipZone> makeLipZone(const std::optional<FaceObservation>& face, double radius) {
    if (!face) {
        return std::nullopt;
    }
    return makeLipZone(*face, radius);
}
