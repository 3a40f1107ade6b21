#pragma once
#include "gesture_tracker.hpp"
#include "page_spread.hpp"
#include <opencv2/opencv.hpp>

class GestureVisualizer {
public:
    GestureVisualizer(int width, int height)
        : frameWidth(width), frameHeight(height) {
        font = cv::FONT_HERSHEY_SIMPLEX;
    }

    // Lip zone, tracked finger, status line and page-turn banner
    void drawOverlay(cv::Mat& frame,
                     const std::optional<HandObservation>& hand,
                     const GestureTracker& tracker,
                     GestureEvent event);

    void drawPageInfo(cv::Mat& frame, const PageSpread& spread);

private:
    cv::Point2f normalizedToPixel(const Eigen::Vector2d& pos) const {
        return cv::Point2f(static_cast<float>(pos.x() * frameWidth),
                           static_cast<float>(pos.y() * frameHeight));
    }
    void drawLipZone(cv::Mat& frame, const LipZone& lips);
    void drawStatus(cv::Mat& frame, const GestureStatus& status);

    int frameWidth;
    int frameHeight;
    int font;
};
