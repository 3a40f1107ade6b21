// visualizer.cpp
#include "visualizer.hpp"

#include <algorithm>
#include <string>

void GestureVisualizer::drawOverlay(cv::Mat& frame,
                                    const std::optional<HandObservation>& hand,
                                    const GestureTracker& tracker,
                                    GestureEvent event) {
    const StepNotices& notices = tracker.lastNotices();

    if (notices.lipZone) {
        drawLipZone(frame, *notices.lipZone);
    }

    if (hand) {
        // Connection line while the finger touches the lips
        if (notices.fingerAtLips && notices.lipZone) {
            cv::line(frame,
                     normalizedToPixel((*hand)[INDEX_TIP]),
                     normalizedToPixel(notices.lipZone->center),
                     cv::Scalar(0, 255, 255), 2);
        }

        // Current position of the tracked finger
        cv::circle(frame, normalizedToPixel((*hand)[tracker.config().trackedFingerTip]),
                   10, cv::Scalar(255, 0, 0), cv::FILLED);
    }

    drawStatus(frame, tracker.status());

    if (event == GestureEvent::Right) {
        cv::putText(frame, "PAGE TURN ->", cv::Point(10, 100), font, 1.0, cv::Scalar(0, 255, 0), 3);
    } else if (event == GestureEvent::Left) {
        cv::putText(frame, "<- PAGE TURN", cv::Point(10, 100), font, 1.0, cv::Scalar(0, 255, 0), 3);
    }
}

void GestureVisualizer::drawPageInfo(cv::Mat& frame, const PageSpread& spread) {
    PageSpread::VisiblePages pages = spread.visiblePages();

    // Page numbers are one-based on screen
    std::string text = "Pages: ";
    text += pages.left ? std::to_string(*pages.left + 1) : "-";
    text += " | ";
    text += pages.right ? std::to_string(*pages.right + 1) : "-";
    text += " of " + std::to_string(spread.pageCount());

    cv::putText(frame, text, cv::Point(10, frameHeight - 20), font, 0.6, cv::Scalar(255, 255, 255), 2);
}

void GestureVisualizer::drawLipZone(cv::Mat& frame, const LipZone& lips) {
    cv::Point center = normalizedToPixel(lips.center);
    int radius = static_cast<int>(lips.radius * std::min(frameWidth, frameHeight));

    cv::circle(frame, center, radius, cv::Scalar(255, 200, 0), 2);
    cv::putText(frame, "LIP ZONE", cv::Point(center.x - 40, center.y - radius - 10),
                font, 0.5, cv::Scalar(255, 200, 0), 1);
}

void GestureVisualizer::drawStatus(cv::Mat& frame, const GestureStatus& status) {
    cv::Scalar color;
    switch (status.state) {
        case GestureState::Cooldown:
            color = cv::Scalar(0, 165, 255);  // Orange
            break;
        case GestureState::Idle:
            color = cv::Scalar(255, 255, 0);
            break;
        default:
            color = status.activelyPriming ? cv::Scalar(0, 255, 255) : cv::Scalar(0, 255, 0);
            break;
    }

    cv::putText(frame, formatStatus(status), cv::Point(10, 30), font, 0.7, color, 2);
}
