// main.cpp
#include "gesture_tracker.hpp"
#include "mediapipe_wrapper.hpp"
#include "page_spread.hpp"
#include "visualizer.hpp"
#include <opencv2/opencv.hpp>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

static constexpr int DEFAULT_PAGE_COUNT = 100;

int main(int argc, char* argv[]) {
    int page_count = DEFAULT_PAGE_COUNT;
    std::string video_path;

    if (argc > 1) {
        try {
            page_count = std::stoi(argv[1]);
        } catch (const std::exception&) {
            std::cerr << "Invalid page count: " << argv[1] << std::endl;
            std::cerr << "Usage: " << argv[0] << " [page_count] [video_path]" << std::endl;
            return -1;
        }
    }

    if (argc > 2) {
        video_path = argv[2];
        if (!std::filesystem::exists(video_path)) {
            std::cerr << "Video file not found: " << video_path << std::endl;
            return -1;
        }
        std::cout << "Video processing mode: " << video_path << std::endl;
    }

    std::cout << "Initializing..." << std::endl;

    std::optional<PageSpread> spread;
    try {
        spread.emplace(page_count);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return -1;
    }

    cv::VideoCapture cap;
    if (video_path.empty()) {
        std::cout << "Opening camera..." << std::endl;
        cap.open(0);
    } else {
        cap.open(video_path);
    }
    if (!cap.isOpened()) {
        std::cerr << "Error: Could not open " << (video_path.empty() ? "camera" : video_path) << std::endl;
        return -1;
    }

    int frameWidth = cap.get(cv::CAP_PROP_FRAME_WIDTH);
    int frameHeight = cap.get(cv::CAP_PROP_FRAME_HEIGHT);
    std::cout << "Resolution: " << frameWidth << "x" << frameHeight << std::endl;

    MediaPipeWrapper landmarks;
    GestureTracker tracker;
    GestureVisualizer visualizer(frameWidth, frameHeight);

    std::cout << "Loaded " << spread->pageCount() << " pages" << std::endl;
    std::cout << "Controls:" << std::endl;
    std::cout << "  Touch your lips (or raise the index finger), then swipe" << std::endl;
    std::cout << "  Swipe LEFT  - next spread" << std::endl;
    std::cout << "  Swipe RIGHT - previous spread" << std::endl;
    std::cout << "  R - Reset gesture state" << std::endl;
    std::cout << "  ESC - Exit" << std::endl;

    cv::namedWindow("Page Turner", cv::WINDOW_NORMAL);

    cv::Mat frame, debug_frame;
    bool detection_failing = false;
    while (true) {
        cap >> frame;
        if (frame.empty()) break;

        try {
            // Mirror so the swipe direction matches the user's view
            cv::flip(frame, frame, 1);

            std::optional<HandObservation> hand;
            std::optional<FaceObservation> face;
            if (!landmarks.processFrame(frame, hand, face, debug_frame)) {
                if (!detection_failing) {
                    std::cerr << "Landmark detection failed, treating frames as empty" << std::endl;
                }
                detection_failing = true;
            } else if (detection_failing) {
                std::cout << "Landmark detection recovered" << std::endl;
                detection_failing = false;
            }

            GestureEvent event = tracker.processFrame(hand, face);
            if (spread->apply(event)) {
                std::cout << "[PAGE] " << (event == GestureEvent::Left ? "Next" : "Previous")
                          << " page: " << spread->currentPage() + 1 << std::endl;
            }

            visualizer.drawOverlay(debug_frame, hand, tracker, event);
            visualizer.drawPageInfo(debug_frame, *spread);
            cv::imshow("Page Turner", debug_frame);
        } catch (const std::exception& e) {
            std::cerr << "Error processing frame: " << e.what() << std::endl;
        }

        // Handle keyboard input
        int key = cv::waitKey(1);
        if (key == 27) break;  // ESC to exit
        else if (key == 'r' || key == 'R') {
            tracker.reset();
            std::cout << "[GESTURE] State reset" << std::endl;
        }
    }

    cap.release();
    cv::destroyAllWindows();
    std::cout << "Application closed" << std::endl;
    return 0;
}
