#pragma once

// C++ Standard Library
#include <iostream>
#include <optional>

// Third-party libraries
#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>
#include <pybind11/embed.h>
#include <opencv2/opencv.hpp>
#include <Eigen/Core>

// built by me
#include "landmarks.hpp"

namespace py = pybind11;

// Runs MediaPipe hands + face mesh through an embedded Python interpreter.
// Owns the interpreter when none is running yet.
class MediaPipeWrapper {
public:
    MediaPipeWrapper() : ownsInterpreter(false) {
        try {
            if (!Py_IsInitialized()) {
                py::initialize_interpreter();
                ownsInterpreter = true;
            }

            py::exec(R"(
                import mediapipe as mp
                import numpy as np
                import cv2

                mp_drawing = mp.solutions.drawing_utils
                mp_hands = mp.solutions.hands
                mp_face_mesh = mp.solutions.face_mesh

                # One hand drives the page turns
                hands = mp_hands.Hands(
                    static_image_mode=False,
                    max_num_hands=1,
                    min_detection_confidence=0.7,
                    min_tracking_confidence=0.5
                )

                # Face mesh is only used for the lip centers
                face_mesh = mp_face_mesh.FaceMesh(
                    static_image_mode=False,
                    max_num_faces=1,
                    min_detection_confidence=0.5,
                    min_tracking_confidence=0.5
                )
            )");

            std::cout << "Successfully initialized MediaPipe detectors" << std::endl;

        } catch (const py::error_already_set& e) {
            std::cerr << "Python error in constructor: " << e.what() << std::endl;
            throw;
        }
    }

    ~MediaPipeWrapper() {
        try {
            py::exec(R"(
                hands.close()
                face_mesh.close()
            )");
        } catch (const py::error_already_set& e) {
            std::cerr << "Python error while closing detectors: " << e.what() << std::endl;
        }
        if (ownsInterpreter) {
            py::finalize_interpreter();
        }
    }

    MediaPipeWrapper(const MediaPipeWrapper&) = delete;
    MediaPipeWrapper& operator=(const MediaPipeWrapper&) = delete;

    // Detect at most one hand and one face in a BGR frame. Hand landmarks are
    // drawn onto debug_output. Errors are logged and reported as "nothing
    // detected" so the capture loop keeps running.
    bool processFrame(const cv::Mat& frame,
                      std::optional<HandObservation>& hand,
                      std::optional<FaceObservation>& face,
                      cv::Mat& debug_output) {
        hand.reset();
        face.reset();

        try {
            // Convert BGR to RGB
            cv::Mat rgb_frame;
            cv::cvtColor(frame, rgb_frame, cv::COLOR_BGR2RGB);

            // Convert to Python numpy array
            py::array_t<unsigned char> py_image(
                {static_cast<py::ssize_t>(rgb_frame.rows), static_cast<py::ssize_t>(rgb_frame.cols), py::ssize_t(3)},
                {static_cast<py::ssize_t>(rgb_frame.step[0]), static_cast<py::ssize_t>(rgb_frame.step[1]),
                 static_cast<py::ssize_t>(rgb_frame.elemSize1())},
                rgb_frame.data
            );

            py::dict locals;
            locals["image_array"] = py_image;

            py::exec(R"(
                try:
                    hand_results = hands.process(image_array)
                    face_results = face_mesh.process(image_array)

                    debug_image = image_array.copy()
                    hand_data = []
                    lip_data = []

                    if hand_results.multi_hand_landmarks:
                        hand_landmarks = hand_results.multi_hand_landmarks[0]
                        mp_drawing.draw_landmarks(debug_image, hand_landmarks,
                                                  mp_hands.HAND_CONNECTIONS)
                        for landmark in hand_landmarks.landmark:
                            hand_data.append([landmark.x, landmark.y])

                    if face_results.multi_face_landmarks:
                        face_landmarks = face_results.multi_face_landmarks[0]
                        upper_lip = face_landmarks.landmark[13]
                        lower_lip = face_landmarks.landmark[14]
                        lip_data = [[upper_lip.x, upper_lip.y], [lower_lip.x, lower_lip.y]]

                except Exception as e:
                    print(f"Error in Python processing: {str(e)}")
                    debug_image = image_array.copy()
                    hand_data = []
                    lip_data = []
            )", py::globals(), locals);

            // Get debug image
            py::array_t<unsigned char> debug_image = locals["debug_image"].cast<py::array_t<unsigned char>>();
            cv::Mat debug_mat(debug_image.shape(0), debug_image.shape(1), CV_8UC3, debug_image.mutable_data());
            cv::cvtColor(debug_mat, debug_output, cv::COLOR_RGB2BGR);

            // Convert hand landmarks
            auto py_hand = locals["hand_data"].cast<py::list>();
            if (py::len(py_hand) == HandObservation::NUM_LANDMARKS) {
                HandObservation observation;
                for (int i = 0; i < HandObservation::NUM_LANDMARKS; ++i) {
                    auto landmark = py_hand[i].cast<py::list>();
                    observation.landmarks[i] = Eigen::Vector2d(landmark[0].cast<double>(),
                                                               landmark[1].cast<double>());
                }
                hand = observation;
            }

            // Convert lip landmarks
            auto py_lips = locals["lip_data"].cast<py::list>();
            if (py::len(py_lips) == 2) {
                auto upper = py_lips[0].cast<py::list>();
                auto lower = py_lips[1].cast<py::list>();
                face = FaceObservation(
                    Eigen::Vector2d(upper[0].cast<double>(), upper[1].cast<double>()),
                    Eigen::Vector2d(lower[0].cast<double>(), lower[1].cast<double>()));
            }

            return true;

        } catch (const py::error_already_set& e) {
            std::cerr << "Python error in processFrame: " << e.what() << std::endl;
            frame.copyTo(debug_output);
            hand.reset();
            face.reset();
            return false;
        }
    }

private:
    bool ownsInterpreter;
};
