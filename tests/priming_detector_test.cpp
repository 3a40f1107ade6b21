#include <gtest/gtest.h>

#include "priming_detector.hpp"
#include "test_helpers.hpp"

TEST(PrimingDetectorTest, RaisedIndexFingerIsPrimingPose) {
  ThresholdConfig config;
  EXPECT_TRUE(isPrimingPose(makePrimingPoseHand(), config));
}

TEST(PrimingDetectorTest, OpenHandIsNotPrimingPose) {
  ThresholdConfig config;
  EXPECT_FALSE(isPrimingPose(makeHand(0.5, 0.45), config));
}

TEST(PrimingDetectorTest, PoseRequiresIndexAboveOtherFingers) {
  ThresholdConfig config;
  HandObservation hand = makePrimingPoseHand();

  // Middle finger raised as high as the index
  hand[MIDDLE_TIP] = Eigen::Vector2d(0.55, 0.22);
  EXPECT_FALSE(isPrimingPose(hand, config));

  hand = makePrimingPoseHand();
  hand[PINKY_TIP] = Eigen::Vector2d(0.6, 0.24);
  EXPECT_FALSE(isPrimingPose(hand, config));
}

TEST(PrimingDetectorTest, PoseRequiresTopOfFrame) {
  ThresholdConfig config;
  HandObservation hand = makeHand(0.5, 0.45, 0.95);
  hand[INDEX_PIP] = Eigen::Vector2d(0.5, 0.8);
  hand[INDEX_TIP] = Eigen::Vector2d(0.5, 0.6);

  // Extended and highest finger, but in the lower half
  EXPECT_FALSE(isPrimingPose(hand, config));

  config.poseTopLimit = 0.7;
  EXPECT_TRUE(isPrimingPose(hand, config));
}

TEST(PrimingDetectorTest, PoseRequiresExtendedIndex) {
  ThresholdConfig config;
  HandObservation hand = makePrimingPoseHand();
  hand[INDEX_PIP] = Eigen::Vector2d(0.5, 0.23);  // within the margin of the tip
  EXPECT_FALSE(isPrimingPose(hand, config));
}

TEST(PrimingDetectorTest, FingerAtLipsUsesZoneRadius) {
  LipZone lips(Eigen::Vector2d(0.5, 0.5), 0.08);
  HandObservation hand = makeHand(0.5, 0.45);

  hand[INDEX_TIP] = Eigen::Vector2d(0.55, 0.55);  // ~0.071 away
  EXPECT_TRUE(isFingerAtLips(hand, lips));

  hand[INDEX_TIP] = Eigen::Vector2d(0.5, 0.59);
  EXPECT_FALSE(isFingerAtLips(hand, lips));
}

TEST(PrimingDetectorTest, LipZoneIsCenteredBetweenLips) {
  FaceObservation face(Eigen::Vector2d(0.4, 0.5), Eigen::Vector2d(0.42, 0.56));
  LipZone lips = makeLipZone(face, 0.08);
  EXPECT_NEAR(0.41, lips.center.x(), 1e-12);
  EXPECT_NEAR(0.53, lips.center.y(), 1e-12);
  EXPECT_DOUBLE_EQ(0.08, lips.radius);

  EXPECT_FALSE(makeLipZone(std::optional<FaceObservation>(), 0.08).has_value());
}

TEST(PrimingDetectorTest, DetectPrimingCombinesBothHeuristics) {
  ThresholdConfig config;
  LipZone lips(Eigen::Vector2d(0.3, 0.6), 0.08);

  // Pose alone
  PrimingResult result = detectPriming(makePrimingPoseHand(), lips, config);
  EXPECT_TRUE(result.priming);
  EXPECT_EQ(PrimingMethod::Pose, result.method);

  // Lip touch alone, hand low in the frame
  HandObservation touching = makeHand(0.5, 0.45);
  touching[INDEX_TIP] = Eigen::Vector2d(0.31, 0.61);
  result = detectPriming(touching, lips, config);
  EXPECT_TRUE(result.priming);
  EXPECT_EQ(PrimingMethod::LipTouch, result.method);

  // Neither
  result = detectPriming(makeHand(0.5, 0.45), lips, config);
  EXPECT_FALSE(result.priming);
  EXPECT_EQ(PrimingMethod::None, result.method);
}

TEST(PrimingDetectorTest, LipTouchReportedWhenBothMatch) {
  ThresholdConfig config;
  LipZone lips(Eigen::Vector2d(0.5, 0.22), 0.08);

  PrimingResult result = detectPriming(makePrimingPoseHand(), lips, config);
  EXPECT_TRUE(result.priming);
  EXPECT_EQ(PrimingMethod::LipTouch, result.method);
}

TEST(PrimingDetectorTest, WithoutFaceOnlyPoseIsChecked) {
  ThresholdConfig config;
  HandObservation touching = makeHand(0.5, 0.45);
  touching[INDEX_TIP] = Eigen::Vector2d(0.31, 0.61);

  EXPECT_FALSE(detectPriming(touching, std::nullopt, config).priming);
  EXPECT_TRUE(detectPriming(makePrimingPoseHand(), std::nullopt, config).priming);
}
