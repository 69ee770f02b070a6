// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/basictypes.h>
#include <base/logging.h>
#include <gtest/gtest.h>

#include "tabswipe/include/gesture_session.h"
#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/swipe_classifier.h"
#include "tabswipe/include/unittest_util.h"

namespace tabswipe {

class SwipeClassifierTest : public ::testing::Test {};

namespace {

GestureSession SessionAt(SwipeDirection direction, float preview_offset) {
  GestureSession session;
  session.armed = true;
  session.direction = direction;
  session.env = TestEnvironment();
  session.preview_offset = preview_offset;
  return session;
}

}  // namespace {}

TEST(SwipeClassifierTest, DirectionTest) {
  struct {
    float dx, dy;
    SwipeDirection expected;
  } inputs[] = {
    { -30, 0, kSwipeRightToLeft },
    { 30, 0, kSwipeLeftToRight },
    { 30, -29, kSwipeLeftToRight },
    { 0, 30, kSwipeTopToBottom },
    { 0, -30, kSwipeBottomToTop },
    { 5, -30, kSwipeBottomToTop },
    // Ties go vertical
    { 30, 30, kSwipeTopToBottom },
    { -30, -30, kSwipeBottomToTop },
    { 0, 0, kSwipeTopToBottom },
  };
  PointF start = MakePoint(500, 1900);
  for (size_t i = 0; i < arraysize(inputs); i++) {
    PointF next = MakePoint(start.x + inputs[i].dx, start.y + inputs[i].dy);
    EXPECT_EQ(inputs[i].expected,
              SwipeClassifier::ClassifyDirection(start, next)) << "i=" << i;
  }
}

TEST(SwipeClassifierTest, ArmTest) {
  SwipeClassifier classifier(NULL);
  GestureEnvironment env = TestEnvironment();
  PointF start = MakePoint(500, 1900);

  struct {
    float dx, dy;
    bool expected;
  } inputs[] = {
    { -30, 0, true },
    { 30, 10, true },
    { 0, -30, true },
    { 10, 40, true },
    // Within slop
    { -20, 0, false },
    { 0, 24, false },
    // Neither axis dominant
    { 30, 30, false },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    PointF next = MakePoint(start.x + inputs[i].dx, start.y + inputs[i].dy);
    EXPECT_EQ(inputs[i].expected, classifier.ShouldArm(env, start, next))
        << "i=" << i;
  }

  PointF next = MakePoint(start.x - 30, start.y);
  env.keyboard_visible = true;
  EXPECT_FALSE(classifier.ShouldArm(env, start, next));
  env.keyboard_visible = false;
  PointF outside = MakePoint(500, 1000);
  EXPECT_FALSE(classifier.ShouldArm(env, outside,
                                    MakePoint(outside.x - 30, outside.y)));
}

TEST(SwipeClassifierTest, ToolbarInsetTest) {
  GestureEnvironment env = TestEnvironment();
  env.mandatory_gesture_inset_bottom = 60;
  env.inset_bottom = 20;
  // Toolbar top at 1850 grows up by 40
  EXPECT_TRUE(SwipeClassifier::IsInToolbar(env, MakePoint(500, 1815)));
  EXPECT_TRUE(SwipeClassifier::IsInToolbar(env, MakePoint(500, 1810)));
  EXPECT_FALSE(SwipeClassifier::IsInToolbar(env, MakePoint(500, 1805)));
  EXPECT_FALSE(SwipeClassifier::IsInToolbar(env, MakePoint(500, 1950)));
  EXPECT_FALSE(SwipeClassifier::IsInToolbar(env, MakePoint(1000, 1900)));

  // A top toolbar doesn't overlap the system gesture area
  env.toolbar_position = kToolbarTop;
  env.toolbar_rect.top = 100;
  env.toolbar_rect.bottom = 200;
  EXPECT_FALSE(SwipeClassifier::IsInToolbar(env, MakePoint(500, 80)));
  EXPECT_TRUE(SwipeClassifier::IsInToolbar(env, MakePoint(500, 100)));
}

TEST(SwipeClassifierTest, VisiblePreviewFractionTest) {
  EXPECT_FLOAT_EQ(1.0, SwipeClassifier::VisiblePreviewFraction(
      SessionAt(kSwipeRightToLeft, 0)));
  EXPECT_FLOAT_EQ(0.38, SwipeClassifier::VisiblePreviewFraction(
      SessionAt(kSwipeRightToLeft, 620)));
  EXPECT_FLOAT_EQ(0.38, SwipeClassifier::VisiblePreviewFraction(
      SessionAt(kSwipeLeftToRight, -620)));
  EXPECT_GT(0.0, SwipeClassifier::VisiblePreviewFraction(
      SessionAt(kSwipeRightToLeft, 1020)));
}

TEST(SwipeClassifierTest, CompleteTest) {
  SwipeClassifier classifier(NULL);
  float fling = classifier.min_fling_velocity();

  struct {
    SwipeDirection direction;
    float preview_offset;
    float velocity;
    bool expected;
  } inputs[] = {
    // Displacement only
    { kSwipeRightToLeft, 750, 0, true },
    { kSwipeRightToLeft, 760, 0, false },
    { kSwipeRightToLeft, 620, 0, true },
    { kSwipeLeftToRight, -750, 0, true },
    { kSwipeLeftToRight, -800, 0, false },
    { kSwipeRightToLeft, 760, -(fling - 1), false },
    // Fling in the swipe direction
    { kSwipeRightToLeft, 1020, -fling, true },
    { kSwipeLeftToRight, -1020, fling, true },
    // Reverse fling, even when fully shown
    { kSwipeRightToLeft, 0, fling, false },
    { kSwipeLeftToRight, 0, -fling, false },
    { kSwipeLeftToRight, 0, -(fling - 1), true },
    // Vertical swipes don't check the sign
    { kSwipeTopToBottom, 1020, -fling, true },
    { kSwipeBottomToTop, 1020, fling, true },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    GestureSession session = SessionAt(inputs[i].direction,
                                       inputs[i].preview_offset);
    EXPECT_EQ(inputs[i].expected,
              classifier.IsComplete(session, inputs[i].velocity))
        << "i=" << i;
  }
}

TEST(SwipeClassifierTest, PropertiesTest) {
  PropRegistry reg;
  SwipeClassifier classifier(&reg);
  GestureEnvironment env = TestEnvironment();
  PointF start = MakePoint(500, 1900);
  PointF next = MakePoint(470, 1900);
  EXPECT_TRUE(classifier.ShouldArm(env, start, next));

  EXPECT_TRUE(reg.ApplyPropertiesFromJson(
      "{ \"Touch Slop\": 40, \"Gesture Finish Percent\": 0.5 }"));
  EXPECT_DOUBLE_EQ(40.0, classifier.touch_slop_.val_);
  EXPECT_DOUBLE_EQ(0.5, classifier.finish_percent_.val_);
  EXPECT_FALSE(classifier.ShouldArm(env, start, next));
  EXPECT_FALSE(classifier.IsComplete(SessionAt(kSwipeRightToLeft, 620), 0));
}

TEST(SwipeClassifierTest, ZeroFinishPercentTest) {
  PropRegistry reg;
  SwipeClassifier classifier(&reg);
  EXPECT_TRUE(reg.ApplyPropertiesFromJson(
      "{ \"Gesture Finish Percent\": 0 }"));

  struct {
    SwipeDirection direction;
    float preview_offset;
    bool expected;
  } inputs[] = {
    // Parked past the edge, as staged
    { kSwipeRightToLeft, 1020, false },
    { kSwipeLeftToRight, -1020, false },
    { kSwipeRightToLeft, 1001, false },
    // Any part on screen
    { kSwipeRightToLeft, 990, true },
    { kSwipeLeftToRight, -990, true },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    GestureSession session = SessionAt(inputs[i].direction,
                                       inputs[i].preview_offset);
    EXPECT_EQ(inputs[i].expected, classifier.IsComplete(session, 0))
        << "i=" << i;
  }
}

}  // namespace tabswipe
