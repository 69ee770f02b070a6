// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/basictypes.h>
#include <base/logging.h>
#include <gtest/gtest.h>

#include "tabswipe/include/preview_animator.h"
#include "tabswipe/include/unittest_util.h"

namespace tabswipe {

class PreviewAnimatorTest : public ::testing::Test {};

namespace {

GestureSession StagedSession(SwipeDirection direction) {
  GestureSession session;
  session.armed = true;
  session.direction = direction;
  session.env = TestEnvironment();
  session.preview_offset = PreviewAnimator::StagedPreviewOffset(session);
  return session;
}

}  // namespace {}

TEST(PreviewAnimatorTest, StagingTest) {
  GestureSession session = StagedSession(kSwipeRightToLeft);
  EXPECT_FLOAT_EQ(1020.0, session.preview_offset);
  EXPECT_FLOAT_EQ(-1020.0, PreviewAnimator::FinishedContentOffset(session));
  EXPECT_FLOAT_EQ(620.0,
                  PreviewAnimator::PreviewOffsetForContent(session, -400.0));

  session = StagedSession(kSwipeLeftToRight);
  EXPECT_FLOAT_EQ(-1020.0, session.preview_offset);
  EXPECT_FLOAT_EQ(1020.0, PreviewAnimator::FinishedContentOffset(session));
  EXPECT_FLOAT_EQ(-620.0,
                  PreviewAnimator::PreviewOffsetForContent(session, 400.0));

  session = StagedSession(kSwipeTopToBottom);
  EXPECT_FLOAT_EQ(0.0, session.preview_offset);
  EXPECT_FLOAT_EQ(0.0,
                  PreviewAnimator::PreviewOffsetForContent(session, 50.0));
}

TEST(PreviewAnimatorTest, TabRightToLeftTest) {
  PreviewAnimator animator(NULL);
  Destination tab = Destination::Tab("c", false);
  GestureSession session = StagedSession(kSwipeRightToLeft);

  struct {
    float dx;
    float expected_content;
    float expected_preview;
  } inputs[] = {
    { 100, -100, 920 },
    { 300, -400, 620 },
    // Dragging back toward the start can't pass the resting position
    { -500, 0, 1020 },
    { 200, -200, 820 },
    // Nor can the content travel further than one window plus gap
    { 5000, -1020, 0 },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    animator.Update(tab, inputs[i].dx, 1000, &session);
    EXPECT_FLOAT_EQ(inputs[i].expected_content, session.content_offset)
        << "i=" << i;
    EXPECT_FLOAT_EQ(inputs[i].expected_preview, session.preview_offset)
        << "i=" << i;
  }
}

TEST(PreviewAnimatorTest, TabLeftToRightTest) {
  PreviewAnimator animator(NULL);
  Destination tab = Destination::Tab("a", false);
  GestureSession session = StagedSession(kSwipeLeftToRight);

  animator.Update(tab, -400, 1000, &session);
  EXPECT_FLOAT_EQ(400.0, session.content_offset);
  EXPECT_FLOAT_EQ(-620.0, session.preview_offset);
  animator.Update(tab, 1000, 1000, &session);
  EXPECT_FLOAT_EQ(0.0, session.content_offset);
  EXPECT_FLOAT_EQ(-1020.0, session.preview_offset);
  animator.Update(tab, -3000, 1000, &session);
  EXPECT_FLOAT_EQ(1020.0, session.content_offset);
  EXPECT_FLOAT_EQ(0.0, session.preview_offset);
}

TEST(PreviewAnimatorTest, RubberBandTest) {
  PreviewAnimator animator(NULL);
  Destination none = Destination::None();
  GestureSession session = StagedSession(kSwipeRightToLeft);
  session.preview_offset = 0.0;

  animator.Update(none, 100, 800, &session);
  EXPECT_FLOAT_EQ(-100.0, session.content_offset);
  animator.Update(none, 400, 800, &session);
  EXPECT_FLOAT_EQ(-160.0, session.content_offset);
  animator.Update(none, -1000, 800, &session);
  EXPECT_FLOAT_EQ(0.0, session.content_offset);
  // The preview stays where it was
  EXPECT_FLOAT_EQ(0.0, session.preview_offset);

  session = StagedSession(kSwipeLeftToRight);
  animator.Update(none, -400, 1000, &session);
  EXPECT_FLOAT_EQ(200.0, session.content_offset);
  animator.Update(none, 250, 1000, &session);
  EXPECT_FLOAT_EQ(0.0, session.content_offset);
}

TEST(PreviewAnimatorTest, TrayTest) {
  PreviewAnimator animator(NULL);
  GestureSession session = StagedSession(kSwipeBottomToTop);
  session.content_offset = 0.0;
  animator.Update(Destination::Tray(), 300, 1000, &session);
  EXPECT_FLOAT_EQ(0.0, session.content_offset);
  EXPECT_FLOAT_EQ(0.0, session.preview_offset);
}

TEST(PreviewAnimatorTest, IncrementalClampTest) {
  PreviewAnimator animator(NULL);
  Destination tab = Destination::Tab("c", false);
  GestureSession session = StagedSession(kSwipeRightToLeft);

  // Motion lost to clamping is not recovered by later samples
  animator.Update(tab, -300, 1000, &session);
  EXPECT_FLOAT_EQ(0.0, session.content_offset);
  animator.Update(tab, 300, 1000, &session);
  EXPECT_FLOAT_EQ(-300.0, session.content_offset);
  EXPECT_FLOAT_EQ(720.0, session.preview_offset);
}

}  // namespace tabswipe
