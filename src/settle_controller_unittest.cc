// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <string>

#include <base/basictypes.h>
#include <base/logging.h>
#include <gtest/gtest.h>

#include "tabswipe/include/preview_animator.h"
#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/settle_controller.h"
#include "tabswipe/include/unittest_util.h"

namespace tabswipe {

class SettleControllerTest : public ::testing::Test {
 protected:
  SettleControllerTest()
      : controller_(NULL, &runner_, &browser_, &preview_, &content_) {}

  GestureSession Session(SwipeDirection direction) {
    GestureSession session;
    session.armed = true;
    session.direction = direction;
    session.env = TestEnvironment();
    return session;
  }

  FakeAnimationRunner runner_;
  FakeBrowserDelegate browser_;
  FakePreviewSurface preview_;
  FakeContentSurface content_;
  SettleController controller_;
};

TEST_F(SettleControllerTest, DecideOutcomeTest) {
  Destination tab = Destination::Tab("t", false);
  Destination none = Destination::None();
  Destination tray = Destination::Tray();

  struct {
    SwipeDirection direction;
    LayoutDirection layout;
    ToolbarPosition position;
    const Destination* destination;
    bool complete;
    SettleController::Outcome expected;
  } inputs[] = {
    { kSwipeRightToLeft, kLayoutLtr, kToolbarBottom, &tab, true,
      SettleController::kOutcomeSwitchTab },
    { kSwipeLeftToRight, kLayoutRtl, kToolbarTop, &tab, true,
      SettleController::kOutcomeSwitchTab },
    { kSwipeRightToLeft, kLayoutLtr, kToolbarBottom, &tab, false,
      SettleController::kOutcomeCancel },
    // Tray only when swiping away from the toolbar's edge
    { kSwipeBottomToTop, kLayoutLtr, kToolbarBottom, &tray, false,
      SettleController::kOutcomeOpenTray },
    { kSwipeTopToBottom, kLayoutLtr, kToolbarTop, &tray, true,
      SettleController::kOutcomeOpenTray },
    { kSwipeTopToBottom, kLayoutLtr, kToolbarBottom, &tray, true,
      SettleController::kOutcomeCancel },
    { kSwipeBottomToTop, kLayoutRtl, kToolbarTop, &tray, true,
      SettleController::kOutcomeCancel },
    // New tab when swiping past the last tab in reading order
    { kSwipeRightToLeft, kLayoutLtr, kToolbarBottom, &none, true,
      SettleController::kOutcomeOpenNewTab },
    { kSwipeLeftToRight, kLayoutRtl, kToolbarBottom, &none, true,
      SettleController::kOutcomeOpenNewTab },
    { kSwipeLeftToRight, kLayoutLtr, kToolbarBottom, &none, true,
      SettleController::kOutcomeCancel },
    { kSwipeRightToLeft, kLayoutRtl, kToolbarBottom, &none, true,
      SettleController::kOutcomeCancel },
    { kSwipeRightToLeft, kLayoutLtr, kToolbarBottom, &none, false,
      SettleController::kOutcomeCancel },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    GestureSession session;
    session.direction = inputs[i].direction;
    session.env = TestEnvironment();
    session.env.layout_direction = inputs[i].layout;
    session.env.toolbar_position = inputs[i].position;
    EXPECT_EQ(inputs[i].expected,
              SettleController::DecideOutcome(session,
                                              *inputs[i].destination,
                                              inputs[i].complete))
        << "i=" << i;
  }
}

TEST_F(SettleControllerTest, SwitchTabTest) {
  GestureSession session = Session(kSwipeRightToLeft);
  session.content_offset = -400;
  session.preview_offset = 620;
  content_.offset_ = -400;
  preview_.offset_ = 620;
  preview_.opacity_ = 1.0;
  preview_.visible_ = true;

  controller_.Arm();
  controller_.NoteUpdate();
  EXPECT_EQ(SettleController::kOutcomeSwitchTab,
            controller_.Settle(session, Destination::Tab("c", false),
                               true, false));
  EXPECT_EQ(SettleController::kStateCompleting, controller_.state());
  ASSERT_EQ(1U, runner_.runs_.size());
  EXPECT_FLOAT_EQ(-400.0, runner_.runs_[0].from);
  EXPECT_FLOAT_EQ(-1020.0, runner_.runs_[0].to);
  EXPECT_EQ(250, runner_.runs_[0].duration_ms);
  EXPECT_EQ(kCurveLinearOutSlowIn, runner_.runs_[0].curve);

  // Both surfaces move together
  runner_.Step(0.5);
  EXPECT_FLOAT_EQ(-710.0, content_.offset_);
  EXPECT_FLOAT_EQ(310.0, preview_.offset_);
  EXPECT_TRUE(browser_.calls_.empty());

  runner_.Finish();
  EXPECT_EQ(SettleController::kStateFadingPreview, controller_.state());
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  EXPECT_FLOAT_EQ(0.0, preview_.offset_);
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("select:c", browser_.calls_[0]);
  ASSERT_EQ(2U, runner_.runs_.size());
  EXPECT_FLOAT_EQ(1.0, runner_.runs_[1].from);
  EXPECT_FLOAT_EQ(0.0, runner_.runs_[1].to);
  EXPECT_EQ(200, runner_.runs_[1].duration_ms);
  EXPECT_TRUE(preview_.visible_);

  runner_.Step(0.25);
  EXPECT_FLOAT_EQ(0.75, preview_.opacity_);
  runner_.Finish();
  EXPECT_TRUE(controller_.idle());
  EXPECT_FALSE(preview_.visible_);
  ASSERT_EQ(2U, browser_.calls_.size());
  EXPECT_EQ("record", browser_.calls_[1]);
  EXPECT_FALSE(runner_.running());
}

TEST_F(SettleControllerTest, CancelTest) {
  struct {
    bool fling;
    int expected_duration;
  } inputs[] = {
    { false, 200 },
    { true, 150 },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    GestureSession session = Session(kSwipeLeftToRight);
    content_.offset_ = 100;
    preview_.offset_ = -920;
    preview_.visible_ = true;

    controller_.Arm();
    EXPECT_EQ(SettleController::kOutcomeCancel,
              controller_.Settle(session, Destination::Tab("a", false),
                                 false, inputs[i].fling));
    EXPECT_EQ(SettleController::kStateCanceling, controller_.state());
    EXPECT_FLOAT_EQ(100.0, runner_.runs_.back().from);
    EXPECT_FLOAT_EQ(0.0, runner_.runs_.back().to);
    EXPECT_EQ(inputs[i].expected_duration, runner_.runs_.back().duration_ms);

    runner_.Finish();
    EXPECT_TRUE(controller_.idle());
    EXPECT_FLOAT_EQ(0.0, content_.offset_);
    EXPECT_FLOAT_EQ(-1020.0, preview_.offset_);
    EXPECT_FALSE(preview_.visible_);
  }
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(SettleControllerTest, TrayTest) {
  GestureSession session = Session(kSwipeBottomToTop);
  session.env.browsing_mode = kBrowsingModePrivate;
  controller_.Arm();
  EXPECT_EQ(SettleController::kOutcomeOpenTray,
            controller_.Settle(session, Destination::Tray(), false, false));
  EXPECT_TRUE(controller_.idle());
  EXPECT_TRUE(runner_.runs_.empty());
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("tray:private", browser_.calls_[0]);

  // Wrong edge animates back instead
  session = Session(kSwipeTopToBottom);
  controller_.Arm();
  EXPECT_EQ(SettleController::kOutcomeCancel,
            controller_.Settle(session, Destination::Tray(), true, false));
  EXPECT_EQ(SettleController::kStateCanceling, controller_.state());
  runner_.Finish();
  EXPECT_TRUE(controller_.idle());
  EXPECT_EQ(1U, browser_.calls_.size());
}

TEST_F(SettleControllerTest, NewTabTest) {
  GestureSession session = Session(kSwipeRightToLeft);
  content_.offset_ = -200;
  controller_.Arm();
  EXPECT_EQ(SettleController::kOutcomeOpenNewTab,
            controller_.Settle(session, Destination::None(), true, false));
  EXPECT_TRUE(controller_.idle());
  EXPECT_TRUE(runner_.runs_.empty());
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("newtab:focus", browser_.calls_[0]);
}

TEST_F(SettleControllerTest, SettleWithoutArmTest) {
  EXPECT_EQ(SettleController::kOutcomeCancel,
            controller_.Settle(Session(kSwipeRightToLeft),
                               Destination::Tab("c", false), true, false));
  EXPECT_TRUE(controller_.idle());
  EXPECT_TRUE(runner_.runs_.empty());
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(SettleControllerTest, DestroyWhileAnimatingTest) {
  FakeAnimationRunner runner;
  {
    SettleController controller(NULL, &runner, &browser_, &preview_,
                                &content_);
    controller.Arm();
    controller.Settle(Session(kSwipeRightToLeft), Destination::None(),
                      false, false);
    EXPECT_TRUE(runner.running());
  }
  EXPECT_FALSE(runner.running());
  EXPECT_EQ(1, runner.cancel_cnt_);
}

TEST_F(SettleControllerTest, DurationPropertiesTest) {
  PropRegistry reg;
  FakeAnimationRunner runner;
  FakeBrowserDelegate browser;
  FakePreviewSurface preview;
  FakeContentSurface content;
  SettleController controller(&reg, &runner, &browser, &preview, &content);
  EXPECT_TRUE(reg.ApplyPropertiesFromJson(
      "{ \"Canceled Gesture Animation Duration\": 320 }"));
  EXPECT_EQ(320, controller.canceled_duration_.val_);

  GestureSession session;
  session.direction = kSwipeRightToLeft;
  session.env = TestEnvironment();
  controller.Arm();
  controller.Settle(session, Destination::Tab("c", false), false, false);
  ASSERT_EQ(1U, runner.runs_.size());
  EXPECT_EQ(320, runner.runs_[0].duration_ms);
}

}  // namespace tabswipe
