// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <string>

#include <base/basictypes.h>
#include <gtest/gtest.h>

#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/toolbar_gesture_handler.h"
#include "tabswipe/include/unittest_util.h"

using std::string;

namespace tabswipe {

class ToolbarGestureHandlerTest : public ::testing::Test {
 protected:
  ToolbarGestureHandlerTest()
      : handler_(&reg_, &store_, &browser_, &env_provider_, &preview_,
                 &content_, &runner_) {
    store_.AddTab("a", false);
    store_.AddTab("b", false);
    store_.AddTab("c", false);
    store_.Select("b");
  }

  // Starts a horizontal swipe on the middle of the toolbar. A negative |dx|
  // moves the finger left.
  bool StartHorizontal(float dx) {
    return handler_.OnSwipeStarted(MakePoint(500, 1900),
                                   MakePoint(500 + dx, 1900));
  }

  PropRegistry reg_;
  FakeTabStore store_;
  FakeBrowserDelegate browser_;
  FakeEnvironmentProvider env_provider_;
  FakePreviewSurface preview_;
  FakeContentSurface content_;
  FakeAnimationRunner runner_;
  ToolbarGestureHandler handler_;
};

TEST_F(ToolbarGestureHandlerTest, SwitchToNextTabTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  EXPECT_EQ(SettleController::kStateArmed, handler_.state());
  EXPECT_EQ(kSwipeRightToLeft, handler_.session().direction);
  // Preview of the right neighbor waits past the right edge
  EXPECT_EQ(1, preview_.load_cnt_);
  EXPECT_EQ("c", preview_.loaded_id_);
  EXPECT_FALSE(preview_.loaded_private_);
  EXPECT_FLOAT_EQ(1.0, preview_.opacity_);
  EXPECT_FLOAT_EQ(1020.0, preview_.offset_);
  EXPECT_TRUE(preview_.visible_);

  handler_.OnSwipeUpdate(150, 3);
  handler_.OnSwipeUpdate(250, -2);
  EXPECT_EQ(SettleController::kStateUpdating, handler_.state());
  EXPECT_FLOAT_EQ(-400.0, content_.offset_);
  EXPECT_FLOAT_EQ(620.0, preview_.offset_);

  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(SettleController::kStateCompleting, handler_.state());
  EXPECT_FALSE(handler_.session().armed);
  ASSERT_EQ(1U, runner_.runs_.size());
  EXPECT_FLOAT_EQ(-1020.0, runner_.runs_[0].to);
  EXPECT_TRUE(browser_.calls_.empty());

  runner_.Finish();
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("select:c", browser_.calls_[0]);
  runner_.Finish();
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  EXPECT_FALSE(preview_.visible_);
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  ASSERT_EQ(2U, browser_.calls_.size());
  EXPECT_EQ("record", browser_.calls_[1]);
}

TEST_F(ToolbarGestureHandlerTest, SwitchToPreviousTabTest) {
  ASSERT_TRUE(StartHorizontal(30));
  EXPECT_EQ("a", preview_.loaded_id_);
  EXPECT_FLOAT_EQ(-1020.0, preview_.offset_);
  handler_.OnSwipeUpdate(-100, 0);
  EXPECT_FLOAT_EQ(100.0, content_.offset_);
  EXPECT_FLOAT_EQ(-920.0, preview_.offset_);
  // Not far enough, but a fling toward the right
  handler_.OnSwipeFinished(2000, 0);
  runner_.Finish();
  runner_.Finish();
  ASSERT_EQ(2U, browser_.calls_.size());
  EXPECT_EQ("select:a", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, RtlTest) {
  env_provider_.env_.layout_direction = kLayoutRtl;
  ASSERT_TRUE(StartHorizontal(-30));
  EXPECT_EQ("a", preview_.loaded_id_);
  handler_.OnSwipeUpdate(400, 0);
  handler_.OnSwipeFinished(0, 0);
  runner_.Finish();
  runner_.Finish();
  ASSERT_FALSE(browser_.calls_.empty());
  EXPECT_EQ("select:a", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, ShortSwipeCancelsTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  handler_.OnSwipeUpdate(200, 0);
  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(SettleController::kStateCanceling, handler_.state());
  ASSERT_EQ(1U, runner_.runs_.size());
  EXPECT_FLOAT_EQ(-200.0, runner_.runs_[0].from);
  EXPECT_FLOAT_EQ(0.0, runner_.runs_[0].to);
  EXPECT_EQ(200, runner_.runs_[0].duration_ms);
  runner_.Finish();
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  EXPECT_FALSE(preview_.visible_);
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(ToolbarGestureHandlerTest, ReverseFlingCancelsTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  handler_.OnSwipeUpdate(900, 0);
  // Most of the preview is showing, but the finger flung back
  handler_.OnSwipeFinished(1000, 0);
  EXPECT_EQ(SettleController::kStateCanceling, handler_.state());
  ASSERT_EQ(1U, runner_.runs_.size());
  EXPECT_EQ(150, runner_.runs_[0].duration_ms);
  runner_.Finish();
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(ToolbarGestureHandlerTest, EndOfListOpensNewTabTest) {
  store_.Select("c");
  ASSERT_TRUE(StartHorizontal(-30));
  EXPECT_EQ(0, preview_.load_cnt_);
  EXPECT_FALSE(preview_.visible_);
  handler_.OnSwipeUpdate(400, 0);
  EXPECT_FLOAT_EQ(-200.0, content_.offset_);
  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  EXPECT_TRUE(runner_.runs_.empty());
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("newtab:focus", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, NewTabAfterCanceledSwipeTest) {
  store_.Select("c");
  // A short swipe toward "b" snaps back and leaves the preview parked past
  // the left edge
  ASSERT_TRUE(StartHorizontal(30));
  handler_.OnSwipeUpdate(-100, 0);
  handler_.OnSwipeFinished(0, 0);
  ASSERT_EQ(SettleController::kStateCanceling, handler_.state());
  runner_.Finish();
  EXPECT_FLOAT_EQ(-1020.0, preview_.offset_);
  EXPECT_TRUE(browser_.calls_.empty());

  // Swiping past the last tab still opens a new tab
  ASSERT_TRUE(StartHorizontal(-30));
  EXPECT_FLOAT_EQ(0.0, handler_.session().preview_offset);
  handler_.OnSwipeUpdate(400, 0);
  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("newtab:focus", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, StartOfListRubberBandsTest) {
  store_.Select("a");
  ASSERT_TRUE(StartHorizontal(30));
  handler_.OnSwipeUpdate(-400, 0);
  EXPECT_FLOAT_EQ(200.0, content_.offset_);
  handler_.OnSwipeFinished(0, 0);
  // Swiping toward the start of the list never opens a tab
  EXPECT_EQ(SettleController::kStateCanceling, handler_.state());
  runner_.Finish();
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(ToolbarGestureHandlerTest, TrayTest) {
  env_provider_.env_.browsing_mode = kBrowsingModePrivate;
  ASSERT_TRUE(handler_.OnSwipeStarted(MakePoint(500, 1900),
                                      MakePoint(505, 1860)));
  EXPECT_EQ(kSwipeBottomToTop, handler_.session().direction);
  EXPECT_EQ(0, preview_.load_cnt_);
  handler_.OnSwipeUpdate(0, 200);
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  handler_.OnSwipeFinished(0, -800);
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("tray:private", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, TrayWrongEdgeCancelsTest) {
  ASSERT_TRUE(handler_.OnSwipeStarted(MakePoint(500, 1860),
                                      MakePoint(500, 1900)));
  EXPECT_EQ(kSwipeTopToBottom, handler_.session().direction);
  handler_.OnSwipeUpdate(0, -50);
  handler_.OnSwipeFinished(0, 800);
  EXPECT_EQ(SettleController::kStateCanceling, handler_.state());
  runner_.Finish();
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(ToolbarGestureHandlerTest, RejectTest) {
  // Too short
  EXPECT_FALSE(StartHorizontal(-10));
  // Off the toolbar
  EXPECT_FALSE(handler_.OnSwipeStarted(MakePoint(500, 1000),
                                       MakePoint(450, 1000)));
  // Keyboard up
  env_provider_.env_.keyboard_visible = true;
  EXPECT_FALSE(StartHorizontal(-30));
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  EXPECT_EQ(0, preview_.load_cnt_);

  // Samples for a gesture that wasn't accepted are ignored
  handler_.OnSwipeUpdate(300, 0);
  handler_.OnSwipeFinished(0, 0);
  EXPECT_FLOAT_EQ(0.0, content_.offset_);
  EXPECT_TRUE(runner_.runs_.empty());
  EXPECT_TRUE(browser_.calls_.empty());
}

TEST_F(ToolbarGestureHandlerTest, GestureInsetTest) {
  env_provider_.env_.mandatory_gesture_inset_bottom = 70;
  env_provider_.env_.inset_bottom = 20;
  EXPECT_TRUE(handler_.OnSwipeStarted(MakePoint(500, 1810),
                                      MakePoint(450, 1810)));
  handler_.OnSwipeFinished(0, 0);
  runner_.Finish();

  env_provider_.env_.toolbar_position = kToolbarTop;
  EXPECT_FALSE(handler_.OnSwipeStarted(MakePoint(500, 1810),
                                       MakePoint(450, 1810)));
}

TEST_F(ToolbarGestureHandlerTest, BusyWhileSettlingTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  handler_.OnSwipeUpdate(100, 0);
  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(SettleController::kStateCanceling, handler_.state());
  EXPECT_FALSE(StartHorizontal(-30));
  runner_.Finish();
  EXPECT_TRUE(StartHorizontal(-30));
}

TEST_F(ToolbarGestureHandlerTest, DestinationReResolvedTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  handler_.OnSwipeUpdate(400, 0);
  EXPECT_FLOAT_EQ(-400.0, content_.offset_);
  // The right neighbor closes during the drag
  store_.RemoveTab("c");
  handler_.OnSwipeUpdate(300, 0);
  EXPECT_FLOAT_EQ(-200.0, content_.offset_);
  EXPECT_FLOAT_EQ(620.0, preview_.offset_);
  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(SettleController::kStateIdle, handler_.state());
  ASSERT_EQ(1U, browser_.calls_.size());
  EXPECT_EQ("newtab:focus", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, SessionFrozenAtArmTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  // Environment changes mid-gesture don't reach the session
  env_provider_.env_.layout_direction = kLayoutRtl;
  env_provider_.env_.window_width = 500;
  handler_.OnSwipeUpdate(400, 0);
  EXPECT_EQ(kLayoutLtr, handler_.session().env.layout_direction);
  EXPECT_FLOAT_EQ(1000.0, handler_.session().env.window_width);
  handler_.OnSwipeFinished(0, 0);
  runner_.Finish();
  runner_.Finish();
  ASSERT_FALSE(browser_.calls_.empty());
  EXPECT_EQ("select:c", browser_.calls_[0]);
}

TEST_F(ToolbarGestureHandlerTest, ExactlyOneEffectTest) {
  const char* kEffects[] = { "select:", "tray:", "newtab" };
  struct {
    const char* selected;
    float dx;
    float vx;
    size_t expected_effects;
  } inputs[] = {
    { "b", -30, -2000, 1 },
    { "b", -30, 2000, 0 },
    { "c", -30, 0, 1 },
    { "a", 30, 0, 0 },
  };
  for (size_t i = 0; i < arraysize(inputs); i++) {
    browser_.calls_.clear();
    store_.Select(inputs[i].selected);
    ASSERT_TRUE(StartHorizontal(inputs[i].dx));
    handler_.OnSwipeUpdate(-inputs[i].dx, 0);
    handler_.OnSwipeFinished(inputs[i].vx, 0);
    while (runner_.running())
      runner_.Finish();
    size_t effects = 0;
    for (size_t j = 0; j < browser_.calls_.size(); j++)
      for (size_t k = 0; k < arraysize(kEffects); k++)
        if (browser_.calls_[j].find(kEffects[k]) == 0)
          effects++;
    EXPECT_EQ(inputs[i].expected_effects, effects) << "i=" << i;
  }
}

TEST_F(ToolbarGestureHandlerTest, ActivityLogTest) {
  ASSERT_TRUE(StartHorizontal(-30));
  handler_.OnSwipeUpdate(400, 0);
  handler_.OnSwipeFinished(0, 0);
  ActivityLog* log = handler_.activity_log();
  ASSERT_EQ(4U, log->size());
  EXPECT_EQ(ActivityLog::kSwipeStart, log->GetEntry(0)->type);
  EXPECT_TRUE(log->GetEntry(0)->details.start.accepted);
  EXPECT_EQ(ActivityLog::kSwipeUpdate, log->GetEntry(1)->type);
  EXPECT_FLOAT_EQ(-400.0, log->GetEntry(1)->details.update.content_offset);
  EXPECT_EQ(ActivityLog::kSwipeEnd, log->GetEntry(2)->type);
  EXPECT_TRUE(log->GetEntry(2)->details.end.complete);
  EXPECT_EQ(ActivityLog::kSettle, log->GetEntry(3)->type);
  EXPECT_EQ(SettleController::kOutcomeSwitchTab,
            log->GetEntry(3)->details.settle.outcome);

  string json = handler_.EncodeActivityLog();
  EXPECT_NE(string::npos, json.find("swipeStart"));
  EXPECT_NE(string::npos, json.find("RightToLeft"));
  EXPECT_NE(string::npos, json.find("Touch Slop"));

  // Turning the log off stops recording
  EXPECT_TRUE(reg_.ApplyPropertiesFromJson(
      "{ \"Activity Log Enabled\": false }"));
  log->Clear();
  runner_.Finish();
  runner_.Finish();
  ASSERT_TRUE(StartHorizontal(-30));
  handler_.OnSwipeFinished(0, 0);
  EXPECT_EQ(0U, log->size());
}

}  // namespace tabswipe
