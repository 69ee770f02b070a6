// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/settle_controller.h"

#include "tabswipe/include/logging.h"
#include "tabswipe/include/preview_animator.h"

namespace tabswipe {

SettleController::SettleController(PropRegistry* prop_reg,
                                   AnimationRunner* runner,
                                   BrowserDelegate* browser,
                                   PreviewSurface* preview,
                                   ContentSurface* content)
    : runner_(runner),
      browser_(browser),
      preview_(preview),
      content_(content),
      state_(kStateIdle),
      finished_duration_(prop_reg, "Finished Gesture Animation Duration", 250),
      canceled_duration_(prop_reg, "Canceled Gesture Animation Duration", 200),
      canceled_fling_duration_(prop_reg, "Canceled Fling Animation Duration",
                               150),
      fade_duration_(prop_reg, "Preview Fade Duration", 200) {}

SettleController::~SettleController() {
  if (runner_ && (state_ == kStateCompleting ||
                  state_ == kStateFadingPreview ||
                  state_ == kStateCanceling))
    runner_->Cancel(this);
}

SettleController::Outcome SettleController::DecideOutcome(
    const GestureSession& session,
    const Destination& destination,
    bool complete) {
  switch (destination.type) {
    case Destination::kDestinationTab:
      return complete ? kOutcomeSwitchTab : kOutcomeCancel;
    case Destination::kDestinationTray: {
      // The tray opens only when swiping away from the edge the toolbar
      // is anchored to.
      ToolbarPosition position = session.env.toolbar_position;
      if ((session.direction == kSwipeTopToBottom &&
           position == kToolbarTop) ||
          (session.direction == kSwipeBottomToTop &&
           position == kToolbarBottom))
        return kOutcomeOpenTray;
      return kOutcomeCancel;
    }
    case Destination::kDestinationNone: {
      if (!complete)
        return kOutcomeCancel;
      bool ltr = session.env.layout_direction == kLayoutLtr;
      if ((session.direction == kSwipeRightToLeft && ltr) ||
          (session.direction == kSwipeLeftToRight && !ltr))
        return kOutcomeOpenNewTab;
      return kOutcomeCancel;
    }
  }
  return kOutcomeCancel;
}

const char* SettleController::OutcomeName(Outcome outcome) {
  switch (outcome) {
    case kOutcomeSwitchTab: return "SwitchTab";
    case kOutcomeOpenTray: return "OpenTray";
    case kOutcomeOpenNewTab: return "OpenNewTab";
    case kOutcomeCancel: return "Cancel";
  }
  return "Unknown";
}

void SettleController::Arm() {
  AssertWithReturn(state_ == kStateIdle);
  state_ = kStateArmed;
}

void SettleController::NoteUpdate() {
  AssertWithReturn(state_ == kStateArmed || state_ == kStateUpdating);
  state_ = kStateUpdating;
}

SettleController::Outcome SettleController::Settle(
    const GestureSession& session,
    const Destination& destination,
    bool complete,
    bool fling) {
  AssertWithReturnValue(state_ == kStateArmed || state_ == kStateUpdating,
                        kOutcomeCancel);
  session_ = session;
  destination_ = destination;
  Outcome outcome = DecideOutcome(session, destination, complete);
  switch (outcome) {
    case kOutcomeSwitchTab:
      StartSwitchToTab();
      break;
    case kOutcomeOpenTray:
      state_ = kStateIdle;
      browser_->NavigateToTray(
          session.env.browsing_mode == kBrowsingModePrivate ?
          kTrayPagePrivateTabs : kTrayPageNormalTabs);
      break;
    case kOutcomeOpenNewTab:
      state_ = kStateIdle;
      content_->set_offset(0.0);
      preview_->set_visible(false);
      browser_->NavigateToNewTab(true);
      break;
    case kOutcomeCancel:
      StartCancel(fling);
      break;
  }
  return outcome;
}

void SettleController::StartSwitchToTab() {
  state_ = kStateCompleting;
  runner_->Start(content_->offset(),
                 PreviewAnimator::FinishedContentOffset(session_),
                 finished_duration_.val_,
                 kCurveLinearOutSlowIn,
                 this);
}

void SettleController::StartCancel(bool fling) {
  state_ = kStateCanceling;
  runner_->Start(content_->offset(),
                 0.0,
                 fling ? canceled_fling_duration_.val_ :
                 canceled_duration_.val_,
                 kCurveLinearOutSlowIn,
                 this);
}

void SettleController::AnimationProgressed(float value) {
  switch (state_) {
    case kStateCompleting:  // fall through
    case kStateCanceling:
      content_->set_offset(value);
      preview_->set_offset(
          PreviewAnimator::PreviewOffsetForContent(session_, value));
      return;
    case kStateFadingPreview:
      preview_->set_opacity(value);
      return;
    default:
      break;
  }
  Err("Animation frame in state %d", state_);
}

void SettleController::AnimationEnded() {
  switch (state_) {
    case kStateCompleting:
      content_->set_offset(0.0);
      browser_->SelectTab(destination_.tab_id);
      // Fade the preview out to hide the flicker of the new tab drawing.
      state_ = kStateFadingPreview;
      runner_->Start(preview_->opacity(), 0.0, fade_duration_.val_,
                     kCurveLinear, this);
      return;
    case kStateFadingPreview:
      preview_->set_visible(false);
      state_ = kStateIdle;
      browser_->RecordToolbarTabSwipe();
      return;
    case kStateCanceling:
      preview_->set_visible(false);
      state_ = kStateIdle;
      return;
    default:
      break;
  }
  Err("Animation ended in state %d", state_);
}

}  // namespace tabswipe
