// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/toolbar_gesture_handler.h"

#include "tabswipe/include/logging.h"

namespace tabswipe {

ToolbarGestureHandler::ToolbarGestureHandler(PropRegistry* prop_reg,
                                             const TabStore* store,
                                             BrowserDelegate* browser,
                                             EnvironmentProvider* env_provider,
                                             PreviewSurface* preview,
                                             ContentSurface* content,
                                             AnimationRunner* runner)
    : prop_reg_(prop_reg),
      env_provider_(env_provider),
      preview_(preview),
      content_(content),
      log_(prop_reg),
      logging_enabled_(prop_reg, "Activity Log Enabled", 1),
      classifier_(prop_reg),
      resolver_(store),
      animator_(prop_reg),
      settle_(prop_reg, runner, browser, preview, content) {
  if (prop_reg && !prop_reg->activity_log())
    prop_reg->set_activity_log(&log_);
}

ToolbarGestureHandler::~ToolbarGestureHandler() {
  if (prop_reg_ && prop_reg_->activity_log() == &log_)
    prop_reg_->set_activity_log(NULL);
}

Destination ToolbarGestureHandler::CurrentDestination() const {
  return resolver_.Resolve(session_.direction,
                           session_.env.layout_direction);
}

bool ToolbarGestureHandler::OnSwipeStarted(const PointF& start,
                                           const PointF& next) {
  if (!settle_.idle()) {
    Err("Swipe started while the previous one is settling (state %d)",
        settle_.state());
    return false;
  }
  GestureEnvironment env = GestureEnvironment();
  env_provider_->GetEnvironment(&env);
  SwipeDirection direction = SwipeClassifier::ClassifyDirection(start, next);
  bool accepted = classifier_.ShouldArm(env, start, next);
  if (logging_enabled()) {
    log_.SetEnvironment(env);
    ActivityLog::SwipeStartEntry entry = { start, next, direction, accepted };
    log_.LogSwipeStart(entry);
  }
  if (!accepted)
    return false;

  session_.Reset();
  session_.armed = true;
  session_.direction = direction;
  session_.start = start;
  session_.env = env;
  session_.content_offset = content_->offset();
  // Only a staged preview moves off its resting offset. Whatever offset the
  // previous gesture left on the surface does not carry over.
  session_.preview_offset = 0.0;
  settle_.Arm();
  if (IsHorizontal(direction))
    PreparePreview(CurrentDestination());
  return true;
}

void ToolbarGestureHandler::PreparePreview(const Destination& destination) {
  if (destination.type != Destination::kDestinationTab)
    return;
  preview_->LoadThumbnail(destination.tab_id, destination.is_private);
  preview_->set_opacity(1.0);
  session_.preview_offset = PreviewAnimator::StagedPreviewOffset(session_);
  preview_->set_offset(session_.preview_offset);
  preview_->set_visible(true);
}

void ToolbarGestureHandler::ApplySessionToSurfaces(
    const Destination& destination) {
  switch (destination.type) {
    case Destination::kDestinationTab:
      preview_->set_offset(session_.preview_offset);
      content_->set_offset(session_.content_offset);
      break;
    case Destination::kDestinationNone:
      content_->set_offset(session_.content_offset);
      break;
    case Destination::kDestinationTray:
      break;
  }
}

void ToolbarGestureHandler::OnSwipeUpdate(float distance_x,
                                          float distance_y) {
  AssertWithReturn(session_.armed);
  // The tab list may change during the drag, so resolve again.
  Destination destination = CurrentDestination();
  animator_.Update(destination, distance_x, content_->width(), &session_);
  ApplySessionToSurfaces(destination);
  settle_.NoteUpdate();
  if (logging_enabled()) {
    ActivityLog::SwipeUpdateEntry entry = {
      distance_x, distance_y, destination.type,
      session_.content_offset, session_.preview_offset
    };
    log_.LogSwipeUpdate(entry);
  }
}

void ToolbarGestureHandler::OnSwipeFinished(float velocity_x,
                                            float velocity_y) {
  AssertWithReturn(session_.armed);
  Destination destination = CurrentDestination();
  bool complete = classifier_.IsComplete(session_, velocity_x);
  bool fling = classifier_.IsFling(velocity_x);
  if (logging_enabled()) {
    ActivityLog::SwipeEndEntry entry = { velocity_x, velocity_y, complete };
    log_.LogSwipeEnd(entry);
  }
  SettleController::Outcome outcome =
      settle_.Settle(session_, destination, complete, fling);
  Log("Swipe %s to %s settled: %s",
      SwipeDirectionName(session_.direction),
      destination.String().c_str(),
      SettleController::OutcomeName(outcome));
  if (logging_enabled()) {
    ActivityLog::SettleEntry entry = { outcome, destination.type };
    log_.LogSettle(entry);
  }
  session_.Reset();
}

}  // namespace tabswipe
