// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/swipe_classifier.h"

#include <math.h>

#include "tabswipe/include/logging.h"
#include "tabswipe/include/surfaces.h"

namespace tabswipe {

SwipeClassifier::SwipeClassifier(PropRegistry* prop_reg)
    : touch_slop_(prop_reg, "Touch Slop", 24.0),
      min_fling_velocity_(prop_reg, "Minimum Fling Velocity", 150.0),
      finish_percent_(prop_reg, "Gesture Finish Percent", 0.25) {}

SwipeDirection SwipeClassifier::ClassifyDirection(const PointF& start,
                                                  const PointF& next) {
  float dx = next.x - start.x;
  float dy = next.y - start.y;
  if (fabsf(dx) > fabsf(dy))
    return dx < 0 ? kSwipeRightToLeft : kSwipeLeftToRight;
  return dy < 0 ? kSwipeBottomToTop : kSwipeTopToBottom;
}

bool SwipeClassifier::IsInToolbar(const GestureEnvironment& env,
                                  const PointF& point) {
  RectF rect = env.toolbar_rect;
  if (env.toolbar_position == kToolbarBottom)
    rect.top -= env.mandatory_gesture_inset_bottom - env.inset_bottom;
  return rect.Contains(point);
}

bool SwipeClassifier::ShouldArm(const GestureEnvironment& env,
                                const PointF& start,
                                const PointF& next) const {
  if (env.keyboard_visible || !IsInToolbar(env, start))
    return false;
  float adx = fabsf(next.x - start.x);
  float ady = fabsf(next.y - start.y);
  if (adx > touch_slop_.val_ && ady < adx)
    return true;
  if (ady > touch_slop_.val_ && adx < ady)
    return true;
  return false;
}

float SwipeClassifier::VisiblePreviewFraction(const GestureSession& session) {
  float window_width = session.env.window_width;
  AssertWithReturnValue(window_width > 0.0, 0.0);
  return VisibleWidth(session.preview_offset, window_width) / window_width;
}

bool SwipeClassifier::IsFling(float velocity) const {
  return fabsf(velocity) >= min_fling_velocity_.val_;
}

bool SwipeClassifier::IsComplete(const GestureSession& session,
                                 float velocity) const {
  bool velocity_matches_direction = true;
  switch (session.direction) {
    case kSwipeRightToLeft:
      velocity_matches_direction = velocity <= 0;
      break;
    case kSwipeLeftToRight:
      velocity_matches_direction = velocity >= 0;
      break;
    case kSwipeTopToBottom:  // fall through
    case kSwipeBottomToTop:
      break;
  }
  bool reverse_fling = IsFling(velocity) && !velocity_matches_direction;
  if (reverse_fling)
    return false;
  return VisiblePreviewFraction(session) >= finish_percent_.val_ ||
      IsFling(velocity);
}

}  // namespace tabswipe
