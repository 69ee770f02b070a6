// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_SWIPE_CLASSIFIER_H_
#define TABSWIPE_SWIPE_CLASSIFIER_H_

#include <base/basictypes.h>
#include <gtest/gtest.h>  // for FRIEND_TEST

#include "tabswipe/include/gesture_session.h"
#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

// Decides whether a drag that begins on the toolbar is a tab swipe, which
// way it goes, and whether the finger was released far or fast enough to
// count.

class SwipeClassifier {
  FRIEND_TEST(SwipeClassifierTest, PropertiesTest);
 public:
  explicit SwipeClassifier(PropRegistry* prop_reg);
  ~SwipeClassifier() {}

  // Picks the dominant axis of the first displacement. Ties go vertical.
  static SwipeDirection ClassifyDirection(const PointF& start,
                                          const PointF& next);

  // Returns true if the gesture from |start| to |next| should be consumed.
  bool ShouldArm(const GestureEnvironment& env,
                 const PointF& start,
                 const PointF& next) const;

  // The toolbar rect, grown upward by the part of the system gesture area
  // that overlaps a bottom toolbar.
  static bool IsInToolbar(const GestureEnvironment& env, const PointF& point);

  // Fraction of the window the preview covers at the session's offset.
  static float VisiblePreviewFraction(const GestureSession& session);

  bool IsFling(float velocity) const;

  // A reverse fling is never complete. Otherwise the gesture is complete if
  // enough of the preview is showing or the release was a fling.
  bool IsComplete(const GestureSession& session, float velocity) const;

  double min_fling_velocity() const { return min_fling_velocity_.val_; }

 private:
  // Minimum travel along the dominant axis before a drag is a swipe, px
  DoubleProperty touch_slop_;
  // Release speed at or above which a swipe is a fling, px/s
  DoubleProperty min_fling_velocity_;
  // Fraction of the preview that must show to finish without a fling
  DoubleProperty finish_percent_;

  DISALLOW_COPY_AND_ASSIGN(SwipeClassifier);
};

}  // namespace tabswipe

#endif  // TABSWIPE_SWIPE_CLASSIFIER_H_
