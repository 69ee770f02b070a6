// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_GESTURE_SESSION_H_
#define TABSWIPE_GESTURE_SESSION_H_

#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

// State of the one in-progress gesture. The handler copies the offsets onto
// the surfaces after every change.
struct GestureSession {
  GestureSession();

  void Reset();

  bool armed;
  SwipeDirection direction;
  PointF start;
  float content_offset;
  // 0, the preview covering the whole window, unless a preview was staged
  // for a tab destination.
  float preview_offset;
  // Frozen when the gesture is armed.
  GestureEnvironment env;
};

}  // namespace tabswipe

#endif  // TABSWIPE_GESTURE_SESSION_H_
