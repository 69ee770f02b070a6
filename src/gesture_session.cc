// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/gesture_session.h"

namespace tabswipe {

GestureSession::GestureSession() {
  Reset();
}

void GestureSession::Reset() {
  armed = false;
  direction = kSwipeLeftToRight;
  start.x = start.y = 0.0;
  content_offset = 0.0;
  preview_offset = 0.0;
  env = GestureEnvironment();
}

}  // namespace tabswipe
