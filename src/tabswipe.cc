// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

const char* SwipeDirectionName(SwipeDirection direction) {
  switch (direction) {
    case kSwipeLeftToRight: return "LeftToRight";
    case kSwipeRightToLeft: return "RightToLeft";
    case kSwipeTopToBottom: return "TopToBottom";
    case kSwipeBottomToTop: return "BottomToTop";
  }
  return "Unknown";
}

}  // namespace tabswipe
