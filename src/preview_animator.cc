// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/preview_animator.h"

#include "tabswipe/include/logging.h"
#include "tabswipe/include/util.h"

namespace tabswipe {

namespace {

// Distance the outgoing content travels to leave the window entirely.
float TravelDistance(const GestureSession& session) {
  return session.env.window_width + session.env.preview_offset;
}

}  // namespace {}

PreviewAnimator::PreviewAnimator(PropRegistry* prop_reg)
    : overscroll_hide_percent_(prop_reg, "Overscroll Hide Percent", 0.20) {}

float PreviewAnimator::StagedPreviewOffset(const GestureSession& session) {
  switch (session.direction) {
    case kSwipeRightToLeft:
      return TravelDistance(session);
    case kSwipeLeftToRight:
      return -TravelDistance(session);
    case kSwipeTopToBottom:  // fall through
    case kSwipeBottomToTop:
      break;
  }
  return 0.0;
}

float PreviewAnimator::FinishedContentOffset(const GestureSession& session) {
  return -StagedPreviewOffset(session);
}

float PreviewAnimator::PreviewOffsetForContent(const GestureSession& session,
                                               float content_offset) {
  if (!IsHorizontal(session.direction))
    return 0.0;
  return content_offset + StagedPreviewOffset(session);
}

void PreviewAnimator::Update(const Destination& destination,
                             float dx,
                             float content_width,
                             GestureSession* session) const {
  AssertWithReturn(session);
  float travel = TravelDistance(*session);
  switch (destination.type) {
    case Destination::kDestinationTab:
      // Restrict the range of motion so that a swipe started in one
      // direction can't drag the content off the other edge.
      switch (session->direction) {
        case kSwipeRightToLeft:
          session->preview_offset =
              ClampFloat(session->preview_offset - dx, 0.0, travel);
          session->content_offset =
              ClampFloat(session->content_offset - dx, -travel, 0.0);
          break;
        case kSwipeLeftToRight:
          session->preview_offset =
              ClampFloat(session->preview_offset - dx, -travel, 0.0);
          session->content_offset =
              ClampFloat(session->content_offset - dx, 0.0, travel);
          break;
        case kSwipeTopToBottom:  // fall through
        case kSwipeBottomToTop:
          session->preview_offset = 0.0;
          session->content_offset = 0.0;
          break;
      }
      break;
    case Destination::kDestinationNone: {
      // No tab to swipe to: only slide partway to show the end of the list.
      float max_hidden = content_width * overscroll_hide_percent_.val_;
      switch (session->direction) {
        case kSwipeRightToLeft:
          session->content_offset =
              ClampFloat(session->content_offset - dx, -max_hidden, 0.0);
          break;
        case kSwipeLeftToRight:
          session->content_offset =
              ClampFloat(session->content_offset - dx, 0.0, max_hidden);
          break;
        case kSwipeTopToBottom:  // fall through
        case kSwipeBottomToTop:
          session->content_offset = 0.0;
          break;
      }
      break;
    }
    case Destination::kDestinationTray:
      break;
  }
}

}  // namespace tabswipe
