// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_PREVIEW_ANIMATOR_H_
#define TABSWIPE_PREVIEW_ANIMATOR_H_

#include <base/basictypes.h>

#include "tabswipe/include/destination_resolver.h"
#include "tabswipe/include/gesture_session.h"
#include "tabswipe/include/prop_registry.h"

namespace tabswipe {

// Computes where the content and preview surfaces sit while the finger is
// down and while a settle animation plays. Only the session is modified;
// the handler copies the result onto the surfaces.

class PreviewAnimator {
 public:
  explicit PreviewAnimator(PropRegistry* prop_reg);
  ~PreviewAnimator() {}

  // Offset that parks the preview just outside the window edge the swipe
  // pulls it in from.
  static float StagedPreviewOffset(const GestureSession& session);

  // Content offset once a tab switch has fully played out.
  static float FinishedContentOffset(const GestureSession& session);

  // Preview offset that keeps the preview beside content at |content_offset|
  // during a settle animation.
  static float PreviewOffsetForContent(const GestureSession& session,
                                       float content_offset);

  // Applies one drag step of |dx| pixels. |content_width| bounds the
  // rubber-band motion used when there is no tab to switch to.
  void Update(const Destination& destination,
              float dx,
              float content_width,
              GestureSession* session) const;

 private:
  // Fraction of the content that may slide away when there is no tab in the
  // swipe direction
  DoubleProperty overscroll_hide_percent_;

  DISALLOW_COPY_AND_ASSIGN(PreviewAnimator);
};

}  // namespace tabswipe

#endif  // TABSWIPE_PREVIEW_ANIMATOR_H_
