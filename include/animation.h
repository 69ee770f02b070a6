// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_ANIMATION_H_
#define TABSWIPE_ANIMATION_H_

namespace tabswipe {

enum AnimationCurve {
  kCurveLinear = 0,
  kCurveLinearOutSlowIn,
};

class AnimationClient {
 public:
  virtual ~AnimationClient() {}

  virtual void AnimationProgressed(float value) = 0;
  // Called once, after the final AnimationProgressed() call.
  virtual void AnimationEnded() = 0;
};

// Host animation clock. Animations run asynchronously: Start() returns
// immediately and the client is called back later on the same thread.
class AnimationRunner {
 public:
  virtual ~AnimationRunner() {}

  // Animates a value from |from| to |to| over |duration_ms|. Starting an
  // animation for a client that already has one running replaces it without
  // calling AnimationEnded() for the old one.
  virtual void Start(float from, float to, int duration_ms,
                     AnimationCurve curve, AnimationClient* client) = 0;
  // Stops the client's animation, if any, without calling AnimationEnded().
  virtual void Cancel(AnimationClient* client) = 0;
};

}  // namespace tabswipe

#endif  // TABSWIPE_ANIMATION_H_
