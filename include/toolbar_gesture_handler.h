// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_TOOLBAR_GESTURE_HANDLER_H_
#define TABSWIPE_TOOLBAR_GESTURE_HANDLER_H_

#include <string>

#include <base/basictypes.h>

#include "tabswipe/include/activity_log.h"
#include "tabswipe/include/animation.h"
#include "tabswipe/include/browser_delegate.h"
#include "tabswipe/include/destination_resolver.h"
#include "tabswipe/include/gesture_session.h"
#include "tabswipe/include/preview_animator.h"
#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/settle_controller.h"
#include "tabswipe/include/surfaces.h"
#include "tabswipe/include/swipe_classifier.h"
#include "tabswipe/include/tab_store.h"

namespace tabswipe {

// Callbacks from the raw touch recognizer. Calls arrive in order on one
// thread: one OnSwipeStarted(), then, only if it returned true, any number
// of OnSwipeUpdate() calls and one OnSwipeFinished().
class SwipeGestureListener {
 public:
  virtual ~SwipeGestureListener() {}

  // |start| is the first contact and |next| the first sample past it.
  // Returns true to consume the gesture.
  virtual bool OnSwipeStarted(const PointF& start, const PointF& next) = 0;
  // Distance scrolled since the previous sample: previous position minus
  // current position, so a finger moving left gives a positive
  // |distance_x|.
  virtual void OnSwipeUpdate(float distance_x, float distance_y) = 0;
  // Release velocity in px/s, positive toward the right and bottom.
  virtual void OnSwipeFinished(float velocity_x, float velocity_y) = 0;
};

// Turns drags on the toolbar into tab switches, the tab tray or a new tab,
// moving the page and a preview of the destination tab under the finger.

class ToolbarGestureHandler : public SwipeGestureListener {
 public:
  // Does not take ownership of any argument. |prop_reg| may be NULL, in
  // which case built-in defaults are used.
  ToolbarGestureHandler(PropRegistry* prop_reg,
                        const TabStore* store,
                        BrowserDelegate* browser,
                        EnvironmentProvider* env_provider,
                        PreviewSurface* preview,
                        ContentSurface* content,
                        AnimationRunner* runner);
  virtual ~ToolbarGestureHandler();

  // SwipeGestureListener:
  virtual bool OnSwipeStarted(const PointF& start, const PointF& next);
  virtual void OnSwipeUpdate(float distance_x, float distance_y);
  virtual void OnSwipeFinished(float velocity_x, float velocity_y);

  SettleController::State state() const { return settle_.state(); }
  const GestureSession& session() const { return session_; }

  std::string EncodeActivityLog() { return log_.Encode(); }
  ActivityLog* activity_log() { return &log_; }

 private:
  Destination CurrentDestination() const;
  void PreparePreview(const Destination& destination);
  void ApplySessionToSurfaces(const Destination& destination);
  bool logging_enabled() const { return logging_enabled_.val_ != 0; }

  PropRegistry* prop_reg_;
  EnvironmentProvider* env_provider_;
  PreviewSurface* preview_;
  ContentSurface* content_;

  ActivityLog log_;
  BoolProperty logging_enabled_;

  SwipeClassifier classifier_;
  DestinationResolver resolver_;
  PreviewAnimator animator_;
  SettleController settle_;

  GestureSession session_;

  DISALLOW_COPY_AND_ASSIGN(ToolbarGestureHandler);
};

}  // namespace tabswipe

#endif  // TABSWIPE_TOOLBAR_GESTURE_HANDLER_H_
