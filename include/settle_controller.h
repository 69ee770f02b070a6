// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_SETTLE_CONTROLLER_H_
#define TABSWIPE_SETTLE_CONTROLLER_H_

#include <base/basictypes.h>
#include <gtest/gtest.h>  // for FRIEND_TEST

#include "tabswipe/include/animation.h"
#include "tabswipe/include/browser_delegate.h"
#include "tabswipe/include/destination_resolver.h"
#include "tabswipe/include/gesture_session.h"
#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/surfaces.h"

namespace tabswipe {

// Owns the gesture state machine:
//
//   Idle -> Armed -> (Updating)* -> Completing -> FadingPreview -> Idle
//                                \-> Canceling -> Idle
//                                \-> Idle (tray or new tab)
//
// A finished gesture's side effect runs once, after the animation that
// leads up to it ends. Each step of a tab switch starts only when the
// previous animation reports that it ended.

class SettleController : public AnimationClient {
  FRIEND_TEST(SettleControllerTest, DurationPropertiesTest);
 public:
  enum State {
    kStateIdle = 0,
    kStateArmed,
    kStateUpdating,
    kStateCompleting,
    kStateFadingPreview,
    kStateCanceling,
  };

  enum Outcome {
    kOutcomeSwitchTab = 0,
    kOutcomeOpenTray,
    kOutcomeOpenNewTab,
    kOutcomeCancel,
  };

  // Does not take ownership of any argument. |prop_reg| may be NULL.
  SettleController(PropRegistry* prop_reg,
                   AnimationRunner* runner,
                   BrowserDelegate* browser,
                   PreviewSurface* preview,
                   ContentSurface* content);
  virtual ~SettleController();

  static Outcome DecideOutcome(const GestureSession& session,
                               const Destination& destination,
                               bool complete);
  static const char* OutcomeName(Outcome outcome);

  void Arm();
  void NoteUpdate();

  // Ends the gesture described by |session|. |fling| selects the shorter
  // cancel animation.
  Outcome Settle(const GestureSession& session,
                 const Destination& destination,
                 bool complete,
                 bool fling);

  State state() const { return state_; }
  bool idle() const { return state_ == kStateIdle; }

  // AnimationClient:
  virtual void AnimationProgressed(float value);
  virtual void AnimationEnded();

 private:
  void StartSwitchToTab();
  void StartCancel(bool fling);

  AnimationRunner* runner_;
  BrowserDelegate* browser_;
  PreviewSurface* preview_;
  ContentSurface* content_;

  State state_;
  // Copies of the finished gesture, used by animation callbacks.
  GestureSession session_;
  Destination destination_;

  // Animation durations, ms
  IntProperty finished_duration_;
  IntProperty canceled_duration_;
  IntProperty canceled_fling_duration_;
  IntProperty fade_duration_;

  DISALLOW_COPY_AND_ASSIGN(SettleController);
};

}  // namespace tabswipe

#endif  // TABSWIPE_SETTLE_CONTROLLER_H_
