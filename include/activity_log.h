// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_ACTIVITY_LOG_H_
#define TABSWIPE_ACTIVITY_LOG_H_

#include "tabswipe/include/tabswipe.h"

#include <string>

#include <base/values.h>
#include <gtest/gtest.h>  // For FRIEND_TEST

// This is a class that circularly buffers the swipe samples the handler
// received and the decisions it made, so that end users can report issues
// and engineers can see why a gesture switched tabs or snapped back.

namespace tabswipe {

class PropRegistry;

class ActivityLog {
  FRIEND_TEST(ActivityLogTest, SimpleTest);
  FRIEND_TEST(ActivityLogTest, WrapAroundTest);
  FRIEND_TEST(PropRegistryTest, PropChangeTest);
 public:
  enum EntryType {
    kSwipeStart = 0,
    kSwipeUpdate,
    kSwipeEnd,
    kSettle,
    kPropChange
  };
  struct SwipeStartEntry {
    PointF start;
    PointF next;
    int direction;  // SwipeDirection
    bool accepted;
  };
  struct SwipeUpdateEntry {
    float dx, dy;
    int destination;  // Destination::Type
    float content_offset;
    float preview_offset;
  };
  struct SwipeEndEntry {
    float vx, vy;
    bool complete;
  };
  struct SettleEntry {
    int outcome;  // SettleController::Outcome
    int destination;  // Destination::Type
  };
  struct PropChangeEntry {
    const char* name;
    enum {
      kBoolProp = 0,
      kDoubleProp,
      kIntProp
    } type;
    union {
      TabswipePropBool bool_val;
      double double_val;
      int int_val;
    } value;
  };
  struct Entry {
    EntryType type;
    struct details {
      SwipeStartEntry start;  // kSwipeStart
      SwipeUpdateEntry update;  // kSwipeUpdate
      SwipeEndEntry end;  // kSwipeEnd
      SettleEntry settle;  // kSettle
      PropChangeEntry prop_change;  // kPropChange
    } details;
  };

  explicit ActivityLog(PropRegistry* prop_reg);
  void SetEnvironment(const GestureEnvironment& env);

  // Log*() functions record an argument into the buffer
  void LogSwipeStart(const SwipeStartEntry& start);
  void LogSwipeUpdate(const SwipeUpdateEntry& update);
  void LogSwipeEnd(const SwipeEndEntry& end);
  void LogSettle(const SettleEntry& settle);
  void LogPropChange(const PropChangeEntry& prop_change);

  std::string Encode();
  void Clear() { head_idx_ = size_ = 0; }

  size_t size() const { return size_; }
  size_t MaxSize() const { return kBufferSize; }
  Entry* GetEntry(size_t idx) {
    return &buffer_[(head_idx_ + idx) % kBufferSize];
  }

  static const char kKeyRoot[];
  static const char kKeyType[];
  static const char kKeySwipeStart[];
  static const char kKeySwipeUpdate[];
  static const char kKeySwipeEnd[];
  static const char kKeySettle[];
  static const char kKeyPropChange[];
  static const char kKeyStartX[];
  static const char kKeyStartY[];
  static const char kKeyNextX[];
  static const char kKeyNextY[];
  static const char kKeyDirection[];
  static const char kKeyAccepted[];
  static const char kKeyDx[];
  static const char kKeyDy[];
  static const char kKeyDestination[];
  static const char kKeyContentOffset[];
  static const char kKeyPreviewOffset[];
  static const char kKeyVx[];
  static const char kKeyVy[];
  static const char kKeyComplete[];
  static const char kKeyOutcome[];
  static const char kKeyPropChangeName[];
  static const char kKeyPropChangeValue[];
  static const char kKeyEnvironment[];
  static const char kKeyProperties[];

 private:
  // Extends the tail of the buffer by one element and returns that new element.
  // This may cause an older element to be overwritten if the buffer is full.
  Entry* PushBack();

  size_t TailIdx() const { return (head_idx_ + size_ - 1) % kBufferSize; }

  // JSON-encoders for data types
  base::DictionaryValue* EncodeSwipeStart(const SwipeStartEntry& start);
  base::DictionaryValue* EncodeSwipeUpdate(const SwipeUpdateEntry& update);
  base::DictionaryValue* EncodeSwipeEnd(const SwipeEndEntry& end);
  base::DictionaryValue* EncodeSettle(const SettleEntry& settle);
  base::DictionaryValue* EncodePropChange(const PropChangeEntry& prop_change);
  base::DictionaryValue* EncodeEnvironment() const;

  static const size_t kBufferSize = 1024;

  Entry buffer_[kBufferSize];
  size_t head_idx_;
  size_t size_;

  GestureEnvironment env_;
  PropRegistry* prop_reg_;
};

}  // namespace tabswipe

#endif  // TABSWIPE_ACTIVITY_LOG_H_
