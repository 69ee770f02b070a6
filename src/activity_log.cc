// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/activity_log.h"

#include <string>

#include <base/json/json_writer.h>
#include <base/stringprintf.h>
#include <base/values.h>

#include "tabswipe/include/logging.h"
#include "tabswipe/include/prop_registry.h"

using base::DictionaryValue;
using base::FundamentalValue;
using base::ListValue;
using base::StringValue;
using base::Value;
using std::string;

namespace tabswipe {

ActivityLog::ActivityLog(PropRegistry* prop_reg)
    : head_idx_(0), size_(0), env_(), prop_reg_(prop_reg) {}

void ActivityLog::SetEnvironment(const GestureEnvironment& env) {
  env_ = env;
}

void ActivityLog::LogSwipeStart(const SwipeStartEntry& start) {
  Entry* entry = PushBack();
  entry->type = kSwipeStart;
  entry->details.start = start;
}

void ActivityLog::LogSwipeUpdate(const SwipeUpdateEntry& update) {
  Entry* entry = PushBack();
  entry->type = kSwipeUpdate;
  entry->details.update = update;
}

void ActivityLog::LogSwipeEnd(const SwipeEndEntry& end) {
  Entry* entry = PushBack();
  entry->type = kSwipeEnd;
  entry->details.end = end;
}

void ActivityLog::LogSettle(const SettleEntry& settle) {
  Entry* entry = PushBack();
  entry->type = kSettle;
  entry->details.settle = settle;
}

void ActivityLog::LogPropChange(const PropChangeEntry& prop_change) {
  Entry* entry = PushBack();
  entry->type = kPropChange;
  entry->details.prop_change = prop_change;
}

ActivityLog::Entry* ActivityLog::PushBack() {
  if (size_ == kBufferSize) {
    Entry* ret = &buffer_[head_idx_];
    head_idx_ = (head_idx_ + 1) % kBufferSize;
    return ret;
  }
  ++size_;
  return &buffer_[TailIdx()];
}

DictionaryValue* ActivityLog::EncodeSwipeStart(const SwipeStartEntry& start) {
  DictionaryValue* ret = new DictionaryValue;
  ret->Set(kKeyType, new StringValue(kKeySwipeStart));
  ret->Set(kKeyStartX, new FundamentalValue(start.start.x));
  ret->Set(kKeyStartY, new FundamentalValue(start.start.y));
  ret->Set(kKeyNextX, new FundamentalValue(start.next.x));
  ret->Set(kKeyNextY, new FundamentalValue(start.next.y));
  ret->Set(kKeyDirection, new StringValue(SwipeDirectionName(
      static_cast<SwipeDirection>(start.direction))));
  ret->Set(kKeyAccepted, new FundamentalValue(start.accepted));
  return ret;
}

DictionaryValue* ActivityLog::EncodeSwipeUpdate(
    const SwipeUpdateEntry& update) {
  DictionaryValue* ret = new DictionaryValue;
  ret->Set(kKeyType, new StringValue(kKeySwipeUpdate));
  ret->Set(kKeyDx, new FundamentalValue(update.dx));
  ret->Set(kKeyDy, new FundamentalValue(update.dy));
  ret->Set(kKeyDestination, new FundamentalValue(update.destination));
  ret->Set(kKeyContentOffset, new FundamentalValue(update.content_offset));
  ret->Set(kKeyPreviewOffset, new FundamentalValue(update.preview_offset));
  return ret;
}

DictionaryValue* ActivityLog::EncodeSwipeEnd(const SwipeEndEntry& end) {
  DictionaryValue* ret = new DictionaryValue;
  ret->Set(kKeyType, new StringValue(kKeySwipeEnd));
  ret->Set(kKeyVx, new FundamentalValue(end.vx));
  ret->Set(kKeyVy, new FundamentalValue(end.vy));
  ret->Set(kKeyComplete, new FundamentalValue(end.complete));
  return ret;
}

DictionaryValue* ActivityLog::EncodeSettle(const SettleEntry& settle) {
  DictionaryValue* ret = new DictionaryValue;
  ret->Set(kKeyType, new StringValue(kKeySettle));
  ret->Set(kKeyOutcome, new FundamentalValue(settle.outcome));
  ret->Set(kKeyDestination, new FundamentalValue(settle.destination));
  return ret;
}

DictionaryValue* ActivityLog::EncodePropChange(
    const PropChangeEntry& prop_change) {
  DictionaryValue* ret = new DictionaryValue;
  ret->Set(kKeyType, new StringValue(kKeyPropChange));
  ret->Set(kKeyPropChangeName, new StringValue(prop_change.name));
  Value* val = NULL;
  switch (prop_change.type) {
    case PropChangeEntry::kBoolProp:
      val = new FundamentalValue(static_cast<bool>(
          prop_change.value.bool_val));
      break;
    case PropChangeEntry::kDoubleProp:
      val = new FundamentalValue(prop_change.value.double_val);
      break;
    case PropChangeEntry::kIntProp:
      val = new FundamentalValue(prop_change.value.int_val);
      break;
    default:
      Err("Unknown prop change type %d", prop_change.type);
      val = new StringValue(base::StringPrintf("Unhandled %d",
                                               prop_change.type));
      break;
  }
  ret->Set(kKeyPropChangeValue, val);
  return ret;
}

DictionaryValue* ActivityLog::EncodeEnvironment() const {
  DictionaryValue* ret = new DictionaryValue;
  ret->Set("windowWidth", new FundamentalValue(env_.window_width));
  ret->Set("previewOffset", new FundamentalValue(env_.preview_offset));
  ret->Set("toolbarLeft", new FundamentalValue(env_.toolbar_rect.left));
  ret->Set("toolbarTop", new FundamentalValue(env_.toolbar_rect.top));
  ret->Set("toolbarRight", new FundamentalValue(env_.toolbar_rect.right));
  ret->Set("toolbarBottom", new FundamentalValue(env_.toolbar_rect.bottom));
  ret->Set("mandatoryGestureInsetBottom",
           new FundamentalValue(env_.mandatory_gesture_inset_bottom));
  ret->Set("insetBottom", new FundamentalValue(env_.inset_bottom));
  ret->Set("keyboardVisible", new FundamentalValue(env_.keyboard_visible));
  ret->Set("rtl", new FundamentalValue(env_.layout_direction == kLayoutRtl));
  ret->Set("bottomToolbar",
           new FundamentalValue(env_.toolbar_position == kToolbarBottom));
  ret->Set("private",
           new FundamentalValue(env_.browsing_mode == kBrowsingModePrivate));
  return ret;
}

string ActivityLog::Encode() {
  DictionaryValue* root = new DictionaryValue;
  ListValue* entries = new ListValue;
  for (size_t i = 0; i < size_; ++i) {
    const Entry& entry = buffer_[(i + head_idx_) % kBufferSize];
    switch (entry.type) {
      case kSwipeStart:
        entries->Append(EncodeSwipeStart(entry.details.start));
        continue;
      case kSwipeUpdate:
        entries->Append(EncodeSwipeUpdate(entry.details.update));
        continue;
      case kSwipeEnd:
        entries->Append(EncodeSwipeEnd(entry.details.end));
        continue;
      case kSettle:
        entries->Append(EncodeSettle(entry.details.settle));
        continue;
      case kPropChange:
        entries->Append(EncodePropChange(entry.details.prop_change));
        continue;
    }
    Err("Unknown entry type %d", entry.type);
  }
  root->Set("version", new FundamentalValue(1));
  root->Set(kKeyRoot, entries);
  root->Set(kKeyEnvironment, EncodeEnvironment());
  if (prop_reg_)
    root->Set(kKeyProperties, prop_reg_->EncodeProperties());

  string out;
  base::JSONWriter::Write(root, true, &out);
  delete root;
  return out;
}

const char ActivityLog::kKeyRoot[] = "entries";
const char ActivityLog::kKeyType[] = "type";
const char ActivityLog::kKeySwipeStart[] = "swipeStart";
const char ActivityLog::kKeySwipeUpdate[] = "swipeUpdate";
const char ActivityLog::kKeySwipeEnd[] = "swipeEnd";
const char ActivityLog::kKeySettle[] = "settle";
const char ActivityLog::kKeyPropChange[] = "propertyChange";
const char ActivityLog::kKeyStartX[] = "startX";
const char ActivityLog::kKeyStartY[] = "startY";
const char ActivityLog::kKeyNextX[] = "nextX";
const char ActivityLog::kKeyNextY[] = "nextY";
const char ActivityLog::kKeyDirection[] = "direction";
const char ActivityLog::kKeyAccepted[] = "accepted";
const char ActivityLog::kKeyDx[] = "dx";
const char ActivityLog::kKeyDy[] = "dy";
const char ActivityLog::kKeyDestination[] = "destination";
const char ActivityLog::kKeyContentOffset[] = "contentOffset";
const char ActivityLog::kKeyPreviewOffset[] = "previewOffset";
const char ActivityLog::kKeyVx[] = "vx";
const char ActivityLog::kKeyVy[] = "vy";
const char ActivityLog::kKeyComplete[] = "complete";
const char ActivityLog::kKeyOutcome[] = "outcome";
const char ActivityLog::kKeyPropChangeName[] = "name";
const char ActivityLog::kKeyPropChangeValue[] = "value";
const char ActivityLog::kKeyEnvironment[] = "environment";
const char ActivityLog::kKeyProperties[] = "properties";

}  // namespace tabswipe
