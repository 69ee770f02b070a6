// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/unittest_util.h"

#include <gtest/gtest.h>

using std::string;
using std::vector;

namespace tabswipe {

PointF MakePoint(float x, float y) {
  PointF ret = { x, y };
  return ret;
}

GestureEnvironment TestEnvironment() {
  GestureEnvironment env = GestureEnvironment();
  env.window_width = 1000.0;
  env.preview_offset = 20.0;
  env.toolbar_rect.left = 0.0;
  env.toolbar_rect.top = 1850.0;
  env.toolbar_rect.right = 1000.0;
  env.toolbar_rect.bottom = 1950.0;
  env.mandatory_gesture_inset_bottom = 0.0;
  env.inset_bottom = 0.0;
  env.keyboard_visible = false;
  env.layout_direction = kLayoutLtr;
  env.toolbar_position = kToolbarBottom;
  env.browsing_mode = kBrowsingModeNormal;
  return env;
}

void FakeTabStore::AddTab(const string& id, bool is_private) {
  TabInfo tab;
  tab.id = id;
  tab.is_private = is_private;
  tabs_.push_back(tab);
}

void FakeTabStore::RemoveTab(const string& id) {
  for (vector<TabInfo>::iterator it = tabs_.begin(); it != tabs_.end(); ++it) {
    if (it->id == id) {
      tabs_.erase(it);
      return;
    }
  }
}

bool FakeTabStore::GetSelectedTab(TabInfo* out) const {
  if (!has_selection_)
    return false;
  for (size_t i = 0; i < tabs_.size(); i++) {
    if (tabs_[i].id == selected_id_) {
      *out = tabs_[i];
      return true;
    }
  }
  out->id = selected_id_;
  out->is_private = false;
  return true;
}

void FakeTabStore::GetTabs(bool is_private, vector<TabInfo>* out) const {
  out->clear();
  for (size_t i = 0; i < tabs_.size(); i++)
    if (tabs_[i].is_private == is_private)
      out->push_back(tabs_[i]);
}

void FakeBrowserDelegate::SelectTab(const string& tab_id) {
  calls_.push_back("select:" + tab_id);
}

void FakeBrowserDelegate::NavigateToTray(TrayPage page) {
  calls_.push_back(page == kTrayPagePrivateTabs ?
                   "tray:private" : "tray:normal");
}

void FakeBrowserDelegate::NavigateToNewTab(bool focus_address_bar) {
  calls_.push_back(focus_address_bar ? "newtab:focus" : "newtab");
}

void FakeBrowserDelegate::RecordToolbarTabSwipe() {
  calls_.push_back("record");
}

void FakeAnimationRunner::Start(float from, float to, int duration_ms,
                                AnimationCurve curve,
                                AnimationClient* client) {
  Run run = { from, to, duration_ms, curve };
  runs_.push_back(run);
  client_ = client;
}

void FakeAnimationRunner::Cancel(AnimationClient* client) {
  cancel_cnt_++;
  if (client_ == client)
    client_ = NULL;
}

void FakeAnimationRunner::Step(float fraction) {
  ASSERT_TRUE(client_);
  const Run& run = runs_.back();
  client_->AnimationProgressed(run.from + (run.to - run.from) * fraction);
}

void FakeAnimationRunner::Finish() {
  ASSERT_TRUE(client_);
  AnimationClient* client = client_;
  float to = runs_.back().to;
  // The client may start its next animation from AnimationEnded().
  client_ = NULL;
  client->AnimationProgressed(to);
  client->AnimationEnded();
}

}  // namespace tabswipe
