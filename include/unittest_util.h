// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_UNITTEST_UTIL_H_
#define TABSWIPE_UNITTEST_UTIL_H_

#include <string>
#include <vector>

#include "tabswipe/include/animation.h"
#include "tabswipe/include/browser_delegate.h"
#include "tabswipe/include/surfaces.h"
#include "tabswipe/include/tab_store.h"
#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

// In-memory stand-ins for the host collaborators, for unit tests.

PointF MakePoint(float x, float y);

// 1000px wide window, 20px preview gap, bottom toolbar spanning y in
// [1850, 1950), no insets, LTR, normal browsing.
GestureEnvironment TestEnvironment();

class FakeTabStore : public TabStore {
 public:
  FakeTabStore() : has_selection_(false) {}

  void AddTab(const std::string& id, bool is_private);
  void RemoveTab(const std::string& id);
  // The selected tab need not be in the list.
  void Select(const std::string& id) {
    selected_id_ = id;
    has_selection_ = true;
  }
  void ClearSelection() { has_selection_ = false; }

  virtual bool GetSelectedTab(TabInfo* out) const;
  virtual void GetTabs(bool is_private, std::vector<TabInfo>* out) const;

  std::vector<TabInfo> tabs_;
  std::string selected_id_;
  bool has_selection_;
};

class FakePreviewSurface : public PreviewSurface {
 public:
  FakePreviewSurface()
      : opacity_(0.0), offset_(0.0), visible_(false), load_cnt_(0),
        loaded_private_(false) {}

  virtual void LoadThumbnail(const std::string& tab_id, bool is_private) {
    load_cnt_++;
    loaded_id_ = tab_id;
    loaded_private_ = is_private;
  }
  virtual float opacity() const { return opacity_; }
  virtual void set_opacity(float opacity) { opacity_ = opacity; }
  virtual float offset() const { return offset_; }
  virtual void set_offset(float offset) { offset_ = offset; }
  virtual bool visible() const { return visible_; }
  virtual void set_visible(bool visible) { visible_ = visible; }

  float opacity_;
  float offset_;
  bool visible_;
  int load_cnt_;
  std::string loaded_id_;
  bool loaded_private_;
};

class FakeContentSurface : public ContentSurface {
 public:
  FakeContentSurface() : offset_(0.0), width_(1000.0) {}

  virtual float offset() const { return offset_; }
  virtual void set_offset(float offset) { offset_ = offset; }
  virtual float width() const { return width_; }

  float offset_;
  float width_;
};

// Records every call as a string, e.g. "select:b", "tray:private",
// "newtab:focus", "record".
class FakeBrowserDelegate : public BrowserDelegate {
 public:
  virtual void SelectTab(const std::string& tab_id);
  virtual void NavigateToTray(TrayPage page);
  virtual void NavigateToNewTab(bool focus_address_bar);
  virtual void RecordToolbarTabSwipe();

  std::vector<std::string> calls_;
};

class FakeEnvironmentProvider : public EnvironmentProvider {
 public:
  FakeEnvironmentProvider() : env_(TestEnvironment()) {}

  virtual void GetEnvironment(GestureEnvironment* env) const { *env = env_; }

  GestureEnvironment env_;
};

// Animations advance only when the test calls Step() or Finish().
class FakeAnimationRunner : public AnimationRunner {
 public:
  struct Run {
    float from, to;
    int duration_ms;
    AnimationCurve curve;
  };

  FakeAnimationRunner() : client_(NULL), cancel_cnt_(0) {}

  virtual void Start(float from, float to, int duration_ms,
                     AnimationCurve curve, AnimationClient* client);
  virtual void Cancel(AnimationClient* client);

  bool running() const { return client_ != NULL; }
  // Reports the value |fraction| of the way through the running animation.
  void Step(float fraction);
  // Reports the end value, then ends the running animation.
  void Finish();

  std::vector<Run> runs_;
  AnimationClient* client_;
  int cancel_cnt_;
};

}  // namespace tabswipe

#endif  // TABSWIPE_UNITTEST_UTIL_H_
