// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_DESTINATION_RESOLVER_H_
#define TABSWIPE_DESTINATION_RESOLVER_H_

#include <string>

#include <base/basictypes.h>

#include "tabswipe/include/tab_store.h"
#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

// What a gesture currently targets. |tab_id| and |is_private| are only
// meaningful for kDestinationTab.
struct Destination {
  enum Type {
    kDestinationNone = 0,
    kDestinationTab,
    kDestinationTray,
  };

  Destination() : type(kDestinationNone), is_private(false) {}

  static Destination None() { return Destination(); }
  static Destination Tray() {
    Destination ret;
    ret.type = kDestinationTray;
    return ret;
  }
  static Destination Tab(const std::string& tab_id, bool is_private) {
    Destination ret;
    ret.type = kDestinationTab;
    ret.tab_id = tab_id;
    ret.is_private = is_private;
    return ret;
  }

  bool operator==(const Destination& that) const {
    if (type != that.type)
      return false;
    if (type != kDestinationTab)
      return true;
    return tab_id == that.tab_id && is_private == that.is_private;
  }
  bool operator!=(const Destination& that) const { return !(*this == that); }

  std::string String() const;

  Type type;
  std::string tab_id;
  bool is_private;
};

// Maps a swipe direction to the neighboring tab it targets. Swiping right to
// left moves to the next tab in reading order, so the index arithmetic is
// mirrored for right-to-left layouts while the on-screen motion is not.
class DestinationResolver {
 public:
  // Does not take ownership of |store|.
  explicit DestinationResolver(const TabStore* store) : store_(store) {}

  Destination Resolve(SwipeDirection direction, LayoutDirection layout) const;

  // Index in the selected tab's partition targeted by a horizontal swipe.
  // May be out of range.
  static int TargetIndex(SwipeDirection direction, LayoutDirection layout,
                         int current_index);

 private:
  const TabStore* store_;

  DISALLOW_COPY_AND_ASSIGN(DestinationResolver);
};

}  // namespace tabswipe

#endif  // TABSWIPE_DESTINATION_RESOLVER_H_
