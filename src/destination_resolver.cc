// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/destination_resolver.h"

#include <vector>

#include <base/stringprintf.h>

#include "tabswipe/include/logging.h"

using std::string;
using std::vector;

namespace tabswipe {

string Destination::String() const {
  switch (type) {
    case kDestinationNone:
      return "(Destination: none)";
    case kDestinationTray:
      return "(Destination: tray)";
    case kDestinationTab:
      return base::StringPrintf("(Destination: tab %s private: %d)",
                                tab_id.c_str(), is_private);
  }
  return "(Destination: unknown)";
}

int DestinationResolver::TargetIndex(SwipeDirection direction,
                                     LayoutDirection layout,
                                     int current_index) {
  bool ltr = layout == kLayoutLtr;
  switch (direction) {
    case kSwipeRightToLeft:
      return ltr ? current_index + 1 : current_index - 1;
    case kSwipeLeftToRight:
      return ltr ? current_index - 1 : current_index + 1;
    case kSwipeTopToBottom:  // fall through
    case kSwipeBottomToTop:
      break;
  }
  return current_index;
}

Destination DestinationResolver::Resolve(SwipeDirection direction,
                                         LayoutDirection layout) const {
  if (!IsHorizontal(direction))
    return Destination::Tray();
  AssertWithReturnValue(store_, Destination::None());

  TabInfo current;
  if (!store_->GetSelectedTab(&current))
    return Destination::None();

  vector<TabInfo> tabs;
  store_->GetTabs(current.is_private, &tabs);
  int current_index = -1;
  for (size_t i = 0; i < tabs.size(); i++) {
    if (tabs[i].id == current.id) {
      current_index = static_cast<int>(i);
      break;
    }
  }
  if (current_index < 0)
    return Destination::None();

  int index = TargetIndex(direction, layout, current_index);
  if (index < 0 || index >= static_cast<int>(tabs.size()))
    return Destination::None();
  return Destination::Tab(tabs[index].id, tabs[index].is_private);
}

}  // namespace tabswipe
