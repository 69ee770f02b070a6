// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_TAB_STORE_H_
#define TABSWIPE_TAB_STORE_H_

#include <string>
#include <vector>

namespace tabswipe {

struct TabInfo {
  std::string id;
  bool is_private;
};

// Read-only view of the browser's tab list. Implemented by the host.
class TabStore {
 public:
  virtual ~TabStore() {}

  // Fills |out| with the selected tab. Returns false if no tab is selected.
  virtual bool GetSelectedTab(TabInfo* out) const = 0;

  // Fills |out| with the tabs of one privacy partition, in tab strip order.
  virtual void GetTabs(bool is_private, std::vector<TabInfo>* out) const = 0;
};

}  // namespace tabswipe

#endif  // TABSWIPE_TAB_STORE_H_
