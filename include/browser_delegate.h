// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_BROWSER_DELEGATE_H_
#define TABSWIPE_BROWSER_DELEGATE_H_

#include <string>

#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

// Side effects a finished gesture asks of the browser.
class BrowserDelegate {
 public:
  virtual ~BrowserDelegate() {}

  virtual void SelectTab(const std::string& tab_id) = 0;
  virtual void NavigateToTray(TrayPage page) = 0;
  virtual void NavigateToNewTab(bool focus_address_bar) = 0;
  // Telemetry for a completed toolbar tab switch.
  virtual void RecordToolbarTabSwipe() = 0;
};

class EnvironmentProvider {
 public:
  virtual ~EnvironmentProvider() {}

  virtual void GetEnvironment(GestureEnvironment* env) const = 0;
};

}  // namespace tabswipe

#endif  // TABSWIPE_BROWSER_DELEGATE_H_
