// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_UTIL_H_
#define TABSWIPE_UTIL_H_

#include <algorithm>

namespace tabswipe {

// Clamps |value| into [lo, hi]. |lo| must not exceed |hi|.
inline float ClampFloat(float value, float lo, float hi) {
  return std::max(lo, std::min(hi, value));
}

}  // namespace tabswipe

#endif  // TABSWIPE_UTIL_H_
