// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_SURFACES_H_
#define TABSWIPE_SURFACES_H_

#include <string>

namespace tabswipe {

// The stand-in for the tab being swiped to. Offsets are horizontal
// translations from the surface's resting position, in pixels.
class PreviewSurface {
 public:
  virtual ~PreviewSurface() {}

  virtual void LoadThumbnail(const std::string& tab_id, bool is_private) = 0;

  virtual float opacity() const = 0;
  virtual void set_opacity(float opacity) = 0;
  virtual float offset() const = 0;
  virtual void set_offset(float offset) = 0;
  virtual bool visible() const = 0;
  virtual void set_visible(bool visible) = 0;
};

// The current page's view.
class ContentSurface {
 public:
  virtual ~ContentSurface() {}

  virtual float offset() const = 0;
  virtual void set_offset(float offset) = 0;
  virtual float width() const = 0;
};

// Returns how many pixels of a window-wide surface translated by |offset|
// fall inside the window. Not clamped: past the window edge the result is
// the negative gap to it, so a preview parked off screen stays below any
// finish threshold, 0 included.
inline float VisibleWidth(float offset, float window_width) {
  if (offset < 0)
    return offset + window_width;
  return window_width - offset;
}

}  // namespace tabswipe

#endif  // TABSWIPE_SURFACES_H_
