// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_TABSWIPE_H__
#define TABSWIPE_TABSWIPE_H__

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// C API:

// external logging interface
#define TABSWIPE_LOG_ERROR 0
#define TABSWIPE_LOG_INFO 1

// this function has to be provided by the user of the library.
void tabswipe_log(int verb, const char* format, ...)
    __attribute__((format(printf, 2, 3)));

// Tabswipe Property Provider Interface
struct TabswipeProp;
typedef struct TabswipeProp TabswipeProp;

typedef int TabswipePropBool;

// These functions create a named property of given type.
//   data - data used by PropProvider
//   loc - location of a variable to be updated by PropProvider.
//         Set to NULL to create a ReadOnly property
//   init - initial value for the property.
//          If the PropProvider has an alternate configuration source, it may
//          override this initial value, in which case *loc returns the
//          value from the configuration source.
typedef TabswipeProp* (*TabswipePropCreateInt)(void* data, const char* name,
                                               int* loc, const int init);

typedef TabswipeProp* (*TabswipePropCreateBool)(void* data, const char* name,
                                                TabswipePropBool* loc,
                                                const TabswipePropBool init);

typedef TabswipeProp* (*TabswipePropCreateReal)(void* data, const char* name,
                                                double* loc, const double init);

// A function to call just after a property's value is updated.
// |handler_data| is a local context pointer that can be used by the handler.
typedef void (*TabswipePropSetHandler)(void* handler_data);

// Register a handler to be called after the provider writes a new value
// into a TabswipeProp.
typedef void (*TabswipePropRegisterHandlers)(void* data, TabswipeProp* prop,
                                             void* handler_data,
                                             TabswipePropSetHandler setter);

// Free a property.
typedef void (*TabswipePropFree)(void* data, TabswipeProp* prop);

typedef struct TabswipePropProvider {
  TabswipePropCreateInt create_int_fn;
  TabswipePropCreateBool create_bool_fn;
  TabswipePropCreateReal create_real_fn;
  TabswipePropRegisterHandlers register_handlers_fn;
  TabswipePropFree free_fn;
} TabswipePropProvider;

#ifdef __cplusplus
}

// C++ API:

namespace tabswipe {

struct PointF {
  float x, y;
};

// Half-open rectangle in screen coordinates: contains [left, right) x
// [top, bottom).
struct RectF {
  bool Contains(const PointF& point) const {
    return point.x >= left && point.x < right &&
        point.y >= top && point.y < bottom;
  }

  float left, top, right, bottom;
};

// Direction of a swipe, named by where the finger travels on screen.
enum SwipeDirection {
  kSwipeLeftToRight = 0,
  kSwipeRightToLeft,
  kSwipeTopToBottom,
  kSwipeBottomToTop,
};

const char* SwipeDirectionName(SwipeDirection direction);

inline bool IsHorizontal(SwipeDirection direction) {
  return direction == kSwipeLeftToRight || direction == kSwipeRightToLeft;
}

enum LayoutDirection {
  kLayoutLtr = 0,
  kLayoutRtl,
};

enum ToolbarPosition {
  kToolbarTop = 0,
  kToolbarBottom,
};

enum BrowsingMode {
  kBrowsingModeNormal = 0,
  kBrowsingModePrivate,
};

enum TrayPage {
  kTrayPageNormalTabs = 0,
  kTrayPagePrivateTabs,
};

// Window geometry and environment facts. A snapshot is taken when a gesture
// is armed and is not re-queried until the next gesture.
struct GestureEnvironment {
  float window_width;
  // Gap kept between the content surface and the preview surface while both
  // are on screen.
  float preview_offset;
  RectF toolbar_rect;
  // Bottom system gesture inset and the regular bottom window inset. When the
  // toolbar sits at the bottom of the screen, the part of the gesture inset
  // that is not a regular inset overlaps the toolbar.
  float mandatory_gesture_inset_bottom;
  float inset_bottom;
  bool keyboard_visible;
  LayoutDirection layout_direction;
  ToolbarPosition toolbar_position;
  BrowsingMode browsing_mode;
};

}  // namespace tabswipe

#endif  // __cplusplus

#endif  // TABSWIPE_TABSWIPE_H__
