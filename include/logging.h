// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_LOGGING_H__
#define TABSWIPE_LOGGING_H__

#include "tabswipe/include/tabswipe.h"

#define AssertWithReturn(condition) \
  do { \
    if (!(condition)) { \
      Err("Assertion '" #condition "' failed"); \
      return; \
    } \
  } while(false)

#define AssertWithReturnValue(condition, returnValue) \
  do { \
    if (!(condition)) { \
      Err("Assertion '" #condition "' failed"); \
      return (returnValue); \
    } \
  } while(false)

#define Log(format, ...) \
  tabswipe_log(TABSWIPE_LOG_INFO, "INFO:%s:%d:" format "\n", \
               __FILE__, __LINE__, ## __VA_ARGS__)
#define Err(format, ...) \
  tabswipe_log(TABSWIPE_LOG_ERROR, "ERROR:%s:%d:" format "\n", \
               __FILE__, __LINE__, ## __VA_ARGS__)

#endif  // TABSWIPE_LOGGING_H__
