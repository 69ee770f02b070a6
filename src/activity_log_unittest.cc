// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <string>

#include <base/json/json_reader.h>
#include <base/memory/scoped_ptr.h>
#include <base/values.h>
#include <gtest/gtest.h>

#include "tabswipe/include/activity_log.h"
#include "tabswipe/include/prop_registry.h"
#include "tabswipe/include/unittest_util.h"

using base::DictionaryValue;
using base::ListValue;
using base::Value;
using std::string;

namespace tabswipe {

class ActivityLogTest : public ::testing::Test {};

TEST(ActivityLogTest, SimpleTest) {
  PropRegistry reg;
  ActivityLog log(&reg);
  EXPECT_EQ(0U, log.size());
  EXPECT_GT(log.MaxSize(), 10U);

  ActivityLog::SwipeStartEntry start = {
    MakePoint(500, 1900), MakePoint(470, 1900), kSwipeRightToLeft, true
  };
  log.LogSwipeStart(start);
  EXPECT_EQ(1U, log.size());
  EXPECT_EQ(ActivityLog::kSwipeStart, log.GetEntry(0)->type);
  EXPECT_FLOAT_EQ(470.0, log.GetEntry(0)->details.start.next.x);

  ActivityLog::SwipeUpdateEntry update = { 400.0, 0.0, 2, -400.0, 620.0 };
  log.LogSwipeUpdate(update);
  EXPECT_EQ(2U, log.size());
  EXPECT_EQ(ActivityLog::kSwipeUpdate, log.GetEntry(1)->type);

  ActivityLog::SwipeEndEntry end = { 0.0, 0.0, true };
  log.LogSwipeEnd(end);
  ActivityLog::SettleEntry settle = { 0, 2 };
  log.LogSettle(settle);
  EXPECT_EQ(4U, log.size());
  EXPECT_EQ(ActivityLog::kSettle, log.GetEntry(3)->type);

  log.Clear();
  EXPECT_EQ(0U, log.size());
}

TEST(ActivityLogTest, WrapAroundTest) {
  ActivityLog log(NULL);
  // Overfill the buffer
  const size_t kExtra = 3;
  for (size_t i = 0; i < ActivityLog::kBufferSize + kExtra; i++) {
    ActivityLog::SwipeUpdateEntry update = {
      static_cast<float>(i), 0.0, 0, 0.0, 0.0
    };
    log.LogSwipeUpdate(update);
  }
  EXPECT_EQ(log.MaxSize(), log.size());
  // The oldest entries were dropped
  EXPECT_FLOAT_EQ(static_cast<float>(kExtra),
                  log.GetEntry(0)->details.update.dx);
  EXPECT_FLOAT_EQ(static_cast<float>(ActivityLog::kBufferSize + kExtra - 1),
                  log.GetEntry(log.size() - 1)->details.update.dx);
}

TEST(ActivityLogTest, EncodeTest) {
  PropRegistry reg;
  IntProperty ip(&reg, "Some Int", 250);
  ActivityLog log(&reg);
  log.SetEnvironment(TestEnvironment());

  ActivityLog::SwipeStartEntry start = {
    MakePoint(500, 1900), MakePoint(500, 1860), kSwipeBottomToTop, true
  };
  log.LogSwipeStart(start);
  ActivityLog::PropChangeEntry prop_change = {
    "Some Int", ActivityLog::PropChangeEntry::kIntProp, { 0 }
  };
  prop_change.value.int_val = 100;
  log.LogPropChange(prop_change);

  string json = log.Encode();
  scoped_ptr<Value> root(base::JSONReader::Read(json, true));
  ASSERT_TRUE(root.get());
  ASSERT_EQ(Value::TYPE_DICTIONARY, root->GetType());
  DictionaryValue* dict = static_cast<DictionaryValue*>(root.get());

  int version = 0;
  EXPECT_TRUE(dict->GetInteger("version", &version));
  EXPECT_EQ(1, version);

  ListValue* entries = NULL;
  ASSERT_TRUE(dict->GetList(ActivityLog::kKeyRoot, &entries));
  ASSERT_EQ(2U, entries->GetSize());
  DictionaryValue* entry = NULL;
  ASSERT_TRUE(entries->GetDictionary(0, &entry));
  string str;
  EXPECT_TRUE(entry->GetString(ActivityLog::kKeyType, &str));
  EXPECT_EQ(ActivityLog::kKeySwipeStart, str);
  EXPECT_TRUE(entry->GetString(ActivityLog::kKeyDirection, &str));
  EXPECT_EQ("BottomToTop", str);
  ASSERT_TRUE(entries->GetDictionary(1, &entry));
  EXPECT_TRUE(entry->GetString(ActivityLog::kKeyType, &str));
  EXPECT_EQ(ActivityLog::kKeyPropChange, str);
  int int_val = 0;
  EXPECT_TRUE(entry->GetInteger(ActivityLog::kKeyPropChangeValue, &int_val));
  EXPECT_EQ(100, int_val);

  DictionaryValue* env = NULL;
  ASSERT_TRUE(dict->GetDictionary(ActivityLog::kKeyEnvironment, &env));
  bool bottom_toolbar = false;
  EXPECT_TRUE(env->GetBoolean("bottomToolbar", &bottom_toolbar));
  EXPECT_TRUE(bottom_toolbar);

  DictionaryValue* props = NULL;
  ASSERT_TRUE(dict->GetDictionary(ActivityLog::kKeyProperties, &props));
  EXPECT_TRUE(props->GetIntegerWithoutPathExpansion("Some Int", &int_val));
  EXPECT_EQ(250, int_val);
}

}  // namespace tabswipe
