// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <string.h>

#include <string>

#include <base/json/json_writer.h>
#include <base/memory/scoped_ptr.h>
#include <base/values.h>
#include <gtest/gtest.h>

#include "tabswipe/include/activity_log.h"
#include "tabswipe/include/prop_registry.h"

using base::DictionaryValue;
using base::FundamentalValue;
using std::string;

namespace tabswipe {

class PropRegistryTest : public ::testing::Test {};

namespace {
string ValueForProperty(const Property& prop) {
  DictionaryValue temp;
  temp.Set("tempkey", prop.NewValue());
  string ret;
  base::JSONWriter::Write(&temp, false, &ret);
  return ret;
}

// Provider that stores created properties' locations so the test can write
// to them the way a host would.
struct TestProvider {
  TestProvider() : create_cnt(0), free_cnt(0), int_loc(NULL),
                   handler_data(NULL), setter(NULL) {}
  int create_cnt;
  int free_cnt;
  int* int_loc;
  void* handler_data;
  TabswipePropSetHandler setter;
};

int int_prop_storage;
int other_prop_storage;

TabswipeProp* IntProp() {
  return reinterpret_cast<TabswipeProp*>(&int_prop_storage);
}

TabswipeProp* OtherProp() {
  return reinterpret_cast<TabswipeProp*>(&other_prop_storage);
}

TabswipeProp* CreateInt(void* data, const char* name, int* loc,
                        const int init) {
  TestProvider* provider = reinterpret_cast<TestProvider*>(data);
  provider->create_cnt++;
  provider->int_loc = loc;
  // A host configuration file overrides the built-in default
  *loc = 300;
  return IntProp();
}

TabswipeProp* CreateBool(void* data, const char* name, TabswipePropBool* loc,
                         const TabswipePropBool init) {
  reinterpret_cast<TestProvider*>(data)->create_cnt++;
  return OtherProp();
}

TabswipeProp* CreateReal(void* data, const char* name, double* loc,
                         const double init) {
  reinterpret_cast<TestProvider*>(data)->create_cnt++;
  return OtherProp();
}

void RegisterHandlers(void* data, TabswipeProp* prop, void* handler_data,
                      TabswipePropSetHandler setter) {
  if (prop != IntProp())
    return;
  TestProvider* provider = reinterpret_cast<TestProvider*>(data);
  provider->handler_data = handler_data;
  provider->setter = setter;
}

void Free(void* data, TabswipeProp* prop) {
  reinterpret_cast<TestProvider*>(data)->free_cnt++;
}

TabswipePropProvider test_prop_provider = {
  CreateInt,
  CreateBool,
  CreateReal,
  RegisterHandlers,
  Free
};
}  // namespace {}

TEST(PropRegistryTest, SimpleTest) {
  PropRegistry reg;
  ActivityLog log(&reg);
  reg.set_activity_log(&log);

  BoolProperty bp1(&reg, "hi", false);
  EXPECT_TRUE(strstr(ValueForProperty(bp1).c_str(), "false"));
  BoolProperty bp2(&reg, "hi", true);
  EXPECT_TRUE(strstr(ValueForProperty(bp2).c_str(), "true"));
  DoubleProperty dp(&reg, "hi", 2721.0);
  EXPECT_TRUE(strstr(ValueForProperty(dp).c_str(), "2721"));
  IntProperty ip(&reg, "hi", 567);
  EXPECT_TRUE(strstr(ValueForProperty(ip).c_str(), "567"));

  // Creating properties is not a write
  EXPECT_EQ(0U, log.size());
  bp2.HandleTabswipePropWritten();
  ip.HandleTabswipePropWritten();
  ASSERT_EQ(2U, log.size());
  EXPECT_EQ(ActivityLog::PropChangeEntry::kBoolProp,
            log.GetEntry(0)->details.prop_change.type);
  EXPECT_EQ(1, log.GetEntry(0)->details.prop_change.value.bool_val);
  EXPECT_EQ(ActivityLog::PropChangeEntry::kIntProp,
            log.GetEntry(1)->details.prop_change.type);
  EXPECT_EQ(567, log.GetEntry(1)->details.prop_change.value.int_val);

  // Without a log, writes are not recorded anywhere
  reg.set_activity_log(NULL);
  dp.HandleTabswipePropWritten();
  EXPECT_EQ(2U, log.size());
}

TEST(PropRegistryTest, RegisterTest) {
  PropRegistry reg;
  {
    IntProperty ip(&reg, "Some Int", 3);
    scoped_ptr<DictionaryValue> encoded(reg.EncodeProperties());
    EXPECT_EQ(1U, encoded->size());
    EXPECT_TRUE(encoded->HasKey("Some Int"));
  }
  scoped_ptr<DictionaryValue> encoded(reg.EncodeProperties());
  EXPECT_TRUE(encoded->empty());

  // Properties without a registry work on their own
  IntProperty loose(NULL, "Loose Int", 4);
  EXPECT_EQ(4, loose.val_);
  loose.HandleTabswipePropWritten();
}

TEST(PropRegistryTest, ApplyPropertiesTest) {
  PropRegistry reg;
  ActivityLog log(&reg);
  reg.set_activity_log(&log);
  BoolProperty bp(&reg, "Some Bool", true);
  DoubleProperty dp(&reg, "Some Double", 0.25);
  IntProperty ip(&reg, "Some Int", 250);

  DictionaryValue dict;
  dict.SetWithoutPathExpansion("Some Bool", new FundamentalValue(false));
  // Integers are accepted for doubles
  dict.SetWithoutPathExpansion("Some Double", new FundamentalValue(1));
  dict.SetWithoutPathExpansion("Unknown", new FundamentalValue(7));
  EXPECT_TRUE(reg.ApplyProperties(dict));
  EXPECT_EQ(0, bp.val_);
  EXPECT_DOUBLE_EQ(1.0, dp.val_);
  EXPECT_EQ(250, ip.val_);
  EXPECT_EQ(2U, log.size());

  EXPECT_TRUE(reg.ApplyPropertiesFromJson(
      "{ \"Some Int\": 100, \"Some Double\": 0.5 }"));
  EXPECT_EQ(100, ip.val_);
  EXPECT_DOUBLE_EQ(0.5, dp.val_);
  EXPECT_EQ(4U, log.size());

  scoped_ptr<DictionaryValue> encoded(reg.EncodeProperties());
  int int_val = 0;
  EXPECT_TRUE(encoded->GetIntegerWithoutPathExpansion("Some Int", &int_val));
  EXPECT_EQ(100, int_val);
  double double_val = 0.0;
  EXPECT_TRUE(encoded->GetDoubleWithoutPathExpansion("Some Double",
                                                     &double_val));
  EXPECT_DOUBLE_EQ(0.5, double_val);
}

TEST(PropRegistryTest, ApplyPropertiesErrorTest) {
  PropRegistry reg;
  BoolProperty bp(&reg, "Some Bool", true);
  IntProperty ip(&reg, "Some Int", 250);

  const char* inputs[] = {
    "",
    "{ \"Some Int\": ",
    "[ 1, 2 ]",
    "{ \"Some Int\": 1.5 }",
    "{ \"Some Int\": \"fast\" }",
    "{ \"Some Bool\": 1 }",
  };
  for (size_t i = 0; i < arraysize(inputs); i++)
    EXPECT_FALSE(reg.ApplyPropertiesFromJson(inputs[i])) << inputs[i];
  EXPECT_EQ(1, bp.val_);
  EXPECT_EQ(250, ip.val_);
}

TEST(PropRegistryTest, PropProviderTest) {
  PropRegistry reg;
  ActivityLog log(&reg);
  reg.set_activity_log(&log);
  TestProvider provider;
  IntProperty ip(&reg, "Some Int", 250);
  BoolProperty bp(&reg, "Some Bool", true);

  reg.SetPropProvider(&test_prop_provider, &provider);
  EXPECT_EQ(2, provider.create_cnt);
  // The provider's initial value wins
  EXPECT_EQ(300, ip.val_);

  // The host writes through the location, then calls the handler
  ASSERT_TRUE(provider.int_loc);
  ASSERT_TRUE(provider.setter);
  *provider.int_loc = 125;
  provider.setter(provider.handler_data);
  EXPECT_EQ(125, ip.val_);
  ASSERT_EQ(1U, log.size());
  EXPECT_EQ(125, log.GetEntry(0)->details.prop_change.value.int_val);

  // Properties registered later are published at once
  DoubleProperty dp(&reg, "Some Double", 0.5);
  EXPECT_EQ(3, provider.create_cnt);

  reg.SetPropProvider(NULL, NULL);
  EXPECT_EQ(3, provider.free_cnt);
}

TEST(PropRegistryTest, PropChangeTest) {
  PropRegistry reg;
  ActivityLog log(&reg);
  reg.set_activity_log(&log);

  DoubleProperty dp(&reg, "hi", 1234.0);
  EXPECT_EQ(0U, log.size());
  dp.HandleTabswipePropWritten();
  ASSERT_EQ(1U, log.size());
  ActivityLog::Entry* entry = log.GetEntry(0);
  EXPECT_EQ(ActivityLog::kPropChange, entry->type);
  EXPECT_STREQ("hi", entry->details.prop_change.name);
  EXPECT_EQ(ActivityLog::PropChangeEntry::kDoubleProp,
            entry->details.prop_change.type);
  EXPECT_DOUBLE_EQ(1234.0, entry->details.prop_change.value.double_val);
}

}  // namespace tabswipe
