// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "tabswipe/include/prop_registry.h"

#include <set>
#include <string>

#include <base/json/json_reader.h>
#include <base/memory/scoped_ptr.h>
#include <base/values.h>

#include "tabswipe/include/activity_log.h"

using base::DictionaryValue;
using base::FundamentalValue;
using base::Value;
using std::set;
using std::string;

namespace tabswipe {

void PropRegistry::Register(Property* prop) {
  props_.insert(prop);
  if (prop_provider_)
    prop->CreateProp();
}

void PropRegistry::Unregister(Property* prop) {
  if (props_.erase(prop) != 1)
    Err("Unregister of unknown property %s", prop->name());
  if (prop_provider_)
    prop->DestroyProp();
}

void PropRegistry::SetPropProvider(TabswipePropProvider* prop_provider,
                                   void* data) {
  if (prop_provider_ == prop_provider)
    return;
  if (prop_provider_) {
    for (set<Property*>::iterator it = props_.begin(); it != props_.end();
         ++it)
      (*it)->DestroyProp();
  }
  prop_provider_ = prop_provider;
  prop_provider_data_ = data;
  if (!prop_provider_)
    return;
  for (set<Property*>::iterator it = props_.begin(); it != props_.end(); ++it)
    (*it)->CreateProp();
}

DictionaryValue* PropRegistry::EncodeProperties() const {
  DictionaryValue* ret = new DictionaryValue;
  for (set<Property*>::const_iterator it = props_.begin();
       it != props_.end(); ++it)
    ret->SetWithoutPathExpansion((*it)->name(), (*it)->NewValue());
  return ret;
}

bool PropRegistry::ApplyProperties(const DictionaryValue& dict) {
  for (set<Property*>::const_iterator it = props_.begin();
       it != props_.end(); ++it) {
    Value* value = NULL;
    if (!dict.GetWithoutPathExpansion((*it)->name(), &value))
      continue;
    if (!(*it)->SetValue(value)) {
      Err("Wrong type %d for property %s", value->GetType(), (*it)->name());
      return false;
    }
    (*it)->HandleTabswipePropWritten();
  }
  return true;
}

bool PropRegistry::ApplyPropertiesFromJson(const string& json) {
  int error_code = 0;
  string error_msg;
  scoped_ptr<Value> root(base::JSONReader::ReadAndReturnError(json, true,
                                                              &error_code,
                                                              &error_msg));
  if (!root.get()) {
    Err("Properties parse failed: %s", error_msg.c_str());
    return false;
  }
  if (root->GetType() != Value::TYPE_DICTIONARY) {
    Err("Properties root type is %d, expected a dictionary",
        root->GetType());
    return false;
  }
  return ApplyProperties(*static_cast<DictionaryValue*>(root.get()));
}

void Property::CreateProp() {
  AssertWithReturn(parent_ && parent_->PropProvider());
  if (gprop_) {
    Err("Property %s already published", name_);
    return;
  }
  TabswipePropProvider* provider = parent_->PropProvider();
  gprop_ = NewProviderProp(provider, parent_->PropProviderData());
  if (gprop_)
    provider->register_handlers_fn(parent_->PropProviderData(), gprop_, this,
                                   &StaticHandleTabswipePropWritten);
}

void Property::DestroyProp() {
  if (!gprop_) {
    Err("Property %s was not published", name_);
    return;
  }
  parent_->PropProvider()->free_fn(parent_->PropProviderData(), gprop_);
  gprop_ = NULL;
}

void Property::HandleTabswipePropWritten() {
  if (parent_ && parent_->activity_log())
    LogWrite(parent_->activity_log());
}

TabswipeProp* BoolProperty::NewProviderProp(TabswipePropProvider* provider,
                                            void* data) {
  return provider->create_bool_fn(data, name(), &val_, val_);
}

Value* BoolProperty::NewValue() const {
  return new FundamentalValue(val_ != 0);
}

bool BoolProperty::SetValue(const Value* value) {
  bool val = false;
  if (value->GetType() != Value::TYPE_BOOLEAN || !value->GetAsBoolean(&val))
    return false;
  val_ = val ? 1 : 0;
  return true;
}

void BoolProperty::LogWrite(ActivityLog* log) const {
  ActivityLog::PropChangeEntry entry;
  entry.name = name();
  entry.type = ActivityLog::PropChangeEntry::kBoolProp;
  entry.value.bool_val = val_;
  log->LogPropChange(entry);
}

TabswipeProp* DoubleProperty::NewProviderProp(TabswipePropProvider* provider,
                                              void* data) {
  return provider->create_real_fn(data, name(), &val_, val_);
}

Value* DoubleProperty::NewValue() const {
  return new FundamentalValue(val_);
}

bool DoubleProperty::SetValue(const Value* value) {
  if (value->GetType() != Value::TYPE_DOUBLE &&
      value->GetType() != Value::TYPE_INTEGER)
    return false;
  return value->GetAsDouble(&val_);
}

void DoubleProperty::LogWrite(ActivityLog* log) const {
  ActivityLog::PropChangeEntry entry;
  entry.name = name();
  entry.type = ActivityLog::PropChangeEntry::kDoubleProp;
  entry.value.double_val = val_;
  log->LogPropChange(entry);
}

TabswipeProp* IntProperty::NewProviderProp(TabswipePropProvider* provider,
                                           void* data) {
  return provider->create_int_fn(data, name(), &val_, val_);
}

Value* IntProperty::NewValue() const {
  return new FundamentalValue(val_);
}

bool IntProperty::SetValue(const Value* value) {
  if (value->GetType() != Value::TYPE_INTEGER)
    return false;
  return value->GetAsInteger(&val_);
}

void IntProperty::LogWrite(ActivityLog* log) const {
  ActivityLog::PropChangeEntry entry;
  entry.name = name();
  entry.type = ActivityLog::PropChangeEntry::kIntProp;
  entry.value.int_val = val_;
  log->LogPropChange(entry);
}

}  // namespace tabswipe
