// Copyright (c) 2011 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef TABSWIPE_PROP_REGISTRY_H__
#define TABSWIPE_PROP_REGISTRY_H__

#include <set>
#include <string>

#include <base/basictypes.h>
#include <base/values.h>

#include "tabswipe/include/logging.h"
#include "tabswipe/include/tabswipe.h"

namespace tabswipe {

class ActivityLog;
class Property;

// Holds every tunable of the library. Components own their properties and
// register them here so that a host can publish them through a
// TabswipePropProvider, or apply values from a dictionary or JSON text.
class PropRegistry {
 public:
  PropRegistry()
      : prop_provider_(NULL), prop_provider_data_(NULL), activity_log_(NULL) {}

  void Register(Property* prop);
  void Unregister(Property* prop);

  void SetPropProvider(TabswipePropProvider* prop_provider, void* data);
  TabswipePropProvider* PropProvider() const { return prop_provider_; }
  void* PropProviderData() const { return prop_provider_data_; }

  // Writes to any property are recorded here, if set.
  void set_activity_log(ActivityLog* activity_log) {
    activity_log_ = activity_log;
  }
  ActivityLog* activity_log() const { return activity_log_; }

  // Caller takes ownership of the returned dictionary.
  base::DictionaryValue* EncodeProperties() const;

  // Sets every registered property that has an entry in |dict|. Properties
  // without an entry keep their value. Returns false if an entry has the
  // wrong type; properties processed before it stay modified.
  bool ApplyProperties(const base::DictionaryValue& dict);
  bool ApplyPropertiesFromJson(const std::string& json);

 private:
  TabswipePropProvider* prop_provider_;
  void* prop_provider_data_;
  ActivityLog* activity_log_;
  std::set<Property*> props_;

  DISALLOW_COPY_AND_ASSIGN(PropRegistry);
};

// A named, typed tunable. The value lives in |val_| of the subclass so that
// a prop provider can write it in place.
class Property {
 public:
  Property(PropRegistry* parent, const char* name)
      : parent_(parent), gprop_(NULL), name_(name) {}

  virtual ~Property() {
    if (parent_)
      parent_->Unregister(this);
  }

  void CreateProp();
  void DestroyProp();

  const char* name() const { return name_; }
  // Returns a newly allocated Value object. Caller takes ownership.
  virtual base::Value* NewValue() const = 0;
  // Returns false if |value| has the wrong type.
  virtual bool SetValue(const base::Value* value) = 0;

  // Called after the value changed from outside the owning component.
  void HandleTabswipePropWritten();
  static void StaticHandleTabswipePropWritten(void* data) {
    reinterpret_cast<Property*>(data)->HandleTabswipePropWritten();
  }

 protected:
  virtual TabswipeProp* NewProviderProp(TabswipePropProvider* provider,
                                        void* data) = 0;
  virtual void LogWrite(ActivityLog* log) const = 0;

  PropRegistry* parent_;

 private:
  TabswipeProp* gprop_;
  const char* name_;
};

class BoolProperty : public Property {
 public:
  BoolProperty(PropRegistry* reg, const char* name, TabswipePropBool val)
      : Property(reg, name), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  virtual base::Value* NewValue() const;
  virtual bool SetValue(const base::Value* value);

  TabswipePropBool val_;

 protected:
  virtual TabswipeProp* NewProviderProp(TabswipePropProvider* provider,
                                        void* data);
  virtual void LogWrite(ActivityLog* log) const;
};

class DoubleProperty : public Property {
 public:
  DoubleProperty(PropRegistry* reg, const char* name, double val)
      : Property(reg, name), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  virtual base::Value* NewValue() const;
  // Integers are accepted too.
  virtual bool SetValue(const base::Value* value);

  double val_;

 protected:
  virtual TabswipeProp* NewProviderProp(TabswipePropProvider* provider,
                                        void* data);
  virtual void LogWrite(ActivityLog* log) const;
};

class IntProperty : public Property {
 public:
  IntProperty(PropRegistry* reg, const char* name, int val)
      : Property(reg, name), val_(val) {
    if (parent_)
      parent_->Register(this);
  }
  virtual base::Value* NewValue() const;
  virtual bool SetValue(const base::Value* value);

  int val_;

 protected:
  virtual TabswipeProp* NewProviderProp(TabswipePropProvider* provider,
                                        void* data);
  virtual void LogWrite(ActivityLog* log) const;
};

}  // namespace tabswipe

#endif  // TABSWIPE_PROP_REGISTRY_H__
