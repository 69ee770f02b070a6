// Copyright (c) 2012 The Chromium OS Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include <base/basictypes.h>
#include <base/logging.h>
#include <gtest/gtest.h>

#include "tabswipe/include/destination_resolver.h"
#include "tabswipe/include/unittest_util.h"

namespace tabswipe {

class DestinationResolverTest : public ::testing::Test {};

TEST(DestinationResolverTest, TargetIndexTest) {
  struct {
    SwipeDirection direction;
    LayoutDirection layout;
    int expected;
  } inputs[] = {
    { kSwipeRightToLeft, kLayoutLtr, 4 },
    { kSwipeRightToLeft, kLayoutRtl, 2 },
    { kSwipeLeftToRight, kLayoutLtr, 2 },
    { kSwipeLeftToRight, kLayoutRtl, 4 },
  };
  for (size_t i = 0; i < arraysize(inputs); i++)
    EXPECT_EQ(inputs[i].expected,
              DestinationResolver::TargetIndex(inputs[i].direction,
                                               inputs[i].layout, 3))
        << "i=" << i;
}

TEST(DestinationResolverTest, VerticalIsTrayTest) {
  FakeTabStore store;
  DestinationResolver resolver(&store);
  // Even with no tabs at all
  EXPECT_EQ(Destination::Tray(),
            resolver.Resolve(kSwipeTopToBottom, kLayoutLtr));
  EXPECT_EQ(Destination::Tray(),
            resolver.Resolve(kSwipeBottomToTop, kLayoutRtl));
}

TEST(DestinationResolverTest, NeighborTest) {
  FakeTabStore store;
  store.AddTab("a", false);
  store.AddTab("b", false);
  store.AddTab("c", false);
  store.Select("b");
  DestinationResolver resolver(&store);

  EXPECT_EQ(Destination::Tab("c", false),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
  EXPECT_EQ(Destination::Tab("a", false),
            resolver.Resolve(kSwipeLeftToRight, kLayoutLtr));
  EXPECT_EQ(Destination::Tab("a", false),
            resolver.Resolve(kSwipeRightToLeft, kLayoutRtl));
  EXPECT_EQ(Destination::Tab("c", false),
            resolver.Resolve(kSwipeLeftToRight, kLayoutRtl));
}

TEST(DestinationResolverTest, EndOfListTest) {
  FakeTabStore store;
  store.AddTab("a", false);
  store.AddTab("b", false);
  DestinationResolver resolver(&store);

  store.Select("b");
  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeLeftToRight, kLayoutRtl));
  store.Select("a");
  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeLeftToRight, kLayoutLtr));
  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeRightToLeft, kLayoutRtl));
}

TEST(DestinationResolverTest, PrivatePartitionTest) {
  FakeTabStore store;
  store.AddTab("n1", false);
  store.AddTab("p1", true);
  store.AddTab("n2", false);
  store.AddTab("p2", true);
  DestinationResolver resolver(&store);

  // Neighbors are looked up within the selected tab's partition only
  store.Select("p1");
  EXPECT_EQ(Destination::Tab("p2", true),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
  store.Select("n1");
  EXPECT_EQ(Destination::Tab("n2", false),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
  store.Select("n2");
  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
}

TEST(DestinationResolverTest, NoSelectionTest) {
  FakeTabStore store;
  store.AddTab("a", false);
  store.AddTab("b", false);
  DestinationResolver resolver(&store);

  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
  // Selected tab missing from its partition
  store.Select("gone");
  EXPECT_EQ(Destination::None(),
            resolver.Resolve(kSwipeRightToLeft, kLayoutLtr));
}

TEST(DestinationResolverTest, StringTest) {
  EXPECT_EQ("(Destination: none)", Destination::None().String());
  EXPECT_EQ("(Destination: tray)", Destination::Tray().String());
  EXPECT_EQ("(Destination: tab x private: 1)",
            Destination::Tab("x", true).String());
  EXPECT_NE(Destination::Tab("x", true), Destination::Tab("x", false));
}

}  // namespace tabswipe
