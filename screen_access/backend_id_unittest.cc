// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_id.h"

#include "gtest/gtest.h"

namespace screen_access {

TEST(BackendIdTest, ShortNamesRoundTrip) {
  for (size_t i = 0; i < kBackendIdCount; ++i) {
    BackendId id = BackendId::kTreeAutomation;
    ASSERT_TRUE(BackendIdFromShortName(BackendIdToShortName(kAllBackendIds[i]),
                                       &id));
    EXPECT_EQ(kAllBackendIds[i], id);
    EXPECT_EQ(i, BackendIdToIndex(id));
  }
}

TEST(BackendIdTest, ShortNamesAreCaseInsensitive) {
  BackendId id = BackendId::kTreeAutomation;
  EXPECT_TRUE(BackendIdFromShortName("IA2", &id));
  EXPECT_EQ(BackendId::kExtendedAccessible, id);
  EXPECT_TRUE(BackendIdFromShortName("Jab", &id));
  EXPECT_EQ(BackendId::kToolkitBridge, id);
  EXPECT_FALSE(BackendIdFromShortName("atk", &id));
  EXPECT_EQ(BackendId::kToolkitBridge, id);
}

TEST(BackendIdTest, DisplayNames) {
  EXPECT_STREQ("UIAutomation", BackendIdToString(BackendId::kTreeAutomation));
  EXPECT_STREQ("MSAA", BackendIdToString(BackendId::kLegacyAccessible));
  EXPECT_STREQ("IAccessible2",
               BackendIdToString(BackendId::kExtendedAccessible));
  EXPECT_STREQ("JavaAccessBridge",
               BackendIdToString(BackendId::kToolkitBridge));
}

TEST(BackendSetTest, PutRemoveHas) {
  BackendSet set;
  EXPECT_TRUE(set.Empty());
  set.Put(BackendId::kLegacyAccessible);
  set.Put(BackendId::kLegacyAccessible);
  set.Put(BackendId::kToolkitBridge);
  EXPECT_EQ(2u, set.Size());
  EXPECT_TRUE(set.Has(BackendId::kLegacyAccessible));
  EXPECT_FALSE(set.Has(BackendId::kTreeAutomation));

  set.Remove(BackendId::kLegacyAccessible);
  set.Remove(BackendId::kExtendedAccessible);
  EXPECT_EQ(1u, set.Size());
  EXPECT_EQ("jab", set.ToString());

  set.Clear();
  EXPECT_TRUE(set.Empty());
  EXPECT_EQ("", set.ToString());
}

TEST(BackendSetTest, BitmaskDropsUnknownBits) {
  BackendSet set = BackendSet::FromBitmask(0xFFFFFFFF);
  EXPECT_EQ(BackendSet::All(), set);
  EXPECT_EQ(0xFu, set.ToBitmask());
  EXPECT_EQ("uia,msaa,ia2,jab", set.ToString());

  set = BackendSet::FromBitmask(0x30);
  EXPECT_TRUE(set.Empty());
}

TEST(BackendSetTest, FromString) {
  BackendSet set;
  ASSERT_TRUE(BackendSetFromString(" msaa , UIA,,", &set));
  EXPECT_EQ(2u, set.Size());
  EXPECT_TRUE(set.Has(BackendId::kTreeAutomation));
  EXPECT_TRUE(set.Has(BackendId::kLegacyAccessible));

  ASSERT_TRUE(BackendSetFromString("", &set));
  EXPECT_TRUE(set.Empty());
}

TEST(BackendSetTest, FromStringRejectsUnknownNamesWithoutChanges) {
  BackendSet set;
  set.Put(BackendId::kToolkitBridge);
  EXPECT_FALSE(BackendSetFromString("uia,atspi", &set));
  EXPECT_EQ(1u, set.Size());
  EXPECT_TRUE(set.Has(BackendId::kToolkitBridge));
}

}  // namespace screen_access
