// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/process_backend_map.h"

#include "base/strings/utf_string_conversions.h"
#include "gtest/gtest.h"

using base::ASCIIToUTF16;

namespace screen_access {

TEST(ProcessBackendMapTest, NormalizeProcessName) {
  EXPECT_EQ("firefox", NormalizeProcessName(ASCIIToUTF16("Firefox.EXE")));
  EXPECT_EQ("javaw", NormalizeProcessName(ASCIIToUTF16("javaw")));
  EXPECT_EQ("", NormalizeProcessName(ASCIIToUTF16(".exe")));
  EXPECT_EQ("setup.exe.bak",
            NormalizeProcessName(ASCIIToUTF16("setup.exe.bak")));
}

TEST(ProcessBackendMapTest, BuiltInMappings) {
  ProcessBackendMap map;
  BackendId backend = BackendId::kTreeAutomation;

  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("firefox.exe"), &backend));
  EXPECT_EQ(BackendId::kExtendedAccessible, backend);
  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("javaw.exe"), &backend));
  EXPECT_EQ(BackendId::kToolkitBridge, backend);
  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("cmd.exe"), &backend));
  EXPECT_EQ(BackendId::kLegacyAccessible, backend);
  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("msedge.exe"), &backend));
  EXPECT_EQ(BackendId::kTreeAutomation, backend);
}

TEST(ProcessBackendMapTest, SubstringMatch) {
  ProcessBackendMap map;
  BackendId backend = BackendId::kTreeAutomation;
  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("firefox-esr.exe"), &backend));
  EXPECT_EQ(BackendId::kExtendedAccessible, backend);
}

TEST(ProcessBackendMapTest, UnknownProcess) {
  ProcessBackendMap map;
  BackendId backend = BackendId::kLegacyAccessible;
  EXPECT_FALSE(map.Lookup(ASCIIToUTF16("calc.exe"), &backend));
  EXPECT_EQ(BackendId::kLegacyAccessible, backend);
  EXPECT_FALSE(map.Lookup(base::string16(), &backend));
}

TEST(ProcessBackendMapTest, RegisterAddsAndOverrides) {
  ProcessBackendMap map;
  size_t initial_size = map.size();
  BackendId backend = BackendId::kTreeAutomation;

  map.Register(ASCIIToUTF16("MyApp.exe"), BackendId::kToolkitBridge);
  EXPECT_EQ(initial_size + 1, map.size());
  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("myapp"), &backend));
  EXPECT_EQ(BackendId::kToolkitBridge, backend);

  map.Register(ASCIIToUTF16("firefox"), BackendId::kLegacyAccessible);
  EXPECT_EQ(initial_size + 1, map.size());
  EXPECT_TRUE(map.Lookup(ASCIIToUTF16("firefox.exe"), &backend));
  EXPECT_EQ(BackendId::kLegacyAccessible, backend);
}

}  // namespace screen_access
