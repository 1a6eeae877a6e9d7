// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_settings.h"

#include "base/command_line.h"
#include "gtest/gtest.h"
#include "screen_access/screen_access_switches.h"

namespace screen_access {

class BackendSettingsTest : public ::testing::Test {
 protected:
  BackendSettingsTest() : command_line_(base::CommandLine::NO_PROGRAM) {}

  base::CommandLine command_line_;
  BackendSettings settings_;
};

TEST_F(BackendSettingsTest, Defaults) {
  EXPECT_TRUE(settings_.enabled_backends.Has(BackendId::kTreeAutomation));
  EXPECT_TRUE(settings_.enabled_backends.Has(BackendId::kLegacyAccessible));
  EXPECT_EQ(2u, settings_.enabled_backends.Size());
  EXPECT_EQ(BackendId::kTreeAutomation, settings_.preferred_backend);
  EXPECT_TRUE(settings_.auto_switch_backend);
  EXPECT_TRUE(settings_.auto_activate_extended);
  EXPECT_EQ(2000, settings_.native_call_timeout.InMilliseconds());
  ASSERT_EQ(6u, settings_.extended_capable_processes.size());
  EXPECT_EQ("chrome", settings_.extended_capable_processes[0]);
}

TEST_F(BackendSettingsTest, EmptyCommandLineChangesNothing) {
  EXPECT_TRUE(ApplyCommandLineSettings(command_line_, &settings_));
  EXPECT_EQ(2u, settings_.enabled_backends.Size());
  EXPECT_EQ(BackendId::kTreeAutomation, settings_.preferred_backend);
}

TEST_F(BackendSettingsTest, ValidSwitches) {
  command_line_.AppendSwitchASCII(switches::kEnableBackends, "ia2,jab");
  command_line_.AppendSwitchASCII(switches::kPreferredBackend, "JAB");
  command_line_.AppendSwitchASCII(switches::kNativeCallTimeoutMs, "500");
  command_line_.AppendSwitchASCII(switches::kExtendedCapableProcesses,
                                  "Chrome, thorium");
  command_line_.AppendSwitch(switches::kDisableBackendAutoSwitch);
  command_line_.AppendSwitch(switches::kDisableExtendedActivation);

  EXPECT_TRUE(ApplyCommandLineSettings(command_line_, &settings_));
  EXPECT_EQ("ia2,jab", settings_.enabled_backends.ToString());
  EXPECT_EQ(BackendId::kToolkitBridge, settings_.preferred_backend);
  EXPECT_EQ(500, settings_.native_call_timeout.InMilliseconds());
  ASSERT_EQ(2u, settings_.extended_capable_processes.size());
  EXPECT_EQ("chrome", settings_.extended_capable_processes[0]);
  EXPECT_EQ("thorium", settings_.extended_capable_processes[1]);
  EXPECT_FALSE(settings_.auto_switch_backend);
  EXPECT_FALSE(settings_.auto_activate_extended);
}

TEST_F(BackendSettingsTest, InvalidValuesAreSkipped) {
  command_line_.AppendSwitchASCII(switches::kEnableBackends, "uia,atspi");
  command_line_.AppendSwitchASCII(switches::kPreferredBackend, "msaa");
  command_line_.AppendSwitchASCII(switches::kNativeCallTimeoutMs, "-5");

  EXPECT_FALSE(ApplyCommandLineSettings(command_line_, &settings_));
  // The valid switch still took effect.
  EXPECT_EQ(BackendId::kLegacyAccessible, settings_.preferred_backend);
  EXPECT_EQ("uia,msaa", settings_.enabled_backends.ToString());
  EXPECT_EQ(2000, settings_.native_call_timeout.InMilliseconds());
}

TEST_F(BackendSettingsTest, EmptyBackendListIsRejected) {
  command_line_.AppendSwitchASCII(switches::kEnableBackends, "");
  EXPECT_FALSE(ApplyCommandLineSettings(command_line_, &settings_));
  EXPECT_EQ(2u, settings_.enabled_backends.Size());
}

TEST_F(BackendSettingsTest, TimeoutMustBeANumber) {
  command_line_.AppendSwitchASCII(switches::kNativeCallTimeoutMs, "fast");
  EXPECT_FALSE(ApplyCommandLineSettings(command_line_, &settings_));
  EXPECT_EQ(2000, settings_.native_call_timeout.InMilliseconds());
}

TEST_F(BackendSettingsTest, ProcessNamesMatchTheFocusedExecutable) {
  command_line_.AppendSwitchASCII(switches::kExtendedCapableProcesses,
                                  "Chrome.EXE, brave.exe,thorium, .exe");

  EXPECT_TRUE(ApplyCommandLineSettings(command_line_, &settings_));
  ASSERT_EQ(3u, settings_.extended_capable_processes.size());
  EXPECT_EQ("chrome", settings_.extended_capable_processes[0]);
  EXPECT_EQ("brave", settings_.extended_capable_processes[1]);
  EXPECT_EQ("thorium", settings_.extended_capable_processes[2]);
}

TEST(ParseProcessListTest, NormalizesLikeTheBackendMap) {
  std::vector<std::string> processes =
      ParseProcessList("MSEdge.exe,,  opera ");
  ASSERT_EQ(2u, processes.size());
  EXPECT_EQ("msedge", processes[0]);
  EXPECT_EQ("opera", processes[1]);
  EXPECT_TRUE(ParseProcessList("").empty());
}

}  // namespace screen_access
