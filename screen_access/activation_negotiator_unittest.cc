// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/activation_negotiator.h"

#include <string>
#include <vector>

#include "base/strings/utf_string_conversions.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "screen_access/test/mock_activation_platform.h"

using base::ASCIIToUTF16;
using ::testing::_;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;

namespace screen_access {

namespace {

const base::ProcessId kBrowserPid = 1200;
const base::ProcessId kEditorPid = 3400;
const WindowHandle kMainWindow = 0x100;
const WindowHandle kContentWindow = 0x200;

class MockNegotiatorDelegate : public ActivationNegotiator::Delegate {
 public:
  MOCK_METHOD2(OnAccessibilityModelChanged,
               void(base::ProcessId, AccessibilityModel));
};

}  // namespace

class ActivationNegotiatorTest : public ::testing::Test {
 protected:
  ActivationNegotiatorTest() : platform_(new NiceMock<MockActivationPlatform>) {
    std::vector<std::string> capable;
    capable.push_back("chrome");
    capable.push_back("msedge");
    negotiator_.reset(new ActivationNegotiator(
        std::unique_ptr<ActivationPlatform>(platform_), capable, &delegate_));

    ON_CALL(*platform_, GetProcessName(kBrowserPid, _))
        .WillByDefault(DoAll(SetArgPointee<1>(ASCIIToUTF16("chrome.exe")),
                             Return(true)));
    ON_CALL(*platform_, GetProcessName(kEditorPid, _))
        .WillByDefault(DoAll(SetArgPointee<1>(ASCIIToUTF16("notepad.exe")),
                             Return(true)));
    ON_CALL(*platform_, GetMainWindow(_)).WillByDefault(Return(kMainWindow));
  }

  // Makes |kMainWindow| host a render widget child.
  void ExpectContentWindow() {
    std::vector<ActivationPlatform::WindowInfo> windows;
    windows.push_back(MakeWindowInfo(0x150, "Chrome_WidgetWin_0"));
    windows.push_back(MakeWindowInfo(kContentWindow,
                                     "Chrome_RenderWidgetHostHWND"));
    ON_CALL(*platform_, GetDescendantWindows(kMainWindow, _))
        .WillByDefault(SetArgPointee<1>(windows));
  }

  MockNegotiatorDelegate delegate_;
  // Owned by |negotiator_|.
  MockActivationPlatform* platform_;
  std::unique_ptr<ActivationNegotiator> negotiator_;
};

TEST_F(ActivationNegotiatorTest, ModelNames) {
  EXPECT_STREQ("Unknown",
               AccessibilityModelToString(AccessibilityModel::kUnknown));
  EXPECT_STREQ("IAccessible2", AccessibilityModelToString(
                                   AccessibilityModel::kExtendedAccessible));
}

TEST_F(ActivationNegotiatorTest, CapableProcessNames) {
  EXPECT_TRUE(negotiator_->IsExtendedCapableProcess(ASCIIToUTF16("chrome")));
  EXPECT_TRUE(
      negotiator_->IsExtendedCapableProcess(ASCIIToUTF16("MSEdge.exe")));
  EXPECT_FALSE(
      negotiator_->IsExtendedCapableProcess(ASCIIToUTF16("chromedriver")));
  EXPECT_FALSE(negotiator_->IsExtendedCapableProcess(base::string16()));
}

TEST_F(ActivationNegotiatorTest, FindContentWindow) {
  ExpectContentWindow();
  EXPECT_EQ(kContentWindow, negotiator_->FindContentWindow(kMainWindow));
  EXPECT_EQ(kNullWindowHandle,
            negotiator_->FindContentWindow(kNullWindowHandle));
}

TEST_F(ActivationNegotiatorTest, FindContentWindowMatchesClassFragment) {
  std::vector<ActivationPlatform::WindowInfo> windows;
  windows.push_back(MakeWindowInfo(0x301, "Intermediate D3D Window"));
  windows.push_back(MakeWindowInfo(0x302, "Edge_RenderWidgetHostView"));
  windows.push_back(MakeWindowInfo(0x303, "Chrome_RenderWidgetHostHWND"));
  EXPECT_CALL(*platform_, GetDescendantWindows(kMainWindow, _))
      .WillOnce(SetArgPointee<1>(windows));
  EXPECT_EQ(static_cast<WindowHandle>(0x302),
            negotiator_->FindContentWindow(kMainWindow));
}

TEST_F(ActivationNegotiatorTest, NoContentWindow) {
  std::vector<ActivationPlatform::WindowInfo> windows;
  windows.push_back(MakeWindowInfo(0x150, "Chrome_WidgetWin_0"));
  EXPECT_CALL(*platform_, GetDescendantWindows(kMainWindow, _))
      .WillOnce(SetArgPointee<1>(windows));
  EXPECT_EQ(kNullWindowHandle, negotiator_->FindContentWindow(kMainWindow));
}

TEST_F(ActivationNegotiatorTest, ProbesContentWindowFirstTime) {
  ExpectContentWindow();
  EXPECT_CALL(*platform_, ProbeExtendedInterface(kContentWindow))
      .WillOnce(Return(true));
  EXPECT_CALL(delegate_,
              OnAccessibilityModelChanged(
                  kBrowserPid, AccessibilityModel::kExtendedAccessible));

  EXPECT_EQ(AccessibilityModel::kExtendedAccessible,
            negotiator_->ActivateForProcess(kBrowserPid));
  EXPECT_EQ(AccessibilityModel::kExtendedAccessible,
            negotiator_->GetModelForProcess(kBrowserPid));
}

TEST_F(ActivationNegotiatorTest, SecondAttemptSucceeds) {
  ExpectContentWindow();
  {
    InSequence sequence;
    EXPECT_CALL(*platform_, ProbeExtendedInterface(kContentWindow))
        .WillOnce(Return(false));
    EXPECT_CALL(*platform_, ProbeExtendedInterface(kContentWindow))
        .WillOnce(Return(true));
  }
  EXPECT_CALL(delegate_,
              OnAccessibilityModelChanged(
                  kBrowserPid, AccessibilityModel::kExtendedAccessible));

  EXPECT_EQ(AccessibilityModel::kExtendedAccessible,
            negotiator_->ActivateForProcess(kBrowserPid));
}

// Two failed probes settle the process on tree automation for good.
TEST_F(ActivationNegotiatorTest, GivesUpAfterTwoAttempts) {
  EXPECT_CALL(*platform_, ProbeExtendedInterface(kMainWindow))
      .Times(ActivationNegotiator::kMaxProbeAttempts)
      .WillRepeatedly(Return(false));
  EXPECT_CALL(delegate_,
              OnAccessibilityModelChanged(
                  kBrowserPid, AccessibilityModel::kTreeAutomation));

  EXPECT_EQ(AccessibilityModel::kTreeAutomation,
            negotiator_->ActivateForProcess(kBrowserPid));
  EXPECT_EQ(AccessibilityModel::kTreeAutomation,
            negotiator_->ActivateForProcess(kBrowserPid));
  EXPECT_EQ(AccessibilityModel::kTreeAutomation,
            negotiator_->GetModelForProcess(kBrowserPid));
}

TEST_F(ActivationNegotiatorTest, CachedResultIsNotProbedAgain) {
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).WillOnce(Return(true));
  EXPECT_CALL(delegate_, OnAccessibilityModelChanged(_, _)).Times(1);

  negotiator_->ActivateForProcess(kBrowserPid);
  EXPECT_EQ(AccessibilityModel::kExtendedAccessible,
            negotiator_->ActivateForProcess(kBrowserPid));
}

TEST_F(ActivationNegotiatorTest, OtherProcessesAreNotProbed) {
  EXPECT_CALL(*platform_, GetMainWindow(_)).Times(0);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).Times(0);
  EXPECT_CALL(delegate_, OnAccessibilityModelChanged(_, _)).Times(0);

  EXPECT_EQ(AccessibilityModel::kTreeAutomation,
            negotiator_->ActivateForProcess(kEditorPid));
  EXPECT_EQ(AccessibilityModel::kUnknown,
            negotiator_->GetModelForProcess(kEditorPid));
}

TEST_F(ActivationNegotiatorTest, UnknownProcessIsNotProbed) {
  EXPECT_CALL(*platform_, GetProcessName(99, _)).WillOnce(Return(false));
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).Times(0);
  EXPECT_EQ(AccessibilityModel::kTreeAutomation,
            negotiator_->ActivateForProcess(99));
}

// A browser without a window yet is retried on the next focus.
TEST_F(ActivationNegotiatorTest, MissingMainWindowIsNotCached) {
  EXPECT_CALL(*platform_, GetMainWindow(kBrowserPid))
      .WillOnce(Return(kNullWindowHandle))
      .WillOnce(Return(kMainWindow));
  EXPECT_CALL(*platform_, ProbeExtendedInterface(kMainWindow))
      .WillOnce(Return(true));
  EXPECT_CALL(delegate_, OnAccessibilityModelChanged(_, _)).Times(1);

  EXPECT_EQ(AccessibilityModel::kTreeAutomation,
            negotiator_->ActivateForProcess(kBrowserPid));
  EXPECT_EQ(AccessibilityModel::kUnknown,
            negotiator_->GetModelForProcess(kBrowserPid));
  EXPECT_EQ(AccessibilityModel::kExtendedAccessible,
            negotiator_->ActivateForProcess(kBrowserPid));
}

TEST_F(ActivationNegotiatorTest, ProcessExitedForgetsTheProcess) {
  EXPECT_CALL(*platform_, ProbeExtendedInterface(kMainWindow))
      .Times(2)
      .WillRepeatedly(Return(true));
  EXPECT_CALL(delegate_, OnAccessibilityModelChanged(_, _)).Times(2);

  negotiator_->ActivateForProcess(kBrowserPid);
  negotiator_->ProcessExited(kBrowserPid);
  EXPECT_EQ(AccessibilityModel::kUnknown,
            negotiator_->GetModelForProcess(kBrowserPid));
  negotiator_->ActivateForProcess(kBrowserPid);
}

TEST_F(ActivationNegotiatorTest, ResetForgetsEverything) {
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_))
      .WillRepeatedly(Return(true));
  EXPECT_CALL(delegate_, OnAccessibilityModelChanged(_, _))
      .Times(::testing::AnyNumber());
  negotiator_->ActivateForProcess(kBrowserPid);
  negotiator_->Reset();
  EXPECT_EQ(AccessibilityModel::kUnknown,
            negotiator_->GetModelForProcess(kBrowserPid));
}

TEST_F(ActivationNegotiatorTest, NullWindowIsNeverProbed) {
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).Times(0);
  EXPECT_FALSE(negotiator_->IsExtendedInterfaceAvailable(kNullWindowHandle));
}

}  // namespace screen_access
