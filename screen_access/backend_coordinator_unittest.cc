// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_coordinator.h"

#include <memory>

#include "base/strings/utf_string_conversions.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "screen_access/backend_settings.h"
#include "screen_access/test/fake_accessibility_provider.h"
#include "screen_access/test/mock_activation_platform.h"

using base::ASCIIToUTF16;
using ::testing::_;
using ::testing::DoAll;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::SetArgPointee;

namespace screen_access {

namespace {

const base::ProcessId kChromePid = 10;
const base::ProcessId kFirefoxPid = 20;
const WindowHandle kChromeWindow = 0x1000;

}  // namespace

class BackendCoordinatorTest : public ::testing::Test {
 protected:
  BackendCoordinatorTest()
      : platform_(NULL), uia_(NULL), ia2_(NULL) {}

  void SetUp() override {
    uia_ = Register(BackendId::kTreeAutomation);
    Register(BackendId::kLegacyAccessible);
    ia2_ = Register(BackendId::kExtendedAccessible);

    BackendSettings settings;
    settings.enabled_backends.Clear();
    settings.enabled_backends.Put(BackendId::kTreeAutomation);
    registry_.ApplySettings(settings);
    registry_.InitializeEnabledProviders();
    registry_.StartEventListening();
  }

  void TearDown() override {
    if (coordinator_)
      coordinator_->Detach();
  }

  FakeAccessibilityProvider* Register(BackendId id) {
    FakeAccessibilityProvider* provider = new FakeAccessibilityProvider(id);
    registry_.RegisterProvider(
        std::unique_ptr<AccessibilityProvider>(provider));
    return provider;
  }

  void CreateCoordinator(bool auto_activate_extended) {
    BackendSettings settings;
    settings.auto_activate_extended = auto_activate_extended;
    coordinator_.reset(new BackendCoordinator(&registry_, settings));

    platform_ = new NiceMock<MockActivationPlatform>;
    ON_CALL(*platform_, GetProcessName(kChromePid, _))
        .WillByDefault(DoAll(SetArgPointee<1>(ASCIIToUTF16("chrome.exe")),
                             Return(true)));
    ON_CALL(*platform_, GetProcessName(kFirefoxPid, _))
        .WillByDefault(DoAll(SetArgPointee<1>(ASCIIToUTF16("firefox.exe")),
                             Return(true)));
    ON_CALL(*platform_, GetMainWindow(kChromePid))
        .WillByDefault(Return(kChromeWindow));
    negotiator_.reset(new ActivationNegotiator(
        std::unique_ptr<ActivationPlatform>(platform_),
        settings.extended_capable_processes, coordinator_.get()));
    coordinator_->Attach(negotiator_.get());
  }

  ProviderRegistry registry_;
  std::unique_ptr<BackendCoordinator> coordinator_;
  std::unique_ptr<ActivationNegotiator> negotiator_;
  // Owned by |negotiator_|.
  MockActivationPlatform* platform_;
  FakeAccessibilityProvider* uia_;
  FakeAccessibilityProvider* ia2_;
};

TEST_F(BackendCoordinatorTest, ExtendedActivationEnablesExtendedBackend) {
  CreateCoordinator(true);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(kChromeWindow))
      .WillOnce(Return(true));

  coordinator_->HandleProcessFocused(kChromePid);
  EXPECT_EQ(AccessibilityModel::kExtendedAccessible,
            negotiator_->GetModelForProcess(kChromePid));
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kExtendedAccessible));
  EXPECT_TRUE(ia2_->IsActive());
  // Chromium stays on tree automation; the extended backend only joins the
  // fallback chain.
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
}

TEST_F(BackendCoordinatorTest, FailedActivationLeavesBackendsAlone) {
  CreateCoordinator(true);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_))
      .Times(2)
      .WillRepeatedly(Return(false));

  coordinator_->HandleProcessFocused(kChromePid);
  EXPECT_FALSE(registry_.IsEnabled(BackendId::kExtendedAccessible));
}

TEST_F(BackendCoordinatorTest, UnavailableExtendedBackendIsNotEnabled) {
  ia2_->set_available(false);
  CreateCoordinator(true);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).WillOnce(Return(true));

  coordinator_->HandleProcessFocused(kChromePid);
  EXPECT_FALSE(registry_.IsEnabled(BackendId::kExtendedAccessible));
}

TEST_F(BackendCoordinatorTest, ActivationCanBeDisabled) {
  CreateCoordinator(false);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).Times(0);
  coordinator_->HandleProcessFocused(kChromePid);
  EXPECT_EQ(AccessibilityModel::kUnknown,
            negotiator_->GetModelForProcess(kChromePid));
}

TEST_F(BackendCoordinatorTest, FocusedProcessPicksPreferredBackend) {
  CreateCoordinator(true);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).Times(0);

  coordinator_->HandleProcessFocused(kFirefoxPid);
  EXPECT_EQ(BackendId::kExtendedAccessible, registry_.preferred_backend());
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kExtendedAccessible));
}

TEST_F(BackendCoordinatorTest, RepeatedFocusInSameProcessIsIgnored) {
  CreateCoordinator(true);
  // Once for backend selection and once by the negotiator.
  EXPECT_CALL(*platform_, GetProcessName(kFirefoxPid, _))
      .Times(2)
      .WillRepeatedly(DoAll(SetArgPointee<1>(ASCIIToUTF16("firefox.exe")),
                            Return(true)));
  EXPECT_CALL(*platform_, GetProcessName(0, _)).Times(0);

  coordinator_->HandleProcessFocused(kFirefoxPid);
  coordinator_->HandleProcessFocused(kFirefoxPid);
  coordinator_->HandleProcessFocused(0);
}

TEST_F(BackendCoordinatorTest, FocusEventsDriveSelection) {
  CreateCoordinator(true);
  uia_->SimulateFocusChanged(ASCIIToUTF16("Address bar"), kFirefoxPid);
  EXPECT_EQ(BackendId::kExtendedAccessible, registry_.preferred_backend());
}

TEST_F(BackendCoordinatorTest, DetachedCoordinatorIgnoresFocusEvents) {
  CreateCoordinator(true);
  coordinator_->Detach();
  uia_->SimulateFocusChanged(ASCIIToUTF16("Address bar"), kFirefoxPid);
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
}

TEST_F(BackendCoordinatorTest, ProcessExitAllowsReactivation) {
  CreateCoordinator(true);
  EXPECT_CALL(*platform_, ProbeExtendedInterface(kChromeWindow))
      .Times(2)
      .WillRepeatedly(Return(true));

  coordinator_->HandleProcessFocused(kChromePid);
  coordinator_->HandleProcessExited(kChromePid);
  EXPECT_EQ(AccessibilityModel::kUnknown,
            negotiator_->GetModelForProcess(kChromePid));
  coordinator_->HandleProcessFocused(kChromePid);
}

TEST_F(BackendCoordinatorTest, ProcessExitClearsProviderCaches) {
  CreateCoordinator(false);
  coordinator_->HandleProcessExited(kFirefoxPid);
  ASSERT_EQ(1u, uia_->forgotten_processes().size());
  EXPECT_EQ(kFirefoxPid, uia_->forgotten_processes()[0]);
}

}  // namespace screen_access
