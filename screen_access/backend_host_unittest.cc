// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_host.h"

#include <memory>

#include "base/strings/utf_string_conversions.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
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

const base::ProcessId kJavaPid = 77;

}  // namespace

class BackendHostTest : public ::testing::Test {
 protected:
  BackendHostTest() : platform_(new NiceMock<MockActivationPlatform>) {
    ON_CALL(*platform_, GetProcessName(kJavaPid, _))
        .WillByDefault(DoAll(SetArgPointee<1>(ASCIIToUTF16("javaw.exe")),
                             Return(true)));
    settings_.enabled_backends.Clear();
    settings_.enabled_backends.Put(BackendId::kTreeAutomation);
    settings_.enabled_backends.Put(BackendId::kLegacyAccessible);
    settings_.preferred_backend = BackendId::kLegacyAccessible;
    host_.reset(new BackendHost(
        settings_, std::unique_ptr<ActivationPlatform>(platform_)));

    // Registered ahead of Start() so the platform providers are dropped as
    // duplicates.
    uia_ = Register(BackendId::kTreeAutomation);
    msaa_ = Register(BackendId::kLegacyAccessible);
    ia2_ = Register(BackendId::kExtendedAccessible);
    jab_ = Register(BackendId::kToolkitBridge);
  }

  FakeAccessibilityProvider* Register(BackendId id) {
    FakeAccessibilityProvider* provider = new FakeAccessibilityProvider(id);
    host_->registry()->RegisterProvider(
        std::unique_ptr<AccessibilityProvider>(provider));
    return provider;
  }

  BackendSettings settings_;
  // Owned by |host_|.
  MockActivationPlatform* platform_;
  std::unique_ptr<BackendHost> host_;
  FakeAccessibilityProvider* uia_;
  FakeAccessibilityProvider* msaa_;
  FakeAccessibilityProvider* ia2_;
  FakeAccessibilityProvider* jab_;
};

TEST_F(BackendHostTest, StartAppliesSettings) {
  host_->Start();
  ProviderRegistry* registry = host_->registry();
  EXPECT_EQ(4u, registry->EnumerateBackends().size());
  EXPECT_EQ(uia_, registry->GetProvider(BackendId::kTreeAutomation));
  EXPECT_EQ(BackendId::kLegacyAccessible, registry->preferred_backend());
  EXPECT_TRUE(uia_->IsActive());
  EXPECT_TRUE(msaa_->IsActive());
  EXPECT_FALSE(ia2_->IsInitialized());
  EXPECT_FALSE(jab_->IsInitialized());

  std::unique_ptr<AccessibleNode> node = registry->GetFocusedObject();
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kLegacyAccessible, node->source());
}

TEST_F(BackendHostTest, StartTwiceDoesNothing) {
  host_->Start();
  host_->Start();
  EXPECT_EQ(1, msaa_->initialize_count());
  EXPECT_EQ(1, msaa_->install_count());
}

TEST_F(BackendHostTest, FocusInJavaProcessSwitchesToToolkitBridge) {
  host_->Start();
  EXPECT_CALL(*platform_, ProbeExtendedInterface(_)).Times(0);

  msaa_->SimulateFocusChanged(ASCIIToUTF16("OK"), kJavaPid);
  EXPECT_EQ(BackendId::kToolkitBridge,
            host_->registry()->preferred_backend());
  EXPECT_TRUE(jab_->IsActive());
}

TEST_F(BackendHostTest, ShutdownReleasesEverything) {
  host_->Start();
  host_->Shutdown();
  host_->Shutdown();
  EXPECT_TRUE(host_->registry()->EnumerateBackends().empty());
  EXPECT_FALSE(host_->registry()->GetFocusedObject());

  // No restart after shutdown.
  host_->Start();
  EXPECT_TRUE(host_->registry()->EnumerateBackends().empty());
}

}  // namespace screen_access
