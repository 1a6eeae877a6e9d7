// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/provider_base.h"

#include "base/strings/utf_string_conversions.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "screen_access/test/fake_accessibility_provider.h"

using base::ASCIIToUTF16;
using ::testing::_;
using ::testing::Property;

namespace screen_access {

namespace {

class MockProviderDelegate : public AccessibilityProvider::Delegate {
 public:
  MOCK_METHOD2(OnProviderFocusChanged,
               void(AccessibilityProvider*, const AccessibleNode&));
};

}  // namespace

TEST(ProviderBaseTest, QueriesFailBeforeInitialize) {
  FakeAccessibilityProvider provider(BackendId::kLegacyAccessible);
  EXPECT_FALSE(provider.IsInitialized());
  EXPECT_FALSE(provider.GetFocusedObject());
  EXPECT_FALSE(provider.GetObjectFromPoint(1, 2));
  EXPECT_FALSE(provider.GetObjectFromHandle(0x10));
  EXPECT_EQ(0, provider.query_count());
}

TEST(ProviderBaseTest, InitializeIsIdempotent) {
  FakeAccessibilityProvider provider(BackendId::kLegacyAccessible);
  EXPECT_TRUE(provider.Initialize());
  EXPECT_TRUE(provider.Initialize());
  EXPECT_EQ(1, provider.initialize_count());
  EXPECT_TRUE(provider.IsInitialized());

  std::unique_ptr<AccessibleNode> node = provider.GetFocusedObject();
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kLegacyAccessible, node->source());
}

TEST(ProviderBaseTest, UnavailableProviderNeverInitializes) {
  FakeAccessibilityProvider provider(BackendId::kToolkitBridge);
  provider.set_available(false);
  EXPECT_FALSE(provider.Initialize());
  EXPECT_EQ(0, provider.initialize_count());
}

TEST(ProviderBaseTest, FailedInitializeCanBeRetried) {
  FakeAccessibilityProvider provider(BackendId::kTreeAutomation);
  provider.set_initialize_result(false);
  EXPECT_FALSE(provider.Initialize());
  provider.set_initialize_result(true);
  EXPECT_TRUE(provider.Initialize());
  EXPECT_EQ(2, provider.initialize_count());
}

TEST(ProviderBaseTest, NullHandleIsRejected) {
  FakeAccessibilityProvider provider(BackendId::kLegacyAccessible);
  ASSERT_TRUE(provider.Initialize());
  EXPECT_FALSE(provider.GetObjectFromHandle(kNullWindowHandle));
  EXPECT_EQ(0, provider.query_count());
}

TEST(ProviderBaseTest, UnsupportedElementIsNotQueried) {
  FakeAccessibilityProvider provider(BackendId::kLegacyAccessible);
  ASSERT_TRUE(provider.Initialize());
  provider.set_supports_elements(false);
  NativeElementRef ref;
  ref.window = 0x42;
  EXPECT_FALSE(provider.GetAccessibleObject(ref));
  EXPECT_EQ(0, provider.query_count());
}

TEST(ProviderBaseTest, ListeningLifecycle) {
  FakeAccessibilityProvider provider(BackendId::kLegacyAccessible);

  // Not initialized yet.
  provider.StartEventListening();
  EXPECT_EQ(0, provider.install_count());
  EXPECT_FALSE(provider.IsActive());

  ASSERT_TRUE(provider.Initialize());
  EXPECT_FALSE(provider.IsActive());
  provider.StartEventListening();
  provider.StartEventListening();
  EXPECT_EQ(1, provider.install_count());
  EXPECT_TRUE(provider.IsActive());

  provider.StopEventListening();
  provider.StopEventListening();
  EXPECT_EQ(1, provider.remove_count());
  EXPECT_FALSE(provider.IsActive());
  EXPECT_TRUE(provider.IsInitialized());
}

TEST(ProviderBaseTest, FailedHookLeavesProviderInactive) {
  FakeAccessibilityProvider provider(BackendId::kToolkitBridge);
  ASSERT_TRUE(provider.Initialize());
  provider.set_hook_result(false);
  provider.StartEventListening();
  EXPECT_FALSE(provider.IsActive());
  provider.StopEventListening();
  EXPECT_EQ(0, provider.remove_count());
}

TEST(ProviderBaseTest, ShutdownIsIdempotentAndFinal) {
  FakeAccessibilityProvider provider(BackendId::kTreeAutomation);
  ASSERT_TRUE(provider.Initialize());
  provider.StartEventListening();

  provider.Shutdown();
  provider.Shutdown();
  EXPECT_EQ(1, provider.remove_count());
  EXPECT_EQ(1, provider.release_count());
  EXPECT_FALSE(provider.IsInitialized());
  EXPECT_FALSE(provider.IsActive());

  EXPECT_FALSE(provider.Initialize());
  EXPECT_EQ(1, provider.initialize_count());
  EXPECT_FALSE(provider.GetFocusedObject());
}

TEST(ProviderBaseTest, ShutdownWithoutInitializeReleasesNothing) {
  FakeAccessibilityProvider provider(BackendId::kTreeAutomation);
  provider.Shutdown();
  EXPECT_EQ(0, provider.release_count());
}

TEST(ProviderBaseTest, FocusChangesReachDelegateUntilShutdown) {
  MockProviderDelegate delegate;
  FakeAccessibilityProvider provider(BackendId::kExtendedAccessible);
  provider.set_delegate(&delegate);

  EXPECT_CALL(delegate,
              OnProviderFocusChanged(
                  &provider,
                  Property(&AccessibleNode::source,
                           BackendId::kExtendedAccessible)));
  provider.SimulateFocusChanged(ASCIIToUTF16("OK"), 42);

  provider.Shutdown();
  EXPECT_CALL(delegate, OnProviderFocusChanged(_, _)).Times(0);
  provider.SimulateFocusChanged(ASCIIToUTF16("OK"), 42);
}

}  // namespace screen_access
