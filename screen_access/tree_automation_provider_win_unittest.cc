// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/tree_automation_provider_win.h"

#include <memory>

#include "base/message_loop/message_loop.h"
#include "base/strings/utf_string_conversions.h"
#include "base/time/time.h"
#include "base/win/scoped_com_initializer.h"
#include "gtest/gtest.h"

namespace screen_access {

namespace {

class CountingDelegate : public AccessibilityProvider::Delegate {
 public:
  CountingDelegate() : focus_count_(0) {}

  void OnProviderFocusChanged(AccessibilityProvider* provider,
                              const AccessibleNode& node) override {
    ++focus_count_;
  }

  int focus_count() const { return focus_count_; }

 private:
  int focus_count_;
};

std::unique_ptr<AccessibleNode> MakeFocusNode() {
  AccessibleNodeData data;
  data.role = AccessibleRole::kEdit;
  data.name = base::ASCIIToUTF16("Search");
  return std::unique_ptr<AccessibleNode>(
      new AccessibleNode(BackendId::kTreeAutomation, data));
}

}  // namespace

class TreeAutomationProviderWinTest : public ::testing::Test {
 protected:
  TreeAutomationProviderWinTest()
      : provider_(base::TimeDelta::FromMilliseconds(500)) {}

  void SetUp() override {
    provider_.set_delegate(&delegate_);
    ASSERT_TRUE(provider_.Initialize());
  }

  void TearDown() override { provider_.Shutdown(); }

  base::win::ScopedCOMInitializer com_initializer_;
  CountingDelegate delegate_;
  TreeAutomationProviderWin provider_;
};

TEST_F(TreeAutomationProviderWinTest, ListeningNeedsAMessageLoop) {
  provider_.StartEventListening();
  EXPECT_FALSE(provider_.is_listening());
  EXPECT_FALSE(provider_.IsActive());
}

TEST_F(TreeAutomationProviderWinTest, FocusIsDeliveredOnlyWhileListening) {
  base::MessageLoop message_loop;
  provider_.StartEventListening();
  ASSERT_TRUE(provider_.is_listening());

  provider_.DeliverFocusChanged(MakeFocusNode());
  EXPECT_EQ(1, delegate_.focus_count());

  // Stopping while a posted event is still queued drops that event.
  provider_.StopEventListening();
  provider_.DeliverFocusChanged(MakeFocusNode());
  EXPECT_EQ(1, delegate_.focus_count());
}

TEST_F(TreeAutomationProviderWinTest, ListenerCanBeRestarted) {
  base::MessageLoop message_loop;
  provider_.StartEventListening();
  provider_.StopEventListening();
  provider_.StartEventListening();
  EXPECT_TRUE(provider_.is_listening());
}

}  // namespace screen_access
