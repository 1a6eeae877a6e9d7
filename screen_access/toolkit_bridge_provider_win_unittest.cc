// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/toolkit_bridge_provider_win.h"

#include <string.h>

#include <map>

#include "base/macros.h"
#include "base/strings/string_util.h"
#include "base/strings/utf_string_conversions.h"
#include "gtest/gtest.h"
#include "screen_access/window_util_win.h"

namespace screen_access {

namespace {

const long kVmId = 7;
const AccessibleContext kFrameContext = 100;
const AccessibleContext kButtonContext = 200;
const AccessibleContext kPanelContext = 300;

// What the fake bridge answers, and which contexts were handed back.
struct FakeJavaVm {
  FakeJavaVm()
      : window_context(kFrameContext),
        hit_test_result(kButtonContext),
        hit_test_fails(false) {}

  AccessibleContext window_context;
  AccessibleContext hit_test_result;
  bool hit_test_fails;
  std::map<AccessibleContext, int> releases;
};

FakeJavaVm* g_vm = NULL;

void FakeWindowsRun() {
}

BOOL FakeIsJavaWindow(HWND window) {
  return TRUE;
}

BOOL FakeGetContextFromHWND(HWND window,
                            long* vm_id,
                            AccessibleContext* context) {
  *vm_id = kVmId;
  *context = g_vm->window_context;
  return TRUE;
}

BOOL FakeGetContextWithFocus(HWND window,
                             long* vm_id,
                             AccessibleContext* context) {
  *vm_id = kVmId;
  *context = kButtonContext;
  return TRUE;
}

BOOL FakeGetContextAt(long vm_id,
                      AccessibleContext parent,
                      jint x,
                      jint y,
                      AccessibleContext* context) {
  if (g_vm->hit_test_fails)
    return FALSE;
  *context = g_vm->hit_test_result;
  return TRUE;
}

BOOL FakeGetContextInfo(long vm_id,
                        AccessibleContext context,
                        AccessibleContextInfo* info) {
  memset(info, 0, sizeof(*info));
  switch (context) {
    case kFrameContext:
      base::wcslcpy(info->role_en_US, L"frame", arraysize(info->role_en_US));
      base::wcslcpy(info->name, L"Editor", arraysize(info->name));
      info->indexInParent = -1;
      info->childrenCount = 1;
      return TRUE;
    case kPanelContext:
      base::wcslcpy(info->role_en_US, L"panel", arraysize(info->role_en_US));
      info->indexInParent = 0;
      info->childrenCount = 3;
      return TRUE;
    case kButtonContext:
      base::wcslcpy(info->role_en_US, L"push button",
                    arraysize(info->role_en_US));
      base::wcslcpy(info->states_en_US, L"enabled,focusable",
                    arraysize(info->states_en_US));
      base::wcslcpy(info->name, L"OK", arraysize(info->name));
      info->indexInParent = 1;
      return TRUE;
  }
  return FALSE;
}

AccessibleContext FakeGetParentFromContext(long vm_id,
                                           AccessibleContext context) {
  return context == kButtonContext ? kPanelContext : 0;
}

void FakeReleaseJavaObject(long vm_id, Java_Object object) {
  ++g_vm->releases[object];
}

void FakeSetFocusGained(AccessBridge_FocusGainedFP callback) {
}

}  // namespace

class ToolkitBridgeProviderWinTest : public ::testing::Test {
 protected:
  ToolkitBridgeProviderWinTest() : bridge_(new ToolkitBridge()) {
    bridge_->windows_run = &FakeWindowsRun;
    bridge_->is_java_window = &FakeIsJavaWindow;
    bridge_->get_context_from_hwnd = &FakeGetContextFromHWND;
    bridge_->get_context_with_focus = &FakeGetContextWithFocus;
    bridge_->get_context_at = &FakeGetContextAt;
    bridge_->get_context_info = &FakeGetContextInfo;
    bridge_->get_parent_from_context = &FakeGetParentFromContext;
    bridge_->release_java_object = &FakeReleaseJavaObject;
    bridge_->set_focus_gained = &FakeSetFocusGained;
  }

  void SetUp() override { g_vm = &vm_; }
  void TearDown() override { g_vm = NULL; }

  int ReleaseCount(AccessibleContext context) const {
    std::map<AccessibleContext, int>::const_iterator it =
        vm_.releases.find(context);
    return it == vm_.releases.end() ? 0 : it->second;
  }

  FakeJavaVm vm_;
  scoped_refptr<ToolkitBridge> bridge_;
};

TEST_F(ToolkitBridgeProviderWinTest, InjectedBridgeIsAvailable) {
  ToolkitBridgeProviderWin provider(bridge_);
  EXPECT_TRUE(provider.IsAvailable());

  bridge_->get_context_at = NULL;
  EXPECT_FALSE(provider.IsAvailable());
}

TEST_F(ToolkitBridgeProviderWinTest, FailedHitTestFallsThrough) {
  vm_.hit_test_fails = true;
  ToolkitBridgeProviderWin provider(bridge_);

  std::unique_ptr<AccessibleNode> node =
      provider.NodeAtPoint(GetDesktopWindow(), 5, 5);
  EXPECT_FALSE(node);
  EXPECT_EQ(1, ReleaseCount(kFrameContext));
}

TEST_F(ToolkitBridgeProviderWinTest, HitTestReleasesTopLevelContext) {
  ToolkitBridgeProviderWin provider(bridge_);
  {
    std::unique_ptr<AccessibleNode> node =
        provider.NodeAtPoint(GetDesktopWindow(), 5, 5);
    ASSERT_TRUE(node);
    EXPECT_EQ(AccessibleRole::kPushButton, node->role());
    EXPECT_EQ(1, ReleaseCount(kFrameContext));
    EXPECT_EQ(0, ReleaseCount(kButtonContext));
  }
  EXPECT_EQ(1, ReleaseCount(kButtonContext));

  // A hit test that lands on the frame itself keeps its one reference.
  vm_.hit_test_result = kFrameContext;
  {
    std::unique_ptr<AccessibleNode> node =
        provider.NodeAtPoint(GetDesktopWindow(), 5, 5);
    ASSERT_TRUE(node);
    EXPECT_EQ(1, ReleaseCount(kFrameContext));
  }
  EXPECT_EQ(2, ReleaseCount(kFrameContext));
}

TEST_F(ToolkitBridgeProviderWinTest, GroupSizeComesFromTheParent) {
  vm_.window_context = kButtonContext;
  ToolkitBridgeProviderWin provider(bridge_);
  ASSERT_TRUE(provider.Initialize());

  std::unique_ptr<AccessibleNode> node = provider.GetObjectFromHandle(
      FromHWND(GetDesktopWindow()));
  ASSERT_TRUE(node);
  EXPECT_EQ(base::ASCIIToUTF16("OK"), node->name());
  EXPECT_EQ(2, node->position_in_group());
  EXPECT_EQ(3, node->group_size());
  EXPECT_EQ(1, ReleaseCount(kPanelContext));

  node.reset();
  EXPECT_EQ(1, ReleaseCount(kButtonContext));
}

TEST_F(ToolkitBridgeProviderWinTest, NoGroupSizeWithoutParentLookup) {
  vm_.window_context = kButtonContext;
  bridge_->get_parent_from_context = NULL;
  ToolkitBridgeProviderWin provider(bridge_);
  ASSERT_TRUE(provider.Initialize());

  std::unique_ptr<AccessibleNode> node = provider.GetObjectFromHandle(
      FromHWND(GetDesktopWindow()));
  ASSERT_TRUE(node);
  EXPECT_EQ(2, node->position_in_group());
  EXPECT_EQ(0, node->group_size());
}

}  // namespace screen_access
