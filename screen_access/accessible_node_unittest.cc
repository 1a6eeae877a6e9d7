// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/accessible_node.h"

#include "base/strings/utf_string_conversions.h"
#include "gtest/gtest.h"

namespace screen_access {

namespace {

class CountingHandle : public NativeElementHandle {
 public:
  explicit CountingHandle(int* destroyed) : destroyed_(destroyed) {}

 private:
  ~CountingHandle() override { ++*destroyed_; }

  int* destroyed_;
};

}  // namespace

TEST(StateSetTest, AddRemoveMerge) {
  StateSet states;
  EXPECT_TRUE(states.Empty());
  states.Add(AccessibleState::kFocused);
  states.Add(AccessibleState::kHasAutoComplete);
  EXPECT_TRUE(states.Has(AccessibleState::kFocused));
  EXPECT_TRUE(states.Has(AccessibleState::kHasAutoComplete));
  EXPECT_FALSE(states.Has(AccessibleState::kSelected));

  StateSet other;
  other.Add(AccessibleState::kSelected);
  states.Merge(other);
  EXPECT_TRUE(states.Has(AccessibleState::kSelected));

  states.Remove(AccessibleState::kFocused);
  EXPECT_FALSE(states.Has(AccessibleState::kFocused));
  EXPECT_EQ(StateSet::FromBits(states.bits()), states);
}

TEST(ScreenRectTest, ContainsIsHalfOpen) {
  ScreenRect rect(10, 20, 30, 40);
  EXPECT_FALSE(rect.IsEmpty());
  EXPECT_TRUE(rect.Contains(10, 20));
  EXPECT_TRUE(rect.Contains(39, 59));
  EXPECT_FALSE(rect.Contains(40, 20));
  EXPECT_FALSE(rect.Contains(10, 60));
  EXPECT_TRUE(ScreenRect(0, 0, 0, 5).IsEmpty());
}

TEST(AccessibleNodeTest, SourceIsStampedByConstructor) {
  AccessibleNodeData data;
  data.native_ref.source = BackendId::kToolkitBridge;
  data.role = AccessibleRole::kCheckButton;
  data.name = base::ASCIIToUTF16("Remember me");
  data.states.Add(AccessibleState::kChecked);

  AccessibleNode node(BackendId::kLegacyAccessible, data);
  EXPECT_EQ(BackendId::kLegacyAccessible, node.source());
  EXPECT_EQ(AccessibleRole::kCheckButton, node.role());
  EXPECT_TRUE(node.HasState(AccessibleState::kChecked));
  EXPECT_EQ("CheckButton 'Remember me' [msaa]", node.ToString());

  AccessibleNodeData copy = node.ToData();
  EXPECT_EQ(BackendId::kLegacyAccessible, copy.native_ref.source);
  EXPECT_EQ(data.name, copy.name);
}

TEST(AccessibleNodeTest, OutOfRangeRoleBecomesPane) {
  AccessibleNodeData data;
  data.role = static_cast<AccessibleRole>(
      static_cast<int>(AccessibleRole::kLastRole) + 1);
  AccessibleNode node(BackendId::kTreeAutomation, data);
  EXPECT_EQ(AccessibleRole::kPane, node.role());
}

TEST(AccessibleNodeTest, EveryRoleHasAName) {
  for (int i = 0; i <= static_cast<int>(AccessibleRole::kLastRole); ++i) {
    EXPECT_STRNE("", AccessibleRoleToString(static_cast<AccessibleRole>(i)))
        << "role " << i;
  }
}

TEST(NativeElementRefTest, EmptyUntilSomethingIdentifiesTheElement) {
  NativeElementRef ref;
  EXPECT_TRUE(ref.IsEmpty());
  ref.window = 0x1234;
  EXPECT_FALSE(ref.IsEmpty());
}

TEST(NativeElementRefTest, NodesShareTheNativeElement) {
  int destroyed = 0;
  std::unique_ptr<AccessibleNode> copy;
  {
    AccessibleNodeData data;
    data.native_ref.native_object = new CountingHandle(&destroyed);
    EXPECT_FALSE(data.native_ref.IsEmpty());
    AccessibleNode node(BackendId::kTreeAutomation, data);
    copy.reset(new AccessibleNode(BackendId::kTreeAutomation, node.ToData()));
  }
  EXPECT_EQ(0, destroyed);
  copy.reset();
  EXPECT_EQ(1, destroyed);
}

}  // namespace screen_access
