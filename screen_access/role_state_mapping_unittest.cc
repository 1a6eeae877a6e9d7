// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/role_state_mapping.h"

#include "base/strings/utf_string_conversions.h"
#include "gtest/gtest.h"

using base::ASCIIToUTF16;

namespace screen_access {

// ROLE_SYSTEM_* values line up with the first block of AccessibleRole.
TEST(RoleStateMappingTest, MsaaRolesMapOneToOne) {
  for (int32_t msaa_role = 1; msaa_role <= 0x40; ++msaa_role) {
    EXPECT_EQ(msaa_role, static_cast<int32_t>(MsaaRoleToRole(msaa_role)))
        << "ROLE_SYSTEM 0x" << std::hex << msaa_role;
  }
  EXPECT_EQ(AccessibleRole::kPushButton, MsaaRoleToRole(0x2B));
  EXPECT_EQ(AccessibleRole::kOutlineButton, MsaaRoleToRole(0x40));
}

TEST(RoleStateMappingTest, UnknownMsaaRolesArePanes) {
  EXPECT_EQ(AccessibleRole::kPane, MsaaRoleToRole(0));
  EXPECT_EQ(AccessibleRole::kPane, MsaaRoleToRole(0x41));
  EXPECT_EQ(AccessibleRole::kPane, MsaaRoleToRole(-1));
  EXPECT_EQ(AccessibleRole::kPane, MsaaRoleToRole(0x401));
}

TEST(RoleStateMappingTest, MsaaStates) {
  EXPECT_TRUE(MsaaStatesToStates(0).Empty());

  // STATE_SYSTEM_FOCUSED | STATE_SYSTEM_FOCUSABLE | STATE_SYSTEM_HASPOPUP
  StateSet states = MsaaStatesToStates(0x80200004);
  EXPECT_TRUE(states.Has(AccessibleState::kFocused));
  EXPECT_TRUE(states.Has(AccessibleState::kFocusable));
  EXPECT_TRUE(states.Has(AccessibleState::kHasPopup));
  EXPECT_FALSE(states.Has(AccessibleState::kSelected));

  // Every bit maps to exactly one distinct state.
  StateSet all = MsaaStatesToStates(0xFFFFFFFF);
  for (int i = 0; i <= static_cast<int>(AccessibleState::kHasPopup); ++i)
    EXPECT_TRUE(all.Has(static_cast<AccessibleState>(i))) << "state " << i;
  EXPECT_FALSE(all.Has(AccessibleState::kInvalid));
}

TEST(RoleStateMappingTest, Ia2Roles) {
  // Plain MSAA roles pass through.
  EXPECT_EQ(AccessibleRole::kLink, Ia2RoleToRole(0x1E));
  EXPECT_EQ(AccessibleRole::kHeading, Ia2RoleToRole(0x414));
  EXPECT_EQ(AccessibleRole::kText, Ia2RoleToRole(0x41E));
  EXPECT_EQ(AccessibleRole::kSection, Ia2RoleToRole(0x424));
  EXPECT_EQ(AccessibleRole::kToggleButton, Ia2RoleToRole(0x42A));
  EXPECT_EQ(AccessibleRole::kLandmark, Ia2RoleToRole(0x42D));
  // IA2_ROLE_UNKNOWN and codes past the table.
  EXPECT_EQ(AccessibleRole::kPane, Ia2RoleToRole(0));
  EXPECT_EQ(AccessibleRole::kPane, Ia2RoleToRole(0x4FF));
}

TEST(RoleStateMappingTest, Ia2States) {
  EXPECT_TRUE(Ia2StatesToStates(0).Empty());
  StateSet states = Ia2StatesToStates(0x40 | 0x800 | 0x8000);
  EXPECT_TRUE(states.Has(AccessibleState::kInvalid));
  EXPECT_TRUE(states.Has(AccessibleState::kRequired));
  EXPECT_TRUE(states.Has(AccessibleState::kHasAutoComplete));
  // IA2_STATE_EDITABLE has no canonical counterpart.
  EXPECT_TRUE(Ia2StatesToStates(0x8).Empty());
}

TEST(RoleStateMappingTest, UiaControlTypes) {
  EXPECT_EQ(AccessibleRole::kPushButton, UiaControlTypeToRole(50000));
  EXPECT_EQ(AccessibleRole::kEdit, UiaControlTypeToRole(50004));
  EXPECT_EQ(AccessibleRole::kLink, UiaControlTypeToRole(50005));
  EXPECT_EQ(AccessibleRole::kDocument, UiaControlTypeToRole(50030));
  EXPECT_EQ(AccessibleRole::kSeparator, UiaControlTypeToRole(50038));
  // Custom and Pane.
  EXPECT_EQ(AccessibleRole::kPane, UiaControlTypeToRole(50025));
  EXPECT_EQ(AccessibleRole::kPane, UiaControlTypeToRole(50033));
  EXPECT_EQ(AccessibleRole::kPane, UiaControlTypeToRole(0));
}

TEST(RoleStateMappingTest, UiaDefaultsProduceNoStates) {
  UiaStateProperties properties;
  EXPECT_TRUE(UiaPropertiesToStates(properties).Empty());
}

TEST(RoleStateMappingTest, UiaStates) {
  UiaStateProperties properties;
  properties.is_enabled = false;
  properties.is_keyboard_focusable = true;
  properties.is_password = true;
  properties.toggle_state = UiaToggleState::kIndeterminate;
  properties.expand_state = UiaExpandState::kPartiallyExpanded;
  StateSet states = UiaPropertiesToStates(properties);
  EXPECT_TRUE(states.Has(AccessibleState::kUnavailable));
  EXPECT_TRUE(states.Has(AccessibleState::kFocusable));
  EXPECT_TRUE(states.Has(AccessibleState::kProtected));
  EXPECT_TRUE(states.Has(AccessibleState::kMixed));
  EXPECT_TRUE(states.Has(AccessibleState::kExpanded));
  EXPECT_FALSE(states.Has(AccessibleState::kChecked));
  EXPECT_FALSE(states.Has(AccessibleState::kFocused));
}

TEST(RoleStateMappingTest, UiaSelectionRequiresSelectionItem) {
  UiaStateProperties properties;
  properties.is_selected = true;
  EXPECT_FALSE(
      UiaPropertiesToStates(properties).Has(AccessibleState::kSelected));

  properties.supports_selection_item = true;
  StateSet states = UiaPropertiesToStates(properties);
  EXPECT_TRUE(states.Has(AccessibleState::kSelectable));
  EXPECT_TRUE(states.Has(AccessibleState::kSelected));
}

TEST(RoleStateMappingTest, JavaRoles) {
  EXPECT_EQ(AccessibleRole::kPushButton,
            JavaRoleToRole(ASCIIToUTF16("push button")));
  EXPECT_EQ(AccessibleRole::kCheckButton,
            JavaRoleToRole(ASCIIToUTF16("  Check Box ")));
  EXPECT_EQ(AccessibleRole::kTreeViewItem,
            JavaRoleToRole(ASCIIToUTF16("tree node")));
  EXPECT_EQ(AccessibleRole::kPane, JavaRoleToRole(ASCIIToUTF16("panel")));
  EXPECT_EQ(AccessibleRole::kPane, JavaRoleToRole(base::string16()));
}

TEST(RoleStateMappingTest, JavaStates) {
  StateSet states = JavaStatesToStates(
      ASCIIToUTF16("enabled,focusable, Focused ,visible,showing,checked"));
  EXPECT_TRUE(states.Has(AccessibleState::kFocusable));
  EXPECT_TRUE(states.Has(AccessibleState::kFocused));
  EXPECT_TRUE(states.Has(AccessibleState::kChecked));
  EXPECT_FALSE(states.Has(AccessibleState::kUnavailable));

  states = JavaStatesToStates(ASCIIToUTF16("enabled=false,multi_selectable"));
  EXPECT_TRUE(states.Has(AccessibleState::kUnavailable));
  EXPECT_TRUE(states.Has(AccessibleState::kMultiselectable));

  EXPECT_TRUE(JavaStatesToStates(base::string16()).Empty());
}

}  // namespace screen_access
