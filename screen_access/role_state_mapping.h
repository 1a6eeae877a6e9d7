// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

// Translation of native role and state vocabularies into AccessibleRole and
// StateSet. Every function is total: unknown roles become kPane and unknown
// state bits or tokens are dropped.

#ifndef SCREEN_ACCESS_ROLE_STATE_MAPPING_H_
#define SCREEN_ACCESS_ROLE_STATE_MAPPING_H_

#include <stdint.h>

#include "base/strings/string16.h"
#include "screen_access/accessible_node.h"

namespace screen_access {

// MSAA ROLE_SYSTEM_* values, 0x01 through 0x40.
AccessibleRole MsaaRoleToRole(int32_t msaa_role);

// MSAA STATE_SYSTEM_* bit mask.
StateSet MsaaStatesToStates(uint32_t msaa_states);

// IA2_ROLE_* values. Codes inside the MSAA range are translated with the
// MSAA table since IAccessible2::role() reports those unchanged.
AccessibleRole Ia2RoleToRole(int32_t ia2_role);

// IA2_STATE_* bit mask.
StateSet Ia2StatesToStates(int32_t ia2_states);

// UIA_*ControlTypeId values (50000 and up).
AccessibleRole UiaControlTypeToRole(int32_t control_type_id);

// Values of the UIA ToggleState property.
enum class UiaToggleState {
  kUnsupported,
  kOff,
  kOn,
  kIndeterminate,
};

// Values of the UIA ExpandCollapseState property.
enum class UiaExpandState {
  kUnsupported,
  kCollapsed,
  kExpanded,
  kPartiallyExpanded,
  kLeafNode,
};

// The UIA element properties that feed the canonical state set.
struct UiaStateProperties {
  UiaStateProperties();

  bool is_enabled;
  bool has_keyboard_focus;
  bool is_keyboard_focusable;
  bool is_offscreen;
  bool is_password;
  bool is_read_only;
  bool supports_selection_item;
  bool is_selected;
  UiaToggleState toggle_state;
  UiaExpandState expand_state;
};

StateSet UiaPropertiesToStates(const UiaStateProperties& properties);

// Java Access Bridge role_en_US strings, e.g. "push button".
AccessibleRole JavaRoleToRole(const base::string16& role);

// Java Access Bridge states_en_US strings: a comma separated token list,
// e.g. "enabled,focusable,focused".
StateSet JavaStatesToStates(const base::string16& states);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_ROLE_STATE_MAPPING_H_
