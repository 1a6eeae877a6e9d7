// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/role_state_mapping.h"

#include <string>
#include <vector>

#include "base/macros.h"
#include "base/strings/string_split.h"
#include "base/strings/string_util.h"
#include "base/strings/utf_string_conversions.h"

namespace screen_access {

namespace {

// STATE_SYSTEM_* bits from oleacc.h, in bit order.
struct MsaaStateBit {
  uint32_t bit;
  AccessibleState state;
};

const MsaaStateBit kMsaaStateBits[] = {
  { 0x00000001, AccessibleState::kUnavailable },
  { 0x00000002, AccessibleState::kSelected },
  { 0x00000004, AccessibleState::kFocused },
  { 0x00000008, AccessibleState::kPressed },
  { 0x00000010, AccessibleState::kChecked },
  { 0x00000020, AccessibleState::kMixed },
  { 0x00000040, AccessibleState::kIndeterminate },
  { 0x00000080, AccessibleState::kReadOnly },
  { 0x00000100, AccessibleState::kHotTracked },
  { 0x00000200, AccessibleState::kDefault },
  { 0x00000400, AccessibleState::kExpanded },
  { 0x00000800, AccessibleState::kCollapsed },
  { 0x00001000, AccessibleState::kBusy },
  { 0x00002000, AccessibleState::kFloating },
  { 0x00004000, AccessibleState::kMarqueed },
  { 0x00008000, AccessibleState::kAnimated },
  { 0x00010000, AccessibleState::kInvisible },
  { 0x00020000, AccessibleState::kOffscreen },
  { 0x00040000, AccessibleState::kSizeable },
  { 0x00080000, AccessibleState::kMoveable },
  { 0x00100000, AccessibleState::kSelfVoicing },
  { 0x00200000, AccessibleState::kFocusable },
  { 0x00400000, AccessibleState::kSelectable },
  { 0x00800000, AccessibleState::kLinked },
  { 0x01000000, AccessibleState::kTraversed },
  { 0x02000000, AccessibleState::kMultiselectable },
  { 0x04000000, AccessibleState::kExtSelectable },
  { 0x08000000, AccessibleState::kAlertLow },
  { 0x10000000, AccessibleState::kAlertMedium },
  { 0x20000000, AccessibleState::kAlertHigh },
  { 0x40000000, AccessibleState::kProtected },
  { 0x80000000, AccessibleState::kHasPopup },
};

// IA2 roles start above the MSAA range.
const int32_t kIa2RoleUnknown = 0;
const int32_t kIa2FirstRole = 0x401;

// IA2_STATE_* bits that have a canonical counterpart.
const int32_t kIa2StateInvalidEntry = 0x40;
const int32_t kIa2StateRequired = 0x800;
const int32_t kIa2StateSupportsAutocompletion = 0x8000;

struct JavaRoleEntry {
  const char* name;
  AccessibleRole role;
};

const JavaRoleEntry kJavaRoles[] = {
  { "push button", AccessibleRole::kPushButton },
  { "toggle button", AccessibleRole::kToggleButton },
  { "radio button", AccessibleRole::kRadioButton },
  { "check box", AccessibleRole::kCheckButton },
  { "combo box", AccessibleRole::kComboBox },
  { "text", AccessibleRole::kEdit },
  { "password text", AccessibleRole::kEdit },
  { "editbar", AccessibleRole::kEdit },
  { "label", AccessibleRole::kStaticText },
  { "list", AccessibleRole::kList },
  { "list item", AccessibleRole::kListItem },
  { "tree", AccessibleRole::kTreeView },
  { "tree node", AccessibleRole::kTreeViewItem },
  { "table", AccessibleRole::kTable },
  { "table cell", AccessibleRole::kCell },
  { "menu", AccessibleRole::kMenu },
  { "menu item", AccessibleRole::kMenuItem },
  { "menu bar", AccessibleRole::kMenuBar },
  { "popup menu", AccessibleRole::kMenuPopup },
  { "dialog", AccessibleRole::kDialog },
  { "option pane", AccessibleRole::kDialog },
  { "color chooser", AccessibleRole::kDialog },
  { "file chooser", AccessibleRole::kDialog },
  { "frame", AccessibleRole::kWindow },
  { "internal frame", AccessibleRole::kWindow },
  { "tabbed pane", AccessibleRole::kPageTabList },
  { "page tab", AccessibleRole::kPageTab },
  { "toolbar", AccessibleRole::kToolBar },
  { "tool tip", AccessibleRole::kTooltip },
  { "progress bar", AccessibleRole::kProgressBar },
  { "slider", AccessibleRole::kSlider },
  { "spinner", AccessibleRole::kSpinButton },
  { "hyperlink", AccessibleRole::kLink },
  { "scroll bar", AccessibleRole::kScrollBar },
  { "separator", AccessibleRole::kSeparator },
  { "status bar", AccessibleRole::kStatusBar },
  { "desktop icon", AccessibleRole::kGraphic },
  { "icon", AccessibleRole::kGraphic },
  { "filler", AccessibleRole::kWhiteSpace },
  { "header", AccessibleRole::kHeader },
  { "paragraph", AccessibleRole::kText },
  { "heading", AccessibleRole::kHeading },
  // Containers ("panel", "scroll pane", "root pane", ...) fall through to
  // the kPane default.
};

}  // namespace

AccessibleRole MsaaRoleToRole(int32_t msaa_role) {
  switch (msaa_role) {
    case 0x01: return AccessibleRole::kTitleBar;
    case 0x02: return AccessibleRole::kMenuBar;
    case 0x03: return AccessibleRole::kScrollBar;
    case 0x04: return AccessibleRole::kGrip;
    case 0x05: return AccessibleRole::kSound;
    case 0x06: return AccessibleRole::kCursor;
    case 0x07: return AccessibleRole::kCaret;
    case 0x08: return AccessibleRole::kAlert;
    case 0x09: return AccessibleRole::kWindow;
    case 0x0A: return AccessibleRole::kClient;
    case 0x0B: return AccessibleRole::kMenuPopup;
    case 0x0C: return AccessibleRole::kMenuItem;
    case 0x0D: return AccessibleRole::kTooltip;
    case 0x0E: return AccessibleRole::kApplication;
    case 0x0F: return AccessibleRole::kDocument;
    case 0x10: return AccessibleRole::kPane;
    case 0x11: return AccessibleRole::kChart;
    case 0x12: return AccessibleRole::kDialog;
    case 0x13: return AccessibleRole::kBorder;
    case 0x14: return AccessibleRole::kGrouping;
    case 0x15: return AccessibleRole::kSeparator;
    case 0x16: return AccessibleRole::kToolBar;
    case 0x17: return AccessibleRole::kStatusBar;
    case 0x18: return AccessibleRole::kTable;
    case 0x19: return AccessibleRole::kColumnHeader;
    case 0x1A: return AccessibleRole::kRowHeader;
    case 0x1B: return AccessibleRole::kColumn;
    case 0x1C: return AccessibleRole::kRow;
    case 0x1D: return AccessibleRole::kCell;
    case 0x1E: return AccessibleRole::kLink;
    case 0x1F: return AccessibleRole::kHelpBalloon;
    case 0x20: return AccessibleRole::kCharacter;
    case 0x21: return AccessibleRole::kList;
    case 0x22: return AccessibleRole::kListItem;
    case 0x23: return AccessibleRole::kOutline;
    case 0x24: return AccessibleRole::kOutlineItem;
    case 0x25: return AccessibleRole::kPageTab;
    case 0x26: return AccessibleRole::kPropertyPage;
    case 0x27: return AccessibleRole::kIndicator;
    case 0x28: return AccessibleRole::kGraphic;
    case 0x29: return AccessibleRole::kStaticText;
    case 0x2A: return AccessibleRole::kText;
    case 0x2B: return AccessibleRole::kPushButton;
    case 0x2C: return AccessibleRole::kCheckButton;
    case 0x2D: return AccessibleRole::kRadioButton;
    case 0x2E: return AccessibleRole::kComboBox;
    case 0x2F: return AccessibleRole::kDropList;
    case 0x30: return AccessibleRole::kProgressBar;
    case 0x31: return AccessibleRole::kDial;
    case 0x32: return AccessibleRole::kHotkeyField;
    case 0x33: return AccessibleRole::kSlider;
    case 0x34: return AccessibleRole::kSpinButton;
    case 0x35: return AccessibleRole::kDiagram;
    case 0x36: return AccessibleRole::kAnimation;
    case 0x37: return AccessibleRole::kEquation;
    case 0x38: return AccessibleRole::kButtonDropDown;
    case 0x39: return AccessibleRole::kButtonMenu;
    case 0x3A: return AccessibleRole::kButtonDropDownGrid;
    case 0x3B: return AccessibleRole::kWhiteSpace;
    case 0x3C: return AccessibleRole::kPageTabList;
    case 0x3D: return AccessibleRole::kClock;
    case 0x3E: return AccessibleRole::kSplitButton;
    case 0x3F: return AccessibleRole::kIpAddress;
    case 0x40: return AccessibleRole::kOutlineButton;
    default:
      return AccessibleRole::kPane;
  }
}

StateSet MsaaStatesToStates(uint32_t msaa_states) {
  StateSet states;
  for (size_t i = 0; i < arraysize(kMsaaStateBits); ++i) {
    if (msaa_states & kMsaaStateBits[i].bit)
      states.Add(kMsaaStateBits[i].state);
  }
  return states;
}

AccessibleRole Ia2RoleToRole(int32_t ia2_role) {
  if (ia2_role != kIa2RoleUnknown && ia2_role < kIa2FirstRole)
    return MsaaRoleToRole(ia2_role);

  switch (ia2_role) {
    case 0x401:  // IA2_ROLE_CANVAS
      return AccessibleRole::kGraphic;
    case 0x402:  // IA2_ROLE_CAPTION
      return AccessibleRole::kStaticText;
    case 0x403:  // IA2_ROLE_CHECK_MENU_ITEM
      return AccessibleRole::kMenuItem;
    case 0x404:  // IA2_ROLE_COLOR_CHOOSER
      return AccessibleRole::kDialog;
    case 0x405:  // IA2_ROLE_DATE_EDITOR
      return AccessibleRole::kEdit;
    case 0x406:  // IA2_ROLE_DESKTOP_ICON
      return AccessibleRole::kGraphic;
    case 0x407:  // IA2_ROLE_DESKTOP_PANE
      return AccessibleRole::kPane;
    case 0x408:  // IA2_ROLE_DIRECTORY_PANE
      return AccessibleRole::kDirectory;
    case 0x409:  // IA2_ROLE_EDITBAR
      return AccessibleRole::kEdit;
    case 0x40A:  // IA2_ROLE_EMBEDDED_OBJECT
      return AccessibleRole::kClient;
    case 0x40B:  // IA2_ROLE_ENDNOTE
      return AccessibleRole::kNote;
    case 0x40C:  // IA2_ROLE_FILE_CHOOSER
    case 0x40D:  // IA2_ROLE_FONT_CHOOSER
      return AccessibleRole::kDialog;
    case 0x40E:  // IA2_ROLE_FOOTER
      return AccessibleRole::kContentInfo;
    case 0x40F:  // IA2_ROLE_FOOTNOTE
      return AccessibleRole::kNote;
    case 0x410:  // IA2_ROLE_FORM
      return AccessibleRole::kForm;
    case 0x411:  // IA2_ROLE_FRAME
      return AccessibleRole::kWindow;
    case 0x412:  // IA2_ROLE_GLASS_PANE
      return AccessibleRole::kPane;
    case 0x413:  // IA2_ROLE_HEADER
      return AccessibleRole::kHeader;
    case 0x414:  // IA2_ROLE_HEADING
      return AccessibleRole::kHeading;
    case 0x415:  // IA2_ROLE_ICON
      return AccessibleRole::kGraphic;
    case 0x416:  // IA2_ROLE_IMAGE_MAP
      return AccessibleRole::kImage;
    case 0x417:  // IA2_ROLE_INPUT_METHOD_WINDOW
    case 0x418:  // IA2_ROLE_INTERNAL_FRAME
      return AccessibleRole::kWindow;
    case 0x419:  // IA2_ROLE_LABEL
      return AccessibleRole::kStaticText;
    case 0x41B:  // IA2_ROLE_NOTE
      return AccessibleRole::kNote;
    case 0x41C:  // IA2_ROLE_OPTION_PANE
      return AccessibleRole::kDialog;
    case 0x41D:  // IA2_ROLE_PAGE
      return AccessibleRole::kDocument;
    case 0x41E:  // IA2_ROLE_PARAGRAPH
      return AccessibleRole::kText;
    case 0x41F:  // IA2_ROLE_RADIO_MENU_ITEM
      return AccessibleRole::kMenuItem;
    case 0x424:  // IA2_ROLE_SECTION
      return AccessibleRole::kSection;
    case 0x425:  // IA2_ROLE_SHAPE
      return AccessibleRole::kGraphic;
    case 0x427:  // IA2_ROLE_TEAR_OFF_MENU
      return AccessibleRole::kMenuPopup;
    case 0x428:  // IA2_ROLE_TERMINAL
    case 0x429:  // IA2_ROLE_TEXT_FRAME
      return AccessibleRole::kDocument;
    case 0x42A:  // IA2_ROLE_TOGGLE_BUTTON
      return AccessibleRole::kToggleButton;
    case 0x42C:  // IA2_ROLE_COMPLEMENTARY_CONTENT
      return AccessibleRole::kComplementary;
    case 0x42D:  // IA2_ROLE_LANDMARK
      return AccessibleRole::kLandmark;
    case 0x42E:  // IA2_ROLE_LEVEL_BAR
      return AccessibleRole::kProgressBar;
    case 0x431:  // IA2_ROLE_BLOCK_QUOTE
      return AccessibleRole::kSection;
    default:
      // Layered, root, scroll, split and view port panes, redundant
      // objects, rulers and everything unknown.
      return AccessibleRole::kPane;
  }
}

StateSet Ia2StatesToStates(int32_t ia2_states) {
  StateSet states;
  if (ia2_states & kIa2StateInvalidEntry)
    states.Add(AccessibleState::kInvalid);
  if (ia2_states & kIa2StateRequired)
    states.Add(AccessibleState::kRequired);
  if (ia2_states & kIa2StateSupportsAutocompletion)
    states.Add(AccessibleState::kHasAutoComplete);
  return states;
}

AccessibleRole UiaControlTypeToRole(int32_t control_type_id) {
  switch (control_type_id) {
    case 50000:  // UIA_ButtonControlTypeId
      return AccessibleRole::kPushButton;
    case 50001:  // UIA_CalendarControlTypeId
      return AccessibleRole::kGraphic;
    case 50002:  // UIA_CheckBoxControlTypeId
      return AccessibleRole::kCheckButton;
    case 50003:  // UIA_ComboBoxControlTypeId
      return AccessibleRole::kComboBox;
    case 50004:  // UIA_EditControlTypeId
      return AccessibleRole::kEdit;
    case 50005:  // UIA_HyperlinkControlTypeId
      return AccessibleRole::kLink;
    case 50006:  // UIA_ImageControlTypeId
      return AccessibleRole::kGraphic;
    case 50007:  // UIA_ListItemControlTypeId
      return AccessibleRole::kListItem;
    case 50008:  // UIA_ListControlTypeId
      return AccessibleRole::kList;
    case 50009:  // UIA_MenuControlTypeId
      return AccessibleRole::kMenuPopup;
    case 50010:  // UIA_MenuBarControlTypeId
      return AccessibleRole::kMenuBar;
    case 50011:  // UIA_MenuItemControlTypeId
      return AccessibleRole::kMenuItem;
    case 50012:  // UIA_ProgressBarControlTypeId
      return AccessibleRole::kProgressBar;
    case 50013:  // UIA_RadioButtonControlTypeId
      return AccessibleRole::kRadioButton;
    case 50014:  // UIA_ScrollBarControlTypeId
      return AccessibleRole::kScrollBar;
    case 50015:  // UIA_SliderControlTypeId
      return AccessibleRole::kSlider;
    case 50016:  // UIA_SpinnerControlTypeId
      return AccessibleRole::kSpinButton;
    case 50017:  // UIA_StatusBarControlTypeId
      return AccessibleRole::kStatusBar;
    case 50018:  // UIA_TabControlTypeId
      return AccessibleRole::kPageTabList;
    case 50019:  // UIA_TabItemControlTypeId
      return AccessibleRole::kPageTab;
    case 50020:  // UIA_TextControlTypeId
      return AccessibleRole::kStaticText;
    case 50021:  // UIA_ToolBarControlTypeId
      return AccessibleRole::kToolBar;
    case 50022:  // UIA_ToolTipControlTypeId
      return AccessibleRole::kTooltip;
    case 50023:  // UIA_TreeControlTypeId
      return AccessibleRole::kTreeView;
    case 50024:  // UIA_TreeItemControlTypeId
      return AccessibleRole::kTreeViewItem;
    case 50026:  // UIA_GroupControlTypeId
      return AccessibleRole::kGrouping;
    case 50027:  // UIA_ThumbControlTypeId
      return AccessibleRole::kIndicator;
    case 50028:  // UIA_DataGridControlTypeId
      return AccessibleRole::kTable;
    case 50029:  // UIA_DataItemControlTypeId
      return AccessibleRole::kListItem;
    case 50030:  // UIA_DocumentControlTypeId
      return AccessibleRole::kDocument;
    case 50031:  // UIA_SplitButtonControlTypeId
      return AccessibleRole::kSplitButton;
    case 50032:  // UIA_WindowControlTypeId
      return AccessibleRole::kWindow;
    case 50034:  // UIA_HeaderControlTypeId
      return AccessibleRole::kHeader;
    case 50035:  // UIA_HeaderItemControlTypeId
      return AccessibleRole::kHeaderItem;
    case 50036:  // UIA_TableControlTypeId
      return AccessibleRole::kTable;
    case 50037:  // UIA_TitleBarControlTypeId
      return AccessibleRole::kTitleBar;
    case 50038:  // UIA_SeparatorControlTypeId
      return AccessibleRole::kSeparator;
    default:
      // Custom, Pane and unknown control types.
      return AccessibleRole::kPane;
  }
}

UiaStateProperties::UiaStateProperties()
    : is_enabled(true),
      has_keyboard_focus(false),
      is_keyboard_focusable(false),
      is_offscreen(false),
      is_password(false),
      is_read_only(false),
      supports_selection_item(false),
      is_selected(false),
      toggle_state(UiaToggleState::kUnsupported),
      expand_state(UiaExpandState::kUnsupported) {
}

StateSet UiaPropertiesToStates(const UiaStateProperties& properties) {
  StateSet states;
  if (!properties.is_enabled)
    states.Add(AccessibleState::kUnavailable);
  if (properties.has_keyboard_focus)
    states.Add(AccessibleState::kFocused);
  if (properties.is_keyboard_focusable)
    states.Add(AccessibleState::kFocusable);
  if (properties.is_offscreen)
    states.Add(AccessibleState::kOffscreen);
  if (properties.is_password)
    states.Add(AccessibleState::kProtected);
  if (properties.is_read_only)
    states.Add(AccessibleState::kReadOnly);

  switch (properties.toggle_state) {
    case UiaToggleState::kOn:
      states.Add(AccessibleState::kChecked);
      break;
    case UiaToggleState::kIndeterminate:
      states.Add(AccessibleState::kMixed);
      break;
    case UiaToggleState::kOff:
    case UiaToggleState::kUnsupported:
      break;
  }

  switch (properties.expand_state) {
    case UiaExpandState::kExpanded:
    case UiaExpandState::kPartiallyExpanded:
      states.Add(AccessibleState::kExpanded);
      break;
    case UiaExpandState::kCollapsed:
      states.Add(AccessibleState::kCollapsed);
      break;
    case UiaExpandState::kLeafNode:
    case UiaExpandState::kUnsupported:
      break;
  }

  if (properties.supports_selection_item) {
    states.Add(AccessibleState::kSelectable);
    if (properties.is_selected)
      states.Add(AccessibleState::kSelected);
  }
  return states;
}

AccessibleRole JavaRoleToRole(const base::string16& role) {
  std::string key;
  base::TrimWhitespaceASCII(base::UTF16ToUTF8(role), base::TRIM_ALL, &key);
  key = base::ToLowerASCII(key);
  for (size_t i = 0; i < arraysize(kJavaRoles); ++i) {
    if (key == kJavaRoles[i].name)
      return kJavaRoles[i].role;
  }
  return AccessibleRole::kPane;
}

StateSet JavaStatesToStates(const base::string16& states_string) {
  StateSet states;
  std::vector<std::string> tokens = base::SplitString(
      base::ToLowerASCII(base::UTF16ToUTF8(states_string)), ",",
      base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY);
  for (const std::string& token : tokens) {
    if (token == "focusable") {
      states.Add(AccessibleState::kFocusable);
    } else if (token == "focused") {
      states.Add(AccessibleState::kFocused);
    } else if (token == "selected") {
      states.Add(AccessibleState::kSelected);
    } else if (token == "selectable") {
      states.Add(AccessibleState::kSelectable);
    } else if (token == "pressed") {
      states.Add(AccessibleState::kPressed);
    } else if (token == "checked") {
      states.Add(AccessibleState::kChecked);
    } else if (token == "expanded") {
      states.Add(AccessibleState::kExpanded);
    } else if (token == "collapsed") {
      states.Add(AccessibleState::kCollapsed);
    } else if (token == "disabled" || token == "enabled=false") {
      states.Add(AccessibleState::kUnavailable);
    } else if (token == "invisible") {
      states.Add(AccessibleState::kInvisible);
    } else if (token == "busy") {
      states.Add(AccessibleState::kBusy);
    } else if (token == "multi_selectable" ||
               token == "multiselectable") {
      states.Add(AccessibleState::kMultiselectable);
    }
    // "enabled", "visible", "showing", "editable", "modal" and the line
    // and orientation tokens have no canonical counterpart.
  }
  return states;
}

}  // namespace screen_access
