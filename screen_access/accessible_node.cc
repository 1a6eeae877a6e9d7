// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/accessible_node.h"

#include "base/logging.h"
#include "base/strings/utf_string_conversions.h"

namespace screen_access {

const char* AccessibleRoleToString(AccessibleRole role) {
  switch (role) {
    case AccessibleRole::kNone:
      return "None";
    case AccessibleRole::kTitleBar:
      return "TitleBar";
    case AccessibleRole::kMenuBar:
      return "MenuBar";
    case AccessibleRole::kScrollBar:
      return "ScrollBar";
    case AccessibleRole::kGrip:
      return "Grip";
    case AccessibleRole::kSound:
      return "Sound";
    case AccessibleRole::kCursor:
      return "Cursor";
    case AccessibleRole::kCaret:
      return "Caret";
    case AccessibleRole::kAlert:
      return "Alert";
    case AccessibleRole::kWindow:
      return "Window";
    case AccessibleRole::kClient:
      return "Client";
    case AccessibleRole::kMenuPopup:
      return "MenuPopup";
    case AccessibleRole::kMenuItem:
      return "MenuItem";
    case AccessibleRole::kTooltip:
      return "Tooltip";
    case AccessibleRole::kApplication:
      return "Application";
    case AccessibleRole::kDocument:
      return "Document";
    case AccessibleRole::kPane:
      return "Pane";
    case AccessibleRole::kChart:
      return "Chart";
    case AccessibleRole::kDialog:
      return "Dialog";
    case AccessibleRole::kBorder:
      return "Border";
    case AccessibleRole::kGrouping:
      return "Grouping";
    case AccessibleRole::kSeparator:
      return "Separator";
    case AccessibleRole::kToolBar:
      return "ToolBar";
    case AccessibleRole::kStatusBar:
      return "StatusBar";
    case AccessibleRole::kTable:
      return "Table";
    case AccessibleRole::kColumnHeader:
      return "ColumnHeader";
    case AccessibleRole::kRowHeader:
      return "RowHeader";
    case AccessibleRole::kColumn:
      return "Column";
    case AccessibleRole::kRow:
      return "Row";
    case AccessibleRole::kCell:
      return "Cell";
    case AccessibleRole::kLink:
      return "Link";
    case AccessibleRole::kHelpBalloon:
      return "HelpBalloon";
    case AccessibleRole::kCharacter:
      return "Character";
    case AccessibleRole::kList:
      return "List";
    case AccessibleRole::kListItem:
      return "ListItem";
    case AccessibleRole::kOutline:
      return "Outline";
    case AccessibleRole::kOutlineItem:
      return "OutlineItem";
    case AccessibleRole::kPageTab:
      return "PageTab";
    case AccessibleRole::kPropertyPage:
      return "PropertyPage";
    case AccessibleRole::kIndicator:
      return "Indicator";
    case AccessibleRole::kGraphic:
      return "Graphic";
    case AccessibleRole::kStaticText:
      return "StaticText";
    case AccessibleRole::kText:
      return "Text";
    case AccessibleRole::kPushButton:
      return "PushButton";
    case AccessibleRole::kCheckButton:
      return "CheckButton";
    case AccessibleRole::kRadioButton:
      return "RadioButton";
    case AccessibleRole::kComboBox:
      return "ComboBox";
    case AccessibleRole::kDropList:
      return "DropList";
    case AccessibleRole::kProgressBar:
      return "ProgressBar";
    case AccessibleRole::kDial:
      return "Dial";
    case AccessibleRole::kHotkeyField:
      return "HotkeyField";
    case AccessibleRole::kSlider:
      return "Slider";
    case AccessibleRole::kSpinButton:
      return "SpinButton";
    case AccessibleRole::kDiagram:
      return "Diagram";
    case AccessibleRole::kAnimation:
      return "Animation";
    case AccessibleRole::kEquation:
      return "Equation";
    case AccessibleRole::kButtonDropDown:
      return "ButtonDropDown";
    case AccessibleRole::kButtonMenu:
      return "ButtonMenu";
    case AccessibleRole::kButtonDropDownGrid:
      return "ButtonDropDownGrid";
    case AccessibleRole::kWhiteSpace:
      return "WhiteSpace";
    case AccessibleRole::kPageTabList:
      return "PageTabList";
    case AccessibleRole::kClock:
      return "Clock";
    case AccessibleRole::kSplitButton:
      return "SplitButton";
    case AccessibleRole::kIpAddress:
      return "IpAddress";
    case AccessibleRole::kOutlineButton:
      return "OutlineButton";
    case AccessibleRole::kEdit:
      return "Edit";
    case AccessibleRole::kTreeView:
      return "TreeView";
    case AccessibleRole::kTreeViewItem:
      return "TreeViewItem";
    case AccessibleRole::kHeader:
      return "Header";
    case AccessibleRole::kHeaderItem:
      return "HeaderItem";
    case AccessibleRole::kHeading:
      return "Heading";
    case AccessibleRole::kLandmark:
      return "Landmark";
    case AccessibleRole::kArticle:
      return "Article";
    case AccessibleRole::kBanner:
      return "Banner";
    case AccessibleRole::kComplementary:
      return "Complementary";
    case AccessibleRole::kContentInfo:
      return "ContentInfo";
    case AccessibleRole::kForm:
      return "Form";
    case AccessibleRole::kMain:
      return "Main";
    case AccessibleRole::kNavigation:
      return "Navigation";
    case AccessibleRole::kRegion:
      return "Region";
    case AccessibleRole::kSearch:
      return "Search";
    case AccessibleRole::kSection:
      return "Section";
    case AccessibleRole::kFigure:
      return "Figure";
    case AccessibleRole::kImage:
      return "Image";
    case AccessibleRole::kMath:
      return "Math";
    case AccessibleRole::kNote:
      return "Note";
    case AccessibleRole::kTimer:
      return "Timer";
    case AccessibleRole::kMarquee:
      return "Marquee";
    case AccessibleRole::kLog:
      return "Log";
    case AccessibleRole::kStatus:
      return "Status";
    case AccessibleRole::kGrid:
      return "Grid";
    case AccessibleRole::kTreeGrid:
      return "TreeGrid";
    case AccessibleRole::kFeed:
      return "Feed";
    case AccessibleRole::kDefinition:
      return "Definition";
    case AccessibleRole::kTerm:
      return "Term";
    case AccessibleRole::kDirectory:
      return "Directory";
    case AccessibleRole::kListBox:
      return "ListBox";
    case AccessibleRole::kMenu:
      return "Menu";
    case AccessibleRole::kTabPanel:
      return "TabPanel";
    case AccessibleRole::kToggleButton:
      return "ToggleButton";
    case AccessibleRole::kSwitch:
      return "Switch";
  }
  NOTREACHED();
  return "";
}

NativeElementRef::NativeElementRef()
    : source(BackendId::kTreeAutomation),
      window(kNullWindowHandle),
      object_id(0),
      child_id(0),
      process_id(0) {
}

NativeElementRef::NativeElementRef(const NativeElementRef& other) = default;

NativeElementRef::~NativeElementRef() {
}

bool NativeElementRef::IsEmpty() const {
  return !native_object && window == kNullWindowHandle;
}

AccessibleNodeData::AccessibleNodeData()
    : role(AccessibleRole::kPane),
      position_in_group(0),
      group_size(0),
      level(0) {
}

AccessibleNodeData::~AccessibleNodeData() {
}

AccessibleNode::AccessibleNode(BackendId source,
                               const AccessibleNodeData& data)
    : data_(data) {
  data_.native_ref.source = source;
  int role_value = static_cast<int>(data_.role);
  if (role_value < 0 ||
      role_value > static_cast<int>(AccessibleRole::kLastRole)) {
    DLOG(WARNING) << "Out of range role " << role_value;
    data_.role = AccessibleRole::kPane;
  }
}

AccessibleNode::~AccessibleNode() {
}

std::string AccessibleNode::ToString() const {
  return std::string(AccessibleRoleToString(data_.role)) + " '" +
         base::UTF16ToUTF8(data_.name) + "' [" +
         BackendIdToShortName(source()) + "]";
}

}  // namespace screen_access
