// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_ACCESSIBLE_NODE_H_
#define SCREEN_ACCESS_ACCESSIBLE_NODE_H_

#include <stdint.h>

#include <memory>
#include <string>

#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "base/process/process_handle.h"
#include "base/strings/string16.h"
#include "screen_access/backend_id.h"
#include "screen_access/native_types.h"

namespace screen_access {

// The closed role vocabulary shared by every backend. The first block
// mirrors the MSAA role constants one to one (kTitleBar is ROLE_SYSTEM_TITLEBAR
// and so on up to kOutlineButton); the rest covers roles only the richer
// backends can express.
enum class AccessibleRole {
  kNone = 0,
  kTitleBar,
  kMenuBar,
  kScrollBar,
  kGrip,
  kSound,
  kCursor,
  kCaret,
  kAlert,
  kWindow,
  kClient,
  kMenuPopup,
  kMenuItem,
  kTooltip,
  kApplication,
  kDocument,
  kPane,
  kChart,
  kDialog,
  kBorder,
  kGrouping,
  kSeparator,
  kToolBar,
  kStatusBar,
  kTable,
  kColumnHeader,
  kRowHeader,
  kColumn,
  kRow,
  kCell,
  kLink,
  kHelpBalloon,
  kCharacter,
  kList,
  kListItem,
  kOutline,
  kOutlineItem,
  kPageTab,
  kPropertyPage,
  kIndicator,
  kGraphic,
  kStaticText,
  kText,
  kPushButton,
  kCheckButton,
  kRadioButton,
  kComboBox,
  kDropList,
  kProgressBar,
  kDial,
  kHotkeyField,
  kSlider,
  kSpinButton,
  kDiagram,
  kAnimation,
  kEquation,
  kButtonDropDown,
  kButtonMenu,
  kButtonDropDownGrid,
  kWhiteSpace,
  kPageTabList,
  kClock,
  kSplitButton,
  kIpAddress,
  kOutlineButton,
  kEdit,
  kTreeView,
  kTreeViewItem,
  kHeader,
  kHeaderItem,
  kHeading,
  kLandmark,
  kArticle,
  kBanner,
  kComplementary,
  kContentInfo,
  kForm,
  kMain,
  kNavigation,
  kRegion,
  kSearch,
  kSection,
  kFigure,
  kImage,
  kMath,
  kNote,
  kTimer,
  kMarquee,
  kLog,
  kStatus,
  kGrid,
  kTreeGrid,
  kFeed,
  kDefinition,
  kTerm,
  kDirectory,
  kListBox,
  kMenu,
  kTabPanel,
  kToggleButton,
  kSwitch,
  kLastRole = kSwitch,
};

const char* AccessibleRoleToString(AccessibleRole role);

// Canonical states. The value of each enumerator is its bit index inside a
// StateSet.
enum class AccessibleState {
  kUnavailable = 0,
  kSelected,
  kFocused,
  kPressed,
  kChecked,
  kMixed,
  kIndeterminate,
  kReadOnly,
  kHotTracked,
  kDefault,
  kExpanded,
  kCollapsed,
  kBusy,
  kFloating,
  kMarqueed,
  kAnimated,
  kInvisible,
  kOffscreen,
  kSizeable,
  kMoveable,
  kSelfVoicing,
  kFocusable,
  kSelectable,
  kLinked,
  kTraversed,
  kMultiselectable,
  kExtSelectable,
  kAlertLow,
  kAlertMedium,
  kAlertHigh,
  kProtected,
  kHasPopup,
  kValid,
  kInvalid,
  kRequired,
  kVisited,
  kCurrent,
  kHasAutoComplete,
  kLastState = kHasAutoComplete,
};

// A 64-bit set of AccessibleState values.
class StateSet {
 public:
  StateSet() : bits_(0) {}

  static StateSet FromBits(uint64_t bits) {
    StateSet set;
    set.bits_ = bits;
    return set;
  }

  bool Has(AccessibleState state) const { return (bits_ & Bit(state)) != 0; }
  void Add(AccessibleState state) { bits_ |= Bit(state); }
  void Remove(AccessibleState state) { bits_ &= ~Bit(state); }
  void Merge(const StateSet& other) { bits_ |= other.bits_; }

  bool Empty() const { return bits_ == 0; }
  uint64_t bits() const { return bits_; }

  bool operator==(const StateSet& other) const { return bits_ == other.bits_; }
  bool operator!=(const StateSet& other) const { return bits_ != other.bits_; }

 private:
  static uint64_t Bit(AccessibleState state) {
    return static_cast<uint64_t>(1) << static_cast<int>(state);
  }

  uint64_t bits_;
};

// Screen coordinates, in physical pixels.
struct ScreenRect {
  ScreenRect() : x(0), y(0), width(0), height(0) {}
  ScreenRect(int x, int y, int width, int height)
      : x(x), y(y), width(width), height(height) {}

  bool IsEmpty() const { return width <= 0 || height <= 0; }
  bool Contains(int point_x, int point_y) const {
    return point_x >= x && point_x < x + width &&
           point_y >= y && point_y < y + height;
  }

  int x;
  int y;
  int width;
  int height;
};

// Keeps a backend's native element alive while any node refers to it. Each
// backend derives its own handle type; only the backend named by
// NativeElementRef::source may downcast it.
class NativeElementHandle
    : public base::RefCountedThreadSafe<NativeElementHandle> {
 protected:
  NativeElementHandle() {}
  virtual ~NativeElementHandle() {}

 private:
  friend class base::RefCountedThreadSafe<NativeElementHandle>;

  DISALLOW_COPY_AND_ASSIGN(NativeElementHandle);
};

// Identifies the native element a node was built from.
struct NativeElementRef {
  NativeElementRef();
  NativeElementRef(const NativeElementRef& other);
  ~NativeElementRef();

  // True if the reference names nothing at all.
  bool IsEmpty() const;

  BackendId source;
  // Shared ownership of the native element, or null when the backend only
  // identifies elements by window.
  scoped_refptr<NativeElementHandle> native_object;
  WindowHandle window;
  // OBJID_* for MSAA style references, the Java VM id for the bridge.
  int32_t object_id;
  // CHILDID_SELF (0) or the simple-child index.
  int32_t child_id;
  base::ProcessId process_id;
};

// Mutable builder for AccessibleNode. Providers fill one of these and then
// freeze it into a node.
struct AccessibleNodeData {
  AccessibleNodeData();
  ~AccessibleNodeData();

  NativeElementRef native_ref;
  AccessibleRole role;
  StateSet states;
  base::string16 name;
  base::string16 description;
  base::string16 value;
  base::string16 help_text;
  base::string16 keyboard_shortcut;
  ScreenRect bounds;
  // 1-based; 0 when unknown.
  int position_in_group;
  int group_size;
  int level;
};

// The canonical, backend independent description of one UI element.
// Immutable once constructed; re-querying the backend produces a new node.
class AccessibleNode {
 public:
  // |source| overrides whatever source |data.native_ref| carries so a node
  // is always tagged with the backend that produced it. Out of range roles
  // collapse to kPane.
  AccessibleNode(BackendId source, const AccessibleNodeData& data);
  ~AccessibleNode();

  BackendId source() const { return data_.native_ref.source; }
  const NativeElementRef& native_ref() const { return data_.native_ref; }
  AccessibleRole role() const { return data_.role; }
  const StateSet& states() const { return data_.states; }
  bool HasState(AccessibleState state) const { return data_.states.Has(state); }
  const base::string16& name() const { return data_.name; }
  const base::string16& description() const { return data_.description; }
  const base::string16& value() const { return data_.value; }
  const base::string16& help_text() const { return data_.help_text; }
  const base::string16& keyboard_shortcut() const {
    return data_.keyboard_shortcut;
  }
  const ScreenRect& bounds() const { return data_.bounds; }
  WindowHandle window() const { return data_.native_ref.window; }
  int32_t child_id() const { return data_.native_ref.child_id; }
  base::ProcessId process_id() const { return data_.native_ref.process_id; }
  int position_in_group() const { return data_.position_in_group; }
  int group_size() const { return data_.group_size; }
  int level() const { return data_.level; }

  // Copy of the underlying data, e.g. to derive a modified node.
  AccessibleNodeData ToData() const { return data_; }

  // Debug representation: "PushButton 'OK' [uia]".
  std::string ToString() const;

 private:
  AccessibleNodeData data_;

  DISALLOW_COPY_AND_ASSIGN(AccessibleNode);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_ACCESSIBLE_NODE_H_
