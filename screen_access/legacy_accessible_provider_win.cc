// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/legacy_accessible_provider_win.h"

#include "base/logging.h"
#include "base/win/scoped_comptr.h"
#include "base/win/scoped_variant.h"
#include "screen_access/com_util_win.h"
#include "screen_access/legacy_node_builder_win.h"
#include "screen_access/window_util_win.h"

namespace screen_access {

LegacyAccessibleProviderWin::LegacyAccessibleProviderWin(
    base::TimeDelta native_call_timeout)
    : ProviderBase(BackendId::kLegacyAccessible),
      native_call_timeout_(native_call_timeout),
      event_hook_(this) {
}

LegacyAccessibleProviderWin::~LegacyAccessibleProviderWin() {
  Shutdown();
}

bool LegacyAccessibleProviderWin::IsAvailable() const {
  // oleacc ships with every supported Windows version.
  return true;
}

bool LegacyAccessibleProviderWin::SupportsElement(
    const NativeElementRef& ref) const {
  return ref.window != kNullWindowHandle;
}

bool LegacyAccessibleProviderWin::InitializeNative() {
  return true;
}

void LegacyAccessibleProviderWin::ReleaseNative() {
}

bool LegacyAccessibleProviderWin::InstallEventHook() {
  return event_hook_.Start(EVENT_OBJECT_FOCUS, EVENT_OBJECT_VALUECHANGE);
}

void LegacyAccessibleProviderWin::RemoveEventHook() {
  event_hook_.Stop();
}

void LegacyAccessibleProviderWin::OnWinEvent(DWORD event,
                                             HWND window,
                                             LONG object_id,
                                             LONG child_id) {
  if (event != EVENT_OBJECT_FOCUS || !IsInitialized())
    return;

  base::win::ScopedComPtr<IAccessible> accessible;
  base::win::ScopedVariant child;
  HRESULT hr = AccessibleObjectFromEvent(window, object_id, child_id,
                                         accessible.Receive(),
                                         child.Receive());
  if (FAILED(hr) || !accessible) {
    DVLOG(1) << "AccessibleObjectFromEvent failed: " << std::hex << hr;
    return;
  }

  LONG resolved_child = child.type() == VT_I4 ? V_I4(child.ptr())
                                              : CHILDID_SELF;
  std::unique_ptr<AccessibleNode> node =
      NodeFromAccessible(accessible.get(), object_id, resolved_child, window);
  if (node)
    NotifyFocusChanged(*node);
}

std::unique_ptr<AccessibleNode>
LegacyAccessibleProviderWin::QueryFocusedObject() {
  GUITHREADINFO info = { sizeof(info) };
  HWND window = NULL;
  if (GetGUIThreadInfo(0, &info) && info.hwndFocus)
    window = info.hwndFocus;
  else
    window = GetForegroundWindow();
  if (!window)
    return nullptr;

  if (!IsWindowResponsive(window, native_call_timeout_))
    return nullptr;

  base::win::ScopedComPtr<IAccessible> accessible;
  HRESULT hr = AccessibleObjectFromWindow(
      window, static_cast<DWORD>(OBJID_CLIENT), IID_IAccessible,
      accessible.ReceiveVoid());
  if (FAILED(hr) || !accessible) {
    DVLOG(1) << "AccessibleObjectFromWindow failed: " << std::hex << hr;
    return nullptr;
  }

  // Descend one level into the focused child when the client reports one.
  base::win::ScopedVariant focus;
  if (SUCCEEDED(accessible->get_accFocus(focus.Receive()))) {
    if (focus.type() == VT_I4 && V_I4(focus.ptr()) != CHILDID_SELF)
      return NodeFromAccessible(accessible.get(), OBJID_CLIENT,
                                V_I4(focus.ptr()), window);
    if (focus.type() == VT_DISPATCH && V_DISPATCH(focus.ptr())) {
      base::win::ScopedComPtr<IAccessible> focused;
      if (SUCCEEDED(focused.QueryFrom(V_DISPATCH(focus.ptr()))))
        return NodeFromAccessible(focused.get(), OBJID_CLIENT, CHILDID_SELF,
                                  NULL);
    }
  }
  return NodeFromAccessible(accessible.get(), OBJID_CLIENT, CHILDID_SELF,
                            window);
}

std::unique_ptr<AccessibleNode>
LegacyAccessibleProviderWin::QueryObjectFromPoint(int x, int y) {
  POINT point = { x, y };
  HWND window = WindowFromPoint(point);
  if (window && !IsWindowResponsive(window, native_call_timeout_))
    return nullptr;

  base::win::ScopedComPtr<IAccessible> accessible;
  base::win::ScopedVariant child;
  HRESULT hr = AccessibleObjectFromPoint(point, accessible.Receive(),
                                         child.Receive());
  if (FAILED(hr) || !accessible) {
    DVLOG(1) << "AccessibleObjectFromPoint failed: " << std::hex << hr;
    return nullptr;
  }
  LONG child_id = child.type() == VT_I4 ? V_I4(child.ptr()) : CHILDID_SELF;
  return NodeFromAccessible(accessible.get(), OBJID_CLIENT, child_id, NULL);
}

std::unique_ptr<AccessibleNode>
LegacyAccessibleProviderWin::QueryObjectFromHandle(WindowHandle window) {
  return NodeFromWindowObject(ToHWND(window), OBJID_WINDOW, CHILDID_SELF);
}

std::unique_ptr<AccessibleNode>
LegacyAccessibleProviderWin::QueryAccessibleObject(
    const NativeElementRef& ref) {
  // A live IAccessible from this backend can be asked directly; anything
  // else is re-resolved through its window. References from other backends
  // carry no OBJID_*, so they resolve the client area.
  bool from_msaa = ref.source == BackendId::kLegacyAccessible ||
                   ref.source == BackendId::kExtendedAccessible;
  if (ref.source == BackendId::kLegacyAccessible && ref.native_object) {
    return NodeFromAccessible(ComElementHandle<IAccessible>::FromRef(ref),
                              ref.object_id, ref.child_id,
                              ToHWND(ref.window));
  }
  LONG object_id = from_msaa ? ref.object_id : OBJID_CLIENT;
  LONG child_id = from_msaa ? ref.child_id : CHILDID_SELF;
  return NodeFromWindowObject(ToHWND(ref.window), object_id, child_id);
}

std::unique_ptr<AccessibleNode>
LegacyAccessibleProviderWin::NodeFromAccessible(IAccessible* accessible,
                                                LONG object_id,
                                                LONG child_id,
                                                HWND window) {
  AccessibleNodeData data;
  if (!BuildLegacyNodeData(accessible, object_id, child_id, window, &data))
    return nullptr;
  return CreateNode(data);
}

std::unique_ptr<AccessibleNode>
LegacyAccessibleProviderWin::NodeFromWindowObject(HWND window,
                                                  LONG object_id,
                                                  LONG child_id) {
  if (!IsWindowResponsive(window, native_call_timeout_))
    return nullptr;

  base::win::ScopedComPtr<IAccessible> accessible;
  HRESULT hr = AccessibleObjectFromWindow(window,
                                          static_cast<DWORD>(object_id),
                                          IID_IAccessible,
                                          accessible.ReceiveVoid());
  if (FAILED(hr) || !accessible) {
    DVLOG(1) << "AccessibleObjectFromWindow failed: " << std::hex << hr;
    return nullptr;
  }
  return NodeFromAccessible(accessible.get(), object_id, child_id, window);
}

}  // namespace screen_access
