// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/legacy_node_builder_win.h"

#include "base/logging.h"
#include "base/win/scoped_bstr.h"
#include "base/win/scoped_variant.h"
#include "screen_access/com_util_win.h"
#include "screen_access/role_state_mapping.h"
#include "screen_access/window_util_win.h"

namespace screen_access {

namespace {

typedef HRESULT (STDMETHODCALLTYPE IAccessible::*StringGetter)(VARIANT, BSTR*);

base::string16 GetStringProperty(IAccessible* accessible,
                                 const VARIANT& child,
                                 StringGetter getter) {
  base::win::ScopedBstr value;
  HRESULT hr = (accessible->*getter)(child, value.Receive());
  if (hr != S_OK || !value)
    return base::string16();
  return base::string16(value, value.Length());
}

}  // namespace

bool BuildLegacyNodeData(IAccessible* accessible,
                         LONG object_id,
                         LONG child_id,
                         HWND window,
                         AccessibleNodeData* data) {
  DCHECK(accessible);
  DCHECK(data);

  base::win::ScopedVariant child(child_id, VT_I4);

  base::win::ScopedVariant role;
  HRESULT hr = accessible->get_accRole(child, role.Receive());
  if (FAILED(hr)) {
    DVLOG(1) << "get_accRole failed: " << std::hex << hr;
    return false;
  }
  // Some servers report string roles; those carry no MSAA role code.
  data->role = role.type() == VT_I4 ? MsaaRoleToRole(V_I4(role.ptr()))
                                    : AccessibleRole::kPane;

  base::win::ScopedVariant state;
  if (SUCCEEDED(accessible->get_accState(child, state.Receive())) &&
      state.type() == VT_I4) {
    data->states = MsaaStatesToStates(static_cast<uint32_t>(V_I4(state.ptr())));
  }

  data->name = GetStringProperty(accessible, child, &IAccessible::get_accName);
  data->value =
      GetStringProperty(accessible, child, &IAccessible::get_accValue);
  data->description =
      GetStringProperty(accessible, child, &IAccessible::get_accDescription);
  data->help_text =
      GetStringProperty(accessible, child, &IAccessible::get_accHelp);
  data->keyboard_shortcut = GetStringProperty(
      accessible, child, &IAccessible::get_accKeyboardShortcut);

  LONG left = 0, top = 0, width = 0, height = 0;
  if (SUCCEEDED(accessible->accLocation(&left, &top, &width, &height, child)))
    data->bounds = ScreenRect(left, top, width, height);

  if (!window)
    WindowFromAccessibleObject(accessible, &window);

  data->native_ref.native_object =
      new ComElementHandle<IAccessible>(accessible);
  data->native_ref.window = FromHWND(window);
  data->native_ref.object_id = object_id;
  data->native_ref.child_id = child_id;
  data->native_ref.process_id = window ? GetWindowProcessId(window) : 0;
  return true;
}

}  // namespace screen_access
