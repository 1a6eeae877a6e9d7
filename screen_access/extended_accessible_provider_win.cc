// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/extended_accessible_provider_win.h"

#include <string>

#include "base/logging.h"
#include "base/macros.h"
#include "base/win/registry.h"
#include "base/win/scoped_comptr.h"
#include "base/win/scoped_variant.h"
#include "ia2_api_all.h"
#include "screen_access/activation_negotiator.h"
#include "screen_access/com_util_win.h"
#include "screen_access/legacy_node_builder_win.h"
#include "screen_access/process_backend_map.h"
#include "screen_access/role_state_mapping.h"
#include "screen_access/window_util_win.h"

namespace screen_access {

namespace {

// The IAccessible2 proxy/stub registration.
const wchar_t kIAccessible2InterfaceKey[] =
    L"Interface\\{E89F726E-C4F4-4c19-BB19-B647D7FA8478}";

// Applications that always serve IAccessible2.
const char* const kExtendedApplications[] = {
  "firefox",
  "thunderbird",
  "soffice",
  "libreoffice",
  "gimp",
  "inkscape",
};

bool IsExtendedApplication(const base::string16& process_name) {
  std::string name = NormalizeProcessName(process_name);
  for (size_t i = 0; i < arraysize(kExtendedApplications); ++i) {
    if (name == kExtendedApplications[i])
      return true;
  }
  return false;
}

// Overlays the IA2 role, states and group position onto |data|.
void ApplyExtendedAttributes(IAccessible* accessible,
                             AccessibleNodeData* data) {
  base::win::ScopedComPtr<IServiceProvider> service_provider;
  HRESULT hr = service_provider.QueryFrom(accessible);
  if (FAILED(hr) || !service_provider)
    return;
  base::win::ScopedComPtr<IAccessible2> extended;
  hr = QueryExtendedService(service_provider.get(), extended.Receive());
  if (FAILED(hr)) {
    DVLOG(1) << "No IAccessible2 on object: " << std::hex << hr;
    return;
  }

  long role = 0;
  if (SUCCEEDED(extended->role(&role)))
    data->role = Ia2RoleToRole(role);

  AccessibleStates states = 0;
  if (SUCCEEDED(extended->get_states(&states)))
    data->states.Merge(Ia2StatesToStates(states));

  long level = 0, similar_items = 0, position = 0;
  if (extended->get_groupPosition(&level, &similar_items, &position) == S_OK) {
    data->level = level;
    data->group_size = similar_items;
    data->position_in_group = position;
  }
}

}  // namespace

ExtendedAccessibleProviderWin::ExtendedAccessibleProviderWin(
    base::TimeDelta native_call_timeout,
    const ActivationNegotiator* negotiator)
    : ProviderBase(BackendId::kExtendedAccessible),
      native_call_timeout_(native_call_timeout),
      negotiator_(negotiator),
      available_(IsInterfaceRegistered()),
      event_hook_(this) {
}

ExtendedAccessibleProviderWin::~ExtendedAccessibleProviderWin() {
  Shutdown();
}

// static
bool ExtendedAccessibleProviderWin::IsInterfaceRegistered() {
  base::win::RegKey key;
  return key.Open(HKEY_CLASSES_ROOT, kIAccessible2InterfaceKey,
                  KEY_QUERY_VALUE) == ERROR_SUCCESS;
}

bool ExtendedAccessibleProviderWin::IsAvailable() const {
  return available_;
}

bool ExtendedAccessibleProviderWin::SupportsElement(
    const NativeElementRef& ref) const {
  return ref.window != kNullWindowHandle &&
         IsExtendedWindow(ToHWND(ref.window));
}

bool ExtendedAccessibleProviderWin::InitializeNative() {
  return true;
}

void ExtendedAccessibleProviderWin::ReleaseNative() {
  known_processes_.clear();
}

void ExtendedAccessibleProviderWin::ForgetProcess(base::ProcessId pid) {
  known_processes_.erase(pid);
}

bool ExtendedAccessibleProviderWin::InstallEventHook() {
  // IAccessible2 servers raise the standard focus WinEvent.
  return event_hook_.Start(EVENT_OBJECT_FOCUS, EVENT_OBJECT_FOCUS);
}

void ExtendedAccessibleProviderWin::RemoveEventHook() {
  event_hook_.Stop();
}

void ExtendedAccessibleProviderWin::OnWinEvent(DWORD event,
                                               HWND window,
                                               LONG object_id,
                                               LONG child_id) {
  if (event != EVENT_OBJECT_FOCUS || !IsInitialized() ||
      !IsExtendedWindow(window)) {
    return;
  }

  base::win::ScopedComPtr<IAccessible> accessible;
  base::win::ScopedVariant child;
  HRESULT hr = AccessibleObjectFromEvent(window, object_id, child_id,
                                         accessible.Receive(),
                                         child.Receive());
  if (FAILED(hr) || !accessible)
    return;

  LONG resolved_child = child.type() == VT_I4 ? V_I4(child.ptr())
                                              : CHILDID_SELF;
  std::unique_ptr<AccessibleNode> node =
      NodeFromAccessible(accessible.get(), object_id, resolved_child, window);
  if (node)
    NotifyFocusChanged(*node);
}

std::unique_ptr<AccessibleNode>
ExtendedAccessibleProviderWin::QueryFocusedObject() {
  GUITHREADINFO info = { sizeof(info) };
  HWND window = NULL;
  if (GetGUIThreadInfo(0, &info) && info.hwndFocus)
    window = info.hwndFocus;
  else
    window = GetForegroundWindow();
  if (!window || !IsExtendedWindow(window))
    return nullptr;
  if (!IsWindowResponsive(window, native_call_timeout_))
    return nullptr;

  base::win::ScopedComPtr<IAccessible> accessible;
  HRESULT hr = AccessibleObjectFromWindow(
      window, static_cast<DWORD>(OBJID_CLIENT), IID_IAccessible,
      accessible.ReceiveVoid());
  if (FAILED(hr) || !accessible)
    return nullptr;

  base::win::ScopedVariant focus;
  if (SUCCEEDED(accessible->get_accFocus(focus.Receive())) &&
      focus.type() == VT_DISPATCH && V_DISPATCH(focus.ptr())) {
    base::win::ScopedComPtr<IAccessible> focused;
    if (SUCCEEDED(focused.QueryFrom(V_DISPATCH(focus.ptr()))))
      return NodeFromAccessible(focused.get(), OBJID_CLIENT, CHILDID_SELF,
                                window);
  }
  return NodeFromAccessible(accessible.get(), OBJID_CLIENT, CHILDID_SELF,
                            window);
}

std::unique_ptr<AccessibleNode>
ExtendedAccessibleProviderWin::QueryObjectFromPoint(int x, int y) {
  POINT point = { x, y };
  HWND window = WindowFromPoint(point);
  if (!window || !IsExtendedWindow(window))
    return nullptr;
  if (!IsWindowResponsive(window, native_call_timeout_))
    return nullptr;

  base::win::ScopedComPtr<IAccessible> accessible;
  base::win::ScopedVariant child;
  HRESULT hr = AccessibleObjectFromPoint(point, accessible.Receive(),
                                         child.Receive());
  if (FAILED(hr) || !accessible)
    return nullptr;
  LONG child_id = child.type() == VT_I4 ? V_I4(child.ptr()) : CHILDID_SELF;
  return NodeFromAccessible(accessible.get(), OBJID_CLIENT, child_id, window);
}

std::unique_ptr<AccessibleNode>
ExtendedAccessibleProviderWin::QueryObjectFromHandle(WindowHandle window) {
  HWND hwnd = ToHWND(window);
  if (!IsExtendedWindow(hwnd))
    return nullptr;
  return NodeFromWindow(hwnd);
}

std::unique_ptr<AccessibleNode>
ExtendedAccessibleProviderWin::QueryAccessibleObject(
    const NativeElementRef& ref) {
  if (ref.native_object && (ref.source == BackendId::kExtendedAccessible ||
                            ref.source == BackendId::kLegacyAccessible)) {
    return NodeFromAccessible(ComElementHandle<IAccessible>::FromRef(ref),
                              ref.object_id, ref.child_id,
                              ToHWND(ref.window));
  }
  return NodeFromWindow(ToHWND(ref.window));
}

bool ExtendedAccessibleProviderWin::IsExtendedWindow(HWND window) const {
  base::ProcessId pid = GetWindowProcessId(window);
  if (pid == 0)
    return false;
  if (negotiator_ && negotiator_->GetModelForProcess(pid) ==
                         AccessibilityModel::kExtendedAccessible) {
    return true;
  }

  std::map<base::ProcessId, bool>::const_iterator it =
      known_processes_.find(pid);
  if (it != known_processes_.end())
    return it->second;

  base::string16 process_name;
  bool extended = GetProcessImageName(pid, &process_name) &&
                  IsExtendedApplication(process_name);
  known_processes_[pid] = extended;
  return extended;
}

std::unique_ptr<AccessibleNode>
ExtendedAccessibleProviderWin::NodeFromAccessible(IAccessible* accessible,
                                                  LONG object_id,
                                                  LONG child_id,
                                                  HWND window) {
  AccessibleNodeData data;
  if (!BuildLegacyNodeData(accessible, object_id, child_id, window, &data))
    return nullptr;
  // Simple children have no IAccessible of their own to ask.
  if (child_id == CHILDID_SELF)
    ApplyExtendedAttributes(accessible, &data);
  return CreateNode(data);
}

std::unique_ptr<AccessibleNode>
ExtendedAccessibleProviderWin::NodeFromWindow(HWND window) {
  if (!IsWindowResponsive(window, native_call_timeout_))
    return nullptr;

  base::win::ScopedComPtr<IAccessible> accessible;
  HRESULT hr = AccessibleObjectFromWindow(
      window, static_cast<DWORD>(OBJID_CLIENT), IID_IAccessible,
      accessible.ReceiveVoid());
  if (FAILED(hr) || !accessible)
    return nullptr;
  return NodeFromAccessible(accessible.get(), OBJID_CLIENT, CHILDID_SELF,
                            window);
}

}  // namespace screen_access
