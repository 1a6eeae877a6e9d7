// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/activation_platform_win.h"

#include <oleacc.h>
#include <servprov.h>

#include "base/logging.h"
#include "base/win/scoped_comptr.h"
#include "ia2_api_all.h"
#include "screen_access/com_util_win.h"
#include "screen_access/window_util_win.h"

namespace screen_access {

bool ProbeExtendedInterfaceOnObject(IUnknown* accessible) {
  if (!accessible)
    return false;

  base::win::ScopedComPtr<IServiceProvider> service_provider;
  HRESULT hr = service_provider.QueryFrom(accessible);
  if (FAILED(hr) || !service_provider) {
    DVLOG(1) << "No IServiceProvider: " << std::hex << hr;
    return false;
  }

  // Declared after |service_provider| so it is released first.
  base::win::ScopedComPtr<IAccessible2> extended;
  hr = QueryExtendedService(service_provider.get(), extended.Receive());
  if (FAILED(hr)) {
    DVLOG(1) << "IAccessible2 service unavailable: " << std::hex << hr;
    return false;
  }
  return true;
}

ActivationPlatformWin::ActivationPlatformWin(
    base::TimeDelta native_call_timeout)
    : native_call_timeout_(native_call_timeout) {
}

ActivationPlatformWin::~ActivationPlatformWin() {
}

bool ActivationPlatformWin::GetProcessName(base::ProcessId pid,
                                           base::string16* name) {
  return GetProcessImageName(pid, name);
}

WindowHandle ActivationPlatformWin::GetMainWindow(base::ProcessId pid) {
  return FromHWND(FindMainWindow(pid));
}

void ActivationPlatformWin::GetDescendantWindows(
    WindowHandle parent,
    std::vector<WindowInfo>* windows) {
  screen_access::GetDescendantWindows(ToHWND(parent), windows);
}

bool ActivationPlatformWin::ProbeExtendedInterface(WindowHandle window) {
  HWND hwnd = ToHWND(window);
  if (!IsWindowResponsive(hwnd, native_call_timeout_))
    return false;

  base::win::ScopedComPtr<IAccessible> accessible;
  HRESULT hr = AccessibleObjectFromWindow(
      hwnd, static_cast<DWORD>(OBJID_CLIENT), IID_IAccessible,
      accessible.ReceiveVoid());
  if (FAILED(hr) || !accessible) {
    DVLOG(1) << "AccessibleObjectFromWindow failed: " << std::hex << hr;
    return false;
  }
  return ProbeExtendedInterfaceOnObject(accessible.get());
}

std::unique_ptr<ActivationPlatform> CreateActivationPlatform(
    base::TimeDelta native_call_timeout) {
  return std::unique_ptr<ActivationPlatform>(
      new ActivationPlatformWin(native_call_timeout));
}

}  // namespace screen_access
