// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/window_util_win.h"

#include <shlwapi.h>

#include "base/logging.h"
#include "base/macros.h"
#include "base/win/scoped_handle.h"

namespace screen_access {

namespace {

// Window class names are limited to 256 characters.
const int kMaxClassNameLength = 256;

struct FindMainWindowParams {
  explicit FindMainWindowParams(base::ProcessId process_id)
      : process_id_(process_id),
        window_found_(NULL) {
  }

  base::ProcessId process_id_;
  HWND window_found_;
};

BOOL CALLBACK MainWindowEnumProc(HWND window, LPARAM lparam) {
  FindMainWindowParams* params =
      reinterpret_cast<FindMainWindowParams*>(lparam);
  if (!params)
    return FALSE;

  if (GetWindowProcessId(window) != params->process_id_)
    return TRUE;
  if (!IsWindowVisible(window) || GetWindow(window, GW_OWNER) != NULL)
    return TRUE;

  // A match; stop enumerating.
  params->window_found_ = window;
  return FALSE;
}

BOOL CALLBACK DescendantEnumProc(HWND window, LPARAM lparam) {
  std::vector<ActivationPlatform::WindowInfo>* windows =
      reinterpret_cast<std::vector<ActivationPlatform::WindowInfo>*>(lparam);
  if (!windows)
    return FALSE;

  ActivationPlatform::WindowInfo info;
  info.window = FromHWND(window);
  info.class_name = GetWindowClass(window);
  windows->push_back(info);
  return TRUE;
}

}  // namespace

base::string16 GetWindowClass(HWND window) {
  wchar_t buffer[kMaxClassNameLength + 1] = {0};
  int size = GetClassNameW(window, buffer, arraysize(buffer));
  if (size <= 0)
    return base::string16();
  return base::string16(buffer, size);
}

base::ProcessId GetWindowProcessId(HWND window) {
  DWORD process_id = 0;
  if (!GetWindowThreadProcessId(window, &process_id))
    return 0;
  return process_id;
}

bool IsWindowResponsive(HWND window, base::TimeDelta timeout) {
  if (!IsWindow(window))
    return false;
  DWORD_PTR result = 0;
  LRESULT sent = SendMessageTimeoutW(
      window, WM_NULL, 0, 0, SMTO_ABORTIFHUNG | SMTO_BLOCK,
      static_cast<UINT>(timeout.InMilliseconds()), &result);
  if (!sent) {
    DVLOG(1) << "Window " << window << " did not respond, error "
             << GetLastError();
    return false;
  }
  return true;
}

void GetDescendantWindows(
    HWND parent,
    std::vector<ActivationPlatform::WindowInfo>* windows) {
  DCHECK(windows);
  if (!IsWindow(parent))
    return;
  // EnumChildWindows already recurses into grandchildren.
  EnumChildWindows(parent, DescendantEnumProc,
                   reinterpret_cast<LPARAM>(windows));
}

HWND FindMainWindow(base::ProcessId pid) {
  if (pid == 0)
    return NULL;
  FindMainWindowParams params(pid);
  EnumWindows(MainWindowEnumProc, reinterpret_cast<LPARAM>(&params));
  return params.window_found_;
}

bool GetProcessImageName(base::ProcessId pid, base::string16* name) {
  DCHECK(name);
  base::win::ScopedHandle process(
      OpenProcess(PROCESS_QUERY_LIMITED_INFORMATION, FALSE, pid));
  if (!process.IsValid()) {
    DVLOG(1) << "OpenProcess(" << pid << ") failed: " << GetLastError();
    return false;
  }

  wchar_t file_path[MAX_PATH] = {0};
  DWORD size = arraysize(file_path);
  if (!QueryFullProcessImageNameW(process.Get(), 0, file_path, &size)) {
    DVLOG(1) << "QueryFullProcessImageName(" << pid << ") failed: "
             << GetLastError();
    return false;
  }
  *name = PathFindFileNameW(file_path);
  return true;
}

}  // namespace screen_access
