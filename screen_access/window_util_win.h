// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_WINDOW_UTIL_WIN_H_
#define SCREEN_ACCESS_WINDOW_UTIL_WIN_H_

#include <windows.h>

#include <vector>

#include "base/process/process_handle.h"
#include "base/strings/string16.h"
#include "base/time/time.h"
#include "screen_access/activation_platform.h"
#include "screen_access/native_types.h"

namespace screen_access {

inline HWND ToHWND(WindowHandle window) {
  return reinterpret_cast<HWND>(window);
}

inline WindowHandle FromHWND(HWND window) {
  return reinterpret_cast<WindowHandle>(window);
}

// Returns the class name of |window|, or an empty string on failure.
base::string16 GetWindowClass(HWND window);

// Returns the id of the process owning |window|, or 0.
base::ProcessId GetWindowProcessId(HWND window);

// Sends |window| a no-op message and waits at most |timeout| for the owning
// thread to process it. Returns false for hung or destroyed windows, so
// cross-process queries against them can be skipped instead of blocking.
bool IsWindowResponsive(HWND window, base::TimeDelta timeout);

// Appends every descendant of |parent| to |windows| in the depth first order
// EnumChildWindows reports them.
void GetDescendantWindows(HWND parent,
                          std::vector<ActivationPlatform::WindowInfo>* windows);

// Returns the first visible, unowned top-level window owned by |pid|.
HWND FindMainWindow(base::ProcessId pid);

// Retrieves the executable base name of |pid|, e.g. "chrome.exe".
bool GetProcessImageName(base::ProcessId pid, base::string16* name);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_WINDOW_UTIL_WIN_H_
