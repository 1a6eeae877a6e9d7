// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_ACTIVATION_PLATFORM_H_
#define SCREEN_ACCESS_ACTIVATION_PLATFORM_H_

#include <memory>
#include <vector>

#include "base/process/process_handle.h"
#include "base/strings/string16.h"
#include "base/time/time.h"
#include "screen_access/native_types.h"

namespace screen_access {

// The native operations ActivationNegotiator depends on.
class ActivationPlatform {
 public:
  struct WindowInfo {
    WindowHandle window;
    base::string16 class_name;
  };

  virtual ~ActivationPlatform() {}

  // Executable base name of |pid|, e.g. "chrome.exe".
  virtual bool GetProcessName(base::ProcessId pid, base::string16* name) = 0;

  // The visible top-level window owned by |pid|, or kNullWindowHandle.
  virtual WindowHandle GetMainWindow(base::ProcessId pid) = 0;

  // Every descendant of |parent|, depth first in enumeration order.
  virtual void GetDescendantWindows(WindowHandle parent,
                                    std::vector<WindowInfo>* windows) = 0;

  // Runs the three step IAccessible2 probe against |window|. Returns true
  // if the extended interface was obtained; every reference acquired along
  // the way has been released by the time this returns.
  virtual bool ProbeExtendedInterface(WindowHandle window) = 0;
};

// The implementation for the current platform. Outside Windows it knows no
// processes and no windows.
std::unique_ptr<ActivationPlatform> CreateActivationPlatform(
    base::TimeDelta native_call_timeout);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_ACTIVATION_PLATFORM_H_
