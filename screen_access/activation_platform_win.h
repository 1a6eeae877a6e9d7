// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_ACTIVATION_PLATFORM_WIN_H_
#define SCREEN_ACCESS_ACTIVATION_PLATFORM_WIN_H_

#include <windows.h>

#include "base/macros.h"
#include "screen_access/activation_platform.h"

namespace screen_access {

// Steps two and three of the IAccessible2 probe: asks |accessible| for
// IServiceProvider and that for the IAccessible2 service. Each interface
// acquired is released before returning, in reverse acquisition order.
bool ProbeExtendedInterfaceOnObject(IUnknown* accessible);

class ActivationPlatformWin : public ActivationPlatform {
 public:
  explicit ActivationPlatformWin(base::TimeDelta native_call_timeout);
  ~ActivationPlatformWin() override;

  // ActivationPlatform:
  bool GetProcessName(base::ProcessId pid, base::string16* name) override;
  WindowHandle GetMainWindow(base::ProcessId pid) override;
  void GetDescendantWindows(WindowHandle parent,
                            std::vector<WindowInfo>* windows) override;
  bool ProbeExtendedInterface(WindowHandle window) override;

 private:
  const base::TimeDelta native_call_timeout_;

  DISALLOW_COPY_AND_ASSIGN(ActivationPlatformWin);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_ACTIVATION_PLATFORM_WIN_H_
