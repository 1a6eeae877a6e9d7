// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/activation_platform.h"

#include "base/macros.h"

namespace screen_access {

namespace {

class ActivationPlatformPosix : public ActivationPlatform {
 public:
  ActivationPlatformPosix() {}

  bool GetProcessName(base::ProcessId pid, base::string16* name) override {
    return false;
  }
  WindowHandle GetMainWindow(base::ProcessId pid) override {
    return kNullWindowHandle;
  }
  void GetDescendantWindows(WindowHandle parent,
                            std::vector<WindowInfo>* windows) override {
    windows->clear();
  }
  bool ProbeExtendedInterface(WindowHandle window) override { return false; }

 private:
  DISALLOW_COPY_AND_ASSIGN(ActivationPlatformPosix);
};

}  // namespace

std::unique_ptr<ActivationPlatform> CreateActivationPlatform(
    base::TimeDelta native_call_timeout) {
  return std::unique_ptr<ActivationPlatform>(new ActivationPlatformPosix());
}

}  // namespace screen_access
