// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_TEST_MOCK_ACTIVATION_PLATFORM_H_
#define SCREEN_ACCESS_TEST_MOCK_ACTIVATION_PLATFORM_H_

#include <vector>

#include "gmock/gmock.h"
#include "screen_access/activation_platform.h"

namespace screen_access {

class MockActivationPlatform : public ActivationPlatform {
 public:
  MockActivationPlatform();
  ~MockActivationPlatform() override;

  MOCK_METHOD2(GetProcessName, bool(base::ProcessId, base::string16*));
  MOCK_METHOD1(GetMainWindow, WindowHandle(base::ProcessId));
  MOCK_METHOD2(GetDescendantWindows,
               void(WindowHandle, std::vector<WindowInfo>*));
  MOCK_METHOD1(ProbeExtendedInterface, bool(WindowHandle));
};

// Builds a WindowInfo for GetDescendantWindows expectations.
ActivationPlatform::WindowInfo MakeWindowInfo(WindowHandle window,
                                              const char* class_name);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_TEST_MOCK_ACTIVATION_PLATFORM_H_
