// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/test/mock_activation_platform.h"

#include "base/strings/utf_string_conversions.h"

namespace screen_access {

MockActivationPlatform::MockActivationPlatform() {
}

MockActivationPlatform::~MockActivationPlatform() {
}

ActivationPlatform::WindowInfo MakeWindowInfo(WindowHandle window,
                                              const char* class_name) {
  ActivationPlatform::WindowInfo info;
  info.window = window;
  info.class_name = base::ASCIIToUTF16(class_name);
  return info;
}

}  // namespace screen_access
