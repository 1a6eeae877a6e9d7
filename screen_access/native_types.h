// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_NATIVE_TYPES_H_
#define SCREEN_ACCESS_NATIVE_TYPES_H_

#include <stdint.h>

namespace screen_access {

// A native top-level or child window handle, stored as an integer so that
// portable code never depends on <windows.h>. Zero means "no window".
typedef uintptr_t WindowHandle;

const WindowHandle kNullWindowHandle = 0;

}  // namespace screen_access

#endif  // SCREEN_ACCESS_NATIVE_TYPES_H_
