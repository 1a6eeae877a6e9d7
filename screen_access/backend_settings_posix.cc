// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_settings.h"

namespace screen_access {

void ApplyPersistedSettings(BackendSettings* settings) {
  // Nothing is persisted outside of Windows.
}

}  // namespace screen_access
