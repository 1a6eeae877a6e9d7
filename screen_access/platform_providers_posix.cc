// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/platform_providers.h"

#include "base/logging.h"

namespace screen_access {

void RegisterPlatformProviders(const BackendSettings& settings,
                               const ActivationNegotiator* negotiator,
                               ProviderRegistry* registry) {
  VLOG(1) << "No native accessibility backends on this platform";
}

}  // namespace screen_access
