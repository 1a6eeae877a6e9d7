// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/platform_providers.h"

#include <memory>

#include "screen_access/backend_settings.h"
#include "screen_access/extended_accessible_provider_win.h"
#include "screen_access/legacy_accessible_provider_win.h"
#include "screen_access/provider_registry.h"
#include "screen_access/toolkit_bridge_provider_win.h"
#include "screen_access/tree_automation_provider_win.h"

namespace screen_access {

void RegisterPlatformProviders(const BackendSettings& settings,
                               const ActivationNegotiator* negotiator,
                               ProviderRegistry* registry) {
  registry->RegisterProvider(std::unique_ptr<AccessibilityProvider>(
      new TreeAutomationProviderWin(settings.native_call_timeout)));
  registry->RegisterProvider(std::unique_ptr<AccessibilityProvider>(
      new LegacyAccessibleProviderWin(settings.native_call_timeout)));
  registry->RegisterProvider(std::unique_ptr<AccessibilityProvider>(
      new ExtendedAccessibleProviderWin(settings.native_call_timeout,
                                        negotiator)));
  registry->RegisterProvider(std::unique_ptr<AccessibilityProvider>(
      new ToolkitBridgeProviderWin()));
}

}  // namespace screen_access
