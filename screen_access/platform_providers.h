// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_PLATFORM_PROVIDERS_H_
#define SCREEN_ACCESS_PLATFORM_PROVIDERS_H_

namespace screen_access {

class ActivationNegotiator;
class ProviderRegistry;
struct BackendSettings;

// Registers the providers this platform supports with |registry|, in the
// order tree automation, legacy, extended, toolkit bridge. |negotiator|
// must outlive the registered providers.
void RegisterPlatformProviders(const BackendSettings& settings,
                               const ActivationNegotiator* negotiator,
                               ProviderRegistry* registry);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_PLATFORM_PROVIDERS_H_
