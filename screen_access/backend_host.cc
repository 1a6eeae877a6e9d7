// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_host.h"

#include <utility>

#include "base/logging.h"
#include "screen_access/activation_platform.h"
#include "screen_access/platform_providers.h"

namespace screen_access {

BackendHost::BackendHost(const BackendSettings& settings,
                         std::unique_ptr<ActivationPlatform> platform)
    : settings_(settings),
      coordinator_(&registry_, settings_),
      negotiator_(std::move(platform),
                  settings_.extended_capable_processes,
                  &coordinator_),
      started_(false),
      shut_down_(false) {
}

BackendHost::~BackendHost() {
  Shutdown();
}

void BackendHost::Start() {
  if (started_ || shut_down_)
    return;
  started_ = true;

  RegisterPlatformProviders(settings_, &negotiator_, &registry_);
  registry_.ApplySettings(settings_);
  registry_.InitializeEnabledProviders();
  registry_.StartEventListening();
  coordinator_.Attach(&negotiator_);
  VLOG(1) << "Backends started: " << registry_.enabled_backends().ToString();
}

void BackendHost::Shutdown() {
  if (shut_down_)
    return;
  shut_down_ = true;

  coordinator_.Detach();
  registry_.StopEventListening();
  registry_.Shutdown();
  negotiator_.Reset();
}

}  // namespace screen_access
