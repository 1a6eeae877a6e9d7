// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_BACKEND_HOST_H_
#define SCREEN_ACCESS_BACKEND_HOST_H_

#include <memory>

#include "base/macros.h"
#include "screen_access/activation_negotiator.h"
#include "screen_access/backend_coordinator.h"
#include "screen_access/backend_settings.h"
#include "screen_access/provider_registry.h"

namespace screen_access {

class ActivationPlatform;

// Owns and wires the whole backend layer for one engine thread: the
// registry with its providers, the activation negotiator and the
// coordinator between them.
//
//   BackendSettings settings =
//       LoadBackendSettings(*base::CommandLine::ForCurrentProcess());
//   BackendHost host(settings, CreateActivationPlatform(timeout));
//   host.Start();
//   std::unique_ptr<AccessibleNode> node = host.registry()->GetFocusedObject();
//   ...
//   host.Shutdown();
class BackendHost {
 public:
  BackendHost(const BackendSettings& settings,
              std::unique_ptr<ActivationPlatform> platform);
  ~BackendHost();

  // Registers the platform providers (providers registered beforehand take
  // precedence), initializes the enabled ones and starts listening.
  // Does nothing after the first call.
  void Start();

  // Stops every listener and releases every native resource. Idempotent.
  void Shutdown();

  ProviderRegistry* registry() { return &registry_; }
  ActivationNegotiator* negotiator() { return &negotiator_; }
  BackendCoordinator* coordinator() { return &coordinator_; }
  const BackendSettings& settings() const { return settings_; }

 private:
  const BackendSettings settings_;
  ProviderRegistry registry_;
  BackendCoordinator coordinator_;
  ActivationNegotiator negotiator_;
  bool started_;
  bool shut_down_;

  DISALLOW_COPY_AND_ASSIGN(BackendHost);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_BACKEND_HOST_H_
