// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_BACKEND_COORDINATOR_H_
#define SCREEN_ACCESS_BACKEND_COORDINATOR_H_

#include "base/macros.h"
#include "base/process/process_handle.h"
#include "base/threading/thread_checker.h"
#include "screen_access/activation_negotiator.h"
#include "screen_access/provider_registry.h"

namespace screen_access {

struct BackendSettings;

// Reacts to focus moving into a new process: picks the preferred backend
// for it and, for Chromium-family browsers, asks for the IAccessible2 tree.
// When a process turns out to expose IAccessible2 the extended backend is
// enabled.
//
// Lives on the registry's thread. The negotiator must be constructed with
// this object as its delegate and only be driven from that same thread.
class BackendCoordinator : public ProviderRegistry::Observer,
                           public ActivationNegotiator::Delegate {
 public:
  BackendCoordinator(ProviderRegistry* registry,
                     const BackendSettings& settings);
  ~BackendCoordinator() override;

  // Starts observing |registry_|. |negotiator| must outlive this object.
  void Attach(ActivationNegotiator* negotiator);
  void Detach();

  // Runs auto-selection and activation for |pid| as if focus had just
  // moved into it.
  void HandleProcessFocused(base::ProcessId pid);

  // Forgets |pid| in the negotiator and in every provider.
  void HandleProcessExited(base::ProcessId pid);

  // ProviderRegistry::Observer:
  void OnFocusChanged(BackendId source, const AccessibleNode& node) override;

  // ActivationNegotiator::Delegate:
  void OnAccessibilityModelChanged(base::ProcessId pid,
                                   AccessibilityModel model) override;

 private:
  ProviderRegistry* registry_;
  ActivationNegotiator* negotiator_;
  const bool auto_activate_extended_;
  base::ProcessId last_focused_pid_;

  base::ThreadChecker thread_checker_;

  DISALLOW_COPY_AND_ASSIGN(BackendCoordinator);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_BACKEND_COORDINATOR_H_
