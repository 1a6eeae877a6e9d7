// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_coordinator.h"

#include "base/logging.h"
#include "base/strings/string16.h"
#include "screen_access/backend_settings.h"

namespace screen_access {

BackendCoordinator::BackendCoordinator(ProviderRegistry* registry,
                                       const BackendSettings& settings)
    : registry_(registry),
      negotiator_(NULL),
      auto_activate_extended_(settings.auto_activate_extended),
      last_focused_pid_(0) {
  DCHECK(registry_);
}

BackendCoordinator::~BackendCoordinator() {
  Detach();
}

void BackendCoordinator::Attach(ActivationNegotiator* negotiator) {
  DCHECK(thread_checker_.CalledOnValidThread());
  DCHECK(negotiator);
  DCHECK(!negotiator_);
  negotiator_ = negotiator;
  registry_->AddObserver(this);
}

void BackendCoordinator::Detach() {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (!negotiator_)
    return;
  registry_->RemoveObserver(this);
  negotiator_ = NULL;
}

void BackendCoordinator::HandleProcessFocused(base::ProcessId pid) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (!negotiator_ || pid == 0 || pid == last_focused_pid_)
    return;
  last_focused_pid_ = pid;

  base::string16 process_name;
  if (negotiator_->GetProcessName(pid, &process_name))
    registry_->AutoSelectBackendForProcess(process_name);

  if (auto_activate_extended_)
    negotiator_->ActivateForProcess(pid);
}

void BackendCoordinator::HandleProcessExited(base::ProcessId pid) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (pid == last_focused_pid_)
    last_focused_pid_ = 0;
  registry_->ProcessExited(pid);
  if (negotiator_)
    negotiator_->ProcessExited(pid);
}

void BackendCoordinator::OnFocusChanged(BackendId source,
                                        const AccessibleNode& node) {
  HandleProcessFocused(node.process_id());
}

void BackendCoordinator::OnAccessibilityModelChanged(
    base::ProcessId pid,
    AccessibilityModel model) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (model != AccessibilityModel::kExtendedAccessible)
    return;
  AccessibilityProvider* provider =
      registry_->GetProvider(BackendId::kExtendedAccessible);
  if (!provider || !provider->IsAvailable())
    return;
  if (!registry_->IsEnabled(BackendId::kExtendedAccessible)) {
    VLOG(1) << "Enabling IAccessible2 for pid " << pid;
    registry_->SetEnabled(BackendId::kExtendedAccessible, true);
  }
}

}  // namespace screen_access
