// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/provider_registry.h"

#include <utility>

#include "base/logging.h"
#include "screen_access/backend_settings.h"

namespace screen_access {

ProviderRegistry::ProviderRegistry()
    : preferred_(BackendId::kTreeAutomation),
      auto_switch_enabled_(true) {
  enabled_.Put(BackendId::kTreeAutomation);
}

ProviderRegistry::~ProviderRegistry() {
  Shutdown();
}

bool ProviderRegistry::RegisterProvider(
    std::unique_ptr<AccessibilityProvider> provider) {
  DCHECK(thread_checker_.CalledOnValidThread());
  DCHECK(provider);
  if (GetProvider(provider->id())) {
    DLOG(WARNING) << BackendIdToString(provider->id())
                  << " is already registered";
    return false;
  }
  provider->set_delegate(this);
  providers_.push_back(std::move(provider));
  return true;
}

void ProviderRegistry::ApplySettings(const BackendSettings& settings) {
  DCHECK(thread_checker_.CalledOnValidThread());
  enabled_ = settings.enabled_backends;
  preferred_ = settings.preferred_backend;
  auto_switch_enabled_ = settings.auto_switch_backend;
}

void ProviderRegistry::InitializeEnabledProviders() {
  DCHECK(thread_checker_.CalledOnValidThread());
  for (const auto& provider : providers_) {
    if (enabled_.Has(provider->id()) && provider->IsAvailable())
      provider->Initialize();
  }
}

void ProviderRegistry::SetEnabled(BackendId id, bool enabled) {
  DCHECK(thread_checker_.CalledOnValidThread());
  AccessibilityProvider* provider = GetProvider(id);
  if (enabled) {
    enabled_.Put(id);
    if (provider && provider->IsAvailable() && provider->Initialize())
      provider->StartEventListening();
  } else {
    enabled_.Remove(id);
    if (provider)
      provider->StopEventListening();
  }
  VLOG(1) << BackendIdToString(id) << (enabled ? " enabled" : " disabled");

  for (Observer& observer : observers_)
    observer.OnEnabledBackendsChanged(enabled_);
}

bool ProviderRegistry::IsEnabled(BackendId id) const {
  return enabled_.Has(id);
}

void ProviderRegistry::SetPreferredBackend(BackendId id) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (preferred_ == id)
    return;
  VLOG(1) << "Preferred backend " << BackendIdToString(preferred_) << " -> "
          << BackendIdToString(id);
  preferred_ = id;
  for (Observer& observer : observers_)
    observer.OnPreferredBackendChanged(preferred_);
}

bool ProviderRegistry::CyclePreferredBackend(BackendId* new_preferred) {
  DCHECK(thread_checker_.CalledOnValidThread());
  size_t current = BackendIdToIndex(preferred_);
  // Offset kBackendIdCount lands back on the current backend, so a lone
  // available backend stays preferred.
  for (size_t offset = 1; offset <= kBackendIdCount; ++offset) {
    BackendId candidate = kAllBackendIds[(current + offset) % kBackendIdCount];
    AccessibilityProvider* provider = GetProvider(candidate);
    if (!provider || !provider->IsAvailable())
      continue;
    SetPreferredBackend(candidate);
    if (new_preferred)
      *new_preferred = candidate;
    return true;
  }
  LOG(WARNING) << "No accessibility backend available";
  return false;
}

bool ProviderRegistry::IsRoutable(
    const AccessibilityProvider* provider) const {
  return enabled_.Has(provider->id()) && provider->IsActive();
}

template <typename Query>
std::unique_ptr<AccessibleNode> ProviderRegistry::Route(const Query& query) {
  DCHECK(thread_checker_.CalledOnValidThread());
  AccessibilityProvider* preferred = GetProvider(preferred_);
  if (preferred && IsRoutable(preferred)) {
    std::unique_ptr<AccessibleNode> node = query(preferred);
    if (node) {
      DCHECK(node->source() == preferred->id());
      return node;
    }
  }

  for (const auto& provider : providers_) {
    if (provider.get() == preferred || !IsRoutable(provider.get()))
      continue;
    std::unique_ptr<AccessibleNode> node = query(provider.get());
    if (node) {
      DCHECK(node->source() == provider->id());
      return node;
    }
  }
  return nullptr;
}

std::unique_ptr<AccessibleNode> ProviderRegistry::GetFocusedObject() {
  return Route([](AccessibilityProvider* provider) {
    return provider->GetFocusedObject();
  });
}

std::unique_ptr<AccessibleNode> ProviderRegistry::GetObjectFromPoint(int x,
                                                                     int y) {
  return Route([x, y](AccessibilityProvider* provider) {
    return provider->GetObjectFromPoint(x, y);
  });
}

std::unique_ptr<AccessibleNode> ProviderRegistry::GetObjectFromHandle(
    WindowHandle window) {
  if (window == kNullWindowHandle)
    return nullptr;
  return Route([window](AccessibilityProvider* provider) {
    return provider->GetObjectFromHandle(window);
  });
}

std::unique_ptr<AccessibleNode> ProviderRegistry::GetAccessibleObject(
    const NativeElementRef& ref) {
  return Route([&ref](AccessibilityProvider* provider)
                   -> std::unique_ptr<AccessibleNode> {
    if (!provider->SupportsElement(ref))
      return nullptr;
    return provider->GetAccessibleObject(ref);
  });
}

AccessibilityProvider* ProviderRegistry::GetProvider(BackendId id) const {
  for (const auto& provider : providers_) {
    if (provider->id() == id)
      return provider.get();
  }
  return NULL;
}

std::vector<ProviderRegistry::BackendStatus>
ProviderRegistry::EnumerateBackends() const {
  std::vector<BackendStatus> result;
  for (const auto& provider : providers_) {
    BackendStatus status = {
      provider->id(), provider->IsAvailable(), enabled_.Has(provider->id())
    };
    result.push_back(status);
  }
  return result;
}

void ProviderRegistry::StartEventListening() {
  DCHECK(thread_checker_.CalledOnValidThread());
  for (const auto& provider : providers_) {
    if (enabled_.Has(provider->id()) && provider->IsAvailable() &&
        provider->IsInitialized()) {
      provider->StartEventListening();
    }
  }
}

void ProviderRegistry::StopEventListening() {
  DCHECK(thread_checker_.CalledOnValidThread());
  for (const auto& provider : providers_)
    provider->StopEventListening();
}

void ProviderRegistry::ProcessExited(base::ProcessId pid) {
  DCHECK(thread_checker_.CalledOnValidThread());
  for (const auto& provider : providers_)
    provider->ProcessExited(pid);
}

void ProviderRegistry::Shutdown() {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (providers_.empty())
    return;
  for (const auto& provider : providers_) {
    provider->Shutdown();
    provider->set_delegate(NULL);
  }
  providers_.clear();
  VLOG(1) << "Accessibility backends shut down";
}

bool ProviderRegistry::AutoSelectBackendForProcess(
    const base::string16& process_name) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (!auto_switch_enabled_ || process_name.empty())
    return false;

  std::string normalized = NormalizeProcessName(process_name);
  if (normalized == last_auto_selected_process_)
    return false;
  last_auto_selected_process_ = normalized;

  BackendId target = GetSuggestedBackendForProcess(process_name);
  AccessibilityProvider* provider = GetProvider(target);
  if (!provider || !provider->IsAvailable()) {
    if (preferred_ == BackendId::kTreeAutomation)
      return false;
    VLOG(1) << BackendIdToString(target) << " unavailable for "
            << normalized << ", falling back";
    SetPreferredBackend(BackendId::kTreeAutomation);
    return true;
  }

  if (preferred_ == target)
    return false;
  SetPreferredBackend(target);
  if (!enabled_.Has(target))
    SetEnabled(target, true);
  VLOG(1) << "Switched to " << BackendIdToString(target) << " for "
          << normalized;
  return true;
}

BackendId ProviderRegistry::GetSuggestedBackendForProcess(
    const base::string16& process_name) const {
  BackendId backend = BackendId::kTreeAutomation;
  process_map_.Lookup(process_name, &backend);
  return backend;
}

void ProviderRegistry::RegisterProcessMapping(
    const base::string16& process_name,
    BackendId backend) {
  DCHECK(thread_checker_.CalledOnValidThread());
  process_map_.Register(process_name, backend);
}

void ProviderRegistry::AddObserver(Observer* observer) {
  observers_.AddObserver(observer);
}

void ProviderRegistry::RemoveObserver(Observer* observer) {
  observers_.RemoveObserver(observer);
}

void ProviderRegistry::OnProviderFocusChanged(AccessibilityProvider* provider,
                                              const AccessibleNode& node) {
  DCHECK(thread_checker_.CalledOnValidThread());
  if (!enabled_.Has(provider->id()))
    return;
  for (Observer& observer : observers_)
    observer.OnFocusChanged(provider->id(), node);
}

}  // namespace screen_access
