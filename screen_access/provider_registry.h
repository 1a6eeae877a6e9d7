// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_PROVIDER_REGISTRY_H_
#define SCREEN_ACCESS_PROVIDER_REGISTRY_H_

#include <memory>
#include <string>
#include <vector>

#include "base/macros.h"
#include "base/observer_list.h"
#include "base/process/process_handle.h"
#include "base/strings/string16.h"
#include "base/threading/thread_checker.h"
#include "screen_access/accessibility_provider.h"
#include "screen_access/backend_id.h"
#include "screen_access/process_backend_map.h"

namespace screen_access {

struct BackendSettings;

// Owns the providers and decides which one answers each query.
//
// Routing is strict first-success: the preferred backend, when enabled and
// active, is asked first; after that every other enabled and active backend
// is asked in registration order. The first non-null node wins.
//
// The provider table is filled once at start-up; afterwards only the enabled
// set and the preferred backend change. All methods must be called on the
// thread that created the registry.
class ProviderRegistry : public AccessibilityProvider::Delegate {
 public:
  class Observer {
   public:
    // Fan-in of the focus notifications of every enabled provider.
    virtual void OnFocusChanged(BackendId source,
                                const AccessibleNode& node) {}
    virtual void OnEnabledBackendsChanged(BackendSet enabled) {}
    virtual void OnPreferredBackendChanged(BackendId preferred) {}

   protected:
    virtual ~Observer() {}
  };

  struct BackendStatus {
    BackendId id;
    bool available;
    bool enabled;
  };

  // Starts with only the tree automation backend enabled and preferred.
  ProviderRegistry();
  ~ProviderRegistry() override;

  // Adds |provider| keyed by its id. A second provider with an id that is
  // already registered is dropped and false is returned.
  bool RegisterProvider(std::unique_ptr<AccessibilityProvider> provider);

  // Replaces the enabled set, preferred backend and auto-switch flag without
  // touching provider state. Call InitializeEnabledProviders() afterwards.
  void ApplySettings(const BackendSettings& settings);

  // Initializes every enabled and available provider.
  void InitializeEnabledProviders();

  // Enabling initializes and starts the provider when it is available;
  // disabling stops its listener. Observers are always told about the new
  // enabled set.
  void SetEnabled(BackendId id, bool enabled);
  bool IsEnabled(BackendId id) const;
  BackendSet enabled_backends() const { return enabled_; }

  BackendId preferred_backend() const { return preferred_; }
  void SetPreferredBackend(BackendId id);

  // Moves the preferred backend to the next available one in the fixed
  // cycling order, wrapping at most once. Returns false and changes nothing
  // when no registered backend is available.
  bool CyclePreferredBackend(BackendId* new_preferred);

  std::unique_ptr<AccessibleNode> GetFocusedObject();
  std::unique_ptr<AccessibleNode> GetObjectFromPoint(int x, int y);
  std::unique_ptr<AccessibleNode> GetObjectFromHandle(WindowHandle window);
  // Like the other queries, but also skips backends whose SupportsElement()
  // rejects |ref|.
  std::unique_ptr<AccessibleNode> GetAccessibleObject(
      const NativeElementRef& ref);

  // Null if no provider with |id| was registered.
  AccessibilityProvider* GetProvider(BackendId id) const;

  // One entry per registered provider, in registration order.
  std::vector<BackendStatus> EnumerateBackends() const;

  // Starts every enabled provider that is available and initialized.
  void StartEventListening();
  // Stops every provider.
  void StopEventListening();

  // Tells every provider that |pid| is gone.
  void ProcessExited(base::ProcessId pid);

  // Shuts down and destroys every provider. Repeated calls do nothing.
  void Shutdown();

  // Makes the backend mapped to |process_name| preferred, enabling it if
  // needed. Does nothing when auto-switching is off or |process_name| was
  // the last one handled. Unmapped processes get the tree automation
  // backend; an unavailable target falls back to it as well. Returns true if
  // the preferred backend changed.
  bool AutoSelectBackendForProcess(const base::string16& process_name);

  // The backend AutoSelectBackendForProcess() would pick, without side
  // effects.
  BackendId GetSuggestedBackendForProcess(
      const base::string16& process_name) const;

  void RegisterProcessMapping(const base::string16& process_name,
                              BackendId backend);

  void set_auto_switch_enabled(bool enabled) { auto_switch_enabled_ = enabled; }
  bool auto_switch_enabled() const { return auto_switch_enabled_; }

  void AddObserver(Observer* observer);
  void RemoveObserver(Observer* observer);

  // AccessibilityProvider::Delegate:
  void OnProviderFocusChanged(AccessibilityProvider* provider,
                              const AccessibleNode& node) override;

 private:
  bool IsRoutable(const AccessibilityProvider* provider) const;

  // Runs |query| against the routable providers in routing order and
  // returns the first non-null node.
  template <typename Query>
  std::unique_ptr<AccessibleNode> Route(const Query& query);

  std::vector<std::unique_ptr<AccessibilityProvider>> providers_;
  BackendSet enabled_;
  BackendId preferred_;

  bool auto_switch_enabled_;
  ProcessBackendMap process_map_;
  std::string last_auto_selected_process_;

  base::ObserverList<Observer> observers_;
  base::ThreadChecker thread_checker_;

  DISALLOW_COPY_AND_ASSIGN(ProviderRegistry);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_PROVIDER_REGISTRY_H_
