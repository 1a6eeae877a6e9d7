// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_PROVIDER_BASE_H_
#define SCREEN_ACCESS_PROVIDER_BASE_H_

#include <memory>

#include "base/macros.h"
#include "base/synchronization/lock.h"
#include "screen_access/accessibility_provider.h"

namespace screen_access {

// Lifecycle bookkeeping shared by every provider: the initialized and
// listening flags, start/stop serialization and delegate dispatch.
// Subclasses implement the native half through the protected hooks.
//
// Subclasses must call Shutdown() from their own destructor, since the
// hooks it invokes are gone once ~ProviderBase runs.
class ProviderBase : public AccessibilityProvider {
 public:
  explicit ProviderBase(BackendId id);
  ~ProviderBase() override;

  // AccessibilityProvider:
  BackendId id() const override;
  bool IsActive() const override;
  bool IsInitialized() const override;
  bool Initialize() override;
  std::unique_ptr<AccessibleNode> GetFocusedObject() override;
  std::unique_ptr<AccessibleNode> GetObjectFromPoint(int x, int y) override;
  std::unique_ptr<AccessibleNode> GetObjectFromHandle(
      WindowHandle window) override;
  std::unique_ptr<AccessibleNode> GetAccessibleObject(
      const NativeElementRef& ref) override;
  void StartEventListening() override;
  void StopEventListening() override;
  void ProcessExited(base::ProcessId pid) override;
  void Shutdown() override;
  void set_delegate(Delegate* delegate) override;

  bool is_listening() const;

 protected:
  // Acquires native resources. Only called while available and not yet
  // initialized.
  virtual bool InitializeNative() = 0;

  // Releases whatever InitializeNative() acquired. Called at most once per
  // successful InitializeNative().
  virtual void ReleaseNative() = 0;

  // Install and remove the native event subscription. Called with the
  // listening lock held; RemoveEventHook() only after a successful
  // InstallEventHook().
  virtual bool InstallEventHook() = 0;
  virtual void RemoveEventHook() = 0;

  // Forgets per-process state. Only called while initialized.
  virtual void ForgetProcess(base::ProcessId pid) {}

  // Native queries. Only called while initialized.
  virtual std::unique_ptr<AccessibleNode> QueryFocusedObject() = 0;
  virtual std::unique_ptr<AccessibleNode> QueryObjectFromPoint(int x,
                                                               int y) = 0;
  virtual std::unique_ptr<AccessibleNode> QueryObjectFromHandle(
      WindowHandle window) = 0;
  virtual std::unique_ptr<AccessibleNode> QueryAccessibleObject(
      const NativeElementRef& ref) = 0;

  // Freezes |data| into a node tagged with this provider's id.
  std::unique_ptr<AccessibleNode> CreateNode(
      const AccessibleNodeData& data) const;

  // Forwards a focus change to the delegate, if any.
  void NotifyFocusChanged(const AccessibleNode& node);

 private:
  const BackendId id_;
  Delegate* delegate_;
  bool initialized_;
  bool shut_down_;

  // Guards |listening_| and serializes Install/RemoveEventHook().
  mutable base::Lock listening_lock_;
  bool listening_;

  DISALLOW_COPY_AND_ASSIGN(ProviderBase);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_PROVIDER_BASE_H_
