// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_ACCESSIBILITY_PROVIDER_H_
#define SCREEN_ACCESS_ACCESSIBILITY_PROVIDER_H_

#include <memory>

#include "base/process/process_handle.h"
#include "screen_access/accessible_node.h"
#include "screen_access/backend_id.h"
#include "screen_access/native_types.h"

namespace screen_access {

// One native accessibility technology. Queries return a null node when the
// backend has nothing to say or a native call failed; nothing here throws or
// reports errors in any other way.
class AccessibilityProvider {
 public:
  // Receives focus changes detected by the provider's native event
  // subscription. Implemented by the registry.
  class Delegate {
   public:
    virtual void OnProviderFocusChanged(AccessibilityProvider* provider,
                                        const AccessibleNode& node) = 0;

   protected:
    virtual ~Delegate() {}
  };

  virtual ~AccessibilityProvider() {}

  virtual BackendId id() const = 0;

  // Whether the technology exists on this machine. Never changes for the
  // lifetime of the provider.
  virtual bool IsAvailable() const = 0;

  // Initialized and currently listening for native events.
  virtual bool IsActive() const = 0;

  // Whether Initialize() has succeeded.
  virtual bool IsInitialized() const = 0;

  // Acquires native resources. Idempotent; returns false on failure.
  virtual bool Initialize() = 0;

  virtual std::unique_ptr<AccessibleNode> GetFocusedObject() = 0;
  virtual std::unique_ptr<AccessibleNode> GetObjectFromPoint(int x, int y) = 0;
  virtual std::unique_ptr<AccessibleNode> GetObjectFromHandle(
      WindowHandle window) = 0;
  virtual std::unique_ptr<AccessibleNode> GetAccessibleObject(
      const NativeElementRef& ref) = 0;

  // Cheap check whether GetAccessibleObject() can make sense of |ref|.
  virtual bool SupportsElement(const NativeElementRef& ref) const = 0;

  // Both are idempotent and serialized against each other.
  virtual void StartEventListening() = 0;
  virtual void StopEventListening() = 0;

  // Drops whatever the provider cached about |pid|, which has exited.
  virtual void ProcessExited(base::ProcessId pid) = 0;

  // Stops listening and releases every native resource. Safe to call more
  // than once and after a partial start.
  virtual void Shutdown() = 0;

  virtual void set_delegate(Delegate* delegate) = 0;
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_ACCESSIBILITY_PROVIDER_H_
