// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/provider_base.h"

#include "base/logging.h"

namespace screen_access {

ProviderBase::ProviderBase(BackendId id)
    : id_(id),
      delegate_(NULL),
      initialized_(false),
      shut_down_(false),
      listening_(false) {
}

ProviderBase::~ProviderBase() {
  DCHECK(!initialized_) << BackendIdToString(id_)
                        << " destroyed without Shutdown()";
}

BackendId ProviderBase::id() const {
  return id_;
}

bool ProviderBase::IsActive() const {
  return initialized_ && is_listening();
}

bool ProviderBase::IsInitialized() const {
  return initialized_;
}

bool ProviderBase::Initialize() {
  if (initialized_)
    return true;
  if (shut_down_ || !IsAvailable())
    return false;

  initialized_ = InitializeNative();
  if (initialized_) {
    VLOG(1) << BackendIdToString(id_) << " initialized";
  } else {
    LOG(WARNING) << "Failed to initialize " << BackendIdToString(id_);
  }
  return initialized_;
}

std::unique_ptr<AccessibleNode> ProviderBase::GetFocusedObject() {
  if (!initialized_)
    return nullptr;
  return QueryFocusedObject();
}

std::unique_ptr<AccessibleNode> ProviderBase::GetObjectFromPoint(int x,
                                                                 int y) {
  if (!initialized_)
    return nullptr;
  return QueryObjectFromPoint(x, y);
}

std::unique_ptr<AccessibleNode> ProviderBase::GetObjectFromHandle(
    WindowHandle window) {
  if (!initialized_ || window == kNullWindowHandle)
    return nullptr;
  return QueryObjectFromHandle(window);
}

std::unique_ptr<AccessibleNode> ProviderBase::GetAccessibleObject(
    const NativeElementRef& ref) {
  if (!initialized_ || !SupportsElement(ref))
    return nullptr;
  return QueryAccessibleObject(ref);
}

void ProviderBase::StartEventListening() {
  base::AutoLock lock(listening_lock_);
  if (!initialized_ || listening_)
    return;
  listening_ = InstallEventHook();
  if (listening_) {
    VLOG(1) << BackendIdToString(id_) << " listening for events";
  } else {
    LOG(WARNING) << "Failed to subscribe to " << BackendIdToString(id_)
                 << " events";
  }
}

void ProviderBase::StopEventListening() {
  base::AutoLock lock(listening_lock_);
  if (!listening_)
    return;
  RemoveEventHook();
  listening_ = false;
  VLOG(1) << BackendIdToString(id_) << " stopped listening";
}

void ProviderBase::ProcessExited(base::ProcessId pid) {
  if (initialized_)
    ForgetProcess(pid);
}

void ProviderBase::Shutdown() {
  if (shut_down_)
    return;
  StopEventListening();
  if (initialized_) {
    ReleaseNative();
    initialized_ = false;
  }
  shut_down_ = true;
  delegate_ = NULL;
}

void ProviderBase::set_delegate(Delegate* delegate) {
  delegate_ = delegate;
}

bool ProviderBase::is_listening() const {
  base::AutoLock lock(listening_lock_);
  return listening_;
}

std::unique_ptr<AccessibleNode> ProviderBase::CreateNode(
    const AccessibleNodeData& data) const {
  return std::unique_ptr<AccessibleNode>(new AccessibleNode(id_, data));
}

void ProviderBase::NotifyFocusChanged(const AccessibleNode& node) {
  if (delegate_)
    delegate_->OnProviderFocusChanged(this, node);
}

}  // namespace screen_access
