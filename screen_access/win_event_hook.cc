// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/win_event_hook.h"

#include <map>

#include "base/lazy_instance.h"
#include "base/logging.h"
#include "base/synchronization/lock.h"

namespace screen_access {

namespace {

typedef std::map<HWINEVENTHOOK, WinEventHook::Delegate*> HookMap;

struct HookRegistry {
  base::Lock lock;
  HookMap hooks;
};

base::LazyInstance<HookRegistry>::Leaky g_hook_registry =
    LAZY_INSTANCE_INITIALIZER;

}  // namespace

WinEventHook::WinEventHook(Delegate* delegate)
    : delegate_(delegate),
      hook_(NULL) {
  DCHECK(delegate_);
}

WinEventHook::~WinEventHook() {
  Stop();
}

bool WinEventHook::Start(DWORD event_min, DWORD event_max) {
  if (hook_ != NULL)
    return false;

  // Hold the registry lock across installation so an event raised before
  // the map entry exists cannot be dispatched to nobody.
  HookRegistry* registry = g_hook_registry.Pointer();
  base::AutoLock lock(registry->lock);
  hook_ = SetWinEventHook(event_min,
                          event_max,
                          NULL,
                          WinEventProc,
                          0,
                          0,
                          WINEVENT_OUTOFCONTEXT | WINEVENT_SKIPOWNPROCESS);
  if (hook_ == NULL) {
    LOG(ERROR) << "SetWinEventHook failed: " << GetLastError();
    return false;
  }
  registry->hooks[hook_] = delegate_;
  return true;
}

void WinEventHook::Stop() {
  if (hook_ == NULL)
    return;

  HookRegistry* registry = g_hook_registry.Pointer();
  {
    base::AutoLock lock(registry->lock);
    registry->hooks.erase(hook_);
  }
  if (!UnhookWinEvent(hook_))
    DLOG(WARNING) << "UnhookWinEvent failed: " << GetLastError();
  hook_ = NULL;
}

// static
VOID CALLBACK WinEventHook::WinEventProc(HWINEVENTHOOK hook,
                                         DWORD event,
                                         HWND window,
                                         LONG object_id,
                                         LONG child_id,
                                         DWORD event_thread_id,
                                         DWORD event_time) {
  Delegate* delegate = NULL;
  {
    HookRegistry* registry = g_hook_registry.Pointer();
    base::AutoLock lock(registry->lock);
    HookMap::const_iterator it = registry->hooks.find(hook);
    if (it == registry->hooks.end())
      return;
    delegate = it->second;
  }
  delegate->OnWinEvent(event, window, object_id, child_id);
}

}  // namespace screen_access
