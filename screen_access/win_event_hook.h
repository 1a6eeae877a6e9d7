// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_WIN_EVENT_HOOK_H_
#define SCREEN_ACCESS_WIN_EVENT_HOOK_H_

#include <windows.h>

#include "base/macros.h"

namespace screen_access {

// An out-of-context SetWinEventHook subscription. The system calls a single
// static procedure which looks the owning WinEventHook up by hook handle, so
// no per-instance thunk is needed and events arriving after Stop() are
// dropped.
//
// Out-of-context events are delivered on the thread that called Start(),
// which must pump messages.
class WinEventHook {
 public:
  class Delegate {
   public:
    virtual void OnWinEvent(DWORD event,
                            HWND window,
                            LONG object_id,
                            LONG child_id) = 0;

   protected:
    virtual ~Delegate() {}
  };

  explicit WinEventHook(Delegate* delegate);
  ~WinEventHook();

  // Installs the hook for events in [event_min, event_max], skipping events
  // raised by this process. Returns false if a hook is already installed or
  // installation failed.
  bool Start(DWORD event_min, DWORD event_max);

  // Removes the hook installed by Start(), if any.
  void Stop();

  bool is_hooked() const { return hook_ != NULL; }

 private:
  static VOID CALLBACK WinEventProc(HWINEVENTHOOK hook,
                                    DWORD event,
                                    HWND window,
                                    LONG object_id,
                                    LONG child_id,
                                    DWORD event_thread_id,
                                    DWORD event_time);

  Delegate* delegate_;
  HWINEVENTHOOK hook_;

  DISALLOW_COPY_AND_ASSIGN(WinEventHook);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_WIN_EVENT_HOOK_H_
