// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_EXTENDED_ACCESSIBLE_PROVIDER_WIN_H_
#define SCREEN_ACCESS_EXTENDED_ACCESSIBLE_PROVIDER_WIN_H_

#include <oleacc.h>

#include <map>
#include <memory>

#include "base/macros.h"
#include "base/process/process_handle.h"
#include "base/time/time.h"
#include "screen_access/provider_base.h"
#include "screen_access/win_event_hook.h"

namespace screen_access {

class ActivationNegotiator;

// IAccessible2 backend. Answers only for windows of applications known to
// implement IAccessible2, or of processes the negotiator has activated.
// Nodes carry the MSAA attributes overlaid with the IA2 role, states and
// group position.
class ExtendedAccessibleProviderWin : public ProviderBase,
                                      public WinEventHook::Delegate {
 public:
  // |negotiator| may be null and must outlive this object.
  ExtendedAccessibleProviderWin(base::TimeDelta native_call_timeout,
                                const ActivationNegotiator* negotiator);
  ~ExtendedAccessibleProviderWin() override;

  // Whether the IAccessible2 proxy is registered with COM.
  static bool IsInterfaceRegistered();

  // AccessibilityProvider:
  bool IsAvailable() const override;
  bool SupportsElement(const NativeElementRef& ref) const override;

  // WinEventHook::Delegate:
  void OnWinEvent(DWORD event,
                  HWND window,
                  LONG object_id,
                  LONG child_id) override;

 protected:
  // ProviderBase:
  bool InitializeNative() override;
  void ReleaseNative() override;
  bool InstallEventHook() override;
  void RemoveEventHook() override;
  void ForgetProcess(base::ProcessId pid) override;
  std::unique_ptr<AccessibleNode> QueryFocusedObject() override;
  std::unique_ptr<AccessibleNode> QueryObjectFromPoint(int x, int y) override;
  std::unique_ptr<AccessibleNode> QueryObjectFromHandle(
      WindowHandle window) override;
  std::unique_ptr<AccessibleNode> QueryAccessibleObject(
      const NativeElementRef& ref) override;

 private:
  // True if |window| belongs to a process that serves IAccessible2.
  bool IsExtendedWindow(HWND window) const;

  std::unique_ptr<AccessibleNode> NodeFromAccessible(IAccessible* accessible,
                                                     LONG object_id,
                                                     LONG child_id,
                                                     HWND window);
  std::unique_ptr<AccessibleNode> NodeFromWindow(HWND window);

  const base::TimeDelta native_call_timeout_;
  const ActivationNegotiator* negotiator_;
  const bool available_;
  WinEventHook event_hook_;

  // Per-process result of the application name check. Entries are dropped
  // when the process exits.
  mutable std::map<base::ProcessId, bool> known_processes_;

  DISALLOW_COPY_AND_ASSIGN(ExtendedAccessibleProviderWin);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_EXTENDED_ACCESSIBLE_PROVIDER_WIN_H_
