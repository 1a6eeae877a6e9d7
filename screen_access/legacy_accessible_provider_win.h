// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_LEGACY_ACCESSIBLE_PROVIDER_WIN_H_
#define SCREEN_ACCESS_LEGACY_ACCESSIBLE_PROVIDER_WIN_H_

#include <oleacc.h>

#include <memory>

#include "base/macros.h"
#include "base/time/time.h"
#include "screen_access/provider_base.h"
#include "screen_access/win_event_hook.h"

namespace screen_access {

// MSAA backend. Always available; events come from a global out-of-context
// WinEvent hook covering focus through value changes.
class LegacyAccessibleProviderWin : public ProviderBase,
                                    public WinEventHook::Delegate {
 public:
  explicit LegacyAccessibleProviderWin(base::TimeDelta native_call_timeout);
  ~LegacyAccessibleProviderWin() override;

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
  std::unique_ptr<AccessibleNode> QueryFocusedObject() override;
  std::unique_ptr<AccessibleNode> QueryObjectFromPoint(int x, int y) override;
  std::unique_ptr<AccessibleNode> QueryObjectFromHandle(
      WindowHandle window) override;
  std::unique_ptr<AccessibleNode> QueryAccessibleObject(
      const NativeElementRef& ref) override;

 private:
  // Builds a node for |accessible| / |child_id| living in |window|.
  // |object_id| is the OBJID_* |accessible| was resolved with.
  std::unique_ptr<AccessibleNode> NodeFromAccessible(IAccessible* accessible,
                                                     LONG object_id,
                                                     LONG child_id,
                                                     HWND window);

  // Node for the object |object_id| / |child_id| of |window|.
  std::unique_ptr<AccessibleNode> NodeFromWindowObject(HWND window,
                                                       LONG object_id,
                                                       LONG child_id);

  const base::TimeDelta native_call_timeout_;
  WinEventHook event_hook_;

  DISALLOW_COPY_AND_ASSIGN(LegacyAccessibleProviderWin);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_LEGACY_ACCESSIBLE_PROVIDER_WIN_H_
