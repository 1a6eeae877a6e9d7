// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_TREE_AUTOMATION_PROVIDER_WIN_H_
#define SCREEN_ACCESS_TREE_AUTOMATION_PROVIDER_WIN_H_

#include <uiautomation.h>

#include <memory>

#include "base/macros.h"
#include "base/memory/weak_ptr.h"
#include "base/time/time.h"
#include "base/win/scoped_comptr.h"
#include "screen_access/provider_base.h"

namespace screen_access {

// UI Automation backend. Requires COM to be initialized on the calling
// thread. Focus events arrive on UI Automation worker threads and are
// posted back to the thread that started listening.
class TreeAutomationProviderWin : public ProviderBase {
 public:
  explicit TreeAutomationProviderWin(base::TimeDelta native_call_timeout);
  ~TreeAutomationProviderWin() override;

  // AccessibilityProvider:
  bool IsAvailable() const override;
  bool SupportsElement(const NativeElementRef& ref) const override;

  // Builds a node from an element fetched with this provider's cache
  // request. Safe to call from any thread. Nodes that leave the calling
  // thread must not carry |element|, so |keep_element| is false for them.
  std::unique_ptr<AccessibleNode> NodeFromCachedElement(
      IUIAutomationElement* element,
      bool keep_element) const;

  // Delivers a focus node built on a UI Automation thread.
  void DeliverFocusChanged(std::unique_ptr<AccessibleNode> node);

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
  class FocusChangedHandler;

  const base::TimeDelta native_call_timeout_;
  base::win::ScopedComPtr<IUIAutomation> automation_;
  base::win::ScopedComPtr<IUIAutomationCacheRequest> cache_request_;
  // Registered with UI Automation while listening. Owns a reference to
  // itself on behalf of UI Automation; detached before removal.
  FocusChangedHandler* focus_handler_;

  base::WeakPtrFactory<TreeAutomationProviderWin> weak_factory_;

  DISALLOW_COPY_AND_ASSIGN(TreeAutomationProviderWin);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_TREE_AUTOMATION_PROVIDER_WIN_H_
