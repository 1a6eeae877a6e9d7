// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_TOOLKIT_BRIDGE_PROVIDER_WIN_H_
#define SCREEN_ACCESS_TOOLKIT_BRIDGE_PROVIDER_WIN_H_

#include <windows.h>

#include <memory>

#include "AccessBridgeCalls.h"
#include "base/gtest_prod_util.h"
#include "base/macros.h"
#include "base/memory/ref_counted.h"
#include "base/scoped_native_library.h"
#include "screen_access/provider_base.h"

namespace base {
class FilePath;
}

namespace screen_access {

// The Java Access Bridge entry points. Shared with every node that holds a
// Java context, so the library stays loaded until the last context is
// released.
class ToolkitBridge : public base::RefCountedThreadSafe<ToolkitBridge> {
 public:
  // No library; the entry points are filled in by the caller.
  ToolkitBridge();
  // Loads |library_path| and resolves its exports.
  explicit ToolkitBridge(const base::FilePath& library_path);

  // isJavaWindow and getAccessibleParentFromContext are optional; the rest
  // are required.
  bool IsComplete() const;

  Windows_runFP windows_run;
  IsJavaWindowFP is_java_window;
  GetAccessibleContextFromHWNDFP get_context_from_hwnd;
  GetAccessibleContextWithFocusFP get_context_with_focus;
  GetAccessibleContextAtFP get_context_at;
  GetAccessibleContextInfoFP get_context_info;
  GetAccessibleParentFromContextFP get_parent_from_context;
  ReleaseJavaObjectFP release_java_object;
  SetFocusGainedFP set_focus_gained;

 private:
  friend class base::RefCountedThreadSafe<ToolkitBridge>;
  ~ToolkitBridge();

  base::ScopedNativeLibrary library_;

  DISALLOW_COPY_AND_ASSIGN(ToolkitBridge);
};

// Java Access Bridge backend. Available when WindowsAccessBridge can be
// loaded. The bridge delivers events on the thread that initialized it,
// which must pump messages. Only one instance may listen at a time, since
// the bridge accepts a single focus callback per process.
class ToolkitBridgeProviderWin : public ProviderBase {
 public:
  // Loads the installed WindowsAccessBridge.
  ToolkitBridgeProviderWin();
  explicit ToolkitBridgeProviderWin(const scoped_refptr<ToolkitBridge>& bridge);
  ~ToolkitBridgeProviderWin() override;

  // AccessibilityProvider:
  bool IsAvailable() const override;
  bool SupportsElement(const NativeElementRef& ref) const override;

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
  FRIEND_TEST_ALL_PREFIXES(ToolkitBridgeProviderWinTest,
                           FailedHitTestFallsThrough);
  FRIEND_TEST_ALL_PREFIXES(ToolkitBridgeProviderWinTest,
                           HitTestReleasesTopLevelContext);

  class ContextHandle;

  static void OnFocusGained(long vm_id, int64_t event, int64_t source);

  bool IsJavaWindow(HWND window) const;

  // Node for the component at |x|, |y| inside the Java frame |window|, or
  // null when the bridge cannot hit test there.
  std::unique_ptr<AccessibleNode> NodeAtPoint(HWND window, int x, int y);

  // Builds a node that takes over the reference to |context|. The context
  // is released with the last node that refers to it, or right away if no
  // node could be built.
  std::unique_ptr<AccessibleNode> NodeFromContext(long vm_id,
                                                  int64_t context,
                                                  HWND window);
  std::unique_ptr<AccessibleNode> NodeFromHandle(
      const scoped_refptr<ContextHandle>& handle,
      HWND window);

  // Fills the group size from the child count of |context|'s parent.
  void ApplyGroupSize(long vm_id, int64_t context, AccessibleNodeData* data);

  void ReleaseContext(long vm_id, int64_t context);

  scoped_refptr<ToolkitBridge> bridge_;

  DISALLOW_COPY_AND_ASSIGN(ToolkitBridgeProviderWin);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_TOOLKIT_BRIDGE_PROVIDER_WIN_H_
