// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/toolkit_bridge_provider_win.h"

#include <string.h>

#include <type_traits>

#include "AccessBridgeCalls.h"
#include "base/files/file_path.h"
#include "base/lazy_instance.h"
#include "base/logging.h"
#include "base/macros.h"
#include "base/strings/string_util.h"
#include "base/synchronization/lock.h"
#include "build/build_config.h"
#include "screen_access/role_state_mapping.h"
#include "screen_access/window_util_win.h"

static_assert(std::is_same<JOBJECT64, int64_t>::value,
              "the bridge must be built with ACCESSBRIDGE_ARCH_64");

namespace screen_access {

namespace {

#if defined(ARCH_CPU_64_BITS)
const wchar_t kBridgeLibrary[] = L"WindowsAccessBridge-64.dll";
#else
const wchar_t kBridgeLibrary[] = L"WindowsAccessBridge-32.dll";
#endif

// Class name fragments of AWT, Swing, SWT and LibreOffice's Java frames, for
// bridges that do not export isJavaWindow.
const wchar_t* const kJavaWindowClassFragments[] = {
  L"SunAwt",
  L"SWT_Window",
  L"SALFRAME",
  L"AWT",
};
const wchar_t kSwingClassPrefix[] = L"javax.swing";

// The provider currently registered with setFocusGainedFP.
struct FocusListener {
  FocusListener() : provider(NULL) {}

  base::Lock lock;
  ToolkitBridgeProviderWin* provider;
};

base::LazyInstance<FocusListener>::Leaky g_focus_listener =
    LAZY_INSTANCE_INITIALIZER;

}  // namespace

ToolkitBridge::ToolkitBridge()
    : windows_run(NULL),
      is_java_window(NULL),
      get_context_from_hwnd(NULL),
      get_context_with_focus(NULL),
      get_context_at(NULL),
      get_context_info(NULL),
      get_parent_from_context(NULL),
      release_java_object(NULL),
      set_focus_gained(NULL) {
}

ToolkitBridge::ToolkitBridge(const base::FilePath& library_path)
    : windows_run(NULL),
      is_java_window(NULL),
      get_context_from_hwnd(NULL),
      get_context_with_focus(NULL),
      get_context_at(NULL),
      get_context_info(NULL),
      get_parent_from_context(NULL),
      release_java_object(NULL),
      set_focus_gained(NULL),
      library_(library_path) {
  if (!library_.is_valid()) {
    VLOG(1) << "Java Access Bridge not installed";
    return;
  }

  windows_run = reinterpret_cast<Windows_runFP>(
      library_.GetFunctionPointer("Windows_run"));
  is_java_window = reinterpret_cast<IsJavaWindowFP>(
      library_.GetFunctionPointer("isJavaWindow"));
  get_context_from_hwnd = reinterpret_cast<GetAccessibleContextFromHWNDFP>(
      library_.GetFunctionPointer("getAccessibleContextFromHWND"));
  get_context_with_focus = reinterpret_cast<GetAccessibleContextWithFocusFP>(
      library_.GetFunctionPointer("getAccessibleContextWithFocus"));
  get_context_at = reinterpret_cast<GetAccessibleContextAtFP>(
      library_.GetFunctionPointer("getAccessibleContextAt"));
  get_context_info = reinterpret_cast<GetAccessibleContextInfoFP>(
      library_.GetFunctionPointer("getAccessibleContextInfo"));
  get_parent_from_context =
      reinterpret_cast<GetAccessibleParentFromContextFP>(
          library_.GetFunctionPointer("getAccessibleParentFromContext"));
  release_java_object = reinterpret_cast<ReleaseJavaObjectFP>(
      library_.GetFunctionPointer("releaseJavaObject"));
  set_focus_gained = reinterpret_cast<SetFocusGainedFP>(
      library_.GetFunctionPointer("setFocusGainedFP"));
  if (!IsComplete())
    LOG(WARNING) << "Java Access Bridge is missing required exports";
}

ToolkitBridge::~ToolkitBridge() {
}

bool ToolkitBridge::IsComplete() const {
  return windows_run && get_context_from_hwnd && get_context_with_focus &&
         get_context_at && get_context_info && release_java_object &&
         set_focus_gained;
}

// One AccessibleContext reference, released when the last node built from
// it goes away.
class ToolkitBridgeProviderWin::ContextHandle : public NativeElementHandle {
 public:
  ContextHandle(const scoped_refptr<ToolkitBridge>& bridge,
                long vm_id,
                int64_t context)
      : bridge_(bridge), vm_id_(vm_id), context_(context) {}

  long vm_id() const { return vm_id_; }
  int64_t context() const { return context_; }

 private:
  ~ContextHandle() override {
    bridge_->release_java_object(vm_id_, context_);
  }

  scoped_refptr<ToolkitBridge> bridge_;
  long vm_id_;
  int64_t context_;

  DISALLOW_COPY_AND_ASSIGN(ContextHandle);
};

ToolkitBridgeProviderWin::ToolkitBridgeProviderWin()
    : ProviderBase(BackendId::kToolkitBridge),
      bridge_(new ToolkitBridge(base::FilePath(kBridgeLibrary))) {
}

ToolkitBridgeProviderWin::ToolkitBridgeProviderWin(
    const scoped_refptr<ToolkitBridge>& bridge)
    : ProviderBase(BackendId::kToolkitBridge),
      bridge_(bridge) {
  DCHECK(bridge_);
}

ToolkitBridgeProviderWin::~ToolkitBridgeProviderWin() {
  Shutdown();
}

bool ToolkitBridgeProviderWin::IsAvailable() const {
  return bridge_->IsComplete();
}

bool ToolkitBridgeProviderWin::SupportsElement(
    const NativeElementRef& ref) const {
  if (ref.source == BackendId::kToolkitBridge && ref.native_object)
    return true;
  return ref.window != kNullWindowHandle && IsJavaWindow(ToHWND(ref.window));
}

bool ToolkitBridgeProviderWin::InitializeNative() {
  bridge_->windows_run();
  return true;
}

void ToolkitBridgeProviderWin::ReleaseNative() {
}

bool ToolkitBridgeProviderWin::InstallEventHook() {
  FocusListener* listener = g_focus_listener.Pointer();
  base::AutoLock lock(listener->lock);
  if (listener->provider && listener->provider != this) {
    LOG(WARNING) << "Another Java Access Bridge listener is registered";
    return false;
  }
  listener->provider = this;
  bridge_->set_focus_gained(&ToolkitBridgeProviderWin::OnFocusGained);
  return true;
}

void ToolkitBridgeProviderWin::RemoveEventHook() {
  FocusListener* listener = g_focus_listener.Pointer();
  base::AutoLock lock(listener->lock);
  if (listener->provider != this)
    return;
  bridge_->set_focus_gained(NULL);
  listener->provider = NULL;
}

// static
void ToolkitBridgeProviderWin::OnFocusGained(long vm_id,
                                             int64_t event,
                                             int64_t source) {
  ToolkitBridgeProviderWin* provider = NULL;
  {
    FocusListener* listener = g_focus_listener.Pointer();
    base::AutoLock lock(listener->lock);
    provider = listener->provider;
  }
  // The callback is cleared under the same lock that clears |provider|.
  if (!provider)
    return;

  provider->ReleaseContext(vm_id, event);
  std::unique_ptr<AccessibleNode> node =
      provider->NodeFromContext(vm_id, source, GetForegroundWindow());
  if (node)
    provider->NotifyFocusChanged(*node);
}

std::unique_ptr<AccessibleNode>
ToolkitBridgeProviderWin::QueryFocusedObject() {
  HWND window = GetForegroundWindow();
  if (!window || !IsJavaWindow(window))
    return nullptr;

  long vm_id = 0;
  AccessibleContext context = 0;
  if (!bridge_->get_context_with_focus(window, &vm_id, &context) ||
      !context) {
    DVLOG(1) << "getAccessibleContextWithFocus failed";
    return nullptr;
  }
  return NodeFromContext(vm_id, context, window);
}

std::unique_ptr<AccessibleNode>
ToolkitBridgeProviderWin::QueryObjectFromPoint(int x, int y) {
  POINT point = { x, y };
  HWND window = WindowFromPoint(point);
  if (window)
    window = GetAncestor(window, GA_ROOT);
  if (!window || !IsJavaWindow(window))
    return nullptr;

  return NodeAtPoint(window, x, y);
}

std::unique_ptr<AccessibleNode>
ToolkitBridgeProviderWin::NodeAtPoint(HWND window, int x, int y) {
  long vm_id = 0;
  AccessibleContext top = 0;
  if (!bridge_->get_context_from_hwnd(window, &vm_id, &top) || !top)
    return nullptr;

  AccessibleContext context = 0;
  if (!bridge_->get_context_at(vm_id, top, x, y, &context) || !context) {
    DVLOG(1) << "getAccessibleContextAt failed";
    ReleaseContext(vm_id, top);
    return nullptr;
  }
  if (context != top)
    ReleaseContext(vm_id, top);
  return NodeFromContext(vm_id, context, window);
}

std::unique_ptr<AccessibleNode>
ToolkitBridgeProviderWin::QueryObjectFromHandle(WindowHandle window) {
  HWND hwnd = ToHWND(window);
  if (!IsJavaWindow(hwnd))
    return nullptr;

  long vm_id = 0;
  AccessibleContext context = 0;
  if (!bridge_->get_context_from_hwnd(hwnd, &vm_id, &context) || !context) {
    DVLOG(1) << "getAccessibleContextFromHWND failed";
    return nullptr;
  }
  return NodeFromContext(vm_id, context, hwnd);
}

std::unique_ptr<AccessibleNode>
ToolkitBridgeProviderWin::QueryAccessibleObject(const NativeElementRef& ref) {
  if (ref.source == BackendId::kToolkitBridge && ref.native_object) {
    scoped_refptr<ContextHandle> handle(
        static_cast<ContextHandle*>(ref.native_object.get()));
    return NodeFromHandle(handle, ToHWND(ref.window));
  }
  return QueryObjectFromHandle(ref.window);
}

bool ToolkitBridgeProviderWin::IsJavaWindow(HWND window) const {
  if (!window)
    return false;
  if (bridge_->is_java_window)
    return bridge_->is_java_window(window) != FALSE;

  base::string16 class_name = GetWindowClass(window);
  if (base::StartsWith(class_name, kSwingClassPrefix,
                       base::CompareCase::SENSITIVE)) {
    return true;
  }
  for (size_t i = 0; i < arraysize(kJavaWindowClassFragments); ++i) {
    if (class_name.find(kJavaWindowClassFragments[i]) != base::string16::npos)
      return true;
  }
  return false;
}

std::unique_ptr<AccessibleNode> ToolkitBridgeProviderWin::NodeFromContext(
    long vm_id,
    int64_t context,
    HWND window) {
  scoped_refptr<ContextHandle> handle(
      new ContextHandle(bridge_, vm_id, context));
  return NodeFromHandle(handle, window);
}

std::unique_ptr<AccessibleNode> ToolkitBridgeProviderWin::NodeFromHandle(
    const scoped_refptr<ContextHandle>& handle,
    HWND window) {
  AccessibleContextInfo info;
  memset(&info, 0, sizeof(info));
  if (!bridge_->get_context_info(handle->vm_id(), handle->context(), &info)) {
    DVLOG(1) << "getAccessibleContextInfo failed";
    return nullptr;
  }

  AccessibleNodeData data;
  data.role = JavaRoleToRole(info.role_en_US);
  data.states = JavaStatesToStates(info.states_en_US);
  data.name = info.name;
  data.description = info.description;
  data.bounds = ScreenRect(info.x, info.y, info.width, info.height);
  if (info.indexInParent >= 0) {
    data.position_in_group = info.indexInParent + 1;
    ApplyGroupSize(handle->vm_id(), handle->context(), &data);
  }

  data.native_ref.native_object = handle;
  data.native_ref.object_id = handle->vm_id();
  data.native_ref.window = FromHWND(window);
  data.native_ref.process_id = window ? GetWindowProcessId(window) : 0;
  return CreateNode(data);
}

void ToolkitBridgeProviderWin::ApplyGroupSize(long vm_id,
                                              int64_t context,
                                              AccessibleNodeData* data) {
  if (!bridge_->get_parent_from_context)
    return;
  AccessibleContext parent = bridge_->get_parent_from_context(vm_id, context);
  if (!parent)
    return;

  AccessibleContextInfo parent_info;
  memset(&parent_info, 0, sizeof(parent_info));
  if (bridge_->get_context_info(vm_id, parent, &parent_info) &&
      parent_info.childrenCount >= data->position_in_group) {
    data->group_size = parent_info.childrenCount;
  }
  ReleaseContext(vm_id, parent);
}

void ToolkitBridgeProviderWin::ReleaseContext(long vm_id, int64_t context) {
  if (context)
    bridge_->release_java_object(vm_id, context);
}

}  // namespace screen_access
