// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/tree_automation_provider_win.h"

#include "base/bind.h"
#include "base/location.h"
#include "base/logging.h"
#include "base/macros.h"
#include "base/single_thread_task_runner.h"
#include "base/synchronization/lock.h"
#include "base/threading/thread_task_runner_handle.h"
#include "base/win/scoped_bstr.h"
#include "base/win/scoped_variant.h"
#include "screen_access/com_util_win.h"
#include "screen_access/role_state_mapping.h"
#include "screen_access/window_util_win.h"

namespace screen_access {

namespace {

const PROPERTYID kCachedProperties[] = {
  UIA_NamePropertyId,
  UIA_ControlTypePropertyId,
  UIA_HelpTextPropertyId,
  UIA_AcceleratorKeyPropertyId,
  UIA_AccessKeyPropertyId,
  UIA_BoundingRectanglePropertyId,
  UIA_NativeWindowHandlePropertyId,
  UIA_ProcessIdPropertyId,
  UIA_IsEnabledPropertyId,
  UIA_HasKeyboardFocusPropertyId,
  UIA_IsKeyboardFocusablePropertyId,
  UIA_IsOffscreenPropertyId,
  UIA_IsPasswordPropertyId,
  UIA_ValueValuePropertyId,
  UIA_ValueIsReadOnlyPropertyId,
  UIA_ToggleToggleStatePropertyId,
  UIA_ExpandCollapseExpandCollapseStatePropertyId,
  UIA_IsSelectionItemPatternAvailablePropertyId,
  UIA_SelectionItemIsSelectedPropertyId,
};

bool GetCachedVariant(IUIAutomationElement* element,
                      PROPERTYID property,
                      base::win::ScopedVariant* value) {
  HRESULT hr = element->GetCachedPropertyValue(property, value->Receive());
  return SUCCEEDED(hr);
}

base::string16 GetCachedString(IUIAutomationElement* element,
                               PROPERTYID property) {
  base::win::ScopedVariant value;
  if (!GetCachedVariant(element, property, &value) ||
      value.type() != VT_BSTR || !V_BSTR(value.ptr())) {
    return base::string16();
  }
  return base::string16(V_BSTR(value.ptr()),
                        SysStringLen(V_BSTR(value.ptr())));
}

bool GetCachedBool(IUIAutomationElement* element,
                   PROPERTYID property,
                   bool default_value) {
  base::win::ScopedVariant value;
  if (!GetCachedVariant(element, property, &value) || value.type() != VT_BOOL)
    return default_value;
  return V_BOOL(value.ptr()) != VARIANT_FALSE;
}

// Returns false when the property is missing or the pattern behind it is
// not supported, in which case UI Automation hands back a VT_UNKNOWN
// sentinel.
bool GetCachedInt(IUIAutomationElement* element,
                  PROPERTYID property,
                  int* result) {
  base::win::ScopedVariant value;
  if (!GetCachedVariant(element, property, &value) || value.type() != VT_I4)
    return false;
  *result = V_I4(value.ptr());
  return true;
}

UiaToggleState ToToggleState(int value) {
  switch (value) {
    case ToggleState_Off:
      return UiaToggleState::kOff;
    case ToggleState_On:
      return UiaToggleState::kOn;
    case ToggleState_Indeterminate:
      return UiaToggleState::kIndeterminate;
    default:
      return UiaToggleState::kUnsupported;
  }
}

UiaExpandState ToExpandState(int value) {
  switch (value) {
    case ExpandCollapseState_Collapsed:
      return UiaExpandState::kCollapsed;
    case ExpandCollapseState_Expanded:
      return UiaExpandState::kExpanded;
    case ExpandCollapseState_PartiallyExpanded:
      return UiaExpandState::kPartiallyExpanded;
    case ExpandCollapseState_LeafNode:
      return UiaExpandState::kLeafNode;
    default:
      return UiaExpandState::kUnsupported;
  }
}

}  // namespace

// Receives focus changes on UI Automation's threads. Builds the node there,
// while the element is alive, and posts it to the listening thread.
class TreeAutomationProviderWin::FocusChangedHandler
    : public IUIAutomationFocusChangedEventHandler {
 public:
  FocusChangedHandler(
      TreeAutomationProviderWin* owner,
      const base::WeakPtr<TreeAutomationProviderWin>& weak_owner,
      scoped_refptr<base::SingleThreadTaskRunner> task_runner)
      : ref_count_(1),
        owner_(owner),
        weak_owner_(weak_owner),
        task_runner_(task_runner) {
    DCHECK(task_runner_);
  }

  // Waits for an in-flight event to finish and stops further delivery.
  void Detach() {
    base::AutoLock lock(lock_);
    owner_ = NULL;
  }

  // IUnknown:
  STDMETHOD(QueryInterface)(REFIID riid, void** object) override {
    if (!object)
      return E_POINTER;
    if (riid == IID_IUnknown ||
        riid == __uuidof(IUIAutomationFocusChangedEventHandler)) {
      *object = static_cast<IUIAutomationFocusChangedEventHandler*>(this);
      AddRef();
      return S_OK;
    }
    *object = NULL;
    return E_NOINTERFACE;
  }

  STDMETHOD_(ULONG, AddRef)() override {
    return InterlockedIncrement(&ref_count_);
  }

  STDMETHOD_(ULONG, Release)() override {
    ULONG count = InterlockedDecrement(&ref_count_);
    if (count == 0)
      delete this;
    return count;
  }

  // IUIAutomationFocusChangedEventHandler:
  STDMETHOD(HandleFocusChangedEvent)(IUIAutomationElement* sender) override {
    if (!sender)
      return E_POINTER;

    std::unique_ptr<AccessibleNode> node;
    {
      base::AutoLock lock(lock_);
      if (!owner_)
        return S_OK;
      node = owner_->NodeFromCachedElement(sender, false);
    }
    if (!node)
      return S_OK;

    // Never deliver here: this is a UI Automation worker thread, and the
    // listening lock may be held by a thread waiting in Detach().
    task_runner_->PostTask(
        FROM_HERE,
        base::Bind(&TreeAutomationProviderWin::DeliverFocusChanged,
                   weak_owner_, base::Passed(&node)));
    return S_OK;
  }

 private:
  ~FocusChangedHandler() {}

  LONG ref_count_;
  base::Lock lock_;
  TreeAutomationProviderWin* owner_;
  base::WeakPtr<TreeAutomationProviderWin> weak_owner_;
  scoped_refptr<base::SingleThreadTaskRunner> task_runner_;

  DISALLOW_COPY_AND_ASSIGN(FocusChangedHandler);
};

TreeAutomationProviderWin::TreeAutomationProviderWin(
    base::TimeDelta native_call_timeout)
    : ProviderBase(BackendId::kTreeAutomation),
      native_call_timeout_(native_call_timeout),
      focus_handler_(NULL),
      weak_factory_(this) {
}

TreeAutomationProviderWin::~TreeAutomationProviderWin() {
  Shutdown();
}

bool TreeAutomationProviderWin::IsAvailable() const {
  // UI Automation is part of every supported Windows version.
  return true;
}

bool TreeAutomationProviderWin::SupportsElement(
    const NativeElementRef& ref) const {
  if (ref.source == BackendId::kTreeAutomation && ref.native_object)
    return true;
  return ref.window != kNullWindowHandle;
}

bool TreeAutomationProviderWin::InitializeNative() {
  HRESULT hr = automation_.CreateInstance(__uuidof(CUIAutomation), NULL,
                                          CLSCTX_INPROC_SERVER);
  if (FAILED(hr) || !automation_) {
    LOG(ERROR) << "Failed to create CUIAutomation: " << std::hex << hr;
    return false;
  }

  // Bound cross-process calls so a hung application cannot stall us.
  base::win::ScopedComPtr<IUIAutomation2> automation2;
  if (SUCCEEDED(automation2.QueryFrom(automation_.get()))) {
    DWORD timeout_ms =
        static_cast<DWORD>(native_call_timeout_.InMilliseconds());
    automation2->put_ConnectionTimeout(timeout_ms);
    automation2->put_TransactionTimeout(timeout_ms);
  }

  hr = automation_->CreateCacheRequest(cache_request_.Receive());
  if (FAILED(hr) || !cache_request_) {
    LOG(ERROR) << "Failed to create UIA cache request: " << std::hex << hr;
    automation_.Release();
    return false;
  }
  for (size_t i = 0; i < arraysize(kCachedProperties); ++i)
    cache_request_->AddProperty(kCachedProperties[i]);
  return true;
}

void TreeAutomationProviderWin::ReleaseNative() {
  weak_factory_.InvalidateWeakPtrs();
  cache_request_.Release();
  automation_.Release();
}

bool TreeAutomationProviderWin::InstallEventHook() {
  DCHECK(!focus_handler_);
  // Focus events arrive on UI Automation's own threads and are posted back
  // to this one.
  if (!base::ThreadTaskRunnerHandle::IsSet()) {
    LOG(ERROR) << "UI Automation events need a thread with a message loop";
    return false;
  }

  focus_handler_ = new FocusChangedHandler(this, weak_factory_.GetWeakPtr(),
                                           base::ThreadTaskRunnerHandle::Get());
  HRESULT hr = automation_->AddFocusChangedEventHandler(cache_request_.get(),
                                                        focus_handler_);
  if (FAILED(hr)) {
    LOG(ERROR) << "AddFocusChangedEventHandler failed: " << std::hex << hr;
    focus_handler_->Detach();
    focus_handler_->Release();
    focus_handler_ = NULL;
    return false;
  }
  return true;
}

void TreeAutomationProviderWin::RemoveEventHook() {
  if (!focus_handler_)
    return;
  focus_handler_->Detach();
  HRESULT hr = automation_->RemoveFocusChangedEventHandler(focus_handler_);
  if (FAILED(hr))
    DLOG(WARNING) << "RemoveFocusChangedEventHandler failed: " << std::hex
                  << hr;
  focus_handler_->Release();
  focus_handler_ = NULL;
}

void TreeAutomationProviderWin::DeliverFocusChanged(
    std::unique_ptr<AccessibleNode> node) {
  if (node && is_listening())
    NotifyFocusChanged(*node);
}

std::unique_ptr<AccessibleNode>
TreeAutomationProviderWin::QueryFocusedObject() {
  base::win::ScopedComPtr<IUIAutomationElement> element;
  HRESULT hr = automation_->GetFocusedElementBuildCache(cache_request_.get(),
                                                        element.Receive());
  if (FAILED(hr) || !element) {
    DVLOG(1) << "GetFocusedElement failed: " << std::hex << hr;
    return nullptr;
  }
  return NodeFromCachedElement(element.get(), true);
}

std::unique_ptr<AccessibleNode>
TreeAutomationProviderWin::QueryObjectFromPoint(int x, int y) {
  POINT point = { x, y };
  base::win::ScopedComPtr<IUIAutomationElement> element;
  HRESULT hr = automation_->ElementFromPointBuildCache(
      point, cache_request_.get(), element.Receive());
  if (FAILED(hr) || !element) {
    DVLOG(1) << "ElementFromPoint failed: " << std::hex << hr;
    return nullptr;
  }
  return NodeFromCachedElement(element.get(), true);
}

std::unique_ptr<AccessibleNode>
TreeAutomationProviderWin::QueryObjectFromHandle(WindowHandle window) {
  base::win::ScopedComPtr<IUIAutomationElement> element;
  HRESULT hr = automation_->ElementFromHandleBuildCache(
      ToHWND(window), cache_request_.get(), element.Receive());
  if (FAILED(hr) || !element) {
    DVLOG(1) << "ElementFromHandle failed: " << std::hex << hr;
    return nullptr;
  }
  return NodeFromCachedElement(element.get(), true);
}

std::unique_ptr<AccessibleNode>
TreeAutomationProviderWin::QueryAccessibleObject(const NativeElementRef& ref) {
  if (ref.source == BackendId::kTreeAutomation && ref.native_object) {
    IUIAutomationElement* element =
        ComElementHandle<IUIAutomationElement>::FromRef(ref);
    base::win::ScopedComPtr<IUIAutomationElement> updated;
    HRESULT hr =
        element->BuildUpdatedCache(cache_request_.get(), updated.Receive());
    if (FAILED(hr) || !updated) {
      DVLOG(1) << "BuildUpdatedCache failed: " << std::hex << hr;
      return nullptr;
    }
    return NodeFromCachedElement(updated.get(), true);
  }
  return QueryObjectFromHandle(ref.window);
}

std::unique_ptr<AccessibleNode>
TreeAutomationProviderWin::NodeFromCachedElement(
    IUIAutomationElement* element,
    bool keep_element) const {
  DCHECK(element);
  AccessibleNodeData data;

  int control_type = 0;
  data.role = GetCachedInt(element, UIA_ControlTypePropertyId, &control_type)
                  ? UiaControlTypeToRole(control_type)
                  : AccessibleRole::kPane;

  data.name = GetCachedString(element, UIA_NamePropertyId);
  data.description = GetCachedString(element, UIA_HelpTextPropertyId);
  data.help_text = data.description;
  data.value = GetCachedString(element, UIA_ValueValuePropertyId);
  data.keyboard_shortcut =
      GetCachedString(element, UIA_AcceleratorKeyPropertyId);
  if (data.keyboard_shortcut.empty())
    data.keyboard_shortcut = GetCachedString(element, UIA_AccessKeyPropertyId);

  RECT rect = { 0 };
  if (SUCCEEDED(element->get_CachedBoundingRectangle(&rect))) {
    data.bounds = ScreenRect(rect.left, rect.top, rect.right - rect.left,
                             rect.bottom - rect.top);
  }

  UiaStateProperties properties;
  properties.is_enabled = GetCachedBool(element, UIA_IsEnabledPropertyId, true);
  properties.has_keyboard_focus =
      GetCachedBool(element, UIA_HasKeyboardFocusPropertyId, false);
  properties.is_keyboard_focusable =
      GetCachedBool(element, UIA_IsKeyboardFocusablePropertyId, false);
  properties.is_offscreen =
      GetCachedBool(element, UIA_IsOffscreenPropertyId, false);
  properties.is_password =
      GetCachedBool(element, UIA_IsPasswordPropertyId, false);
  properties.is_read_only =
      GetCachedBool(element, UIA_ValueIsReadOnlyPropertyId, false);
  properties.supports_selection_item = GetCachedBool(
      element, UIA_IsSelectionItemPatternAvailablePropertyId, false);
  properties.is_selected =
      GetCachedBool(element, UIA_SelectionItemIsSelectedPropertyId, false);
  int state = 0;
  if (GetCachedInt(element, UIA_ToggleToggleStatePropertyId, &state))
    properties.toggle_state = ToToggleState(state);
  if (GetCachedInt(element, UIA_ExpandCollapseExpandCollapseStatePropertyId,
                   &state)) {
    properties.expand_state = ToExpandState(state);
  }
  data.states = UiaPropertiesToStates(properties);

  int native_window = 0;
  GetCachedInt(element, UIA_NativeWindowHandlePropertyId, &native_window);
  int process_id = 0;
  GetCachedInt(element, UIA_ProcessIdPropertyId, &process_id);

  if (keep_element) {
    data.native_ref.native_object =
        new ComElementHandle<IUIAutomationElement>(element);
  }
  data.native_ref.window =
      static_cast<WindowHandle>(static_cast<uint32_t>(native_window));
  data.native_ref.process_id = static_cast<base::ProcessId>(process_id);
  return CreateNode(data);
}

}  // namespace screen_access
