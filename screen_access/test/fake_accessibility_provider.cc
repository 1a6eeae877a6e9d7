// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/test/fake_accessibility_provider.h"

#include "base/strings/utf_string_conversions.h"

namespace screen_access {

FakeAccessibilityProvider::FakeAccessibilityProvider(BackendId id)
    : ProviderBase(id),
      available_(true),
      initialize_result_(true),
      hook_result_(true),
      returns_nodes_(true),
      supports_elements_(true),
      result_name_(base::ASCIIToUTF16(BackendIdToShortName(id))),
      query_count_(0),
      initialize_count_(0),
      release_count_(0),
      install_count_(0),
      remove_count_(0),
      last_point_x_(0),
      last_point_y_(0) {
}

FakeAccessibilityProvider::~FakeAccessibilityProvider() {
  Shutdown();
}

void FakeAccessibilityProvider::SimulateFocusChanged(
    const base::string16& name,
    base::ProcessId pid) {
  AccessibleNodeData data;
  data.role = AccessibleRole::kPushButton;
  data.name = name;
  data.native_ref.process_id = pid;
  NotifyFocusChanged(*CreateNode(data));
}

bool FakeAccessibilityProvider::IsAvailable() const {
  return available_;
}

bool FakeAccessibilityProvider::SupportsElement(
    const NativeElementRef& ref) const {
  return supports_elements_;
}

bool FakeAccessibilityProvider::InitializeNative() {
  ++initialize_count_;
  return initialize_result_;
}

void FakeAccessibilityProvider::ReleaseNative() {
  ++release_count_;
}

void FakeAccessibilityProvider::ForgetProcess(base::ProcessId pid) {
  forgotten_processes_.push_back(pid);
}

bool FakeAccessibilityProvider::InstallEventHook() {
  ++install_count_;
  return hook_result_;
}

void FakeAccessibilityProvider::RemoveEventHook() {
  ++remove_count_;
}

std::unique_ptr<AccessibleNode>
FakeAccessibilityProvider::QueryFocusedObject() {
  return MakeResult();
}

std::unique_ptr<AccessibleNode>
FakeAccessibilityProvider::QueryObjectFromPoint(int x, int y) {
  last_point_x_ = x;
  last_point_y_ = y;
  return MakeResult();
}

std::unique_ptr<AccessibleNode>
FakeAccessibilityProvider::QueryObjectFromHandle(WindowHandle window) {
  return MakeResult();
}

std::unique_ptr<AccessibleNode>
FakeAccessibilityProvider::QueryAccessibleObject(const NativeElementRef& ref) {
  return MakeResult();
}

std::unique_ptr<AccessibleNode> FakeAccessibilityProvider::MakeResult() {
  ++query_count_;
  if (!returns_nodes_)
    return nullptr;
  AccessibleNodeData data;
  data.role = AccessibleRole::kEdit;
  data.name = result_name_;
  return CreateNode(data);
}

}  // namespace screen_access
