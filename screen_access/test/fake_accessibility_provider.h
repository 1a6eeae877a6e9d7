// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_TEST_FAKE_ACCESSIBILITY_PROVIDER_H_
#define SCREEN_ACCESS_TEST_FAKE_ACCESSIBILITY_PROVIDER_H_

#include <memory>
#include <vector>

#include "base/macros.h"
#include "base/strings/string16.h"
#include "screen_access/provider_base.h"

namespace screen_access {

// A scriptable provider that records how it was driven. Queries return a
// node named |result_name| unless set_returns_nodes(false) was called.
class FakeAccessibilityProvider : public ProviderBase {
 public:
  explicit FakeAccessibilityProvider(BackendId id);
  ~FakeAccessibilityProvider() override;

  void set_available(bool available) { available_ = available; }
  void set_initialize_result(bool result) { initialize_result_ = result; }
  void set_hook_result(bool result) { hook_result_ = result; }
  void set_returns_nodes(bool returns_nodes) { returns_nodes_ = returns_nodes; }
  void set_supports_elements(bool supports) { supports_elements_ = supports; }
  void set_result_name(const base::string16& name) { result_name_ = name; }

  // Delivers a focus change for a node named |name| owned by |pid|.
  void SimulateFocusChanged(const base::string16& name, base::ProcessId pid);

  int query_count() const { return query_count_; }
  int initialize_count() const { return initialize_count_; }
  int release_count() const { return release_count_; }
  int install_count() const { return install_count_; }
  int remove_count() const { return remove_count_; }
  int last_point_x() const { return last_point_x_; }
  int last_point_y() const { return last_point_y_; }
  const std::vector<base::ProcessId>& forgotten_processes() const {
    return forgotten_processes_;
  }

  // AccessibilityProvider:
  bool IsAvailable() const override;
  bool SupportsElement(const NativeElementRef& ref) const override;

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
  std::unique_ptr<AccessibleNode> MakeResult();

  bool available_;
  bool initialize_result_;
  bool hook_result_;
  bool returns_nodes_;
  bool supports_elements_;
  base::string16 result_name_;

  int query_count_;
  int initialize_count_;
  int release_count_;
  int install_count_;
  int remove_count_;
  int last_point_x_;
  int last_point_y_;
  std::vector<base::ProcessId> forgotten_processes_;

  DISALLOW_COPY_AND_ASSIGN(FakeAccessibilityProvider);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_TEST_FAKE_ACCESSIBILITY_PROVIDER_H_
