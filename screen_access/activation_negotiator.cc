// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/activation_negotiator.h"

#include <algorithm>
#include <utility>

#include "base/logging.h"
#include "base/strings/string_util.h"
#include "base/strings/utf_string_conversions.h"
#include "screen_access/activation_platform.h"
#include "screen_access/process_backend_map.h"

namespace screen_access {

namespace {

// The window class Chromium uses for the surface that hosts web content.
const char kRenderWidgetHostClass[] = "Chrome_RenderWidgetHostHWND";
const char kRenderWidgetHostClassFragment[] = "RenderWidgetHost";

bool IsContentWindowClass(const base::string16& class_name) {
  std::string name = base::UTF16ToUTF8(class_name);
  return name == kRenderWidgetHostClass ||
         name.find(kRenderWidgetHostClassFragment) != std::string::npos;
}

}  // namespace

const char* AccessibilityModelToString(AccessibilityModel model) {
  switch (model) {
    case AccessibilityModel::kUnknown:
      return "Unknown";
    case AccessibilityModel::kTreeAutomation:
      return "UIAutomation";
    case AccessibilityModel::kExtendedAccessible:
      return "IAccessible2";
    case AccessibilityModel::kLegacyAccessible:
      return "MSAA";
  }
  NOTREACHED();
  return "";
}

// static
const int ActivationNegotiator::kMaxProbeAttempts;

ActivationNegotiator::ActivationNegotiator(
    std::unique_ptr<ActivationPlatform> platform,
    const std::vector<std::string>& extended_capable_processes,
    Delegate* delegate)
    : platform_(std::move(platform)),
      extended_capable_processes_(extended_capable_processes),
      delegate_(delegate) {
  DCHECK(platform_);
}

ActivationNegotiator::~ActivationNegotiator() {
}

AccessibilityModel ActivationNegotiator::ActivateForProcess(
    base::ProcessId pid) {
  AccessibilityModel cached = AccessibilityModel::kUnknown;
  if (IsActivated(pid, &cached))
    return cached;

  base::string16 process_name;
  if (!platform_->GetProcessName(pid, &process_name) ||
      !IsExtendedCapableProcess(process_name)) {
    return AccessibilityModel::kTreeAutomation;
  }

  WindowHandle main_window = platform_->GetMainWindow(pid);
  if (main_window == kNullWindowHandle) {
    DVLOG(1) << "No main window for process " << pid;
    return AccessibilityModel::kTreeAutomation;
  }

  VLOG(1) << "Activating IAccessible2 for "
          << base::UTF16ToUTF8(process_name) << " (pid "
          << pid << ")";

  // The first request sometimes only wakes the renderer's accessibility
  // support up; the second one then gets the interface.
  AccessibilityModel model = AccessibilityModel::kTreeAutomation;
  for (int attempt = 1; attempt <= kMaxProbeAttempts; ++attempt) {
    if (ActivateContentWindow(main_window)) {
      model = AccessibilityModel::kExtendedAccessible;
      VLOG(1) << "IAccessible2 active for pid " << pid << " after "
              << attempt << " attempt(s)";
      break;
    }
  }
  if (model != AccessibilityModel::kExtendedAccessible)
    VLOG(1) << "Falling back to UIAutomation for pid " << pid;

  RecordModel(pid, model);
  if (delegate_)
    delegate_->OnAccessibilityModelChanged(pid, model);
  return model;
}

WindowHandle ActivationNegotiator::FindContentWindow(
    WindowHandle main_window) {
  if (main_window == kNullWindowHandle)
    return kNullWindowHandle;

  std::vector<ActivationPlatform::WindowInfo> windows;
  platform_->GetDescendantWindows(main_window, &windows);
  for (const ActivationPlatform::WindowInfo& info : windows) {
    if (IsContentWindowClass(info.class_name))
      return info.window;
  }
  return kNullWindowHandle;
}

bool ActivationNegotiator::ActivateContentWindow(WindowHandle main_window) {
  WindowHandle content_window = FindContentWindow(main_window);
  if (content_window == kNullWindowHandle)
    content_window = main_window;
  return IsExtendedInterfaceAvailable(content_window);
}

bool ActivationNegotiator::IsExtendedInterfaceAvailable(WindowHandle window) {
  if (window == kNullWindowHandle)
    return false;
  return platform_->ProbeExtendedInterface(window);
}

AccessibilityModel ActivationNegotiator::GetModelForProcess(
    base::ProcessId pid) const {
  base::AutoLock lock(lock_);
  std::map<base::ProcessId, AccessibilityModel>::const_iterator it =
      process_models_.find(pid);
  return it == process_models_.end() ? AccessibilityModel::kUnknown
                                     : it->second;
}

bool ActivationNegotiator::IsExtendedCapableProcess(
    const base::string16& process_name) const {
  std::string name = NormalizeProcessName(process_name);
  return std::find(extended_capable_processes_.begin(),
                   extended_capable_processes_.end(),
                   name) != extended_capable_processes_.end();
}

bool ActivationNegotiator::GetProcessName(base::ProcessId pid,
                                          base::string16* name) {
  return platform_->GetProcessName(pid, name);
}

void ActivationNegotiator::ProcessExited(base::ProcessId pid) {
  base::AutoLock lock(lock_);
  activated_processes_.erase(pid);
  process_models_.erase(pid);
}

void ActivationNegotiator::Reset() {
  base::AutoLock lock(lock_);
  activated_processes_.clear();
  process_models_.clear();
}

bool ActivationNegotiator::IsActivated(base::ProcessId pid,
                                       AccessibilityModel* model) const {
  base::AutoLock lock(lock_);
  if (activated_processes_.find(pid) == activated_processes_.end())
    return false;
  std::map<base::ProcessId, AccessibilityModel>::const_iterator it =
      process_models_.find(pid);
  *model = it == process_models_.end() ? AccessibilityModel::kUnknown
                                       : it->second;
  return true;
}

void ActivationNegotiator::RecordModel(base::ProcessId pid,
                                       AccessibilityModel model) {
  base::AutoLock lock(lock_);
  activated_processes_.insert(pid);
  process_models_[pid] = model;
}

}  // namespace screen_access
