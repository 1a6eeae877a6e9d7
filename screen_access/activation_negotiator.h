// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_ACTIVATION_NEGOTIATOR_H_
#define SCREEN_ACCESS_ACTIVATION_NEGOTIATOR_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "base/macros.h"
#include "base/process/process_handle.h"
#include "base/strings/string16.h"
#include "base/synchronization/lock.h"
#include "screen_access/native_types.h"

namespace screen_access {

class ActivationPlatform;

// The accessibility model a process ended up exposing.
enum class AccessibilityModel {
  kUnknown,
  kTreeAutomation,
  kExtendedAccessible,
  kLegacyAccessible,
};

const char* AccessibilityModelToString(AccessibilityModel model);

// Chromium-family browsers only build their IAccessible2 tree once a client
// asks for it through IServiceProvider on the content window. This class
// performs that request once per process, retries once on failure, and
// remembers the outcome until the process exits.
//
// Thread-safe: the per-process cache is guarded by a lock that is never
// held while probing, so two threads racing on a fresh process may both
// probe it.
class ActivationNegotiator {
 public:
  class Delegate {
   public:
    // Called on the thread that ran the activation.
    virtual void OnAccessibilityModelChanged(base::ProcessId pid,
                                             AccessibilityModel model) = 0;

   protected:
    virtual ~Delegate() {}
  };

  // Probes at most this many times per process.
  static const int kMaxProbeAttempts = 2;

  // |extended_capable_processes| holds normalized process names (lowercase,
  // no ".exe"). |delegate| may be null and must outlive this object.
  ActivationNegotiator(
      std::unique_ptr<ActivationPlatform> platform,
      const std::vector<std::string>& extended_capable_processes,
      Delegate* delegate);
  ~ActivationNegotiator();

  // Returns the cached model when |pid| was already activated. Otherwise
  // probes the content window of an extended-capable process: success caches
  // kExtendedAccessible, two failures cache kTreeAutomation. Processes that
  // are not extended-capable, or have no main window, get kTreeAutomation
  // without probing or caching.
  AccessibilityModel ActivateForProcess(base::ProcessId pid);

  // The first descendant of |main_window| whose class hosts web content, or
  // kNullWindowHandle when the frame itself is the content surface.
  WindowHandle FindContentWindow(WindowHandle main_window);

  // Probes the content window of |main_window|, or |main_window| itself when
  // it has none.
  bool ActivateContentWindow(WindowHandle main_window);

  // One uncached probe of |window|.
  bool IsExtendedInterfaceAvailable(WindowHandle window);

  // kUnknown when |pid| has no cached entry.
  AccessibilityModel GetModelForProcess(base::ProcessId pid) const;

  bool IsExtendedCapableProcess(const base::string16& process_name) const;

  // Forwards to the platform; used to resolve focus events to process names.
  bool GetProcessName(base::ProcessId pid, base::string16* name);

  // Drops everything cached for |pid|.
  void ProcessExited(base::ProcessId pid);

  // Drops the whole cache.
  void Reset();

 private:
  bool IsActivated(base::ProcessId pid, AccessibilityModel* model) const;
  void RecordModel(base::ProcessId pid, AccessibilityModel model);

  std::unique_ptr<ActivationPlatform> platform_;
  const std::vector<std::string> extended_capable_processes_;
  Delegate* const delegate_;

  mutable base::Lock lock_;
  std::map<base::ProcessId, AccessibilityModel> process_models_;
  std::set<base::ProcessId> activated_processes_;

  DISALLOW_COPY_AND_ASSIGN(ActivationNegotiator);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_ACTIVATION_NEGOTIATOR_H_
