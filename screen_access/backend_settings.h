// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_BACKEND_SETTINGS_H_
#define SCREEN_ACCESS_BACKEND_SETTINGS_H_

#include <string>
#include <vector>

#include "base/time/time.h"
#include "screen_access/backend_id.h"

namespace base {
class CommandLine;
}

namespace screen_access {

// Start-up configuration of the backend layer.
struct BackendSettings {
  BackendSettings();
  ~BackendSettings();

  BackendSet enabled_backends;
  BackendId preferred_backend;
  // Pick the preferred backend from the focused process name.
  bool auto_switch_backend;
  // Probe Chromium-family browsers for IAccessible2 on first focus.
  bool auto_activate_extended;
  // Upper bound for a single call into another process.
  base::TimeDelta native_call_timeout;
  // Normalized process names eligible for IAccessible2 activation.
  std::vector<std::string> extended_capable_processes;
};

// Splits a comma separated list of process names and normalizes each the
// way ProcessBackendMap keys are normalized.
std::vector<std::string> ParseProcessList(const std::string& list);

// Overrides |settings| with whatever the platform persists (the registry on
// Windows). Values that fail validation are logged and skipped.
void ApplyPersistedSettings(BackendSettings* settings);

// Overrides |settings| with the switches in screen_access_switches.h.
// Returns false if any switch carried an invalid value; the valid ones are
// still applied.
bool ApplyCommandLineSettings(const base::CommandLine& command_line,
                              BackendSettings* settings);

// Defaults, then persisted settings, then |command_line|.
BackendSettings LoadBackendSettings(const base::CommandLine& command_line);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_BACKEND_SETTINGS_H_
