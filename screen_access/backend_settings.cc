// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_settings.h"

#include "base/command_line.h"
#include "base/logging.h"
#include "base/macros.h"
#include "base/strings/string_number_conversions.h"
#include "base/strings/string_split.h"
#include "base/strings/utf_string_conversions.h"
#include "screen_access/process_backend_map.h"
#include "screen_access/screen_access_switches.h"

namespace screen_access {

namespace {

const int kDefaultNativeCallTimeoutMs = 2000;

// Browsers built on Chromium keep their IAccessible2 tree dormant until an
// assistive client asks for it.
const char* const kDefaultExtendedCapableProcesses[] = {
  "chrome",
  "msedge",
  "chromium",
  "brave",
  "vivaldi",
  "opera",
};

}  // namespace

BackendSettings::BackendSettings()
    : preferred_backend(BackendId::kTreeAutomation),
      auto_switch_backend(true),
      auto_activate_extended(true),
      native_call_timeout(
          base::TimeDelta::FromMilliseconds(kDefaultNativeCallTimeoutMs)) {
  enabled_backends.Put(BackendId::kTreeAutomation);
  enabled_backends.Put(BackendId::kLegacyAccessible);
  for (size_t i = 0; i < arraysize(kDefaultExtendedCapableProcesses); ++i)
    extended_capable_processes.push_back(kDefaultExtendedCapableProcesses[i]);
}

BackendSettings::~BackendSettings() {
}

bool ApplyCommandLineSettings(const base::CommandLine& command_line,
                              BackendSettings* settings) {
  DCHECK(settings);
  bool all_valid = true;

  if (command_line.HasSwitch(switches::kEnableBackends)) {
    std::string value =
        command_line.GetSwitchValueASCII(switches::kEnableBackends);
    BackendSet enabled;
    if (BackendSetFromString(value, &enabled) && !enabled.Empty()) {
      settings->enabled_backends = enabled;
    } else {
      LOG(WARNING) << "Ignoring invalid --" << switches::kEnableBackends
                   << "=" << value;
      all_valid = false;
    }
  }

  if (command_line.HasSwitch(switches::kPreferredBackend)) {
    std::string value =
        command_line.GetSwitchValueASCII(switches::kPreferredBackend);
    BackendId preferred;
    if (BackendIdFromShortName(value, &preferred)) {
      settings->preferred_backend = preferred;
    } else {
      LOG(WARNING) << "Ignoring invalid --" << switches::kPreferredBackend
                   << "=" << value;
      all_valid = false;
    }
  }

  if (command_line.HasSwitch(switches::kNativeCallTimeoutMs)) {
    std::string value =
        command_line.GetSwitchValueASCII(switches::kNativeCallTimeoutMs);
    int timeout_ms = 0;
    if (base::StringToInt(value, &timeout_ms) && timeout_ms > 0) {
      settings->native_call_timeout =
          base::TimeDelta::FromMilliseconds(timeout_ms);
    } else {
      LOG(WARNING) << "Ignoring invalid --" << switches::kNativeCallTimeoutMs
                   << "=" << value;
      all_valid = false;
    }
  }

  if (command_line.HasSwitch(switches::kExtendedCapableProcesses)) {
    settings->extended_capable_processes = ParseProcessList(
        command_line.GetSwitchValueASCII(switches::kExtendedCapableProcesses));
  }

  if (command_line.HasSwitch(switches::kDisableBackendAutoSwitch))
    settings->auto_switch_backend = false;
  if (command_line.HasSwitch(switches::kDisableExtendedActivation))
    settings->auto_activate_extended = false;

  return all_valid;
}

std::vector<std::string> ParseProcessList(const std::string& list) {
  std::vector<std::string> processes;
  for (const std::string& entry : base::SplitString(
           list, ",", base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY)) {
    std::string name = NormalizeProcessName(base::UTF8ToUTF16(entry));
    if (!name.empty())
      processes.push_back(name);
  }
  return processes;
}

BackendSettings LoadBackendSettings(const base::CommandLine& command_line) {
  BackendSettings settings;
  ApplyPersistedSettings(&settings);
  ApplyCommandLineSettings(command_line, &settings);
  VLOG(1) << "Backends enabled: " << settings.enabled_backends.ToString()
          << ", preferred: "
          << BackendIdToShortName(settings.preferred_backend);
  return settings;
}

}  // namespace screen_access
