// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_settings.h"

#include <windows.h>

#include "base/logging.h"
#include "base/strings/utf_string_conversions.h"
#include "base/win/registry.h"

using base::win::RegKey;

namespace screen_access {

namespace {

const wchar_t kSettingsKey[] = L"Software\\ScreenAccess";

const wchar_t kEnabledBackendsValue[] = L"EnabledBackends";
const wchar_t kPreferredBackendValue[] = L"PreferredBackend";
const wchar_t kAutoSwitchBackendValue[] = L"AutoSwitchBackend";
const wchar_t kAutoActivateExtendedValue[] = L"AutoActivateExtended";
const wchar_t kNativeCallTimeoutMsValue[] = L"NativeCallTimeoutMs";
const wchar_t kExtendedCapableProcessesValue[] = L"ExtendedCapableProcesses";

bool ReadConfigDword(RegKey* key, const wchar_t* value_name, DWORD* value) {
  return key->ReadValueDW(value_name, value) == ERROR_SUCCESS;
}

}  // namespace

void ApplyPersistedSettings(BackendSettings* settings) {
  DCHECK(settings);
  RegKey config_key;
  if (config_key.Open(HKEY_CURRENT_USER, kSettingsKey,
                      KEY_QUERY_VALUE) != ERROR_SUCCESS) {
    return;
  }

  DWORD value = 0;
  if (ReadConfigDword(&config_key, kEnabledBackendsValue, &value)) {
    BackendSet enabled = BackendSet::FromBitmask(value);
    if (!enabled.Empty()) {
      settings->enabled_backends = enabled;
    } else {
      LOG(WARNING) << "Ignoring empty EnabledBackends mask " << value;
    }
  }

  if (ReadConfigDword(&config_key, kPreferredBackendValue, &value)) {
    BackendSet preferred = BackendSet::FromBitmask(value);
    if (preferred.Size() == 1) {
      for (size_t i = 0; i < kBackendIdCount; ++i) {
        if (preferred.Has(kAllBackendIds[i]))
          settings->preferred_backend = kAllBackendIds[i];
      }
    } else {
      LOG(WARNING) << "Ignoring invalid PreferredBackend " << value;
    }
  }

  if (ReadConfigDword(&config_key, kAutoSwitchBackendValue, &value))
    settings->auto_switch_backend = (value != FALSE);
  if (ReadConfigDword(&config_key, kAutoActivateExtendedValue, &value))
    settings->auto_activate_extended = (value != FALSE);

  if (ReadConfigDword(&config_key, kNativeCallTimeoutMsValue, &value)) {
    if (value > 0) {
      settings->native_call_timeout = base::TimeDelta::FromMilliseconds(value);
    } else {
      LOG(WARNING) << "Ignoring zero NativeCallTimeoutMs";
    }
  }

  std::wstring processes;
  if (config_key.ReadValue(kExtendedCapableProcessesValue, &processes) ==
      ERROR_SUCCESS) {
    settings->extended_capable_processes =
        ParseProcessList(base::WideToUTF8(processes));
  }
}

}  // namespace screen_access
