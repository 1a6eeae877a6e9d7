// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/process_backend_map.h"

#include "base/logging.h"
#include "base/macros.h"
#include "base/strings/string_util.h"
#include "base/strings/utf_string_conversions.h"

namespace screen_access {

namespace {

const char kExecutableSuffix[] = ".exe";

struct DefaultMapping {
  const char* name;
  BackendId backend;
};

const DefaultMapping kDefaultMappings[] = {
  // Gecko and LibreOffice expose their richest tree through IAccessible2.
  { "firefox", BackendId::kExtendedAccessible },
  { "thunderbird", BackendId::kExtendedAccessible },
  { "waterfox", BackendId::kExtendedAccessible },
  { "librewolf", BackendId::kExtendedAccessible },
  { "soffice", BackendId::kExtendedAccessible },
  { "swriter", BackendId::kExtendedAccessible },
  { "scalc", BackendId::kExtendedAccessible },
  { "simpress", BackendId::kExtendedAccessible },
  { "java", BackendId::kToolkitBridge },
  { "javaw", BackendId::kToolkitBridge },
  { "eclipse", BackendId::kToolkitBridge },
  { "idea64", BackendId::kToolkitBridge },
  { "idea", BackendId::kToolkitBridge },
  { "studio64", BackendId::kToolkitBridge },
  { "netbeans64", BackendId::kToolkitBridge },
  { "chrome", BackendId::kTreeAutomation },
  { "msedge", BackendId::kTreeAutomation },
  { "brave", BackendId::kTreeAutomation },
  { "vivaldi", BackendId::kTreeAutomation },
  { "opera", BackendId::kTreeAutomation },
  { "windowsterminal", BackendId::kTreeAutomation },
  { "pwsh", BackendId::kTreeAutomation },
  { "notepad", BackendId::kTreeAutomation },
  { "cmd", BackendId::kLegacyAccessible },
  { "powershell", BackendId::kLegacyAccessible },
  { "conhost", BackendId::kLegacyAccessible },
  { "mspaint", BackendId::kLegacyAccessible },
  { "wordpad", BackendId::kLegacyAccessible },
};

}  // namespace

std::string NormalizeProcessName(const base::string16& process_name) {
  std::string name = base::ToLowerASCII(base::UTF16ToUTF8(process_name));
  if (base::EndsWith(name, kExecutableSuffix, base::CompareCase::SENSITIVE))
    name.resize(name.size() - arraysize(kExecutableSuffix) + 1);
  return name;
}

ProcessBackendMap::ProcessBackendMap() {
  for (size_t i = 0; i < arraysize(kDefaultMappings); ++i) {
    Entry entry = { kDefaultMappings[i].name, kDefaultMappings[i].backend };
    entries_.push_back(entry);
  }
}

ProcessBackendMap::~ProcessBackendMap() {
}

bool ProcessBackendMap::Lookup(const base::string16& process_name,
                               BackendId* backend) const {
  DCHECK(backend);
  std::string name = NormalizeProcessName(process_name);
  if (name.empty())
    return false;

  for (const Entry& entry : entries_) {
    if (entry.name == name) {
      *backend = entry.backend;
      return true;
    }
  }
  for (const Entry& entry : entries_) {
    if (name.find(entry.name) != std::string::npos) {
      *backend = entry.backend;
      return true;
    }
  }
  return false;
}

void ProcessBackendMap::Register(const base::string16& process_name,
                                 BackendId backend) {
  std::string name = NormalizeProcessName(process_name);
  if (name.empty())
    return;
  for (Entry& entry : entries_) {
    if (entry.name == name) {
      entry.backend = backend;
      return;
    }
  }
  Entry entry = { name, backend };
  entries_.push_back(entry);
}

}  // namespace screen_access
