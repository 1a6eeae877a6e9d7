// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/backend_id.h"

#include <vector>

#include "base/logging.h"
#include "base/macros.h"
#include "base/strings/string_split.h"
#include "base/strings/string_util.h"

namespace screen_access {

const BackendId kAllBackendIds[] = {
  BackendId::kTreeAutomation,
  BackendId::kLegacyAccessible,
  BackendId::kExtendedAccessible,
  BackendId::kToolkitBridge,
};

const size_t kBackendIdCount = arraysize(kAllBackendIds);

namespace {

const uint32_t kAllBackendBits =
    static_cast<uint32_t>(BackendId::kTreeAutomation) |
    static_cast<uint32_t>(BackendId::kLegacyAccessible) |
    static_cast<uint32_t>(BackendId::kExtendedAccessible) |
    static_cast<uint32_t>(BackendId::kToolkitBridge);

}  // namespace

const char* BackendIdToString(BackendId id) {
  switch (id) {
    case BackendId::kTreeAutomation:
      return "UIAutomation";
    case BackendId::kLegacyAccessible:
      return "MSAA";
    case BackendId::kExtendedAccessible:
      return "IAccessible2";
    case BackendId::kToolkitBridge:
      return "JavaAccessBridge";
  }
  NOTREACHED();
  return "";
}

const char* BackendIdToShortName(BackendId id) {
  switch (id) {
    case BackendId::kTreeAutomation:
      return "uia";
    case BackendId::kLegacyAccessible:
      return "msaa";
    case BackendId::kExtendedAccessible:
      return "ia2";
    case BackendId::kToolkitBridge:
      return "jab";
  }
  NOTREACHED();
  return "";
}

bool BackendIdFromShortName(const std::string& name, BackendId* id) {
  DCHECK(id);
  for (size_t i = 0; i < kBackendIdCount; ++i) {
    if (base::EqualsCaseInsensitiveASCII(
            name, BackendIdToShortName(kAllBackendIds[i]))) {
      *id = kAllBackendIds[i];
      return true;
    }
  }
  return false;
}

size_t BackendIdToIndex(BackendId id) {
  for (size_t i = 0; i < kBackendIdCount; ++i) {
    if (kAllBackendIds[i] == id)
      return i;
  }
  NOTREACHED();
  return 0;
}

// static
BackendSet BackendSet::All() {
  return BackendSet(kAllBackendBits);
}

// static
BackendSet BackendSet::FromBitmask(uint32_t bits) {
  return BackendSet(bits & kAllBackendBits);
}

size_t BackendSet::Size() const {
  size_t count = 0;
  for (size_t i = 0; i < kBackendIdCount; ++i) {
    if (Has(kAllBackendIds[i]))
      ++count;
  }
  return count;
}

std::string BackendSet::ToString() const {
  std::string result;
  for (size_t i = 0; i < kBackendIdCount; ++i) {
    if (!Has(kAllBackendIds[i]))
      continue;
    if (!result.empty())
      result += ",";
    result += BackendIdToShortName(kAllBackendIds[i]);
  }
  return result;
}

bool BackendSetFromString(const std::string& list, BackendSet* set) {
  DCHECK(set);
  std::vector<std::string> names = base::SplitString(
      list, ",", base::TRIM_WHITESPACE, base::SPLIT_WANT_NONEMPTY);
  BackendSet parsed;
  for (const std::string& name : names) {
    BackendId id;
    if (!BackendIdFromShortName(name, &id)) {
      DLOG(WARNING) << "Unknown backend name: " << name;
      return false;
    }
    parsed.Put(id);
  }
  *set = parsed;
  return true;
}

}  // namespace screen_access
