// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_BACKEND_ID_H_
#define SCREEN_ACCESS_BACKEND_ID_H_

#include <stddef.h>
#include <stdint.h>

#include <string>

namespace screen_access {

// Identifies one native accessibility technology. Every value is a distinct
// bit so that a BackendSet can hold any combination of them.
enum class BackendId : uint32_t {
  // UI Automation client API.
  kTreeAutomation = 1 << 0,
  // MSAA (IAccessible).
  kLegacyAccessible = 1 << 1,
  // IAccessible2, reached from an IAccessible through IServiceProvider.
  kExtendedAccessible = 1 << 2,
  // Java Access Bridge.
  kToolkitBridge = 1 << 3,
};

// All identities in the fixed order used when cycling the preferred backend.
extern const BackendId kAllBackendIds[];
extern const size_t kBackendIdCount;

// Display name, e.g. "UIAutomation".
const char* BackendIdToString(BackendId id);

// Short name used on the command line and in the registry, e.g. "uia".
const char* BackendIdToShortName(BackendId id);

// Parses a short name (case-insensitive). Returns false and leaves |id|
// untouched on unknown input.
bool BackendIdFromShortName(const std::string& name, BackendId* id);

// Position of |id| in kAllBackendIds.
size_t BackendIdToIndex(BackendId id);

// A set of backend identities. Kept distinct from BackendId so that a single
// identity is never silently compared against a mask.
class BackendSet {
 public:
  BackendSet() : bits_(0) {}

  static BackendSet All();
  static BackendSet FromBitmask(uint32_t bits);

  bool Has(BackendId id) const {
    return (bits_ & static_cast<uint32_t>(id)) != 0;
  }
  void Put(BackendId id) { bits_ |= static_cast<uint32_t>(id); }
  void Remove(BackendId id) { bits_ &= ~static_cast<uint32_t>(id); }
  void Clear() { bits_ = 0; }

  bool Empty() const { return bits_ == 0; }
  size_t Size() const;
  uint32_t ToBitmask() const { return bits_; }

  // Comma separated short names in cycling order, e.g. "uia,msaa".
  std::string ToString() const;

  bool operator==(const BackendSet& other) const {
    return bits_ == other.bits_;
  }
  bool operator!=(const BackendSet& other) const {
    return bits_ != other.bits_;
  }

 private:
  explicit BackendSet(uint32_t bits) : bits_(bits) {}

  uint32_t bits_;
};

// Parses a comma separated list of short names. Returns false without
// modifying |set| if any entry is unknown.
bool BackendSetFromString(const std::string& list, BackendSet* set);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_BACKEND_ID_H_
