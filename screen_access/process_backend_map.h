// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_PROCESS_BACKEND_MAP_H_
#define SCREEN_ACCESS_PROCESS_BACKEND_MAP_H_

#include <string>
#include <vector>

#include "base/macros.h"
#include "base/strings/string16.h"
#include "screen_access/backend_id.h"

namespace screen_access {

// Lowercases |process_name| and strips a trailing ".exe".
std::string NormalizeProcessName(const base::string16& process_name);

// Knows which backend gives the best results for well known applications,
// keyed by normalized process name.
class ProcessBackendMap {
 public:
  // Starts out with the built-in application list.
  ProcessBackendMap();
  ~ProcessBackendMap();

  // Exact match first, then the first registered entry whose name is a
  // substring of |process_name| (e.g. "firefox" matches "firefox-esr").
  // Returns false when nothing matches.
  bool Lookup(const base::string16& process_name, BackendId* backend) const;

  // Adds a mapping or replaces the existing one for the same name.
  void Register(const base::string16& process_name, BackendId backend);

  size_t size() const { return entries_.size(); }

 private:
  struct Entry {
    std::string name;
    BackendId backend;
  };

  // Kept in registration order so substring matches are deterministic.
  std::vector<Entry> entries_;

  DISALLOW_COPY_AND_ASSIGN(ProcessBackendMap);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_PROCESS_BACKEND_MAP_H_
