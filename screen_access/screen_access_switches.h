// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_SCREEN_ACCESS_SWITCHES_H_
#define SCREEN_ACCESS_SCREEN_ACCESS_SWITCHES_H_

namespace screen_access {
namespace switches {

extern const char kDisableBackendAutoSwitch[];
extern const char kDisableExtendedActivation[];
extern const char kEnableBackends[];
extern const char kExtendedCapableProcesses[];
extern const char kNativeCallTimeoutMs[];
extern const char kPreferredBackend[];

}  // namespace switches
}  // namespace screen_access

#endif  // SCREEN_ACCESS_SCREEN_ACCESS_SWITCHES_H_
