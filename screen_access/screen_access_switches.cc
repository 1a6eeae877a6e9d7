// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/screen_access_switches.h"

namespace screen_access {
namespace switches {

// Keeps the preferred backend fixed when focus moves between applications.
const char kDisableBackendAutoSwitch[] = "disable-backend-auto-switch";

// Never probes Chromium-family browsers for a dormant IAccessible2 tree.
const char kDisableExtendedActivation[] = "disable-extended-activation";

// Comma separated list of backends to enable at start-up, e.g. "uia,msaa".
// Valid names are uia, msaa, ia2 and jab.
const char kEnableBackends[] = "enable-backends";

// Comma separated process names that may expose IAccessible2 on request.
const char kExtendedCapableProcesses[] = "extended-capable-processes";

// Upper bound, in milliseconds, for any single call into another process.
const char kNativeCallTimeoutMs[] = "native-call-timeout-ms";

// Backend queried first, e.g. "uia".
const char kPreferredBackend[] = "preferred-backend";

}  // namespace switches
}  // namespace screen_access
