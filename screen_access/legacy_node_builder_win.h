// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_LEGACY_NODE_BUILDER_WIN_H_
#define SCREEN_ACCESS_LEGACY_NODE_BUILDER_WIN_H_

#include <oleacc.h>

#include "screen_access/accessible_node.h"

namespace screen_access {

// Fills |data| from the MSAA properties of |accessible| / |child_id|.
// |window| is the window the object came from; when null it is looked up
// with WindowFromAccessibleObject. |object_id| is the OBJID_* the object
// was resolved with and is recorded in the node's reference. Returns false
// if the object does not answer get_accRole, which is taken to mean it is
// dead.
bool BuildLegacyNodeData(IAccessible* accessible,
                         LONG object_id,
                         LONG child_id,
                         HWND window,
                         AccessibleNodeData* data);

}  // namespace screen_access

#endif  // SCREEN_ACCESS_LEGACY_NODE_BUILDER_WIN_H_
