// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#ifndef SCREEN_ACCESS_COM_UTIL_WIN_H_
#define SCREEN_ACCESS_COM_UTIL_WIN_H_

#include <windows.h>
#include <servprov.h>

#include "base/logging.h"
#include "base/macros.h"
#include "base/win/scoped_comptr.h"
#include "ia2_api_all.h"
#include "screen_access/accessible_node.h"

namespace screen_access {

// Asks |service_provider| for IAccessible2. Chromium only serves it when the
// service id and the requested interface are both IAccessible2, so both are
// always passed. Answers that carry no interface come back as
// E_NOINTERFACE; other failures, such as a disconnected server, are passed
// through.
HRESULT QueryExtendedService(IServiceProvider* service_provider,
                             IAccessible2** extended);

// Holds a COM reference for the nodes built from |T|.
template <typename T>
class ComElementHandle : public NativeElementHandle {
 public:
  explicit ComElementHandle(T* element) : element_(element) {}

  T* get() const { return element_.get(); }

  // Returns the element |ref| holds, or null. |ref.source| must name a
  // backend whose handles wrap a |T|.
  static T* FromRef(const NativeElementRef& ref) {
    if (!ref.native_object)
      return NULL;
    return static_cast<ComElementHandle<T>*>(ref.native_object.get())->get();
  }

 private:
  ~ComElementHandle() override {}

  base::win::ScopedComPtr<T> element_;

  DISALLOW_COPY_AND_ASSIGN(ComElementHandle);
};

}  // namespace screen_access

#endif  // SCREEN_ACCESS_COM_UTIL_WIN_H_
