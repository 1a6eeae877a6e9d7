// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/com_util_win.h"

namespace screen_access {

HRESULT QueryExtendedService(IServiceProvider* service_provider,
                             IAccessible2** extended) {
  DCHECK(extended);
  *extended = NULL;
  if (!service_provider)
    return E_INVALIDARG;

  HRESULT hr = service_provider->QueryService(
      __uuidof(IAccessible2), __uuidof(IAccessible2),
      reinterpret_cast<void**>(extended));
  if (hr == S_OK && *extended)
    return S_OK;

  if (*extended) {
    (*extended)->Release();
    *extended = NULL;
  }
  // Servers without IAccessible2 answer S_FALSE or E_FAIL as often as
  // E_NOINTERFACE.
  if (SUCCEEDED(hr) || hr == E_FAIL)
    return E_NOINTERFACE;
  return hr;
}

}  // namespace screen_access
