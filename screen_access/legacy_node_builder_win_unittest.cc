// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/legacy_node_builder_win.h"

#include "base/macros.h"
#include "base/strings/utf_string_conversions.h"
#include "gtest/gtest.h"

namespace screen_access {

namespace {

// An MSAA object with a fixed role, state, name and location. Everything
// else is unimplemented.
class FakeAccessible : public IAccessible {
 public:
  FakeAccessible() : ref_count_(1), role_(ROLE_SYSTEM_PUSHBUTTON) {}

  void set_role(LONG role) { role_ = role; }
  ULONG ref_count() const { return ref_count_; }

  // IUnknown:
  STDMETHOD(QueryInterface)(REFIID riid, void** object) override {
    if (riid == IID_IUnknown || riid == IID_IDispatch ||
        riid == IID_IAccessible) {
      AddRef();
      *object = static_cast<IAccessible*>(this);
      return S_OK;
    }
    *object = NULL;
    return E_NOINTERFACE;
  }
  STDMETHOD_(ULONG, AddRef)() override { return ++ref_count_; }
  STDMETHOD_(ULONG, Release)() override { return --ref_count_; }

  // IDispatch:
  STDMETHOD(GetTypeInfoCount)(UINT* count) override { return E_NOTIMPL; }
  STDMETHOD(GetTypeInfo)(UINT index, LCID lcid, ITypeInfo** info) override {
    return E_NOTIMPL;
  }
  STDMETHOD(GetIDsOfNames)(REFIID riid, LPOLESTR* names, UINT count,
                           LCID lcid, DISPID* ids) override {
    return E_NOTIMPL;
  }
  STDMETHOD(Invoke)(DISPID id, REFIID riid, LCID lcid, WORD flags,
                    DISPPARAMS* params, VARIANT* result, EXCEPINFO* info,
                    UINT* arg_error) override {
    return E_NOTIMPL;
  }

  // IAccessible:
  STDMETHOD(get_accParent)(IDispatch** parent) override { return E_NOTIMPL; }
  STDMETHOD(get_accChildCount)(LONG* count) override { return E_NOTIMPL; }
  STDMETHOD(get_accChild)(VARIANT child, IDispatch** result) override {
    return E_NOTIMPL;
  }
  STDMETHOD(get_accName)(VARIANT child, BSTR* name) override {
    *name = SysAllocString(L"OK");
    return S_OK;
  }
  STDMETHOD(get_accValue)(VARIANT child, BSTR* value) override {
    *value = NULL;
    return S_FALSE;
  }
  STDMETHOD(get_accDescription)(VARIANT child, BSTR* description) override {
    *description = NULL;
    return S_FALSE;
  }
  STDMETHOD(get_accRole)(VARIANT child, VARIANT* role) override {
    if (role_ < 0)
      return E_FAIL;
    role->vt = VT_I4;
    role->lVal = role_;
    return S_OK;
  }
  STDMETHOD(get_accState)(VARIANT child, VARIANT* state) override {
    state->vt = VT_I4;
    state->lVal = STATE_SYSTEM_FOCUSED | STATE_SYSTEM_FOCUSABLE;
    return S_OK;
  }
  STDMETHOD(get_accHelp)(VARIANT child, BSTR* help) override {
    *help = NULL;
    return S_FALSE;
  }
  STDMETHOD(get_accHelpTopic)(BSTR* file, VARIANT child, LONG* topic)
      override {
    return E_NOTIMPL;
  }
  STDMETHOD(get_accKeyboardShortcut)(VARIANT child, BSTR* shortcut)
      override {
    *shortcut = NULL;
    return S_FALSE;
  }
  STDMETHOD(get_accFocus)(VARIANT* child) override { return E_NOTIMPL; }
  STDMETHOD(get_accSelection)(VARIANT* children) override {
    return E_NOTIMPL;
  }
  STDMETHOD(get_accDefaultAction)(VARIANT child, BSTR* action) override {
    return E_NOTIMPL;
  }
  STDMETHOD(accSelect)(LONG flags, VARIANT child) override {
    return E_NOTIMPL;
  }
  STDMETHOD(accLocation)(LONG* left, LONG* top, LONG* width, LONG* height,
                         VARIANT child) override {
    *left = 10;
    *top = 20;
    *width = 75;
    *height = 23;
    return S_OK;
  }
  STDMETHOD(accNavigate)(LONG direction, VARIANT start, VARIANT* end)
      override {
    return E_NOTIMPL;
  }
  STDMETHOD(accHitTest)(LONG left, LONG top, VARIANT* child) override {
    return E_NOTIMPL;
  }
  STDMETHOD(accDoDefaultAction)(VARIANT child) override { return E_NOTIMPL; }
  STDMETHOD(put_accName)(VARIANT child, BSTR name) override {
    return E_NOTIMPL;
  }
  STDMETHOD(put_accValue)(VARIANT child, BSTR value) override {
    return E_NOTIMPL;
  }

 private:
  ULONG ref_count_;
  LONG role_;

  DISALLOW_COPY_AND_ASSIGN(FakeAccessible);
};

}  // namespace

TEST(LegacyNodeBuilderTest, RecordsTheObjectIdItWasResolvedWith) {
  FakeAccessible accessible;
  AccessibleNodeData data;
  ASSERT_TRUE(BuildLegacyNodeData(&accessible, OBJID_WINDOW, CHILDID_SELF,
                                  GetDesktopWindow(), &data));
  EXPECT_EQ(OBJID_WINDOW, data.native_ref.object_id);
  EXPECT_EQ(CHILDID_SELF, data.native_ref.child_id);

  AccessibleNodeData client;
  ASSERT_TRUE(BuildLegacyNodeData(&accessible, OBJID_CLIENT, 3,
                                  GetDesktopWindow(), &client));
  EXPECT_EQ(OBJID_CLIENT, client.native_ref.object_id);
  EXPECT_EQ(3, client.native_ref.child_id);
}

TEST(LegacyNodeBuilderTest, MapsPropertiesAndHoldsTheObject) {
  FakeAccessible accessible;
  {
    AccessibleNodeData data;
    ASSERT_TRUE(BuildLegacyNodeData(&accessible, OBJID_CLIENT, CHILDID_SELF,
                                    GetDesktopWindow(), &data));
    EXPECT_EQ(AccessibleRole::kPushButton, data.role);
    EXPECT_TRUE(data.states.Has(AccessibleState::kFocused));
    EXPECT_TRUE(data.states.Has(AccessibleState::kFocusable));
    EXPECT_EQ(base::ASCIIToUTF16("OK"), data.name);
    EXPECT_TRUE(data.value.empty());
    EXPECT_EQ(10, data.bounds.x);
    EXPECT_EQ(23, data.bounds.height);
    EXPECT_TRUE(data.native_ref.native_object.get());
    EXPECT_EQ(2u, accessible.ref_count());
  }
  EXPECT_EQ(1u, accessible.ref_count());
}

TEST(LegacyNodeBuilderTest, DeadObjectBuildsNothing) {
  FakeAccessible accessible;
  accessible.set_role(-1);
  AccessibleNodeData data;
  EXPECT_FALSE(BuildLegacyNodeData(&accessible, OBJID_CLIENT, CHILDID_SELF,
                                   GetDesktopWindow(), &data));
  EXPECT_EQ(1u, accessible.ref_count());
}

}  // namespace screen_access
