// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/activation_platform_win.h"

#include <servprov.h>

#include <string>
#include <vector>

#include "base/macros.h"
#include "base/win/scoped_comptr.h"
#include "gtest/gtest.h"
#include "ia2_api_all.h"
#include "screen_access/com_util_win.h"

namespace screen_access {

namespace {

// A COM object that can play the accessible, its service provider or the
// IAccessible2 service. Every Release() is appended to a shared log.
class FakeComObject : public IServiceProvider {
 public:
  FakeComObject(const char* name, std::vector<std::string>* release_log)
      : name_(name),
        release_log_(release_log),
        ref_count_(1),
        service_provider_(NULL),
        service_(NULL),
        query_service_result_(S_OK),
        query_service_calls_(0) {}

  void set_service_provider(FakeComObject* provider) {
    service_provider_ = provider;
  }
  void set_service(FakeComObject* service) { service_ = service; }
  // What QueryService() answers when it has a service to hand out.
  void set_query_service_result(HRESULT result) {
    query_service_result_ = result;
  }

  ULONG ref_count() const { return ref_count_; }
  int query_service_calls() const { return query_service_calls_; }

  // IUnknown:
  STDMETHOD(QueryInterface)(REFIID riid, void** object) {
    if (riid == IID_IUnknown) {
      AddRef();
      *object = static_cast<IUnknown*>(this);
      return S_OK;
    }
    if (riid == IID_IServiceProvider && service_provider_) {
      service_provider_->AddRef();
      *object = static_cast<IServiceProvider*>(service_provider_);
      return S_OK;
    }
    *object = NULL;
    return E_NOINTERFACE;
  }

  STDMETHOD_(ULONG, AddRef)() { return ++ref_count_; }

  STDMETHOD_(ULONG, Release)() {
    release_log_->push_back(name_);
    return --ref_count_;
  }

  // IServiceProvider:
  STDMETHOD(QueryService)(REFGUID service_id, REFIID riid, void** object) {
    ++query_service_calls_;
    *object = NULL;
    if (!service_ || service_id != __uuidof(IAccessible2) ||
        riid != __uuidof(IAccessible2)) {
      return E_NOINTERFACE;
    }
    if (FAILED(query_service_result_))
      return query_service_result_;
    service_->AddRef();
    *object = static_cast<IUnknown*>(service_);
    return query_service_result_;
  }

 private:
  std::string name_;
  std::vector<std::string>* release_log_;
  ULONG ref_count_;
  FakeComObject* service_provider_;
  FakeComObject* service_;
  HRESULT query_service_result_;
  int query_service_calls_;

  DISALLOW_COPY_AND_ASSIGN(FakeComObject);
};

}  // namespace

class ExtendedInterfaceServiceTest : public ::testing::Test {
 protected:
  ExtendedInterfaceServiceTest()
      : accessible_("accessible", &release_log_),
        service_provider_("service_provider", &release_log_),
        extended_("extended", &release_log_) {}

  std::vector<std::string> release_log_;
  FakeComObject accessible_;
  FakeComObject service_provider_;
  FakeComObject extended_;
};

TEST_F(ExtendedInterfaceServiceTest, NullObject) {
  EXPECT_FALSE(ProbeExtendedInterfaceOnObject(NULL));
}

TEST_F(ExtendedInterfaceServiceTest, SucceedsAndReleasesInReverseOrder) {
  accessible_.set_service_provider(&service_provider_);
  service_provider_.set_service(&extended_);

  EXPECT_TRUE(ProbeExtendedInterfaceOnObject(&accessible_));
  EXPECT_EQ(1, service_provider_.query_service_calls());

  ASSERT_EQ(2u, release_log_.size());
  EXPECT_EQ("extended", release_log_[0]);
  EXPECT_EQ("service_provider", release_log_[1]);
  EXPECT_EQ(1u, accessible_.ref_count());
  EXPECT_EQ(1u, service_provider_.ref_count());
  EXPECT_EQ(1u, extended_.ref_count());
}

TEST_F(ExtendedInterfaceServiceTest, NoServiceProvider) {
  EXPECT_FALSE(ProbeExtendedInterfaceOnObject(&accessible_));
  EXPECT_TRUE(release_log_.empty());
  EXPECT_EQ(1u, accessible_.ref_count());
}

TEST_F(ExtendedInterfaceServiceTest, ServiceUnavailable) {
  accessible_.set_service_provider(&service_provider_);

  EXPECT_FALSE(ProbeExtendedInterfaceOnObject(&accessible_));
  EXPECT_EQ(1, service_provider_.query_service_calls());
  ASSERT_EQ(1u, release_log_.size());
  EXPECT_EQ("service_provider", release_log_[0]);
  EXPECT_EQ(1u, service_provider_.ref_count());
}

TEST_F(ExtendedInterfaceServiceTest, FalseAnswerReleasesTheService) {
  accessible_.set_service_provider(&service_provider_);
  service_provider_.set_service(&extended_);
  service_provider_.set_query_service_result(S_FALSE);

  base::win::ScopedComPtr<IAccessible2> extended;
  EXPECT_EQ(E_NOINTERFACE,
            QueryExtendedService(&service_provider_, extended.Receive()));
  EXPECT_FALSE(extended.get());
  EXPECT_EQ(1u, extended_.ref_count());
  EXPECT_FALSE(ProbeExtendedInterfaceOnObject(&accessible_));
}

TEST_F(ExtendedInterfaceServiceTest, GenericFailureMeansNoInterface) {
  accessible_.set_service_provider(&service_provider_);
  service_provider_.set_service(&extended_);
  service_provider_.set_query_service_result(E_FAIL);

  base::win::ScopedComPtr<IAccessible2> extended;
  EXPECT_EQ(E_NOINTERFACE,
            QueryExtendedService(&service_provider_, extended.Receive()));
}

TEST_F(ExtendedInterfaceServiceTest, DisconnectedServerIsReported) {
  accessible_.set_service_provider(&service_provider_);
  service_provider_.set_service(&extended_);
  service_provider_.set_query_service_result(RPC_E_DISCONNECTED);

  base::win::ScopedComPtr<IAccessible2> extended;
  EXPECT_EQ(RPC_E_DISCONNECTED,
            QueryExtendedService(&service_provider_, extended.Receive()));
  EXPECT_EQ(1u, extended_.ref_count());
}

}  // namespace screen_access
