// Copyright 2014 The Chromium Authors. All rights reserved.
// Use of this source code is governed by a BSD-style license that can be
// found in the LICENSE file.

#include "screen_access/provider_registry.h"

#include <memory>

#include "base/strings/utf_string_conversions.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "screen_access/backend_settings.h"
#include "screen_access/test/fake_accessibility_provider.h"

using base::ASCIIToUTF16;
using ::testing::_;
using ::testing::InSequence;
using ::testing::Property;

namespace screen_access {

namespace {

class MockRegistryObserver : public ProviderRegistry::Observer {
 public:
  MOCK_METHOD2(OnFocusChanged, void(BackendId, const AccessibleNode&));
  MOCK_METHOD1(OnEnabledBackendsChanged, void(BackendSet));
  MOCK_METHOD1(OnPreferredBackendChanged, void(BackendId));
};

}  // namespace

class ProviderRegistryTest : public ::testing::Test {
 protected:
  ProviderRegistryTest()
      : uia_(NULL), msaa_(NULL), ia2_(NULL), jab_(NULL) {}

  // Registers one fake per backend in cycling order.
  void RegisterAll() {
    uia_ = Register(BackendId::kTreeAutomation);
    msaa_ = Register(BackendId::kLegacyAccessible);
    ia2_ = Register(BackendId::kExtendedAccessible);
    jab_ = Register(BackendId::kToolkitBridge);
  }

  FakeAccessibilityProvider* Register(BackendId id) {
    FakeAccessibilityProvider* provider = new FakeAccessibilityProvider(id);
    EXPECT_TRUE(registry_.RegisterProvider(
        std::unique_ptr<AccessibilityProvider>(provider)));
    return provider;
  }

  // Enables |enabled|, prefers |preferred| and brings every enabled
  // provider up.
  void Start(BackendSet enabled, BackendId preferred) {
    BackendSettings settings;
    settings.enabled_backends = enabled;
    settings.preferred_backend = preferred;
    registry_.ApplySettings(settings);
    registry_.InitializeEnabledProviders();
    registry_.StartEventListening();
  }

  static BackendSet SetOf(BackendId a, BackendId b) {
    BackendSet set;
    set.Put(a);
    set.Put(b);
    return set;
  }

  ProviderRegistry registry_;
  FakeAccessibilityProvider* uia_;
  FakeAccessibilityProvider* msaa_;
  FakeAccessibilityProvider* ia2_;
  FakeAccessibilityProvider* jab_;
};

TEST_F(ProviderRegistryTest, Defaults) {
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kTreeAutomation));
  EXPECT_EQ(1u, registry_.enabled_backends().Size());
  EXPECT_TRUE(registry_.auto_switch_enabled());
  EXPECT_TRUE(registry_.EnumerateBackends().empty());
  EXPECT_FALSE(registry_.GetFocusedObject());
}

TEST_F(ProviderRegistryTest, DuplicateRegistrationIsDropped) {
  FakeAccessibilityProvider* first = Register(BackendId::kLegacyAccessible);
  EXPECT_FALSE(registry_.RegisterProvider(
      std::unique_ptr<AccessibilityProvider>(
          new FakeAccessibilityProvider(BackendId::kLegacyAccessible))));
  EXPECT_EQ(first, registry_.GetProvider(BackendId::kLegacyAccessible));
  EXPECT_EQ(1u, registry_.EnumerateBackends().size());
}

TEST_F(ProviderRegistryTest, EnumerateBackends) {
  RegisterAll();
  jab_->set_available(false);
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kToolkitBridge),
        BackendId::kTreeAutomation);

  std::vector<ProviderRegistry::BackendStatus> backends =
      registry_.EnumerateBackends();
  ASSERT_EQ(4u, backends.size());
  EXPECT_EQ(BackendId::kTreeAutomation, backends[0].id);
  EXPECT_TRUE(backends[0].available);
  EXPECT_TRUE(backends[0].enabled);
  EXPECT_EQ(BackendId::kLegacyAccessible, backends[1].id);
  EXPECT_FALSE(backends[1].enabled);
  EXPECT_EQ(BackendId::kToolkitBridge, backends[3].id);
  EXPECT_FALSE(backends[3].available);
  EXPECT_TRUE(backends[3].enabled);
}

TEST_F(ProviderRegistryTest, StartBringsUpOnlyEnabledAvailableProviders) {
  RegisterAll();
  jab_->set_available(false);
  Start(SetOf(BackendId::kLegacyAccessible, BackendId::kToolkitBridge),
        BackendId::kLegacyAccessible);

  EXPECT_TRUE(msaa_->IsActive());
  EXPECT_FALSE(uia_->IsInitialized());
  EXPECT_FALSE(ia2_->IsInitialized());
  EXPECT_FALSE(jab_->IsInitialized());
  EXPECT_EQ(0, jab_->initialize_count());
}

// The preferred backend answers and nobody else is asked.
TEST_F(ProviderRegistryTest, PreferredBackendAnswersFirst) {
  RegisterAll();
  Start(BackendSet::All(), BackendId::kExtendedAccessible);

  std::unique_ptr<AccessibleNode> node = registry_.GetFocusedObject();
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kExtendedAccessible, node->source());
  EXPECT_EQ(1, ia2_->query_count());
  EXPECT_EQ(0, uia_->query_count());
  EXPECT_EQ(0, msaa_->query_count());
  EXPECT_EQ(0, jab_->query_count());
}

// A null answer from the preferred backend falls through to the others in
// registration order.
TEST_F(ProviderRegistryTest, FallsBackInRegistrationOrder) {
  RegisterAll();
  Start(BackendSet::All(), BackendId::kExtendedAccessible);
  ia2_->set_returns_nodes(false);
  uia_->set_returns_nodes(false);

  std::unique_ptr<AccessibleNode> node = registry_.GetObjectFromPoint(5, 7);
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kLegacyAccessible, node->source());
  EXPECT_EQ(1, ia2_->query_count());
  EXPECT_EQ(1, uia_->query_count());
  EXPECT_EQ(1, msaa_->query_count());
  EXPECT_EQ(0, jab_->query_count());
  EXPECT_EQ(5, msaa_->last_point_x());
  EXPECT_EQ(7, msaa_->last_point_y());
}

TEST_F(ProviderRegistryTest, NobodyAnswers) {
  RegisterAll();
  Start(BackendSet::All(), BackendId::kTreeAutomation);
  uia_->set_returns_nodes(false);
  msaa_->set_returns_nodes(false);
  ia2_->set_returns_nodes(false);
  jab_->set_returns_nodes(false);

  EXPECT_FALSE(registry_.GetFocusedObject());
  EXPECT_EQ(1, uia_->query_count());
  EXPECT_EQ(1, msaa_->query_count());
  EXPECT_EQ(1, ia2_->query_count());
  EXPECT_EQ(1, jab_->query_count());
}

TEST_F(ProviderRegistryTest, DisabledAndInactiveProvidersAreSkipped) {
  RegisterAll();
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kToolkitBridge),
        BackendId::kTreeAutomation);
  uia_->set_returns_nodes(false);
  // Enabled but not listening.
  jab_->StopEventListening();

  EXPECT_FALSE(registry_.GetFocusedObject());
  EXPECT_EQ(0, msaa_->query_count());
  EXPECT_EQ(0, ia2_->query_count());
  EXPECT_EQ(0, jab_->query_count());
}

// A preferred backend that is not enabled is skipped without being asked.
TEST_F(ProviderRegistryTest, DisabledPreferredBackendIsSkipped) {
  RegisterAll();
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kLegacyAccessible),
        BackendId::kToolkitBridge);

  std::unique_ptr<AccessibleNode> node = registry_.GetFocusedObject();
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kTreeAutomation, node->source());
  EXPECT_EQ(0, jab_->query_count());
}

TEST_F(ProviderRegistryTest, NullHandleIsNeverRouted) {
  RegisterAll();
  Start(BackendSet::All(), BackendId::kTreeAutomation);
  EXPECT_FALSE(registry_.GetObjectFromHandle(kNullWindowHandle));
  EXPECT_EQ(0, uia_->query_count());

  std::unique_ptr<AccessibleNode> node = registry_.GetObjectFromHandle(0x99);
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kTreeAutomation, node->source());
}

TEST_F(ProviderRegistryTest, AccessibleObjectSkipsUnsupportingProviders) {
  RegisterAll();
  Start(BackendSet::All(), BackendId::kTreeAutomation);
  uia_->set_supports_elements(false);
  msaa_->set_supports_elements(false);

  NativeElementRef ref;
  ref.source = BackendId::kExtendedAccessible;
  ref.window = 0x10;
  std::unique_ptr<AccessibleNode> node = registry_.GetAccessibleObject(ref);
  ASSERT_TRUE(node);
  EXPECT_EQ(BackendId::kExtendedAccessible, node->source());
  EXPECT_EQ(0, uia_->query_count());
  EXPECT_EQ(0, msaa_->query_count());
}

TEST_F(ProviderRegistryTest, EnableAndDisable) {
  RegisterAll();
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kTreeAutomation),
        BackendId::kTreeAutomation);
  MockRegistryObserver observer;
  registry_.AddObserver(&observer);

  {
    InSequence sequence;
    EXPECT_CALL(observer,
                OnEnabledBackendsChanged(SetOf(BackendId::kTreeAutomation,
                                               BackendId::kToolkitBridge)));
    EXPECT_CALL(observer, OnEnabledBackendsChanged(
                              SetOf(BackendId::kTreeAutomation,
                                    BackendId::kTreeAutomation)));
  }

  registry_.SetEnabled(BackendId::kToolkitBridge, true);
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kToolkitBridge));
  EXPECT_TRUE(jab_->IsActive());

  registry_.SetEnabled(BackendId::kToolkitBridge, false);
  EXPECT_FALSE(registry_.IsEnabled(BackendId::kToolkitBridge));
  EXPECT_FALSE(jab_->IsActive());
  // Disabling leaves the provider initialized.
  EXPECT_TRUE(jab_->IsInitialized());
  EXPECT_EQ(1, jab_->remove_count());

  registry_.RemoveObserver(&observer);
}

TEST_F(ProviderRegistryTest, EnablingUnavailableBackendOnlyRecordsIt) {
  RegisterAll();
  ia2_->set_available(false);
  registry_.SetEnabled(BackendId::kExtendedAccessible, true);
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kExtendedAccessible));
  EXPECT_FALSE(ia2_->IsInitialized());
  EXPECT_FALSE(ia2_->IsActive());
}

TEST_F(ProviderRegistryTest, EnablingUnregisteredBackend) {
  registry_.SetEnabled(BackendId::kLegacyAccessible, true);
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kLegacyAccessible));
  EXPECT_FALSE(registry_.GetFocusedObject());
}

TEST_F(ProviderRegistryTest, SetPreferredNotifiesOnlyOnChange) {
  MockRegistryObserver observer;
  registry_.AddObserver(&observer);
  EXPECT_CALL(observer, OnPreferredBackendChanged(BackendId::kToolkitBridge))
      .Times(1);
  registry_.SetPreferredBackend(BackendId::kToolkitBridge);
  registry_.SetPreferredBackend(BackendId::kToolkitBridge);
  EXPECT_EQ(BackendId::kToolkitBridge, registry_.preferred_backend());
  registry_.RemoveObserver(&observer);
}

TEST_F(ProviderRegistryTest, CycleVisitsEveryAvailableBackendAndWraps) {
  RegisterAll();
  BackendId next = BackendId::kTreeAutomation;

  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kLegacyAccessible, next);
  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kExtendedAccessible, next);
  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kToolkitBridge, next);
  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kTreeAutomation, next);
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
}

TEST_F(ProviderRegistryTest, CycleSkipsUnavailableBackends) {
  RegisterAll();
  msaa_->set_available(false);
  ia2_->set_available(false);
  BackendId next = BackendId::kTreeAutomation;

  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kToolkitBridge, next);
  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kTreeAutomation, next);
}

TEST_F(ProviderRegistryTest, CycleSkipsUnregisteredBackends) {
  Register(BackendId::kTreeAutomation);
  Register(BackendId::kToolkitBridge);
  BackendId next = BackendId::kTreeAutomation;
  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kToolkitBridge, next);
}

TEST_F(ProviderRegistryTest, CycleWithSingleAvailableBackendStaysPut) {
  RegisterAll();
  uia_->set_available(false);
  ia2_->set_available(false);
  jab_->set_available(false);
  registry_.SetPreferredBackend(BackendId::kLegacyAccessible);

  BackendId next = BackendId::kTreeAutomation;
  ASSERT_TRUE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kLegacyAccessible, next);
}

TEST_F(ProviderRegistryTest, CycleFailsWhenNothingIsAvailable) {
  RegisterAll();
  uia_->set_available(false);
  msaa_->set_available(false);
  ia2_->set_available(false);
  jab_->set_available(false);

  BackendId next = BackendId::kToolkitBridge;
  EXPECT_FALSE(registry_.CyclePreferredBackend(&next));
  EXPECT_EQ(BackendId::kToolkitBridge, next);
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
}

TEST_F(ProviderRegistryTest, FocusEventsFromEnabledProvidersReachObservers) {
  RegisterAll();
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kLegacyAccessible),
        BackendId::kTreeAutomation);
  MockRegistryObserver observer;
  registry_.AddObserver(&observer);

  EXPECT_CALL(observer,
              OnFocusChanged(BackendId::kLegacyAccessible,
                             Property(&AccessibleNode::name,
                                      ASCIIToUTF16("Save"))));
  msaa_->SimulateFocusChanged(ASCIIToUTF16("Save"), 7);

  // Disabled providers are muted.
  EXPECT_CALL(observer, OnFocusChanged(BackendId::kToolkitBridge, _))
      .Times(0);
  jab_->SimulateFocusChanged(ASCIIToUTF16("Cancel"), 7);

  registry_.RemoveObserver(&observer);
}

TEST_F(ProviderRegistryTest, AutoSelectSwitchesAndEnables) {
  RegisterAll();
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kTreeAutomation),
        BackendId::kTreeAutomation);

  EXPECT_TRUE(registry_.AutoSelectBackendForProcess(
      ASCIIToUTF16("firefox.exe")));
  EXPECT_EQ(BackendId::kExtendedAccessible, registry_.preferred_backend());
  EXPECT_TRUE(registry_.IsEnabled(BackendId::kExtendedAccessible));
  EXPECT_TRUE(ia2_->IsActive());

  // Same process again: nothing to do.
  registry_.SetPreferredBackend(BackendId::kLegacyAccessible);
  EXPECT_FALSE(registry_.AutoSelectBackendForProcess(
      ASCIIToUTF16("Firefox.exe")));
  EXPECT_EQ(BackendId::kLegacyAccessible, registry_.preferred_backend());

  // Unmapped processes go back to tree automation.
  EXPECT_TRUE(registry_.AutoSelectBackendForProcess(
      ASCIIToUTF16("calc.exe")));
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
}

TEST_F(ProviderRegistryTest, AutoSelectFallsBackWhenTargetIsUnavailable) {
  RegisterAll();
  jab_->set_available(false);
  registry_.SetPreferredBackend(BackendId::kLegacyAccessible);

  EXPECT_TRUE(registry_.AutoSelectBackendForProcess(
      ASCIIToUTF16("javaw.exe")));
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
  EXPECT_FALSE(registry_.IsEnabled(BackendId::kToolkitBridge));
}

TEST_F(ProviderRegistryTest, AutoSelectRespectsSwitch) {
  RegisterAll();
  registry_.set_auto_switch_enabled(false);
  EXPECT_FALSE(registry_.AutoSelectBackendForProcess(
      ASCIIToUTF16("firefox.exe")));
  EXPECT_EQ(BackendId::kTreeAutomation, registry_.preferred_backend());
  EXPECT_FALSE(registry_.AutoSelectBackendForProcess(base::string16()));
}

TEST_F(ProviderRegistryTest, ProcessMappings) {
  EXPECT_EQ(BackendId::kToolkitBridge,
            registry_.GetSuggestedBackendForProcess(ASCIIToUTF16("javaw")));
  EXPECT_EQ(BackendId::kTreeAutomation,
            registry_.GetSuggestedBackendForProcess(ASCIIToUTF16("app.exe")));
  registry_.RegisterProcessMapping(ASCIIToUTF16("app.exe"),
                                   BackendId::kLegacyAccessible);
  EXPECT_EQ(BackendId::kLegacyAccessible,
            registry_.GetSuggestedBackendForProcess(ASCIIToUTF16("APP")));
}

TEST_F(ProviderRegistryTest, ShutdownIsIdempotent) {
  RegisterAll();
  Start(BackendSet::All(), BackendId::kTreeAutomation);

  registry_.Shutdown();
  registry_.Shutdown();
  EXPECT_TRUE(registry_.EnumerateBackends().empty());
  EXPECT_FALSE(registry_.GetProvider(BackendId::kTreeAutomation));
  EXPECT_FALSE(registry_.GetFocusedObject());
}

TEST_F(ProviderRegistryTest, ProcessExitReachesInitializedProviders) {
  RegisterAll();
  Start(SetOf(BackendId::kTreeAutomation, BackendId::kExtendedAccessible),
        BackendId::kTreeAutomation);

  registry_.ProcessExited(42);

  ASSERT_EQ(1u, uia_->forgotten_processes().size());
  EXPECT_EQ(42u, uia_->forgotten_processes()[0]);
  ASSERT_EQ(1u, ia2_->forgotten_processes().size());
  EXPECT_EQ(42u, ia2_->forgotten_processes()[0]);
  // Never initialized, so nothing to forget.
  EXPECT_TRUE(msaa_->forgotten_processes().empty());
  EXPECT_TRUE(jab_->forgotten_processes().empty());
}

}  // namespace screen_access
