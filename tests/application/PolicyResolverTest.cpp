/**
 * @file PolicyResolverTest.cpp
 * @brief Unit tests for PolicyResolver
 */

#include <gtest/gtest.h>
#include "application/PolicyResolver.hpp"

using namespace scim;
using namespace scim::application;
using domain::Capability;

class PolicyResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<PolicyResolver> create(const std::string& profile,
                                           std::map<std::string, bool> environment = {}) {
        auto settings = std::make_shared<settings::PolicySettings>(profile, std::move(environment));
        return std::make_shared<PolicyResolver>(settings);
    }
};

// ============================================================================
// PROFILES
// ============================================================================

TEST_F(PolicyResolverTest, Permissive_AllowsEverything) {
    auto policy = create("permissive");

    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPut));
    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPatch));
}

TEST_F(PolicyResolverTest, RestrictedPut_DisablesPutOnly) {
    auto policy = create("restricted-put");

    EXPECT_FALSE(policy->isAllowed(Capability::GroupsPut));
    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPatch));
}

TEST_F(PolicyResolverTest, RestrictedPatch_DisablesPatchOnly) {
    auto policy = create("restricted-patch");

    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPut));
    EXPECT_FALSE(policy->isAllowed(Capability::GroupsPatch));
}

TEST_F(PolicyResolverTest, Aliases_ResolveToCanonicalProfiles) {
    EXPECT_EQ(create("pingdirectory")->activeProfile(), "restricted-put");
    EXPECT_EQ(create("PUT_ONLY")->activeProfile(), "restricted-patch");
    EXPECT_EQ(create("Permissive")->activeProfile(), "permissive");
}

TEST_F(PolicyResolverTest, UnknownInitialProfile_ThrowsInvalidConfig) {
    try {
        create("strict");
        FAIL() << "Expected DirectoryException";
    } catch (const domain::DirectoryException& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::InvalidConfig);
    }
}

// ============================================================================
// PRECEDENCE
// ============================================================================

TEST_F(PolicyResolverTest, EnvironmentOverride_BeatsProfile) {
    auto policy = create("restricted-put", {{"groups_put", true}});

    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPut));
}

TEST_F(PolicyResolverTest, RuntimeOverride_BeatsEnvironment) {
    auto policy = create("permissive", {{"groups_patch", false}});
    ASSERT_FALSE(policy->isAllowed(Capability::GroupsPatch));

    policy->setOverride("groups_patch", true);

    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPatch));
}

TEST_F(PolicyResolverTest, ClearOverride_RevertsToProfile) {
    auto policy = create("restricted-put");

    policy->setOverride("groups_put", true);
    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPut));

    policy->clearOverride("groups_put");
    EXPECT_FALSE(policy->isAllowed(Capability::GroupsPut));
}

TEST_F(PolicyResolverTest, ProfileSwitch_ClearsRuntimeOverrides) {
    auto policy = create("restricted-put");
    policy->setOverride("groups_put", true);
    policy->setOverride("groups_patch", false);

    policy->setProfile("restricted-put");

    EXPECT_FALSE(policy->isAllowed(Capability::GroupsPut));
    EXPECT_TRUE(policy->isAllowed(Capability::GroupsPatch));
    EXPECT_TRUE(policy->snapshot().overrides.empty());
}

TEST_F(PolicyResolverTest, ProfileSwitch_KeepsEnvironmentLayer) {
    auto policy = create("permissive", {{"groups_patch", false}});

    policy->setProfile("restricted-put");

    EXPECT_FALSE(policy->isAllowed(Capability::GroupsPut));
    EXPECT_FALSE(policy->isAllowed(Capability::GroupsPatch));
}

// ============================================================================
// ERRORS
// ============================================================================

TEST_F(PolicyResolverTest, SetOverride_UnknownFlag_ThrowsInvalidConfig) {
    auto policy = create("permissive");

    try {
        policy->setOverride("users_delete", false);
        FAIL() << "Expected DirectoryException";
    } catch (const domain::DirectoryException& e) {
        EXPECT_EQ(e.kind(), domain::ErrorKind::InvalidConfig);
    }
    EXPECT_TRUE(policy->snapshot().overrides.empty());
}

TEST_F(PolicyResolverTest, ClearOverride_UnknownFlag_ThrowsInvalidConfig) {
    auto policy = create("permissive");

    EXPECT_THROW(policy->clearOverride("nope"), domain::DirectoryException);
}

TEST_F(PolicyResolverTest, SetProfile_Unknown_KeepsCurrentState) {
    auto policy = create("restricted-patch");
    policy->setOverride("groups_put", false);

    EXPECT_THROW(policy->setProfile("bogus"), domain::DirectoryException);

    EXPECT_EQ(policy->activeProfile(), "restricted-patch");
    EXPECT_EQ(policy->snapshot().overrides.at("groups_put"), false);
}

// ============================================================================
// SNAPSHOT
// ============================================================================

TEST_F(PolicyResolverTest, Snapshot_KeepsLayersDistinct) {
    auto policy = create("restricted-put", {{"groups_patch", true}});
    policy->setOverride("groups_put", false);

    auto state = policy->snapshot();

    EXPECT_EQ(state.profile, "restricted-put");
    EXPECT_EQ(state.effective.at("groups_put"), false);
    EXPECT_EQ(state.effective.at("groups_patch"), true);
    EXPECT_EQ(state.overrides.size(), 1u);
    EXPECT_EQ(state.overrides.at("groups_put"), false);
    EXPECT_EQ(state.environment.size(), 1u);
    EXPECT_EQ(state.environment.at("groups_patch"), true);
}

TEST_F(PolicyResolverTest, ParseBool_AcceptsCommonSpellings) {
    EXPECT_TRUE(settings::PolicySettings::parseBool("true"));
    EXPECT_TRUE(settings::PolicySettings::parseBool("YES"));
    EXPECT_TRUE(settings::PolicySettings::parseBool("1"));
    EXPECT_TRUE(settings::PolicySettings::parseBool("On"));
    EXPECT_FALSE(settings::PolicySettings::parseBool("false"));
    EXPECT_FALSE(settings::PolicySettings::parseBool("maybe"));
}
