/**
 * @file AdminHandlerTest.cpp
 * @brief Unit-тесты для AdminHandler
 *
 * /admin/*: загрузка данных, очистка, состояние политики
 */

#include <gtest/gtest.h>

#include "adapters/primary/AdminHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"
#include "application/AdminService.hpp"
#include "adapters/secondary/InMemoryResourceStore.hpp"

#include <SimpleRequest.hpp>
#include <SimpleResponse.hpp>
#include <nlohmann/json.hpp>

using namespace scim;
using namespace scim::adapters::primary;
using json = nlohmann::json;

// ============================================================================
// Test Fixture
// ============================================================================

class AdminHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store_ = std::make_shared<adapters::secondary::InMemoryResourceStore>();
        auto settings = std::make_shared<settings::PolicySettings>(
            "restricted-put", std::map<std::string, bool>{{"groups_patch", true}});
        policy_ = std::make_shared<application::PolicyResolver>(settings);
        auto adminService = std::make_shared<application::AdminService>(store_, policy_);
        handler_ = std::make_unique<AdminHandler>(adminService);
    }

    SimpleRequest createRequest(const std::string &method,
                                const std::string &path,
                                const std::string &body = "",
                                const std::string &pathPattern = "")
    {
        SimpleRequest req;
        req.setMethod(method);
        req.setPath(path);
        req.setBody(body);

        if (!pathPattern.empty())
        {
            req.setPathPattern(pathPattern);
        }

        return req;
    }

    json parseJson(const std::string &body)
    {
        return json::parse(body);
    }

    std::shared_ptr<adapters::secondary::InMemoryResourceStore> store_;
    std::shared_ptr<application::PolicyResolver> policy_;
    std::unique_ptr<AdminHandler> handler_;
};

// ============================================================================
// ТЕСТЫ: POST /admin/seed, DELETE /admin/clear
// ============================================================================

TEST_F(AdminHandlerTest, Seed_LoadsUsersAndGroups)
{
    json body = {
        {"users", json::array({
            {{"userName", "alice"}, {"displayName", "Alice"}},
            {{"userName", "bob"}}
        })},
        {"groups", json::array({
            {{"displayName", "Eng"}, {"members", json::array({"alice", "bob", "ghost"})}}
        })}
    };
    auto req = createRequest("POST", "/admin/seed", body.dump());
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["message"], "Data seeded successfully");
    EXPECT_EQ(json["users"], 2);
    EXPECT_EQ(json["groups"], 1);

    auto groups = store_->listGroups(1, 10, std::nullopt);
    ASSERT_EQ(groups.items.size(), 1u);
    EXPECT_EQ(groups.items[0].members.size(), 2u);
}

TEST_F(AdminHandlerTest, Seed_DuplicateUserName_Returns409)
{
    store_->createUser(domain::User("existing"));

    json body = {{"users", json::array({{{"userName", "dup"}}, {{"userName", "dup"}}})}};
    auto req = createRequest("POST", "/admin/seed", body.dump());
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);
    EXPECT_TRUE(parseJson(res.getBody()).contains("detail"));
    EXPECT_TRUE(store_->getUserByName("existing").has_value());
}

TEST_F(AdminHandlerTest, Seed_MalformedBody_Returns400)
{
    auto req = createRequest("POST", "/admin/seed", "[1, 2");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AdminHandlerTest, Seed_InvalidUtf8Body_Returns400)
{
    auto req = createRequest("POST", "/admin/seed", "{\"users\":[{\"userName\":\"\xc3\x28\"}]}");
    SimpleResponse res;

    EXPECT_NO_THROW(handler_->handle(req, res));

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["detail"], "Invalid request body");
    EXPECT_EQ(store_->userCount(), 0u);
}

TEST_F(AdminHandlerTest, Clear_RemovesEverything)
{
    store_->createUser(domain::User("alice"));

    auto req = createRequest("DELETE", "/admin/clear");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["message"], "All data cleared");
    EXPECT_EQ(store_->userCount(), 0u);
}

// ============================================================================
// ТЕСТЫ: GET /admin/status, GET /admin/config
// ============================================================================

TEST_F(AdminHandlerTest, Status_ReportsCountsAndConfig)
{
    store_->createUser(domain::User("alice"));

    auto req = createRequest("GET", "/admin/status");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["users"], 1);
    EXPECT_EQ(json["groups"], 0);
    EXPECT_EQ(json["config"]["preset"], "restricted-put");
}

TEST_F(AdminHandlerTest, Config_ShowsAllLayers)
{
    policy_->setOverride("groups_put", true);

    auto req = createRequest("GET", "/admin/config");
    SimpleResponse res;

    handler_->handle(req, res);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["preset"], "restricted-put");
    EXPECT_EQ(json["effective"]["groups_put"], true);
    EXPECT_EQ(json["effective"]["groups_patch"], true);
    EXPECT_EQ(json["overrides"]["groups_put"], true);
    EXPECT_EQ(json["environment"]["groups_patch"], true);
}

// ============================================================================
// ТЕСТЫ: PUT /admin/preset/{name}
// ============================================================================

TEST_F(AdminHandlerTest, Preset_SwitchesProfile)
{
    auto req = createRequest("PUT", "/admin/preset/restricted-patch", "", "/admin/preset/*");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["message"], "Preset changed to 'restricted-patch'");
    EXPECT_EQ(json["config"]["preset"], "restricted-patch");
    EXPECT_EQ(policy_->activeProfile(), "restricted-patch");
}

TEST_F(AdminHandlerTest, Preset_Unknown_Returns400)
{
    auto req = createRequest("PUT", "/admin/preset/locked", "", "/admin/preset/*");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);

    auto json = parseJson(res.getBody());
    EXPECT_NE(json["detail"].get<std::string>().find("Invalid preset 'locked'"), std::string::npos);
    EXPECT_EQ(policy_->activeProfile(), "restricted-put");
}

TEST_F(AdminHandlerTest, Mode_LegacyAliasAccepted)
{
    auto req = createRequest("PUT", "/admin/mode/pingdirectory", "", "/admin/mode/*");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(policy_->activeProfile(), "restricted-put");
}

// ============================================================================
// ТЕСТЫ: PUT/DELETE /admin/config/{flag}
// ============================================================================

TEST_F(AdminHandlerTest, SetOverride_AppliesValue)
{
    auto req = createRequest("PUT", "/admin/config/groups_put", "", "/admin/config/*");
    req.setQueryParam("value", "true");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["message"], "Override set: groups_put=true");
    EXPECT_TRUE(policy_->isAllowed(domain::Capability::GroupsPut));
}

TEST_F(AdminHandlerTest, SetOverride_MissingValue_Returns400)
{
    auto req = createRequest("PUT", "/admin/config/groups_put", "", "/admin/config/*");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(AdminHandlerTest, SetOverride_UnknownFlag_Returns400)
{
    auto req = createRequest("PUT", "/admin/config/users_delete", "", "/admin/config/*");
    req.setQueryParam("value", "false");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_TRUE(policy_->snapshot().overrides.empty());
}

TEST_F(AdminHandlerTest, ClearOverride_RevertsToPreset)
{
    policy_->setOverride("groups_put", true);

    auto req = createRequest("DELETE", "/admin/config/groups_put", "", "/admin/config/*");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["message"], "Override cleared: groups_put");
    EXPECT_FALSE(policy_->isAllowed(domain::Capability::GroupsPut));
}

TEST_F(AdminHandlerTest, UnknownRoute_Returns404)
{
    auto req = createRequest("GET", "/admin/unknown");
    SimpleResponse res;

    handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);
}

// ============================================================================
// ТЕСТЫ: GET /health
// ============================================================================

TEST_F(AdminHandlerTest, Health_ReportsBothDialects)
{
    HealthHandler health;
    auto req = createRequest("GET", "/health");
    SimpleResponse res;

    health.handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["status"], "ok");
    EXPECT_EQ(json["dialects"], json::parse(R"(["v1", "v2"])"));
}
