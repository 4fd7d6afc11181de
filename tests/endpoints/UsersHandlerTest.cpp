/**
 * @file UsersHandlerTest.cpp
 * @brief Unit-тесты для UsersHandler
 *
 * /scim/{v}/Users поверх настоящих DirectoryService и InMemoryResourceStore
 */

#include <gtest/gtest.h>

#include "adapters/primary/UsersHandler.hpp"
#include "application/DirectoryService.hpp"
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

class UsersHandlerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        store_ = std::make_shared<adapters::secondary::InMemoryResourceStore>();
        auto settings = std::make_shared<settings::PolicySettings>("permissive", std::map<std::string, bool>{});
        auto policy = std::make_shared<application::PolicyResolver>(settings);
        directory_ = std::make_shared<application::DirectoryService>(store_, policy);

        v1Handler_ = std::make_unique<UsersHandler>(directory_, domain::Dialect::Legacy);
        v2Handler_ = std::make_unique<UsersHandler>(directory_, domain::Dialect::Current);
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
        req.setHeader("Content-Type", "application/json");

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

    std::string createUser(const std::string &userName)
    {
        json body = {{"userName", userName}};
        auto req = createRequest("POST", "/scim/v2/Users", body.dump());
        SimpleResponse res;
        v2Handler_->handle(req, res);
        EXPECT_EQ(res.getStatus(), 201);
        return parseJson(res.getBody())["id"].get<std::string>();
    }

    std::shared_ptr<adapters::secondary::InMemoryResourceStore> store_;
    std::shared_ptr<application::DirectoryService> directory_;
    std::unique_ptr<UsersHandler> v1Handler_;
    std::unique_ptr<UsersHandler> v2Handler_;
};

// ============================================================================
// ТЕСТЫ: POST /scim/{v}/Users
// ============================================================================

TEST_F(UsersHandlerTest, Create_Returns201WithMeta)
{
    json body = {
        {"userName", "alice"},
        {"displayName", "Alice"},
        {"password", "secret"},
        {"emails", json::array({{{"value", "alice@example.com"}, {"primary", true}}})}
    };
    auto req = createRequest("POST", "/scim/v2/Users", body.dump());
    req.setHeader("Host", "localhost:8080");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["schemas"][0], SCIM_V2_SCHEMA_USER);
    EXPECT_EQ(json["userName"], "alice");
    EXPECT_EQ(json["active"], true);
    EXPECT_EQ(json["emails"][0]["value"], "alice@example.com");
    EXPECT_FALSE(json.contains("password"));
    EXPECT_FALSE(json.contains("groups"));
    EXPECT_EQ(json["meta"]["resourceType"], "User");
    EXPECT_EQ(json["meta"]["created"], json["meta"]["lastModified"]);

    auto id = json["id"].get<std::string>();
    EXPECT_EQ(json["meta"]["location"], "http://localhost:8080/scim/v2/Users/" + id);
}

TEST_F(UsersHandlerTest, Create_DuplicateUserName_Returns409)
{
    createUser("alice");

    auto req = createRequest("POST", "/scim/v2/Users", R"({"userName": "alice"})");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 409);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["schemas"][0], SCIM_V2_ERROR);
    EXPECT_EQ(json["status"], 409);
    EXPECT_EQ(json["detail"], "User with userName 'alice' already exists");
}

TEST_F(UsersHandlerTest, Create_MissingUserName_Returns400)
{
    auto req = createRequest("POST", "/scim/v2/Users", R"({"displayName": "Nobody"})");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(store_->userCount(), 0u);
}

TEST_F(UsersHandlerTest, Create_MalformedBody_Returns400)
{
    auto req = createRequest("POST", "/scim/v2/Users", "{not json");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(UsersHandlerTest, Create_InvalidUtf8Body_Returns400)
{
    auto req = createRequest("POST", "/scim/v1/Users", "{\"userName\":\"a\xff\"}");
    SimpleResponse res;

    EXPECT_NO_THROW(v1Handler_->handle(req, res));

    EXPECT_EQ(res.getStatus(), 400);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["Errors"][0]["description"], "Invalid request body");
    EXPECT_EQ(store_->userCount(), 0u);
}

TEST_F(UsersHandlerTest, Get_InvalidUtf8Id_Returns404)
{
    auto req = createRequest("GET", "/scim/v2/Users/id\xfe", "", "/scim/v2/Users/*");
    SimpleResponse res;

    EXPECT_NO_THROW(v2Handler_->handle(req, res));

    EXPECT_EQ(res.getStatus(), 404);
    EXPECT_EQ(parseJson(res.getBody())["status"], 404);
}

TEST_F(UsersHandlerTest, Create_Legacy_KeepsEnterpriseUnderV1Urn)
{
    json body = {
        {"userName", "bob"},
        {domain::ENTERPRISE_URN_V1, {{"department", "R&D"}, {"manager", {{"managerId", "m-1"}}}}}
    };
    auto req = createRequest("POST", "/scim/v1/Users", body.dump());
    SimpleResponse res;

    v1Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 201);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["schemas"][0], SCIM_V1_SCHEMA_CORE);
    EXPECT_EQ(json["schemas"][1], domain::ENTERPRISE_URN_V1);
    EXPECT_EQ(json[domain::ENTERPRISE_URN_V1]["department"], "R&D");
    EXPECT_FALSE(json.contains(domain::ENTERPRISE_URN_V2));

    auto id = json["id"].get<std::string>();
    EXPECT_EQ(json["meta"]["location"], "/scim/v1/Users/" + id);
}

// ============================================================================
// ТЕСТЫ: GET /scim/{v}/Users
// ============================================================================

TEST_F(UsersHandlerTest, List_AppliesWindowAndReportsTotal)
{
    for (const auto &name : {"u1", "u2", "u3", "u4", "u5"})
    {
        createUser(name);
    }

    auto req = createRequest("GET", "/scim/v2/Users");
    req.setQueryParam("startIndex", "4");
    req.setQueryParam("count", "10");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["schemas"][0], SCIM_V2_LIST_RESPONSE);
    EXPECT_EQ(json["totalResults"], 5);
    EXPECT_EQ(json["startIndex"], 4);
    EXPECT_EQ(json["itemsPerPage"], 2);
    ASSERT_EQ(json["Resources"].size(), 2u);
    EXPECT_EQ(json["Resources"][0]["userName"], "u4");
}

TEST_F(UsersHandlerTest, List_CountZero_ReturnsOnlyTotal)
{
    createUser("alice");
    createUser("bob");

    auto req = createRequest("GET", "/scim/v2/Users");
    req.setQueryParam("count", "0");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["totalResults"], 2);
    EXPECT_EQ(json["itemsPerPage"], 0);
    EXPECT_TRUE(json["Resources"].empty());
}

TEST_F(UsersHandlerTest, List_Filter_ByUserName)
{
    createUser("alice");
    createUser("bob");

    auto req = createRequest("GET", "/scim/v1/Users");
    req.setQueryParam("filter", "userName eq \"bob\"");
    SimpleResponse res;

    v1Handler_->handle(req, res);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["schemas"][0], SCIM_V1_SCHEMA_CORE);
    EXPECT_EQ(json["totalResults"], 1);
    EXPECT_EQ(json["Resources"][0]["userName"], "bob");
}

TEST_F(UsersHandlerTest, List_InvalidStartIndex_Returns400)
{
    auto req = createRequest("GET", "/scim/v2/Users");
    req.setQueryParam("startIndex", "abc");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

// ============================================================================
// ТЕСТЫ: /scim/{v}/Users/{id}
// ============================================================================

TEST_F(UsersHandlerTest, Get_NotFound_ReturnsLegacyEnvelope)
{
    auto req = createRequest("GET", "/scim/v1/Users/missing", "", "/scim/v1/Users/*");
    SimpleResponse res;

    v1Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 404);

    auto json = parseJson(res.getBody());
    ASSERT_TRUE(json["Errors"].is_array());
    EXPECT_EQ(json["Errors"][0]["code"], 404);
    EXPECT_EQ(json["Errors"][0]["description"], "User missing not found");
}

TEST_F(UsersHandlerTest, Put_ReplacesAttributes)
{
    auto id = createUser("alice");

    auto req = createRequest("PUT", "/scim/v2/Users/" + id,
                             R"({"userName": "alice2", "title": "CTO", "active": false})",
                             "/scim/v2/Users/*");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["userName"], "alice2");
    EXPECT_EQ(json["title"], "CTO");
    EXPECT_EQ(json["active"], false);
}

TEST_F(UsersHandlerTest, CreateAndPut_ActiveAcceptsStringBoolean)
{
    auto create = createRequest("POST", "/scim/v2/Users", R"({"userName": "alice", "active": "FALSE"})");
    SimpleResponse created;
    v2Handler_->handle(create, created);

    ASSERT_EQ(created.getStatus(), 201);
    auto body = parseJson(created.getBody());
    EXPECT_EQ(body["active"], false);

    auto id = body["id"].get<std::string>();
    auto put = createRequest("PUT", "/scim/v2/Users/" + id, R"({"userName": "alice", "active": "True"})",
                             "/scim/v2/Users/*");
    SimpleResponse replaced;
    v2Handler_->handle(put, replaced);

    EXPECT_EQ(replaced.getStatus(), 200);
    EXPECT_EQ(parseJson(replaced.getBody())["active"], true);
}

TEST_F(UsersHandlerTest, Put_ActiveNotBoolean_Returns400)
{
    auto id = createUser("alice");

    auto req = createRequest("PUT", "/scim/v2/Users/" + id, R"({"userName": "alice", "active": "yes"})",
                             "/scim/v2/Users/*");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
    EXPECT_EQ(parseJson(res.getBody())["detail"], "Attribute 'active' must be a boolean");
}

TEST_F(UsersHandlerTest, Patch_Current_ReplaceAndRemove)
{
    auto id = createUser("alice");

    json body = {
        {"schemas", json::array({"urn:ietf:params:scim:api:messages:2.0:PatchOp"})},
        {"Operations", json::array({
            {{"op", "replace"}, {"path", "displayName"}, {"value", "Alice"}},
            {{"op", "Replace"}, {"value", {{"nickName", "Al"}, {"title", "Lead"}}}},
            {{"op", "remove"}, {"path", "title"}}
        })}
    };
    auto req = createRequest("PATCH", "/scim/v2/Users/" + id, body.dump(), "/scim/v2/Users/*");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["displayName"], "Alice");
    EXPECT_EQ(json["nickName"], "Al");
    EXPECT_FALSE(json.contains("title"));
}

TEST_F(UsersHandlerTest, Patch_Legacy_FlatAttributes)
{
    auto id = createUser("alice");

    auto req = createRequest("PATCH", "/scim/v1/Users/" + id,
                             R"({"title": "Engineer", "active": "false"})",
                             "/scim/v1/Users/*");
    SimpleResponse res;

    v1Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);

    auto json = parseJson(res.getBody());
    EXPECT_EQ(json["title"], "Engineer");
    EXPECT_EQ(json["active"], false);
}

TEST_F(UsersHandlerTest, Patch_NoValidOperations_Returns400)
{
    auto id = createUser("alice");

    auto req = createRequest("PATCH", "/scim/v2/Users/" + id,
                             R"({"Operations": [{"op": "move", "path": "title", "value": "x"}]})",
                             "/scim/v2/Users/*");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 400);
}

TEST_F(UsersHandlerTest, Delete_Returns204ThenGetReturns404)
{
    auto id = createUser("alice");

    auto deleteReq = createRequest("DELETE", "/scim/v2/Users/" + id, "", "/scim/v2/Users/*");
    SimpleResponse deleteRes;
    v2Handler_->handle(deleteReq, deleteRes);

    EXPECT_EQ(deleteRes.getStatus(), 204);
    EXPECT_TRUE(deleteRes.getBody().empty());

    auto getReq = createRequest("GET", "/scim/v2/Users/" + id, "", "/scim/v2/Users/*");
    SimpleResponse getRes;
    v2Handler_->handle(getReq, getRes);

    EXPECT_EQ(getRes.getStatus(), 404);
}

TEST_F(UsersHandlerTest, CrossDialect_SameUserVisibleInBoth)
{
    auto id = createUser("alice");

    auto req = createRequest("GET", "/scim/v1/Users/" + id, "", "/scim/v1/Users/*");
    SimpleResponse res;

    v1Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 200);
    EXPECT_EQ(parseJson(res.getBody())["userName"], "alice");
}

TEST_F(UsersHandlerTest, UnsupportedMethod_Returns405)
{
    auto req = createRequest("PUT", "/scim/v2/Users");
    SimpleResponse res;

    v2Handler_->handle(req, res);

    EXPECT_EQ(res.getStatus(), 405);
}

// ============================================================================
// ТЕСТЫ: полный набор необязательных атрибутов
// ============================================================================

TEST_F(UsersHandlerTest, RoundTrip_AllOptionalAttributesUnchanged)
{
    json body = {
        {"userName", "carol"},
        {"name", {{"formatted", "Carol C. Doe"}, {"familyName", "Doe"}, {"givenName", "Carol"},
                  {"middleName", "C."}, {"honorificPrefix", "Dr."}, {"honorificSuffix", "PhD"}}},
        {"displayName", "Carol"},
        {"nickName", "Caz"},
        {"profileUrl", "https://example.com/carol"},
        {"title", "Architect"},
        {"userType", "Employee"},
        {"preferredLanguage", "en-US"},
        {"locale", "en-US"},
        {"timezone", "Europe/Berlin"},
        {"active", false},
        {"externalId", "ext-7"},
        {"emails", json::array({{{"value", "carol@example.com"}, {"type", "work"}, {"primary", true}}})},
        {"phoneNumbers", json::array({{{"value", "+1-555-0100"}, {"type", "mobile"}}})},
        {"ims", json::array({{{"value", "carol_im"}, {"type", "xmpp"}}})},
        {"photos", json::array({{{"value", "https://example.com/carol.png"}, {"type", "photo"}}})},
        {"addresses", json::array({{{"streetAddress", "1 Main St"}, {"locality", "Berlin"},
                                    {"postalCode", "10115"}, {"country", "DE"}, {"type", "work"},
                                    {"primary", true}}})},
        {"entitlements", json::array({{{"value", "vpn"}}})},
        {"roles", json::array({{{"value", "admin"}, {"display", "Administrator"}}})},
        {"x509Certificates", json::array({{{"value", "MIIC..."}}})},
        {domain::ENTERPRISE_URN_V2, {{"employeeNumber", "42"}, {"costCenter", "CC-9"},
                                     {"organization", "Acme"}, {"division", "R&D"},
                                     {"department", "Platform"},
                                     {"manager", {{"value", "m-1"}, {"displayName", "Boss"}}}}}
    };

    auto createReq = createRequest("POST", "/scim/v2/Users", body.dump());
    SimpleResponse createRes;
    v2Handler_->handle(createReq, createRes);
    ASSERT_EQ(createRes.getStatus(), 201);
    auto id = parseJson(createRes.getBody())["id"].get<std::string>();

    auto getReq = createRequest("GET", "/scim/v2/Users/" + id, "", "/scim/v2/Users/*");
    SimpleResponse getRes;
    v2Handler_->handle(getReq, getRes);
    ASSERT_EQ(getRes.getStatus(), 200);

    auto user = parseJson(getRes.getBody());
    for (auto it = body.begin(); it != body.end(); ++it)
    {
        EXPECT_EQ(user[it.key()], it.value()) << "attribute " << it.key();
    }
}

TEST_F(UsersHandlerTest, RoundTrip_RequiredOnly_OmitsOptionalAttributes)
{
    auto id = createUser("dave");

    auto req = createRequest("GET", "/scim/v2/Users/" + id, "", "/scim/v2/Users/*");
    SimpleResponse res;
    v2Handler_->handle(req, res);

    auto user = parseJson(res.getBody());
    for (const auto &attribute : {"name", "displayName", "nickName", "profileUrl", "title", "userType",
                                  "preferredLanguage", "locale", "timezone", "externalId", "emails",
                                  "phoneNumbers", "ims", "photos", "addresses", "entitlements", "roles",
                                  "x509Certificates", "groups", "password"})
    {
        EXPECT_FALSE(user.contains(attribute)) << "attribute " << attribute;
    }
    EXPECT_FALSE(user.contains(domain::ENTERPRISE_URN_V2));
    EXPECT_EQ(user["schemas"].size(), 1u);
}
