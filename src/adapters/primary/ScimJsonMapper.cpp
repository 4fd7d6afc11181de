#include "adapters/primary/ScimJsonMapper.hpp"
#include "domain/serialization/ScimJson.hpp"
#include "domain/DirectoryException.hpp"

namespace scim::adapters::primary {

using domain::json_detail::readOptional;
using domain::json_detail::writeOptional;
using nlohmann::json;

namespace {

void requireObject(const json& body) {
    if (!body.is_object()) {
        throw domain::DirectoryException(domain::ErrorKind::InvalidValue, "Request body must be a JSON object");
    }
}

json metaToJson(const domain::ResourceMeta& meta, const std::string& location) {
    return {
        {"resourceType", meta.resourceType},
        {"created", meta.created.toString()},
        {"lastModified", meta.lastModified.toString()},
        {"location", location}
    };
}

std::vector<domain::PatchOperation> operationsFromJson(const json& body) {
    std::vector<domain::PatchOperation> operations;

    auto it = body.find("Operations");
    if (it == body.end() || !it->is_array()) {
        return operations;
    }

    for (const auto& item : *it) {
        if (!item.is_object()) continue;

        domain::PatchOperation operation;
        operation.op = item.value("op", "");
        operation.path = readOptional<std::string>(item, "path");
        operation.value = item.contains("value") ? item.at("value") : json();
        operations.push_back(std::move(operation));
    }
    return operations;
}

} // namespace

std::string ScimJsonMapper::basePath() const {
    return "/scim/" + domain::toString(dialect_);
}

std::string ScimJsonMapper::location(const std::optional<std::string>& host,
                                     const std::string& resourceType,
                                     const std::string& id) const {
    std::string path = basePath() + "/" + resourceType + "/" + id;
    if (host && !host->empty()) {
        return "http://" + *host + path;
    }
    return path;
}

// ============================================================================
// Вход
// ============================================================================

domain::User ScimJsonMapper::userFromJson(const json& body) const {
    requireObject(body);

    domain::User user(body.at("userName").get<std::string>());
    user.name = readOptional<domain::Name>(body, "name");
    user.displayName = readOptional<std::string>(body, "displayName");
    user.nickName = readOptional<std::string>(body, "nickName");
    user.profileUrl = readOptional<std::string>(body, "profileUrl");
    user.title = readOptional<std::string>(body, "title");
    user.userType = readOptional<std::string>(body, "userType");
    user.preferredLanguage = readOptional<std::string>(body, "preferredLanguage");
    user.locale = readOptional<std::string>(body, "locale");
    user.timezone = readOptional<std::string>(body, "timezone");
    user.password = readOptional<std::string>(body, "password");
    user.emails = readOptional<domain::MultiValuedList>(body, "emails");
    user.phoneNumbers = readOptional<domain::MultiValuedList>(body, "phoneNumbers");
    user.ims = readOptional<domain::MultiValuedList>(body, "ims");
    user.photos = readOptional<domain::MultiValuedList>(body, "photos");
    user.addresses = readOptional<std::vector<domain::Address>>(body, "addresses");
    user.entitlements = readOptional<domain::MultiValuedList>(body, "entitlements");
    user.roles = readOptional<domain::MultiValuedList>(body, "roles");
    user.x509Certificates = readOptional<domain::MultiValuedList>(body, "x509Certificates");
    auto active = body.find("active");
    if (active != body.end() && !active->is_null()) {
        auto flag = domain::json_detail::toBool(*active);
        if (!flag) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue,
                                             "Attribute 'active' must be a boolean");
        }
        user.active = *flag;
    }
    user.externalId = readOptional<std::string>(body, "externalId");

    auto enterprise = body.find(domain::enterpriseUrn(dialect_));
    if (enterprise != body.end() && !enterprise->is_null()) {
        user.enterprise = domain::enterpriseFromJson(*enterprise, dialect_);
    }

    return user;
}

domain::GroupDraft ScimJsonMapper::groupFromJson(const json& body) const {
    requireObject(body);

    domain::GroupDraft draft;
    draft.displayName = body.at("displayName").get<std::string>();
    draft.externalId = readOptional<std::string>(body, "externalId");

    auto members = body.find("members");
    if (members != body.end() && !members->is_null()) {
        std::vector<domain::Member> list;
        for (const auto& member : members->get<std::vector<json>>()) {
            list.emplace_back(member.at("value").get<std::string>());
        }
        draft.members = std::move(list);
    }

    return draft;
}

domain::UserPatch ScimJsonMapper::userPatchFromJson(const json& body) const {
    requireObject(body);

    if (dialect_ == domain::Dialect::Legacy) {
        return domain::LegacyUserPatch{body};
    }

    domain::CurrentPatch patch;
    patch.operations = operationsFromJson(body);
    auto enterprise = body.find(domain::ENTERPRISE_URN_V2);
    if (enterprise != body.end()) {
        patch.enterprise = *enterprise;
    }
    return patch;
}

domain::GroupPatch ScimJsonMapper::groupPatchFromJson(const json& body) const {
    requireObject(body);

    if (dialect_ == domain::Dialect::Legacy) {
        domain::LegacyGroupPatch patch;
        auto members = body.find("members");
        if (members != body.end() && members->is_array()) {
            for (const auto& item : *members) {
                if (!item.is_object()) continue;
                domain::LegacyMemberOperation operation;
                operation.value = item.value("value", "");
                operation.operation = item.value("operation", "add");
                patch.members.push_back(std::move(operation));
            }
        }
        return patch;
    }

    domain::CurrentPatch patch;
    patch.operations = operationsFromJson(body);
    return patch;
}

// ============================================================================
// Выход
// ============================================================================

json ScimJsonMapper::userToJson(const domain::UserResource& resource, const std::optional<std::string>& host) const {
    const auto& user = resource.user;

    json schemas = json::array();
    schemas.push_back(dialect_ == domain::Dialect::Legacy ? SCIM_V1_SCHEMA_CORE : SCIM_V2_SCHEMA_USER);
    if (user.enterprise) {
        schemas.push_back(domain::enterpriseUrn(user.enterprise->dialect));
    }

    json j;
    j["schemas"] = schemas;
    j["id"] = user.id;
    j["userName"] = user.userName;
    writeOptional(j, "name", user.name);
    writeOptional(j, "displayName", user.displayName);
    writeOptional(j, "nickName", user.nickName);
    writeOptional(j, "profileUrl", user.profileUrl);
    writeOptional(j, "title", user.title);
    writeOptional(j, "userType", user.userType);
    writeOptional(j, "preferredLanguage", user.preferredLanguage);
    writeOptional(j, "locale", user.locale);
    writeOptional(j, "timezone", user.timezone);
    writeOptional(j, "emails", user.emails);
    writeOptional(j, "phoneNumbers", user.phoneNumbers);
    writeOptional(j, "ims", user.ims);
    writeOptional(j, "photos", user.photos);
    writeOptional(j, "addresses", user.addresses);
    writeOptional(j, "entitlements", user.entitlements);
    writeOptional(j, "roles", user.roles);
    writeOptional(j, "x509Certificates", user.x509Certificates);
    j["active"] = user.active;
    writeOptional(j, "externalId", user.externalId);

    if (!resource.groups.empty()) {
        json groups = json::array();
        for (const auto& ref : resource.groups) {
            groups.push_back({{"value", ref.value}, {"display", ref.display}});
        }
        j["groups"] = groups;
    }

    if (user.enterprise) {
        j[domain::enterpriseUrn(user.enterprise->dialect)] = domain::enterpriseToJson(*user.enterprise);
    }

    j["meta"] = metaToJson(user.meta, location(host, "Users", user.id));
    return j;
}

json ScimJsonMapper::groupToJson(const domain::Group& group, const std::optional<std::string>& host) const {
    json j;
    j["schemas"] = json::array({dialect_ == domain::Dialect::Legacy ? SCIM_V1_SCHEMA_CORE : SCIM_V2_SCHEMA_GROUP});
    j["id"] = group.id;
    j["displayName"] = group.displayName;
    writeOptional(j, "externalId", group.externalId);

    json members = json::array();
    for (const auto& member : group.members) {
        json m;
        m["value"] = member.value;
        writeOptional(m, "display", member.display);
        m["type"] = member.type;
        members.push_back(m);
    }
    j["members"] = members;

    j["meta"] = metaToJson(group.meta, location(host, "Groups", group.id));
    return j;
}

json ScimJsonMapper::listResponse(const std::vector<json>& resources,
                                  std::size_t total,
                                  std::size_t startIndex) const {
    json j;
    j["schemas"] = json::array({dialect_ == domain::Dialect::Legacy ? SCIM_V1_SCHEMA_CORE : SCIM_V2_LIST_RESPONSE});
    j["totalResults"] = total;
    j["startIndex"] = startIndex;
    j["itemsPerPage"] = resources.size();
    j["Resources"] = resources;
    return j;
}

json ScimJsonMapper::error(int status, const std::string& detail) const {
    if (dialect_ == domain::Dialect::Legacy) {
        json entry = {{"description", detail}, {"code", status}};
        json errors = json::array();
        errors.push_back(entry);
        return {{"Errors", errors}};
    }
    return {
        {"schemas", json::array({SCIM_V2_ERROR})},
        {"detail", detail},
        {"status", status}
    };
}

// ============================================================================
// Администрирование
// ============================================================================

domain::SeedData ScimJsonMapper::seedFromJson(const json& body) {
    requireObject(body);

    const ScimJsonMapper mapper(domain::Dialect::Current);
    domain::SeedData data;

    auto users = body.find("users");
    if (users != body.end() && !users->is_null()) {
        for (const auto& user : users->get<std::vector<json>>()) {
            data.users.push_back(mapper.userFromJson(user));
        }
    }

    auto groups = body.find("groups");
    if (groups != body.end() && !groups->is_null()) {
        for (const auto& group : groups->get<std::vector<json>>()) {
            requireObject(group);
            domain::SeedGroup seedGroup;
            seedGroup.displayName = group.at("displayName").get<std::string>();
            seedGroup.externalId = readOptional<std::string>(group, "externalId");
            seedGroup.memberUserNames = readOptional<std::vector<std::string>>(group, "members")
                .value_or(std::vector<std::string>{});
            data.groups.push_back(std::move(seedGroup));
        }
    }

    return data;
}

json ScimJsonMapper::policyToJson(const domain::PolicyState& state) {
    return {
        {"preset", state.profile},
        {"effective", state.effective},
        {"overrides", state.overrides},
        {"environment", state.environment}
    };
}

} // namespace scim::adapters::primary
