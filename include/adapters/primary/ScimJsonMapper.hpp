#pragma once

#include "domain/User.hpp"
#include "domain/UserResource.hpp"
#include "domain/Group.hpp"
#include "domain/PatchRequest.hpp"
#include "domain/PolicyState.hpp"
#include "domain/SeedData.hpp"
#include "domain/enums/Dialect.hpp"
#include <nlohmann/json.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scim::adapters::primary {

inline const std::string SCIM_V1_SCHEMA_CORE = "urn:scim:schemas:core:1.0";
inline const std::string SCIM_V2_SCHEMA_USER = "urn:ietf:params:scim:schemas:core:2.0:User";
inline const std::string SCIM_V2_SCHEMA_GROUP = "urn:ietf:params:scim:schemas:core:2.0:Group";
inline const std::string SCIM_V2_LIST_RESPONSE = "urn:ietf:params:scim:api:messages:2.0:ListResponse";
inline const std::string SCIM_V2_ERROR = "urn:ietf:params:scim:api:messages:2.0:Error";

/**
 * @brief JSON <-> domain для одной версии протокола
 *
 * Разбор входа бросает nlohmann::json::exception при неверном типе или
 * отсутствии обязательного поля и DirectoryException(InvalidValue),
 * если тело не объект. Оба случая обработчики отдают как 400.
 */
class ScimJsonMapper {
public:
    explicit ScimJsonMapper(domain::Dialect dialect) : dialect_(dialect) {}

    domain::Dialect dialect() const { return dialect_; }

    /**
     * @brief "/scim/v1" или "/scim/v2"
     */
    std::string basePath() const;

    // Вход

    domain::User userFromJson(const nlohmann::json& body) const;
    domain::GroupDraft groupFromJson(const nlohmann::json& body) const;
    domain::UserPatch userPatchFromJson(const nlohmann::json& body) const;
    domain::GroupPatch groupPatchFromJson(const nlohmann::json& body) const;

    // Выход

    /**
     * @param host Значение заголовка Host; без него meta.location относительный
     */
    nlohmann::json userToJson(const domain::UserResource& resource, const std::optional<std::string>& host) const;
    nlohmann::json groupToJson(const domain::Group& group, const std::optional<std::string>& host) const;

    nlohmann::json listResponse(const std::vector<nlohmann::json>& resources,
                                std::size_t total,
                                std::size_t startIndex) const;

    nlohmann::json error(int status, const std::string& detail) const;

    // Административная поверхность (не зависит от версии)

    static domain::SeedData seedFromJson(const nlohmann::json& body);
    static nlohmann::json policyToJson(const domain::PolicyState& state);

private:
    domain::Dialect dialect_;

    std::string location(const std::optional<std::string>& host,
                         const std::string& resourceType,
                         const std::string& id) const;
};

} // namespace scim::adapters::primary
