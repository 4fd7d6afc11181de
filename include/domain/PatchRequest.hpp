#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scim::domain {

/**
 * @brief Операция участника в PATCH группы SCIM 1.1
 *
 * {"value": "<user-id>", "operation": "add" | "delete"}
 */
struct LegacyMemberOperation {
    std::string value;
    std::string operation = "add";
};

/**
 * @brief PATCH группы SCIM 1.1: плоский список операций над участниками
 */
struct LegacyGroupPatch {
    std::vector<LegacyMemberOperation> members;
};

/**
 * @brief PATCH пользователя SCIM 1.1: плоская карта атрибут -> значение
 *
 * Ключ со значением null: тоже изменение (очистка атрибута).
 */
struct LegacyUserPatch {
    nlohmann::json attributes = nlohmann::json::object();
};

/**
 * @brief Операция SCIM 2.0: {"op", "path", "value"}
 */
struct PatchOperation {
    std::string op;
    std::optional<std::string> path;
    nlohmann::json value;
};

/**
 * @brief PATCH SCIM 2.0 (массив Operations)
 *
 * enterprise: значение enterprise URN-ключа верхнего уровня тела запроса,
 * если он был передан.
 */
struct CurrentPatch {
    std::vector<PatchOperation> operations;
    std::optional<nlohmann::json> enterprise;
};

using GroupPatch = std::variant<LegacyGroupPatch, CurrentPatch>;
using UserPatch = std::variant<LegacyUserPatch, CurrentPatch>;

} // namespace scim::domain
