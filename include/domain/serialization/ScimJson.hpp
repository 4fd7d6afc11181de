#pragma once

#include "domain/Name.hpp"
#include "domain/Address.hpp"
#include "domain/MultiValuedAttribute.hpp"
#include "domain/EnterpriseExtension.hpp"
#include "domain/DirectoryException.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

/**
 * @file ScimJson.hpp
 * @brief JSON-представление составных значений атрибутов SCIM
 *
 * from_json строгий по типам: неверный тип поля приводит к
 * nlohmann::json::type_error, объект не той формы приводит к
 * DirectoryException(InvalidValue). Неизвестные поля игнорируются.
 */

namespace scim::domain {

namespace json_detail {

template <typename T>
std::optional<T> readOptional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

template <typename T>
void writeOptional(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

/**
 * @brief Логическое значение: JSON bool или строка "true"/"false" в любом регистре
 * @return std::nullopt, если значение не приводится
 */
inline std::optional<bool> toBool(const nlohmann::json& value) {
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        auto lowered = value.get<std::string>();
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "true") return true;
        if (lowered == "false") return false;
    }
    return std::nullopt;
}

} // namespace json_detail

inline void to_json(nlohmann::json& j, const Name& name) {
    j = nlohmann::json::object();
    json_detail::writeOptional(j, "formatted", name.formatted);
    json_detail::writeOptional(j, "familyName", name.familyName);
    json_detail::writeOptional(j, "givenName", name.givenName);
    json_detail::writeOptional(j, "middleName", name.middleName);
    json_detail::writeOptional(j, "honorificPrefix", name.honorificPrefix);
    json_detail::writeOptional(j, "honorificSuffix", name.honorificSuffix);
}

inline void from_json(const nlohmann::json& j, Name& name) {
    if (!j.is_object()) {
        throw DirectoryException(ErrorKind::InvalidValue, "name must be an object");
    }
    name.formatted = json_detail::readOptional<std::string>(j, "formatted");
    name.familyName = json_detail::readOptional<std::string>(j, "familyName");
    name.givenName = json_detail::readOptional<std::string>(j, "givenName");
    name.middleName = json_detail::readOptional<std::string>(j, "middleName");
    name.honorificPrefix = json_detail::readOptional<std::string>(j, "honorificPrefix");
    name.honorificSuffix = json_detail::readOptional<std::string>(j, "honorificSuffix");
}

inline void to_json(nlohmann::json& j, const MultiValuedAttribute& attribute) {
    j = nlohmann::json::object();
    j["value"] = attribute.value;
    json_detail::writeOptional(j, "type", attribute.type);
    json_detail::writeOptional(j, "primary", attribute.primary);
    json_detail::writeOptional(j, "display", attribute.display);
}

inline void from_json(const nlohmann::json& j, MultiValuedAttribute& attribute) {
    attribute.value = j.at("value").get<std::string>();
    attribute.type = json_detail::readOptional<std::string>(j, "type");
    attribute.primary = json_detail::readOptional<bool>(j, "primary");
    attribute.display = json_detail::readOptional<std::string>(j, "display");
}

inline void to_json(nlohmann::json& j, const Address& address) {
    j = nlohmann::json::object();
    json_detail::writeOptional(j, "formatted", address.formatted);
    json_detail::writeOptional(j, "streetAddress", address.streetAddress);
    json_detail::writeOptional(j, "locality", address.locality);
    json_detail::writeOptional(j, "region", address.region);
    json_detail::writeOptional(j, "postalCode", address.postalCode);
    json_detail::writeOptional(j, "country", address.country);
    json_detail::writeOptional(j, "type", address.type);
    json_detail::writeOptional(j, "primary", address.primary);
}

inline void from_json(const nlohmann::json& j, Address& address) {
    if (!j.is_object()) {
        throw DirectoryException(ErrorKind::InvalidValue, "address must be an object");
    }
    address.formatted = json_detail::readOptional<std::string>(j, "formatted");
    address.streetAddress = json_detail::readOptional<std::string>(j, "streetAddress");
    address.locality = json_detail::readOptional<std::string>(j, "locality");
    address.region = json_detail::readOptional<std::string>(j, "region");
    address.postalCode = json_detail::readOptional<std::string>(j, "postalCode");
    address.country = json_detail::readOptional<std::string>(j, "country");
    address.type = json_detail::readOptional<std::string>(j, "type");
    address.primary = json_detail::readOptional<bool>(j, "primary");
}

/**
 * @brief Разобрать enterprise-расширение в форме указанной версии протокола
 *
 * SCIM 1.1: manager = {managerId, displayName}
 * SCIM 2.0: manager = {value, $ref, displayName}
 */
inline EnterpriseExtension enterpriseFromJson(const nlohmann::json& j, Dialect dialect) {
    if (!j.is_object()) {
        throw DirectoryException(ErrorKind::InvalidValue, "enterprise extension must be an object");
    }

    EnterpriseExtension extension;
    extension.dialect = dialect;
    extension.employeeNumber = json_detail::readOptional<std::string>(j, "employeeNumber");
    extension.costCenter = json_detail::readOptional<std::string>(j, "costCenter");
    extension.organization = json_detail::readOptional<std::string>(j, "organization");
    extension.division = json_detail::readOptional<std::string>(j, "division");
    extension.department = json_detail::readOptional<std::string>(j, "department");

    auto it = j.find("manager");
    if (it != j.end() && !it->is_null()) {
        if (!it->is_object()) {
            throw DirectoryException(ErrorKind::InvalidValue, "manager must be an object");
        }
        Manager manager;
        if (dialect == Dialect::Legacy) {
            manager.value = json_detail::readOptional<std::string>(*it, "managerId");
        } else {
            manager.value = json_detail::readOptional<std::string>(*it, "value");
            manager.ref = json_detail::readOptional<std::string>(*it, "$ref");
        }
        manager.displayName = json_detail::readOptional<std::string>(*it, "displayName");
        extension.manager = manager;
    }

    return extension;
}

/**
 * @brief Выдать enterprise-расширение в форме той версии, из которой оно пришло
 */
inline nlohmann::json enterpriseToJson(const EnterpriseExtension& extension) {
    nlohmann::json j = nlohmann::json::object();
    json_detail::writeOptional(j, "employeeNumber", extension.employeeNumber);
    json_detail::writeOptional(j, "costCenter", extension.costCenter);
    json_detail::writeOptional(j, "organization", extension.organization);
    json_detail::writeOptional(j, "division", extension.division);
    json_detail::writeOptional(j, "department", extension.department);

    if (extension.manager) {
        nlohmann::json manager = nlohmann::json::object();
        if (extension.dialect == Dialect::Legacy) {
            json_detail::writeOptional(manager, "managerId", extension.manager->value);
        } else {
            json_detail::writeOptional(manager, "value", extension.manager->value);
            json_detail::writeOptional(manager, "$ref", extension.manager->ref);
        }
        json_detail::writeOptional(manager, "displayName", extension.manager->displayName);
        j["manager"] = manager;
    }

    return j;
}

} // namespace scim::domain
