#pragma once

#include "User.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace scim::domain {

/**
 * @brief Изменяемые атрибуты пользователя верхнего уровня
 */
enum class UserAttribute {
    UserName,
    Name,
    DisplayName,
    NickName,
    ProfileUrl,
    Title,
    UserType,
    PreferredLanguage,
    Locale,
    Timezone,
    Password,
    Emails,
    PhoneNumbers,
    Ims,
    Photos,
    Addresses,
    Entitlements,
    Roles,
    X509Certificates,
    Active,
    ExternalId,
    Enterprise
};

/**
 * @brief Тип значения, которое принимает атрибут
 */
enum class AttributeKind {
    String,
    Bool,
    Name,
    MultiValued,
    Addresses,
    Enterprise
};

/**
 * @brief Значение мутации; std::monostate означает "очистить атрибут"
 */
using AttributeValue = std::variant<
    std::monostate,
    std::string,
    bool,
    Name,
    MultiValuedList,
    std::vector<Address>,
    EnterpriseExtension>;

/**
 * @brief Нормализованное изменение одного атрибута пользователя
 *
 * Обе версии PATCH сводятся к списку таких мутаций до обращения к хранилищу.
 */
struct AttributeMutation {
    UserAttribute attribute;
    AttributeValue value;

    AttributeMutation(UserAttribute attribute_, AttributeValue value_)
        : attribute(attribute_)
        , value(std::move(value_))
    {}

    static AttributeMutation clear(UserAttribute attribute) {
        return AttributeMutation(attribute, std::monostate{});
    }

    bool clears() const {
        return std::holds_alternative<std::monostate>(value);
    }
};

/**
 * @brief Имя атрибута SCIM -> UserAttribute (с учётом регистра)
 *
 * Enterprise не имеет имени атрибута: он адресуется URN-ключом.
 */
std::optional<UserAttribute> parseUserAttribute(const std::string& name);

std::string toString(UserAttribute attribute);

AttributeKind kindOf(UserAttribute attribute);

/**
 * @brief Применить мутацию к пользователю
 *
 * @throws DirectoryException(InvalidPatch) при очистке userName
 *         или несоответствии типа значения атрибуту
 */
void applyMutation(User& user, const AttributeMutation& mutation);

} // namespace scim::domain
