#pragma once

#include "enums/Dialect.hpp"
#include <optional>
#include <string>

namespace scim::domain {

/**
 * @brief Ссылка на руководителя
 *
 * В SCIM 1.1 приходит как {managerId, displayName},
 * в SCIM 2.0: как {value, $ref, displayName}. Хранится в общей форме.
 */
struct Manager {
    std::optional<std::string> value;
    std::optional<std::string> ref;
    std::optional<std::string> displayName;

    bool operator==(const Manager& other) const {
        return value == other.value
            && ref == other.ref
            && displayName == other.displayName;
    }
};

/**
 * @brief Enterprise-расширение пользователя
 *
 * Помнит версию протокола, из которой пришло: при выдаче
 * расширение кладётся под тот же URN-ключ.
 */
struct EnterpriseExtension {
    Dialect dialect = Dialect::Current;
    std::optional<std::string> employeeNumber;
    std::optional<std::string> costCenter;
    std::optional<std::string> organization;
    std::optional<std::string> division;
    std::optional<std::string> department;
    std::optional<Manager> manager;

    /**
     * @brief Наложить заполненные поля другого расширения поверх текущих
     *
     * При переходе на SCIM 1.1 manager.$ref отбрасывается: эта версия его не выдаёт.
     */
    void mergeFrom(const EnterpriseExtension& other) {
        dialect = other.dialect;
        if (other.employeeNumber) employeeNumber = other.employeeNumber;
        if (other.costCenter) costCenter = other.costCenter;
        if (other.organization) organization = other.organization;
        if (other.division) division = other.division;
        if (other.department) department = other.department;
        if (other.manager) manager = other.manager;
        if (dialect == Dialect::Legacy && manager) {
            manager->ref.reset();
        }
    }

    bool operator==(const EnterpriseExtension& other) const {
        return dialect == other.dialect
            && employeeNumber == other.employeeNumber
            && costCenter == other.costCenter
            && organization == other.organization
            && division == other.division
            && department == other.department
            && manager == other.manager;
    }
};

} // namespace scim::domain
