#pragma once

#include "User.hpp"
#include <string>
#include <vector>

namespace scim::domain {

/**
 * @brief Ссылка на группу пользователя (вычисляется, не хранится)
 */
struct GroupRef {
    std::string value;     ///< ID группы
    std::string display;   ///< displayName группы
};

/**
 * @brief Пользователь вместе с производным списком групп
 *
 * groups строится из обратного индекса хранилища под той же
 * блокировкой, что и чтение пользователя.
 */
struct UserResource {
    User user;
    std::vector<GroupRef> groups;
};

} // namespace scim::domain
