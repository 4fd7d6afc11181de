#pragma once

#include "domain/SeedData.hpp"
#include "domain/PolicyState.hpp"
#include <string>

namespace scim::ports::input {

/**
 * @brief Административные операции: начальные данные, очистка, политика
 */
class IAdminService {
public:
    virtual ~IAdminService() = default;

    /**
     * @brief Заменить всё содержимое каталога
     */
    virtual domain::SeedResult seed(const domain::SeedData& data) = 0;

    virtual void clearAll() = 0;

    virtual domain::DirectoryStatus status() = 0;

    virtual domain::PolicyState getPolicyState() = 0;

    /**
     * @throws DirectoryException(InvalidConfig) для неизвестного профиля
     */
    virtual domain::PolicyState setProfile(const std::string& name) = 0;

    /**
     * @throws DirectoryException(InvalidConfig) для неизвестного флага
     */
    virtual domain::PolicyState setOverride(const std::string& flag, bool value) = 0;

    virtual domain::PolicyState clearOverride(const std::string& flag) = 0;
};

} // namespace scim::ports::input
