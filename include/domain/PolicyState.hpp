#pragma once

#include <cstddef>
#include <map>
#include <string>

namespace scim::domain {

/**
 * @brief Снимок политики для инспекции
 *
 * Слои хранятся раздельно, чтобы можно было отличить
 * "false из-за override" от "false из-за профиля".
 */
struct PolicyState {
    std::string profile;
    std::map<std::string, bool> effective;     ///< Итоговые значения всех флагов
    std::map<std::string, bool> overrides;     ///< Runtime overrides
    std::map<std::string, bool> environment;   ///< Overrides из окружения
};

/**
 * @brief Состояние каталога для /admin/status
 */
struct DirectoryStatus {
    std::size_t users = 0;
    std::size_t groups = 0;
    PolicyState policy;
};

} // namespace scim::domain
