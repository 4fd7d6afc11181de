#pragma once

#include "ResourceMeta.hpp"
#include <optional>
#include <string>
#include <vector>

namespace scim::domain {

/**
 * @brief Участник группы
 */
struct Member {
    std::string value;                    ///< ID пользователя
    std::optional<std::string> display;   ///< Подпись на момент добавления
    std::string type = "User";

    Member() = default;

    explicit Member(const std::string& value_,
                    std::optional<std::string> display_ = std::nullopt)
        : value(value_)
        , display(std::move(display_))
    {}
};

/**
 * @brief Группа каталога
 */
struct Group {
    std::string id;
    std::string displayName;
    std::optional<std::string> externalId;
    std::vector<Member> members;
    ResourceMeta meta;

    bool hasMember(const std::string& userId) const {
        for (const auto& member : members) {
            if (member.value == userId) return true;
        }
        return false;
    }
};

/**
 * @brief Входные данные для создания/замены группы
 *
 * members == nullopt: список участников не передан (при замене не трогаем).
 */
struct GroupDraft {
    std::string displayName;
    std::optional<std::string> externalId;
    std::optional<std::vector<Member>> members;
};

} // namespace scim::domain
