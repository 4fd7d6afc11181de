#pragma once

#include <optional>
#include <string>

namespace scim::domain {

/**
 * @brief Структурированное имя пользователя
 */
struct Name {
    std::optional<std::string> formatted;
    std::optional<std::string> familyName;
    std::optional<std::string> givenName;
    std::optional<std::string> middleName;
    std::optional<std::string> honorificPrefix;
    std::optional<std::string> honorificSuffix;

    bool operator==(const Name& other) const {
        return formatted == other.formatted
            && familyName == other.familyName
            && givenName == other.givenName
            && middleName == other.middleName
            && honorificPrefix == other.honorificPrefix
            && honorificSuffix == other.honorificSuffix;
    }

    bool operator!=(const Name& other) const { return !(*this == other); }
};

} // namespace scim::domain
