#pragma once

#include <optional>
#include <string>

namespace scim::domain {

/**
 * @brief Почтовый адрес пользователя
 */
struct Address {
    std::optional<std::string> formatted;
    std::optional<std::string> streetAddress;
    std::optional<std::string> locality;
    std::optional<std::string> region;
    std::optional<std::string> postalCode;
    std::optional<std::string> country;
    std::optional<std::string> type;
    std::optional<bool> primary;

    bool operator==(const Address& other) const {
        return formatted == other.formatted
            && streetAddress == other.streetAddress
            && locality == other.locality
            && region == other.region
            && postalCode == other.postalCode
            && country == other.country
            && type == other.type
            && primary == other.primary;
    }

    bool operator!=(const Address& other) const { return !(*this == other); }
};

} // namespace scim::domain
