#pragma once

#include "Name.hpp"
#include "Address.hpp"
#include "MultiValuedAttribute.hpp"
#include "EnterpriseExtension.hpp"
#include "ResourceMeta.hpp"
#include <optional>
#include <string>
#include <vector>

namespace scim::domain {

using MultiValuedList = std::vector<MultiValuedAttribute>;

/**
 * @brief Пользователь каталога
 *
 * Все необязательные атрибуты: std::optional: "атрибут не передан"
 * отличается от "атрибут очищен". password только принимается
 * и никогда не отдаётся наружу.
 */
struct User {
    std::string id;
    std::string userName;
    std::optional<Name> name;
    std::optional<std::string> displayName;
    std::optional<std::string> nickName;
    std::optional<std::string> profileUrl;
    std::optional<std::string> title;
    std::optional<std::string> userType;
    std::optional<std::string> preferredLanguage;
    std::optional<std::string> locale;
    std::optional<std::string> timezone;
    std::optional<std::string> password;
    std::optional<MultiValuedList> emails;
    std::optional<MultiValuedList> phoneNumbers;
    std::optional<MultiValuedList> ims;
    std::optional<MultiValuedList> photos;
    std::optional<std::vector<Address>> addresses;
    std::optional<MultiValuedList> entitlements;
    std::optional<MultiValuedList> roles;
    std::optional<MultiValuedList> x509Certificates;
    bool active = true;
    std::optional<std::string> externalId;
    std::optional<EnterpriseExtension> enterprise;
    ResourceMeta meta;

    User() = default;

    explicit User(const std::string& userName_) : userName(userName_) {}

    /**
     * @brief Подпись для Member.display: displayName, иначе userName
     */
    std::string memberDisplay() const {
        if (displayName && !displayName->empty()) {
            return *displayName;
        }
        return userName;
    }
};

} // namespace scim::domain
