#include "domain/AttributeMutation.hpp"
#include "domain/DirectoryException.hpp"

namespace scim::domain {

namespace {

struct AttributeInfo {
    UserAttribute attribute;
    const char* name;
    AttributeKind kind;
};

const AttributeInfo kAttributes[] = {
    {UserAttribute::UserName,          "userName",          AttributeKind::String},
    {UserAttribute::Name,              "name",              AttributeKind::Name},
    {UserAttribute::DisplayName,       "displayName",       AttributeKind::String},
    {UserAttribute::NickName,          "nickName",          AttributeKind::String},
    {UserAttribute::ProfileUrl,        "profileUrl",        AttributeKind::String},
    {UserAttribute::Title,             "title",             AttributeKind::String},
    {UserAttribute::UserType,          "userType",          AttributeKind::String},
    {UserAttribute::PreferredLanguage, "preferredLanguage", AttributeKind::String},
    {UserAttribute::Locale,            "locale",            AttributeKind::String},
    {UserAttribute::Timezone,          "timezone",          AttributeKind::String},
    {UserAttribute::Password,          "password",          AttributeKind::String},
    {UserAttribute::Emails,            "emails",            AttributeKind::MultiValued},
    {UserAttribute::PhoneNumbers,      "phoneNumbers",      AttributeKind::MultiValued},
    {UserAttribute::Ims,               "ims",               AttributeKind::MultiValued},
    {UserAttribute::Photos,            "photos",            AttributeKind::MultiValued},
    {UserAttribute::Addresses,         "addresses",         AttributeKind::Addresses},
    {UserAttribute::Entitlements,      "entitlements",      AttributeKind::MultiValued},
    {UserAttribute::Roles,             "roles",             AttributeKind::MultiValued},
    {UserAttribute::X509Certificates,  "x509Certificates",  AttributeKind::MultiValued},
    {UserAttribute::Active,            "active",            AttributeKind::Bool},
    {UserAttribute::ExternalId,        "externalId",        AttributeKind::String},
    {UserAttribute::Enterprise,        "enterprise",        AttributeKind::Enterprise},
};

const AttributeInfo& infoOf(UserAttribute attribute) {
    for (const auto& info : kAttributes) {
        if (info.attribute == attribute) return info;
    }
    throw DirectoryException(ErrorKind::Internal, "Unknown user attribute");
}

std::optional<std::string> User::* stringField(UserAttribute attribute) {
    switch (attribute) {
        case UserAttribute::DisplayName: return &User::displayName;
        case UserAttribute::NickName: return &User::nickName;
        case UserAttribute::ProfileUrl: return &User::profileUrl;
        case UserAttribute::Title: return &User::title;
        case UserAttribute::UserType: return &User::userType;
        case UserAttribute::PreferredLanguage: return &User::preferredLanguage;
        case UserAttribute::Locale: return &User::locale;
        case UserAttribute::Timezone: return &User::timezone;
        case UserAttribute::Password: return &User::password;
        case UserAttribute::ExternalId: return &User::externalId;
        default: return nullptr;
    }
}

std::optional<MultiValuedList> User::* listField(UserAttribute attribute) {
    switch (attribute) {
        case UserAttribute::Emails: return &User::emails;
        case UserAttribute::PhoneNumbers: return &User::phoneNumbers;
        case UserAttribute::Ims: return &User::ims;
        case UserAttribute::Photos: return &User::photos;
        case UserAttribute::Entitlements: return &User::entitlements;
        case UserAttribute::Roles: return &User::roles;
        case UserAttribute::X509Certificates: return &User::x509Certificates;
        default: return nullptr;
    }
}

template <typename T>
const T& expect(const AttributeMutation& mutation) {
    if (const auto* value = std::get_if<T>(&mutation.value)) {
        return *value;
    }
    throw DirectoryException(ErrorKind::InvalidPatch,
        "Invalid value type for attribute '" + toString(mutation.attribute) + "'");
}

} // namespace

std::optional<UserAttribute> parseUserAttribute(const std::string& name) {
    for (const auto& info : kAttributes) {
        if (info.attribute != UserAttribute::Enterprise && name == info.name) {
            return info.attribute;
        }
    }
    return std::nullopt;
}

std::string toString(UserAttribute attribute) {
    return infoOf(attribute).name;
}

AttributeKind kindOf(UserAttribute attribute) {
    return infoOf(attribute).kind;
}

void applyMutation(User& user, const AttributeMutation& mutation) {
    const auto attribute = mutation.attribute;

    if (attribute == UserAttribute::UserName) {
        if (mutation.clears()) {
            throw DirectoryException(ErrorKind::InvalidPatch, "userName cannot be removed");
        }
        const auto& userName = expect<std::string>(mutation);
        if (userName.empty()) {
            throw DirectoryException(ErrorKind::InvalidPatch, "userName cannot be empty");
        }
        user.userName = userName;
        return;
    }

    if (attribute == UserAttribute::Active) {
        // active не бывает "отсутствующим": очистка возвращает значение по умолчанию
        user.active = mutation.clears() ? true : expect<bool>(mutation);
        return;
    }

    if (auto field = stringField(attribute)) {
        if (mutation.clears()) {
            (user.*field).reset();
        } else {
            user.*field = expect<std::string>(mutation);
        }
        return;
    }

    if (auto field = listField(attribute)) {
        if (mutation.clears()) {
            (user.*field).reset();
        } else {
            user.*field = expect<MultiValuedList>(mutation);
        }
        return;
    }

    switch (attribute) {
        case UserAttribute::Name:
            if (mutation.clears()) {
                user.name.reset();
            } else {
                user.name = expect<Name>(mutation);
            }
            return;

        case UserAttribute::Addresses:
            if (mutation.clears()) {
                user.addresses.reset();
            } else {
                user.addresses = expect<std::vector<Address>>(mutation);
            }
            return;

        case UserAttribute::Enterprise:
            if (mutation.clears()) {
                user.enterprise.reset();
            } else if (user.enterprise) {
                user.enterprise->mergeFrom(expect<EnterpriseExtension>(mutation));
            } else {
                user.enterprise = expect<EnterpriseExtension>(mutation);
            }
            return;

        default:
            throw DirectoryException(ErrorKind::Internal,
                "Unhandled user attribute '" + toString(attribute) + "'");
    }
}

} // namespace scim::domain
