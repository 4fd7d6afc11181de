#include "application/FilterMatcher.hpp"

#include <cctype>

namespace scim::application {

namespace {

const std::string kOperator = " eq ";

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

bool containsSpace(const std::string& s) {
    for (char c : s) {
        if (std::isspace(static_cast<unsigned char>(c))) return true;
    }
    return false;
}

} // namespace

std::optional<FilterExpression> FilterMatcher::parse(const std::string& filter) {
    auto trimmed = trim(filter);

    auto pos = trimmed.find(kOperator);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    auto attribute = trim(trimmed.substr(0, pos));
    auto rest = trim(trimmed.substr(pos + kOperator.size()));

    if (attribute.empty() || containsSpace(attribute) || rest.empty()) {
        return std::nullopt;
    }

    const char first = rest.front();
    if (first == '"' || first == '\'') {
        // Закрывающая кавычка должна быть последним символом: хвост вида
        // `"a" and x eq "b"` означает составной фильтр, который не поддерживается
        auto closing = rest.find(first, 1);
        if (closing == std::string::npos || closing != rest.size() - 1) {
            return std::nullopt;
        }
        return FilterExpression{attribute, rest.substr(1, rest.size() - 2)};
    }

    if (containsSpace(rest)) {
        return std::nullopt;
    }
    return FilterExpression{attribute, rest};
}

bool FilterMatcher::matches(const FilterExpression& expression, const domain::User& user) {
    auto value = attributeValue(user, expression.attribute);
    return value && *value == expression.value;
}

bool FilterMatcher::matches(const FilterExpression& expression, const domain::Group& group) {
    auto value = attributeValue(group, expression.attribute);
    return value && *value == expression.value;
}

std::optional<std::string> FilterMatcher::attributeValue(const domain::User& user, const std::string& attribute) {
    if (attribute == "id") return user.id;
    if (attribute == "userName") return user.userName;
    if (attribute == "displayName") return user.displayName;
    if (attribute == "externalId") return user.externalId;
    if (attribute == "nickName") return user.nickName;
    if (attribute == "title") return user.title;
    if (attribute == "userType") return user.userType;
    if (attribute == "profileUrl") return user.profileUrl;
    if (attribute == "preferredLanguage") return user.preferredLanguage;
    if (attribute == "locale") return user.locale;
    if (attribute == "timezone") return user.timezone;
    if (attribute == "active") return std::string(user.active ? "true" : "false");
    return std::nullopt;
}

std::optional<std::string> FilterMatcher::attributeValue(const domain::Group& group, const std::string& attribute) {
    if (attribute == "id") return group.id;
    if (attribute == "displayName") return group.displayName;
    if (attribute == "externalId") return group.externalId;
    return std::nullopt;
}

} // namespace scim::application
