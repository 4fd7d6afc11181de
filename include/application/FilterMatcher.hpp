#pragma once

#include "domain/User.hpp"
#include "domain/Group.hpp"
#include <optional>
#include <string>

namespace scim::application {

/**
 * @brief Разобранный фильтр: attribute eq "value"
 */
struct FilterExpression {
    std::string attribute;
    std::string value;
};

/**
 * @brief Фильтр из одного условия равенства
 *
 * Грамматика: `attributeName eq "value"` (или value без кавычек).
 * Имя атрибута и значение сравниваются с учётом регистра.
 * Строка, которую не удалось разобрать, не фильтрует ничего:
 * parse() возвращает nullopt и вызывающий отдаёт всё без фильтрации.
 */
class FilterMatcher {
public:
    static std::optional<FilterExpression> parse(const std::string& filter);

    static bool matches(const FilterExpression& expression, const domain::User& user);
    static bool matches(const FilterExpression& expression, const domain::Group& group);

    /**
     * @brief Строковое значение атрибута для сравнения; nullopt: атрибута нет
     */
    static std::optional<std::string> attributeValue(const domain::User& user, const std::string& attribute);
    static std::optional<std::string> attributeValue(const domain::Group& group, const std::string& attribute);
};

} // namespace scim::application
