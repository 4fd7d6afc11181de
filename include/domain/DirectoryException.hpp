#pragma once

#include "enums/ErrorKind.hpp"
#include <stdexcept>
#include <string>

namespace scim::domain {

/**
 * @brief Ожидаемая ошибка операции над каталогом
 *
 * Выбрасывается до фиксации изменений: состояние хранилища
 * после исключения остаётся прежним.
 */
class DirectoryException : public std::runtime_error {
public:
    DirectoryException(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const { return kind_; }

    static DirectoryException notFound(const std::string& resourceType, const std::string& id) {
        return DirectoryException(ErrorKind::NotFound, resourceType + " " + id + " not found");
    }

private:
    ErrorKind kind_;
};

} // namespace scim::domain
