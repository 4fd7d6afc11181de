#pragma once

#include "domain/User.hpp"
#include "domain/UserResource.hpp"
#include "domain/Group.hpp"
#include "domain/ListResult.hpp"
#include "domain/PatchRequest.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace scim::ports::input {

/**
 * @brief Единая точка входа для операций над пользователями и группами
 *
 * Input Port. Ожидаемые ошибки: domain::DirectoryException.
 * PUT и PATCH групп проверяются политикой до любого обращения к хранилищу.
 */
class IDirectoryService {
public:
    virtual ~IDirectoryService() = default;

    // Users

    virtual domain::UserResource createUser(const domain::User& fields) = 0;
    virtual domain::UserResource getUser(const std::string& id) = 0;
    virtual std::optional<domain::UserResource> getUserByName(const std::string& userName) = 0;
    virtual domain::ListResult<domain::UserResource> listUsers(
        std::size_t startIndex, std::size_t count, const std::optional<std::string>& filter) = 0;
    virtual domain::UserResource replaceUser(const std::string& id, const domain::User& fields) = 0;
    virtual domain::UserResource patchUser(const std::string& id, const domain::UserPatch& patch) = 0;
    virtual void deleteUser(const std::string& id) = 0;

    // Groups

    virtual domain::Group createGroup(const domain::GroupDraft& draft) = 0;
    virtual domain::Group getGroup(const std::string& id) = 0;
    virtual domain::ListResult<domain::Group> listGroups(
        std::size_t startIndex, std::size_t count, const std::optional<std::string>& filter) = 0;
    virtual domain::Group replaceGroup(const std::string& id, const domain::GroupDraft& draft) = 0;
    virtual domain::Group patchGroup(const std::string& id, const domain::GroupPatch& patch) = 0;
    virtual void deleteGroup(const std::string& id) = 0;
};

} // namespace scim::ports::input
