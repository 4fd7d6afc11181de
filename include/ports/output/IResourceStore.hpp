#pragma once

#include "domain/User.hpp"
#include "domain/UserResource.hpp"
#include "domain/Group.hpp"
#include "domain/MemberOp.hpp"
#include "domain/AttributeMutation.hpp"
#include "domain/ListResult.hpp"
#include "domain/SeedData.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace scim::ports::output {

/**
 * @brief Интерфейс хранилища пользователей и групп
 *
 * Output Port. Владеет обеими таблицами, обратным индексом членства
 * и метаданными жизненного цикла. Ошибки: domain::DirectoryException.
 */
class IResourceStore {
public:
    virtual ~IResourceStore() = default;

    // ------------------------------------------------------------------
    // Users
    // ------------------------------------------------------------------

    /**
     * @brief Создать пользователя с новым ID
     * @throws DirectoryException(Conflict) если userName занят
     */
    virtual domain::UserResource createUser(const domain::User& fields) = 0;

    virtual std::optional<domain::UserResource> getUser(const std::string& id) = 0;

    virtual std::optional<domain::UserResource> getUserByName(const std::string& userName) = 0;

    /**
     * @brief Список пользователей: фильтр, затем total, затем окно startIndex/count
     * @param startIndex Индекс с 1
     */
    virtual domain::ListResult<domain::UserResource> listUsers(
        std::size_t startIndex,
        std::size_t count,
        const std::optional<std::string>& filter) = 0;

    /**
     * @brief Замена пользователя: перезаписывает userName и active всегда,
     *        остальные атрибуты: только переданные
     * @throws DirectoryException(NotFound | Conflict)
     */
    virtual domain::UserResource updateUser(const std::string& id, const domain::User& fields) = 0;

    /**
     * @brief Применить нормализованные мутации атомарно
     * @throws DirectoryException(NotFound | Conflict | InvalidPatch)
     */
    virtual domain::UserResource applyUserMutations(
        const std::string& id,
        const std::vector<domain::AttributeMutation>& mutations) = 0;

    /**
     * @brief Удалить пользователя и убрать его из всех групп
     * @return false если пользователь не найден
     */
    virtual bool deleteUser(const std::string& id) = 0;

    // ------------------------------------------------------------------
    // Groups
    // ------------------------------------------------------------------

    /**
     * @throws DirectoryException(InvalidValue) если участник не найден
     */
    virtual domain::Group createGroup(const domain::GroupDraft& draft) = 0;

    virtual std::optional<domain::Group> getGroup(const std::string& id) = 0;

    virtual domain::ListResult<domain::Group> listGroups(
        std::size_t startIndex,
        std::size_t count,
        const std::optional<std::string>& filter) = 0;

    /**
     * @throws DirectoryException(NotFound | InvalidValue)
     */
    virtual domain::Group updateGroup(const std::string& id, const domain::GroupDraft& draft) = 0;

    virtual bool deleteGroup(const std::string& id) = 0;

    /**
     * @brief Применить операции над участниками по порядку
     *
     * add идемпотентен и не обновляет display существующей записи,
     * remove удаляет все совпадения. Изменения фиксируются целиком или никак.
     *
     * @throws DirectoryException(NotFound | InvalidValue)
     */
    virtual domain::Group applyMemberOps(
        const std::string& groupId,
        const std::vector<domain::MemberOp>& ops) = 0;

    // ------------------------------------------------------------------
    // Administration
    // ------------------------------------------------------------------

    /**
     * @brief Атомарно заменить всё содержимое хранилища начальными данными
     *
     * Участники групп задаются по userName и разрешаются в ID созданных
     * пользователей; неизвестные имена пропускаются.
     *
     * @throws DirectoryException(Conflict) при повторяющемся userName
     */
    virtual domain::SeedResult seed(const domain::SeedData& data) = 0;

    virtual void clear() = 0;

    virtual std::size_t userCount() const = 0;
    virtual std::size_t groupCount() const = 0;
};

} // namespace scim::ports::output
