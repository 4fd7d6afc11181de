#pragma once

#include "ports/output/IResourceStore.hpp"
#include "application/FilterMatcher.hpp"
#include "domain/DirectoryException.hpp"
#include "utils/UuidGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <unordered_map>

namespace scim::adapters::secondary {

/**
 * @brief In-memory хранилище пользователей и групп
 *
 * Одна std::shared_mutex на всё хранилище: изменения под эксклюзивной
 * блокировкой, чтения под разделяемой. Каждое изменение собирается
 * на копии сущности и фиксируется только после всех проверок, поэтому
 * неудачный вызов ничего не меняет.
 *
 * Обратный индекс членства (userId -> groupIds) поддерживается
 * инкрементально при каждом изменении состава группы.
 */
class InMemoryResourceStore : public ports::output::IResourceStore {
public:
    InMemoryResourceStore() {
        std::cout << "[InMemoryResourceStore] Created" << std::endl;
    }

    // ================================================================
    // Users
    // ================================================================

    domain::UserResource createUser(const domain::User& fields) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        if (tables_.userNameIndex.count(fields.userName)) {
            throw userNameConflict(fields.userName);
        }

        domain::User user = fields;
        user.id = newId(tables_.users);
        user.meta = domain::ResourceMeta("User");

        tables_.userNameIndex[user.userName] = user.id;
        tables_.userOrder.push_back(user.id);
        auto& stored = tables_.users.emplace(user.id, std::move(user)).first->second;

        return toResource(tables_, stored);
    }

    std::optional<domain::UserResource> getUser(const std::string& id) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.users.find(id);
        if (it == tables_.users.end()) {
            return std::nullopt;
        }
        return toResource(tables_, it->second);
    }

    std::optional<domain::UserResource> getUserByName(const std::string& userName) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.userNameIndex.find(userName);
        if (it == tables_.userNameIndex.end()) {
            return std::nullopt;
        }
        return toResource(tables_, tables_.users.at(it->second));
    }

    domain::ListResult<domain::UserResource> listUsers(
        std::size_t startIndex,
        std::size_t count,
        const std::optional<std::string>& filter) override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto expression = parseFilter(filter);
        std::vector<const domain::User*> matched;
        for (const auto& id : tables_.userOrder) {
            const auto& user = tables_.users.at(id);
            if (!expression || application::FilterMatcher::matches(*expression, user)) {
                matched.push_back(&user);
            }
        }

        domain::ListResult<domain::UserResource> result;
        result.total = matched.size();
        forEachInWindow(matched, startIndex, count, [&](const domain::User* user) {
            result.items.push_back(toResource(tables_, *user));
        });
        return result;
    }

    domain::UserResource updateUser(const std::string& id, const domain::User& fields) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.users.find(id);
        if (it == tables_.users.end()) {
            throw domain::DirectoryException::notFound("User", id);
        }

        domain::User updated = it->second;
        updated.userName = fields.userName;
        updated.active = fields.active;
        overwriteIfPresent(updated.name, fields.name);
        overwriteIfPresent(updated.displayName, fields.displayName);
        overwriteIfPresent(updated.nickName, fields.nickName);
        overwriteIfPresent(updated.profileUrl, fields.profileUrl);
        overwriteIfPresent(updated.title, fields.title);
        overwriteIfPresent(updated.userType, fields.userType);
        overwriteIfPresent(updated.preferredLanguage, fields.preferredLanguage);
        overwriteIfPresent(updated.locale, fields.locale);
        overwriteIfPresent(updated.timezone, fields.timezone);
        overwriteIfPresent(updated.password, fields.password);
        overwriteIfPresent(updated.emails, fields.emails);
        overwriteIfPresent(updated.phoneNumbers, fields.phoneNumbers);
        overwriteIfPresent(updated.ims, fields.ims);
        overwriteIfPresent(updated.photos, fields.photos);
        overwriteIfPresent(updated.addresses, fields.addresses);
        overwriteIfPresent(updated.entitlements, fields.entitlements);
        overwriteIfPresent(updated.roles, fields.roles);
        overwriteIfPresent(updated.x509Certificates, fields.x509Certificates);
        overwriteIfPresent(updated.externalId, fields.externalId);
        overwriteIfPresent(updated.enterprise, fields.enterprise);

        return commitUser(it->second, std::move(updated));
    }

    domain::UserResource applyUserMutations(
        const std::string& id,
        const std::vector<domain::AttributeMutation>& mutations) override
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.users.find(id);
        if (it == tables_.users.end()) {
            throw domain::DirectoryException::notFound("User", id);
        }

        domain::User updated = it->second;
        for (const auto& mutation : mutations) {
            domain::applyMutation(updated, mutation);
        }

        return commitUser(it->second, std::move(updated));
    }

    bool deleteUser(const std::string& id) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.users.find(id);
        if (it == tables_.users.end()) {
            return false;
        }

        // Каскад: пользователь исчезает из всех групп вместе с собой
        auto membership = tables_.memberships.find(id);
        if (membership != tables_.memberships.end()) {
            for (const auto& groupId : membership->second) {
                auto& members = tables_.groups.at(groupId).members;
                members.erase(std::remove_if(members.begin(), members.end(),
                                             [&](const domain::Member& m) { return m.value == id; }),
                              members.end());
            }
            tables_.memberships.erase(membership);
        }

        tables_.userNameIndex.erase(it->second.userName);
        eraseFromOrder(tables_.userOrder, id);
        tables_.users.erase(it);
        return true;
    }

    // ================================================================
    // Groups
    // ================================================================

    domain::Group createGroup(const domain::GroupDraft& draft) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        domain::Group group;
        group.displayName = draft.displayName;
        group.externalId = draft.externalId;
        if (draft.members) {
            group.members = resolveMembers(tables_, *draft.members);
        }
        group.id = newId(tables_.groups);
        group.meta = domain::ResourceMeta("Group");

        indexMembers(tables_, group);
        tables_.groupOrder.push_back(group.id);
        return tables_.groups.emplace(group.id, group).first->second;
    }

    std::optional<domain::Group> getGroup(const std::string& id) override {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.groups.find(id);
        if (it == tables_.groups.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    domain::ListResult<domain::Group> listGroups(
        std::size_t startIndex,
        std::size_t count,
        const std::optional<std::string>& filter) override
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        auto expression = parseFilter(filter);
        std::vector<const domain::Group*> matched;
        for (const auto& id : tables_.groupOrder) {
            const auto& group = tables_.groups.at(id);
            if (!expression || application::FilterMatcher::matches(*expression, group)) {
                matched.push_back(&group);
            }
        }

        domain::ListResult<domain::Group> result;
        result.total = matched.size();
        forEachInWindow(matched, startIndex, count, [&](const domain::Group* group) {
            result.items.push_back(*group);
        });
        return result;
    }

    domain::Group updateGroup(const std::string& id, const domain::GroupDraft& draft) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.groups.find(id);
        if (it == tables_.groups.end()) {
            throw domain::DirectoryException::notFound("Group", id);
        }

        domain::Group updated = it->second;
        updated.displayName = draft.displayName;
        overwriteIfPresent(updated.externalId, draft.externalId);
        if (draft.members) {
            updated.members = resolveMembers(tables_, *draft.members);
        }

        return commitGroup(it->second, std::move(updated));
    }

    bool deleteGroup(const std::string& id) override {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.groups.find(id);
        if (it == tables_.groups.end()) {
            return false;
        }

        unindexMembers(tables_, it->second);
        eraseFromOrder(tables_.groupOrder, id);
        tables_.groups.erase(it);
        return true;
    }

    domain::Group applyMemberOps(
        const std::string& groupId,
        const std::vector<domain::MemberOp>& ops) override
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = tables_.groups.find(groupId);
        if (it == tables_.groups.end()) {
            throw domain::DirectoryException::notFound("Group", groupId);
        }

        domain::Group updated = it->second;
        for (const auto& op : ops) {
            if (op.kind == domain::MemberOpKind::Add) {
                if (updated.hasMember(op.memberId)) {
                    continue;
                }
                updated.members.emplace_back(op.memberId, requireUser(tables_, op.memberId).memberDisplay());
            } else {
                auto& members = updated.members;
                members.erase(std::remove_if(members.begin(), members.end(),
                                             [&](const domain::Member& m) { return m.value == op.memberId; }),
                              members.end());
            }
        }

        return commitGroup(it->second, std::move(updated));
    }

    // ================================================================
    // Administration
    // ================================================================

    domain::SeedResult seed(const domain::SeedData& data) override {
        // Новые таблицы собираются без блокировки и подменяются целиком
        Tables fresh;

        for (const auto& fields : data.users) {
            if (fresh.userNameIndex.count(fields.userName)) {
                throw userNameConflict(fields.userName);
            }
            domain::User user = fields;
            user.id = newId(fresh.users);
            user.meta = domain::ResourceMeta("User");

            fresh.userNameIndex[user.userName] = user.id;
            fresh.userOrder.push_back(user.id);
            fresh.users.emplace(user.id, std::move(user));
        }

        for (const auto& seedGroup : data.groups) {
            domain::Group group;
            group.id = newId(fresh.groups);
            group.displayName = seedGroup.displayName;
            group.externalId = seedGroup.externalId;
            group.meta = domain::ResourceMeta("Group");

            for (const auto& userName : seedGroup.memberUserNames) {
                auto user = fresh.userNameIndex.find(userName);
                if (user == fresh.userNameIndex.end() || group.hasMember(user->second)) {
                    continue;
                }
                group.members.emplace_back(user->second, fresh.users.at(user->second).memberDisplay());
            }

            indexMembers(fresh, group);
            fresh.groupOrder.push_back(group.id);
            fresh.groups.emplace(group.id, std::move(group));
        }

        domain::SeedResult result;
        result.users = fresh.users.size();
        result.groups = fresh.groups.size();

        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            std::swap(tables_, fresh);
        }

        std::cout << "[InMemoryResourceStore] Seeded " << result.users << " users, "
                  << result.groups << " groups" << std::endl;
        return result;
    }

    void clear() override {
        Tables empty;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            std::swap(tables_, empty);
        }
        std::cout << "[InMemoryResourceStore] Cleared" << std::endl;
    }

    std::size_t userCount() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tables_.users.size();
    }

    std::size_t groupCount() const override {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return tables_.groups.size();
    }

private:
    struct Tables {
        std::unordered_map<std::string, domain::User> users;
        std::vector<std::string> userOrder;                                     // порядок вставки
        std::unordered_map<std::string, std::string> userNameIndex;             // userName -> id
        std::unordered_map<std::string, domain::Group> groups;
        std::vector<std::string> groupOrder;
        std::unordered_map<std::string, std::set<std::string>> memberships;     // userId -> groupIds
    };

    mutable std::shared_mutex mutex_;
    Tables tables_;

    template <typename Map>
    static std::string newId(const Map& table) {
        auto id = utils::UuidGenerator::generate();
        if (table.count(id)) {
            throw domain::DirectoryException(domain::ErrorKind::Internal,
                "Identifier collision on " + id);
        }
        return id;
    }

    static domain::DirectoryException userNameConflict(const std::string& userName) {
        return domain::DirectoryException(domain::ErrorKind::Conflict,
            "User with userName '" + userName + "' already exists");
    }

    template <typename T>
    static void overwriteIfPresent(std::optional<T>& target, const std::optional<T>& source) {
        if (source) {
            target = source;
        }
    }

    static void eraseFromOrder(std::vector<std::string>& order, const std::string& id) {
        order.erase(std::remove(order.begin(), order.end(), id), order.end());
    }

    static std::optional<application::FilterExpression> parseFilter(const std::optional<std::string>& filter) {
        if (!filter || filter->empty()) {
            return std::nullopt;
        }
        return application::FilterMatcher::parse(*filter);
    }

    /**
     * @brief Окно [startIndex, startIndex + count) в 1-базной нумерации
     */
    template <typename T, typename Fn>
    static void forEachInWindow(const std::vector<T>& items, std::size_t startIndex, std::size_t count, Fn fn) {
        std::size_t begin = std::max<std::size_t>(startIndex, 1) - 1;
        for (std::size_t i = begin; i < items.size() && i - begin < count; ++i) {
            fn(items[i]);
        }
    }

    static const domain::User& requireUser(const Tables& tables, const std::string& userId) {
        auto it = tables.users.find(userId);
        if (it == tables.users.end()) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue,
                "Member " + userId + " does not reference an existing User");
        }
        return it->second;
    }

    /**
     * @brief Участники без повторов, display берётся из текущего пользователя
     * @throws DirectoryException(InvalidValue) для несуществующего пользователя
     */
    static std::vector<domain::Member> resolveMembers(const Tables& tables, const std::vector<domain::Member>& members) {
        std::vector<domain::Member> resolved;
        std::set<std::string> seen;
        for (const auto& member : members) {
            if (!seen.insert(member.value).second) {
                continue;
            }
            resolved.emplace_back(member.value, requireUser(tables, member.value).memberDisplay());
        }
        return resolved;
    }

    static void indexMembers(Tables& tables, const domain::Group& group) {
        for (const auto& member : group.members) {
            tables.memberships[member.value].insert(group.id);
        }
    }

    static void unindexMembers(Tables& tables, const domain::Group& group) {
        for (const auto& member : group.members) {
            auto it = tables.memberships.find(member.value);
            if (it == tables.memberships.end()) continue;
            it->second.erase(group.id);
            if (it->second.empty()) {
                tables.memberships.erase(it);
            }
        }
    }

    static domain::UserResource toResource(const Tables& tables, const domain::User& user) {
        domain::UserResource resource;
        resource.user = user;

        auto it = tables.memberships.find(user.id);
        if (it != tables.memberships.end()) {
            for (const auto& groupId : it->second) {
                resource.groups.push_back({groupId, tables.groups.at(groupId).displayName});
            }
        }
        return resource;
    }

    /**
     * @brief Зафиксировать изменённую копию пользователя (вызывается под блокировкой)
     */
    domain::UserResource commitUser(domain::User& current, domain::User updated) {
        if (updated.userName != current.userName) {
            auto owner = tables_.userNameIndex.find(updated.userName);
            if (owner != tables_.userNameIndex.end() && owner->second != current.id) {
                throw userNameConflict(updated.userName);
            }
            tables_.userNameIndex.erase(current.userName);
            tables_.userNameIndex[updated.userName] = current.id;
        }

        updated.meta.touch();
        current = std::move(updated);
        return toResource(tables_, current);
    }

    /**
     * @brief Зафиксировать изменённую копию группы и обновить обратный индекс
     */
    domain::Group commitGroup(domain::Group& current, domain::Group updated) {
        unindexMembers(tables_, current);
        indexMembers(tables_, updated);

        updated.meta.touch();
        current = std::move(updated);
        return current;
    }
};

} // namespace scim::adapters::secondary
