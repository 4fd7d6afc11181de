#pragma once

#include "ports/input/IDirectoryService.hpp"
#include "ports/output/IResourceStore.hpp"
#include "application/PolicyResolver.hpp"
#include "application/PatchMerger.hpp"
#include "domain/DirectoryException.hpp"
#include <memory>

namespace scim::application {

/**
 * @brief Сервис каталога
 *
 * Реализует IDirectoryService поверх IResourceStore. Своего состояния нет:
 * проверка политики, нормализация PATCH, затем вызов хранилища.
 */
class DirectoryService : public ports::input::IDirectoryService {
public:
    DirectoryService(
        std::shared_ptr<ports::output::IResourceStore> store,
        std::shared_ptr<PolicyResolver> policy
    ) : store_(std::move(store))
      , policy_(std::move(policy))
    {}

    // ================================================================
    // Users (политикой не ограничиваются)
    // ================================================================

    domain::UserResource createUser(const domain::User& fields) override {
        if (fields.userName.empty()) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue, "userName is required");
        }
        return store_->createUser(fields);
    }

    domain::UserResource getUser(const std::string& id) override {
        auto user = store_->getUser(id);
        if (!user) {
            throw domain::DirectoryException::notFound("User", id);
        }
        return *user;
    }

    std::optional<domain::UserResource> getUserByName(const std::string& userName) override {
        return store_->getUserByName(userName);
    }

    domain::ListResult<domain::UserResource> listUsers(
        std::size_t startIndex, std::size_t count, const std::optional<std::string>& filter) override
    {
        return store_->listUsers(startIndex, count, filter);
    }

    domain::UserResource replaceUser(const std::string& id, const domain::User& fields) override {
        if (fields.userName.empty()) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue, "userName is required");
        }
        return store_->updateUser(id, fields);
    }

    domain::UserResource patchUser(const std::string& id, const domain::UserPatch& patch) override {
        auto mutations = PatchMerger::normalizeUserPatch(patch);
        return store_->applyUserMutations(id, mutations);
    }

    void deleteUser(const std::string& id) override {
        if (!store_->deleteUser(id)) {
            throw domain::DirectoryException::notFound("User", id);
        }
    }

    // ================================================================
    // Groups
    // ================================================================

    domain::Group createGroup(const domain::GroupDraft& draft) override {
        requireDisplayName(draft);
        return store_->createGroup(draft);
    }

    domain::Group getGroup(const std::string& id) override {
        auto group = store_->getGroup(id);
        if (!group) {
            throw domain::DirectoryException::notFound("Group", id);
        }
        return *group;
    }

    domain::ListResult<domain::Group> listGroups(
        std::size_t startIndex, std::size_t count, const std::optional<std::string>& filter) override
    {
        return store_->listGroups(startIndex, count, filter);
    }

    domain::Group replaceGroup(const std::string& id, const domain::GroupDraft& draft) override {
        requireCapability(domain::Capability::GroupsPut, "PUT");
        requireDisplayName(draft);
        return store_->updateGroup(id, draft);
    }

    domain::Group patchGroup(const std::string& id, const domain::GroupPatch& patch) override {
        requireCapability(domain::Capability::GroupsPatch, "PATCH");
        auto ops = PatchMerger::normalizeGroupPatch(patch);
        return store_->applyMemberOps(id, ops);
    }

    void deleteGroup(const std::string& id) override {
        if (!store_->deleteGroup(id)) {
            throw domain::DirectoryException::notFound("Group", id);
        }
    }

private:
    std::shared_ptr<ports::output::IResourceStore> store_;
    std::shared_ptr<PolicyResolver> policy_;

    void requireCapability(domain::Capability capability, const std::string& method) const {
        if (!policy_->isAllowed(capability)) {
            throw domain::DirectoryException(domain::ErrorKind::MethodNotAllowed,
                method + " on Groups is disabled (" + domain::toString(capability) + "=false)");
        }
    }

    static void requireDisplayName(const domain::GroupDraft& draft) {
        if (draft.displayName.empty()) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidValue, "displayName is required");
        }
    }
};

} // namespace scim::application
