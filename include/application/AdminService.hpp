#pragma once

#include "ports/input/IAdminService.hpp"
#include "ports/output/IResourceStore.hpp"
#include "application/PolicyResolver.hpp"
#include <memory>

namespace scim::application {

/**
 * @brief Административный сервис
 *
 * seed и clearAll атомарны относительно обычных запросов:
 * хранилище подменяет таблицы за одну критическую секцию.
 */
class AdminService : public ports::input::IAdminService {
public:
    AdminService(
        std::shared_ptr<ports::output::IResourceStore> store,
        std::shared_ptr<PolicyResolver> policy
    ) : store_(std::move(store))
      , policy_(std::move(policy))
    {}

    domain::SeedResult seed(const domain::SeedData& data) override {
        return store_->seed(data);
    }

    void clearAll() override {
        store_->clear();
    }

    domain::DirectoryStatus status() override {
        domain::DirectoryStatus status;
        status.users = store_->userCount();
        status.groups = store_->groupCount();
        status.policy = policy_->snapshot();
        return status;
    }

    domain::PolicyState getPolicyState() override {
        return policy_->snapshot();
    }

    domain::PolicyState setProfile(const std::string& name) override {
        policy_->setProfile(name);
        return policy_->snapshot();
    }

    domain::PolicyState setOverride(const std::string& flag, bool value) override {
        policy_->setOverride(flag, value);
        return policy_->snapshot();
    }

    domain::PolicyState clearOverride(const std::string& flag) override {
        policy_->clearOverride(flag);
        return policy_->snapshot();
    }

private:
    std::shared_ptr<ports::output::IResourceStore> store_;
    std::shared_ptr<PolicyResolver> policy_;
};

} // namespace scim::application
