#pragma once

#include <BoostBeastApplication.hpp>
#include <boost/di.hpp>

// Settings
#include "settings/PolicySettings.hpp"

// Ports
#include "ports/input/IDirectoryService.hpp"
#include "ports/input/IAdminService.hpp"
#include "ports/output/IResourceStore.hpp"

// Application
#include "application/PolicyResolver.hpp"
#include "application/DirectoryService.hpp"
#include "application/AdminService.hpp"

// Secondary Adapters
#include "adapters/secondary/InMemoryResourceStore.hpp"

// Primary Adapters
#include "adapters/primary/UsersHandler.hpp"
#include "adapters/primary/GroupsHandler.hpp"
#include "adapters/primary/AdminHandler.hpp"
#include "adapters/primary/HealthHandler.hpp"

#include <iostream>
#include <memory>

namespace di = boost::di;

namespace scim
{

    /**
     * @brief SCIM Directory Service Application
     *
     * Обслуживает SCIM 1.1 (/scim/v1) и SCIM 2.0 (/scim/v2) поверх одного
     * in-memory хранилища, плюс административную поверхность /admin.
     */
    class ScimApp : public BoostBeastApplication
    {
    public:
        ScimApp() { std::cout << "[ScimApp] Initializing..." << std::endl; }
        ~ScimApp() override { std::cout << "[ScimApp] Shutting down..." << std::endl; }

    protected:
        void loadEnvironment(int argc, char *argv[]) override
        {
            BoostBeastApplication::loadEnvironment(argc, argv);
            std::cout << "[ScimApp] Environment loaded" << std::endl;
        }

        void configureInjection() override
        {
            std::cout << "[ScimApp] Configuring DI..." << std::endl;

            auto injector = di::make_injector(
                di::bind<settings::PolicySettings>().to(std::make_shared<settings::PolicySettings>()),
                di::bind<application::PolicyResolver>().in(di::singleton),

                di::bind<ports::output::IResourceStore>()
                    .to<adapters::secondary::InMemoryResourceStore>()
                    .in(di::singleton),

                di::bind<ports::input::IDirectoryService>().to<application::DirectoryService>().in(di::singleton),
                di::bind<ports::input::IAdminService>().to<application::AdminService>().in(di::singleton));

            auto directory = injector.create<std::shared_ptr<ports::input::IDirectoryService>>();

            // SCIM endpoints: по одному handler на ресурс и версию протокола
            for (auto dialect : {domain::Dialect::Legacy, domain::Dialect::Current}) {
                const std::string base = "/scim/" + domain::toString(dialect);

                auto usersHandler = std::make_shared<adapters::primary::UsersHandler>(directory, dialect);
                handlers_[getHandlerKey("GET", base + "/Users")] = usersHandler;
                handlers_[getHandlerKey("POST", base + "/Users")] = usersHandler;
                handlers_[getHandlerKey("GET", base + "/Users/*")] = usersHandler;
                handlers_[getHandlerKey("PUT", base + "/Users/*")] = usersHandler;
                handlers_[getHandlerKey("PATCH", base + "/Users/*")] = usersHandler;
                handlers_[getHandlerKey("DELETE", base + "/Users/*")] = usersHandler;

                auto groupsHandler = std::make_shared<adapters::primary::GroupsHandler>(directory, dialect);
                handlers_[getHandlerKey("GET", base + "/Groups")] = groupsHandler;
                handlers_[getHandlerKey("POST", base + "/Groups")] = groupsHandler;
                handlers_[getHandlerKey("GET", base + "/Groups/*")] = groupsHandler;
                handlers_[getHandlerKey("PUT", base + "/Groups/*")] = groupsHandler;
                handlers_[getHandlerKey("PATCH", base + "/Groups/*")] = groupsHandler;
                handlers_[getHandlerKey("DELETE", base + "/Groups/*")] = groupsHandler;

                std::cout << "[ScimApp] Registered " << base << "/Users, " << base << "/Groups" << std::endl;
            }

            // Admin endpoints
            {
                auto adminHandler = injector.create<std::shared_ptr<adapters::primary::AdminHandler>>();
                handlers_[getHandlerKey("POST", "/admin/seed")] = adminHandler;
                handlers_[getHandlerKey("DELETE", "/admin/clear")] = adminHandler;
                handlers_[getHandlerKey("GET", "/admin/status")] = adminHandler;
                handlers_[getHandlerKey("GET", "/admin/config")] = adminHandler;
                handlers_[getHandlerKey("PUT", "/admin/preset/*")] = adminHandler;
                handlers_[getHandlerKey("PUT", "/admin/config/*")] = adminHandler;
                handlers_[getHandlerKey("DELETE", "/admin/config/*")] = adminHandler;
                handlers_[getHandlerKey("PUT", "/admin/mode/*")] = adminHandler;
            }

            handlers_[getHandlerKey("GET", "/health")] = injector.create<std::shared_ptr<adapters::primary::HealthHandler>>();

            auto policy = injector.create<std::shared_ptr<application::PolicyResolver>>();
            std::cout << "[ScimApp] Ready: " << handlers_.size() << " routes, profile '"
                      << policy->activeProfile() << "'" << std::endl;
        }
    };

} // namespace scim
