#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ScimJsonMapper.hpp"
#include "adapters/primary/RequestParams.hpp"
#include "ports/input/IAdminService.hpp"
#include "domain/DirectoryException.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace scim::adapters::primary {

/**
 * @brief HTTP Handler административной поверхности
 *
 * Endpoints:
 * - POST   /admin/seed
 * - DELETE /admin/clear
 * - GET    /admin/status
 * - GET    /admin/config
 * - PUT    /admin/preset/{name}
 * - PUT    /admin/config/{flag}?value=true|false
 * - DELETE /admin/config/{flag}
 * - PUT    /admin/mode/{name}     (устаревший алиас preset)
 */
class AdminHandler : public IHttpHandler
{
public:
    explicit AdminHandler(std::shared_ptr<ports::input::IAdminService> adminService)
        : adminService_(std::move(adminService))
    {
        std::cout << "[AdminHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            const std::string method = req.getMethod();
            const std::string path = req.getPath();

            if (method == "POST" && path == "/admin/seed") {
                handleSeed(req, res);
            } else if (method == "DELETE" && path == "/admin/clear") {
                adminService_->clearAll();
                sendJson(res, 200, {{"message", "All data cleared"}});
            } else if (method == "GET" && path == "/admin/status") {
                auto status = adminService_->status();
                sendJson(res, 200, {
                    {"users", status.users},
                    {"groups", status.groups},
                    {"config", ScimJsonMapper::policyToJson(status.policy)}
                });
            } else if (method == "GET" && path == "/admin/config") {
                sendJson(res, 200, ScimJsonMapper::policyToJson(adminService_->getPolicyState()));
            } else if (method == "PUT" && (startsWith(path, "/admin/preset/") || startsWith(path, "/admin/mode/"))) {
                auto name = requireName(req);
                auto state = adminService_->setProfile(name);
                sendConfig(res, "Preset changed to '" + name + "'", state);
            } else if (method == "PUT" && startsWith(path, "/admin/config/")) {
                handleSetOverride(req, res);
            } else if (method == "DELETE" && startsWith(path, "/admin/config/")) {
                auto flag = requireName(req);
                auto state = adminService_->clearOverride(flag);
                sendConfig(res, "Override cleared: " + flag, state);
            } else {
                sendError(res, 404, "Not found");
            }

        } catch (const domain::DirectoryException& e) {
            sendError(res, domain::httpStatus(e.kind()), e.what());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[AdminHandler] Invalid body: " << e.what() << std::endl;
            sendError(res, 400, "Invalid request body");
        } catch (const std::exception& e) {
            std::cerr << "[AdminHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IAdminService> adminService_;

    void handleSeed(IRequest& req, IResponse& res)
    {
        auto data = ScimJsonMapper::seedFromJson(nlohmann::json::parse(req.getBody()));
        auto result = adminService_->seed(data);

        sendJson(res, 200, {
            {"message", "Data seeded successfully"},
            {"users", result.users},
            {"groups", result.groups}
        });
    }

    void handleSetOverride(IRequest& req, IResponse& res)
    {
        auto flag = requireName(req);

        auto raw = req.getQueryParam("value");
        if (!raw) {
            sendError(res, 400, "Query parameter 'value' is required");
            return;
        }
        auto value = request_params::parseBool(*raw);
        if (!value) {
            sendError(res, 400, "Query parameter 'value' must be true or false");
            return;
        }

        auto state = adminService_->setOverride(flag, *value);
        sendConfig(res, "Override set: " + flag + "=" + (*value ? "true" : "false"), state);
    }

    static bool startsWith(const std::string& path, const std::string& prefix)
    {
        return path.compare(0, prefix.size(), prefix) == 0;
    }

    static std::string requireName(IRequest& req)
    {
        auto name = request_params::resourceId(req);
        if (!name) {
            throw domain::DirectoryException(domain::ErrorKind::InvalidConfig, "Name is required");
        }
        return *name;
    }

    void sendConfig(IResponse& res, const std::string& message, const domain::PolicyState& state)
    {
        sendJson(res, 200, {{"message", message}, {"config", ScimJsonMapper::policyToJson(state)}});
    }

    void sendJson(IResponse& res, int status, const nlohmann::json& body)
    {
        res.setResult(status, "application/json", body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void sendError(IResponse& res, int status, const std::string& detail)
    {
        nlohmann::json body = {{"detail", detail}};
        res.setResult(status, "application/json", body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
};

} // namespace scim::adapters::primary
