#pragma once

#include <IHttpHandler.hpp>
#include "adapters/primary/ScimJsonMapper.hpp"
#include "adapters/primary/RequestParams.hpp"
#include "ports/input/IDirectoryService.hpp"
#include "domain/DirectoryException.hpp"
#include <nlohmann/json.hpp>
#include <iostream>
#include <memory>

namespace scim::adapters::primary {

/**
 * @brief HTTP Handler пользователей для одной версии протокола
 *
 * Endpoints ({v} = v1 | v2):
 * - GET    /scim/{v}/Users           (startIndex, count, filter)
 * - POST   /scim/{v}/Users
 * - GET    /scim/{v}/Users/{id}
 * - PUT    /scim/{v}/Users/{id}
 * - PATCH  /scim/{v}/Users/{id}
 * - DELETE /scim/{v}/Users/{id}
 */
class UsersHandler : public IHttpHandler
{
public:
    UsersHandler(
        std::shared_ptr<ports::input::IDirectoryService> directory,
        domain::Dialect dialect
    ) : directory_(std::move(directory))
      , mapper_(dialect)
    {
        std::cout << "[UsersHandler] Created for " << domain::toString(dialect) << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            const std::string method = req.getMethod();
            auto id = request_params::resourceId(req);

            if (!id) {
                if (method == "GET") {
                    handleList(req, res);
                } else if (method == "POST") {
                    handleCreate(req, res);
                } else {
                    sendError(res, 405, "Method not allowed");
                }
                return;
            }

            if (method == "GET") {
                auto user = directory_->getUser(*id);
                sendJson(res, 200, mapper_.userToJson(user, req.getHeader("Host")));
            } else if (method == "PUT") {
                auto fields = mapper_.userFromJson(nlohmann::json::parse(req.getBody()));
                auto user = directory_->replaceUser(*id, fields);
                sendJson(res, 200, mapper_.userToJson(user, req.getHeader("Host")));
            } else if (method == "PATCH") {
                auto patch = mapper_.userPatchFromJson(nlohmann::json::parse(req.getBody()));
                auto user = directory_->patchUser(*id, patch);
                sendJson(res, 200, mapper_.userToJson(user, req.getHeader("Host")));
            } else if (method == "DELETE") {
                directory_->deleteUser(*id);
                res.setStatus(204);
                res.setBody("");
            } else {
                sendError(res, 405, "Method not allowed");
            }

        } catch (const domain::DirectoryException& e) {
            sendError(res, domain::httpStatus(e.kind()), e.what());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[UsersHandler] Invalid body: " << e.what() << std::endl;
            sendError(res, 400, "Invalid request body");
        } catch (const std::exception& e) {
            std::cerr << "[UsersHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IDirectoryService> directory_;
    ScimJsonMapper mapper_;

    void handleList(IRequest& req, IResponse& res)
    {
        auto page = request_params::pagination(req);
        auto result = directory_->listUsers(page.startIndex, page.count, request_params::filter(req));

        auto host = req.getHeader("Host");
        std::vector<nlohmann::json> resources;
        for (const auto& user : result.items) {
            resources.push_back(mapper_.userToJson(user, host));
        }
        sendJson(res, 200, mapper_.listResponse(resources, result.total, page.startIndex));
    }

    void handleCreate(IRequest& req, IResponse& res)
    {
        auto fields = mapper_.userFromJson(nlohmann::json::parse(req.getBody()));
        auto user = directory_->createUser(fields);
        sendJson(res, 201, mapper_.userToJson(user, req.getHeader("Host")));
    }

    void sendJson(IResponse& res, int status, const nlohmann::json& body)
    {
        res.setResult(status, "application/json", body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }

    void sendError(IResponse& res, int status, const std::string& detail)
    {
        res.setResult(status, "application/json", mapper_.error(status, detail).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    }
};

} // namespace scim::adapters::primary
