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
 * @brief HTTP Handler групп для одной версии протокола
 *
 * Endpoints ({v} = v1 | v2):
 * - GET    /scim/{v}/Groups          (startIndex, count, filter)
 * - POST   /scim/{v}/Groups
 * - GET    /scim/{v}/Groups/{id}
 * - PUT    /scim/{v}/Groups/{id}     (groups_put)
 * - PATCH  /scim/{v}/Groups/{id}     (groups_patch)
 * - DELETE /scim/{v}/Groups/{id}
 */
class GroupsHandler : public IHttpHandler
{
public:
    GroupsHandler(
        std::shared_ptr<ports::input::IDirectoryService> directory,
        domain::Dialect dialect
    ) : directory_(std::move(directory))
      , mapper_(dialect)
    {
        std::cout << "[GroupsHandler] Created for " << domain::toString(dialect) << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        try {
            const std::string method = req.getMethod();
            auto id = request_params::resourceId(req);
            auto host = req.getHeader("Host");

            if (!id) {
                if (method == "GET") {
                    auto page = request_params::pagination(req);
                    auto result = directory_->listGroups(page.startIndex, page.count, request_params::filter(req));

                    std::vector<nlohmann::json> resources;
                    for (const auto& group : result.items) {
                        resources.push_back(mapper_.groupToJson(group, host));
                    }
                    sendJson(res, 200, mapper_.listResponse(resources, result.total, page.startIndex));
                } else if (method == "POST") {
                    auto draft = mapper_.groupFromJson(nlohmann::json::parse(req.getBody()));
                    sendJson(res, 201, mapper_.groupToJson(directory_->createGroup(draft), host));
                } else {
                    sendError(res, 405, "Method not allowed");
                }
                return;
            }

            if (method == "GET") {
                sendJson(res, 200, mapper_.groupToJson(directory_->getGroup(*id), host));
            } else if (method == "PUT") {
                auto draft = mapper_.groupFromJson(nlohmann::json::parse(req.getBody()));
                sendJson(res, 200, mapper_.groupToJson(directory_->replaceGroup(*id, draft), host));
            } else if (method == "PATCH") {
                auto patch = mapper_.groupPatchFromJson(nlohmann::json::parse(req.getBody()));
                sendJson(res, 200, mapper_.groupToJson(directory_->patchGroup(*id, patch), host));
            } else if (method == "DELETE") {
                directory_->deleteGroup(*id);
                res.setStatus(204);
                res.setBody("");
            } else {
                sendError(res, 405, "Method not allowed");
            }

        } catch (const domain::DirectoryException& e) {
            sendError(res, domain::httpStatus(e.kind()), e.what());
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[GroupsHandler] Invalid body: " << e.what() << std::endl;
            sendError(res, 400, "Invalid request body");
        } catch (const std::exception& e) {
            std::cerr << "[GroupsHandler] Error: " << e.what() << std::endl;
            sendError(res, 500, "Internal server error");
        }
    }

private:
    std::shared_ptr<ports::input::IDirectoryService> directory_;
    ScimJsonMapper mapper_;

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
