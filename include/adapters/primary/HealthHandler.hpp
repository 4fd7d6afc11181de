#pragma once

#include <IHttpHandler.hpp>
#include "domain/Timestamp.hpp"
#include <nlohmann/json.hpp>
#include <iostream>

namespace scim::adapters::primary {

/**
 * @brief HTTP Handler для проверки здоровья сервера
 *
 * Endpoint: GET /health
 */
class HealthHandler : public IHttpHandler
{
public:
    HealthHandler()
    {
        std::cout << "[HealthHandler] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override
    {
        nlohmann::json response;
        response["status"] = "ok";
        response["timestamp"] = domain::Timestamp::now().toString();
        response["dialects"] = {"v1", "v2"};
        response["storage"] = "in-memory";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace scim::adapters::primary
