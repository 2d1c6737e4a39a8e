#pragma once

#include <IHttpHandler.hpp>
#include <nlohmann/json.hpp>

namespace credentials::adapters::primary {

/**
 * @brief Health check handler
 * 
 * GET /health
 */
class HealthHandler : public IHttpHandler {
public:
    void handle(IRequest& req, IResponse& res) override {
        nlohmann::json response;
        response["status"] = "healthy";
        response["service"] = "credential-service";
        response["version"] = "1.0.0";

        res.setResult(200, "application/json", response.dump());
    }
};

} // namespace credentials::adapters::primary
