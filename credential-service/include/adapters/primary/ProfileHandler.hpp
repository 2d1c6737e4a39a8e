#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICredentialService.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/TokenAuthMiddleware.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace credentials::adapters::primary {

/**
 * @brief GET /api/v1/auth/profile: профиль текущего аккаунта
 */
class ProfileHandler : public IHttpHandler {
public:
    explicit ProfileHandler(
        std::shared_ptr<ports::input::ICredentialService> credentialService
    ) : credentialService_(std::move(credentialService)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto result = credentialService_->getProfile(TokenAuthMiddleware::subjectOf(req));

        if (!result.success) {
            sendError(res, statusFor(result.error), result.message, result.error);
            return;
        }

        nlohmann::json response;
        response["account"] = toJson(*result.account);
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ICredentialService> credentialService_;
};

} // namespace credentials::adapters::primary
