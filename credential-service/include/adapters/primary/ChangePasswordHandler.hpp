#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICredentialService.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include "adapters/primary/TokenAuthMiddleware.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace credentials::adapters::primary {

/**
 * @brief Смена пароля
 *
 * POST /api/v1/auth/change-password
 * Authorization: Bearer <session_token>
 * {"old_password": "...", "new_password": "..."}
 *
 * Работает за TokenAuthMiddleware: аккаунт берётся из атрибута subjectId.
 */
class ChangePasswordHandler : public IHttpHandler {
public:
    explicit ChangePasswordHandler(
        std::shared_ptr<ports::input::ICredentialService> credentialService
    ) : credentialService_(std::move(credentialService)) {}

    void handle(IRequest& req, IResponse& res) override {
        auto subject = TokenAuthMiddleware::subjectOf(req);
        if (subject.subjectId.empty()) {
            sendError(res, 401, "Invalid token", domain::AuthErrorKind::INVALID_TOKEN);
            return;
        }

        domain::ChangePasswordRequest request;
        try {
            auto body = nlohmann::json::parse(req.getBody());
            request.oldPassword = body.value("old_password", "");
            request.newPassword = body.value("new_password", "");
        } catch (const nlohmann::json::exception& e) {
            sendInvalidJson(res);
            return;
        }

        auto result = credentialService_->changePassword(subject, request);

        if (!result.success) {
            sendError(res, statusFor(result.error), result.message, result.error);
            return;
        }

        nlohmann::json response;
        response["message"] = result.message;
        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ICredentialService> credentialService_;
};

} // namespace credentials::adapters::primary
