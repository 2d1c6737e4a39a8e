#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICredentialService.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace credentials::adapters::primary {

/**
 * @brief Вход по email или login name
 * 
 * POST /api/v1/auth/login
 * {"identifier": "john@example.com", "password": "secret123"}
 *
 * Неизвестный аккаунт и неверный пароль дают одинаковый ответ 401.
 */
class LoginHandler : public IHttpHandler {
public:
    explicit LoginHandler(
        std::shared_ptr<ports::input::ICredentialService> credentialService
    ) : credentialService_(std::move(credentialService)) {}

    void handle(IRequest& req, IResponse& res) override {
        domain::LoginRequest request;
        try {
            auto body = nlohmann::json::parse(req.getBody());
            request.identifier = body.value("identifier", "");
            request.password = body.value("password", "");
        } catch (const nlohmann::json::exception& e) {
            sendInvalidJson(res);
            return;
        }

        auto result = credentialService_->login(request);

        if (!result.success) {
            // Наружу не раскрываем, существует ли аккаунт
            auto kind = result.error == domain::AuthErrorKind::ACCOUNT_NOT_FOUND
                ? domain::AuthErrorKind::INVALID_CREDENTIALS
                : result.error;
            sendError(res, loginStatusFor(result.error), result.message, kind);
            return;
        }

        nlohmann::json response;
        response["message"] = result.message;
        response["token"] = result.token;
        response["account"] = toJson(*result.account);

        res.setResult(200, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ICredentialService> credentialService_;
};

} // namespace credentials::adapters::primary
