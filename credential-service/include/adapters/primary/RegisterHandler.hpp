#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICredentialService.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <nlohmann/json.hpp>
#include <memory>

namespace credentials::adapters::primary {

/**
 * @brief Регистрация нового аккаунта
 * 
 * POST /api/v1/auth/register
 * {
 *   "login_name": "john",
 *   "email": "john@example.com",
 *   "password": "secret123",
 *   "phone_number": "+79001234567",
 *   "date_of_birth": "1990-05-17",
 *   "gender": "male",
 *   "address": "Moscow, Tverskaya 1"
 * }
 */
class RegisterHandler : public IHttpHandler {
public:
    explicit RegisterHandler(
        std::shared_ptr<ports::input::ICredentialService> credentialService
    ) : credentialService_(std::move(credentialService)) {}

    void handle(IRequest& req, IResponse& res) override {
        domain::RegisterRequest request;
        try {
            auto body = nlohmann::json::parse(req.getBody());

            request.loginName = body.value("login_name", "");
            request.email = body.value("email", "");
            request.password = body.value("password", "");
            request.phoneNumber = body.value("phone_number", "");
            request.dateOfBirth = body.value("date_of_birth", "");
            request.gender = body.value("gender", "");
            request.address = body.value("address", "");

        } catch (const nlohmann::json::exception& e) {
            sendInvalidJson(res);
            return;
        }

        auto result = credentialService_->registerAccount(request);

        if (!result.success) {
            sendError(res, statusFor(result.error), result.message, result.error);
            return;
        }

        nlohmann::json response;
        response["message"] = result.message;
        response["token"] = result.token;
        response["account"] = toJson(*result.account);

        res.setResult(201, "application/json", response.dump());
    }

private:
    std::shared_ptr<ports::input::ICredentialService> credentialService_;
};

} // namespace credentials::adapters::primary
