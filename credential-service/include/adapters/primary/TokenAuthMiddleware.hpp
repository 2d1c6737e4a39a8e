#pragma once

#include <IHttpHandler.hpp>
#include "ports/input/ICredentialService.hpp"
#include "adapters/primary/HttpResponses.hpp"
#include <memory>
#include <iostream>

namespace credentials::adapters::primary {

/**
 * @brief Middleware проверки session token
 *
 * Читает Authorization: Bearer <token>, при успехе кладёт в атрибуты
 * запроса subjectId и subjectName и оставляет статус 0, чтобы
 * ChainHandler продолжил цепочку.
 */
class TokenAuthMiddleware : public IHttpHandler {
public:
    static constexpr const char* SUBJECT_ID_ATTRIBUTE = "subjectId";
    static constexpr const char* SUBJECT_NAME_ATTRIBUTE = "subjectName";

    explicit TokenAuthMiddleware(
        std::shared_ptr<ports::input::ICredentialService> credentialService
    ) : credentialService_(std::move(credentialService))
    {
        std::cout << "[TokenAuthMiddleware] Created" << std::endl;
    }

    void handle(IRequest& req, IResponse& res) override {
        std::string token = req.getBearerToken().value_or("");
        if (token.empty()) {
            sendError(res, 401, "Invalid token", domain::AuthErrorKind::INVALID_TOKEN);
            return;
        }

        auto result = credentialService_->verifyToken(token);
        if (!result.valid) {
            sendError(res, statusFor(result.error), result.message, result.error);
            return;
        }

        req.setAttribute(SUBJECT_ID_ATTRIBUTE, result.subject.subjectId);
        req.setAttribute(SUBJECT_NAME_ATTRIBUTE, result.subject.subjectName);
        res.setStatus(0); // для middleware
    }

    /**
     * @brief Восстановить TokenSubject из атрибутов, выставленных middleware
     */
    static domain::TokenSubject subjectOf(IRequest& req) {
        return domain::TokenSubject{
            req.getAttribute(SUBJECT_ID_ATTRIBUTE).value_or(""),
            req.getAttribute(SUBJECT_NAME_ATTRIBUTE).value_or("")
        };
    }

private:
    std::shared_ptr<ports::input::ICredentialService> credentialService_;
};

} // namespace credentials::adapters::primary
