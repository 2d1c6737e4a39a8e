#pragma once

#include <IHttpHandler.hpp>
#include "domain/AccountView.hpp"
#include "domain/enums/AuthErrorKind.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace credentials::adapters::primary {

/**
 * @brief HTTP статус для категории ошибки
 *
 * Для логина ACCOUNT_NOT_FOUND и INVALID_CREDENTIALS отдаются одинаково
 * (401), см. loginStatusFor().
 */
inline int statusFor(domain::AuthErrorKind kind) {
    if (domain::isInternal(kind)) {
        return 500;
    }

    switch (kind) {
        case domain::AuthErrorKind::NONE:                return 200;
        case domain::AuthErrorKind::VALIDATION_ERROR:    return 400;
        case domain::AuthErrorKind::DUPLICATE_ACCOUNT:   return 409;
        case domain::AuthErrorKind::ACCOUNT_NOT_FOUND:   return 404;
        case domain::AuthErrorKind::INVALID_CREDENTIALS: return 400;
        case domain::AuthErrorKind::INVALID_TOKEN:       return 401;
        case domain::AuthErrorKind::EXPIRED_TOKEN:       return 401;
        default:                                         return 500;
    }
}

inline int loginStatusFor(domain::AuthErrorKind kind) {
    if (kind == domain::AuthErrorKind::ACCOUNT_NOT_FOUND
        || kind == domain::AuthErrorKind::INVALID_CREDENTIALS) {
        return 401;
    }
    return statusFor(kind);
}

/**
 * @brief Тело ошибки: {"error": message, "kind": kind}
 */
inline void sendError(IResponse& res, int status, const std::string& message, domain::AuthErrorKind kind) {
    nlohmann::json error;
    error["error"] = message;
    error["kind"] = domain::toString(kind);
    res.setResult(status, "application/json", error.dump());
}

inline void sendInvalidJson(IResponse& res) {
    sendError(res, 400, "Invalid JSON", domain::AuthErrorKind::VALIDATION_ERROR);
}

inline nlohmann::json toJson(const domain::AccountView& account) {
    nlohmann::json json;
    json["id"] = account.accountId;
    json["login_name"] = account.loginName;
    json["email"] = account.email;
    json["phone_number"] = account.phoneNumber;
    json["date_of_birth"] = account.dateOfBirth;
    json["gender"] = account.gender;
    json["address"] = account.address;
    json["created_at"] = account.createdAt.toString();
    return json;
}

} // namespace credentials::adapters::primary
