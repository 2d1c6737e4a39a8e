#pragma once

#include <string>

namespace credentials::domain {

/**
 * @brief Категория ошибки операции с учётными данными
 *
 * CRYPTO_FAILURE, STORE_UNAVAILABLE и INTERNAL_ERROR означают инфраструктурный
 * сбой: наружу отдаются с общим сообщением, детали только в логах.
 */
enum class AuthErrorKind {
    NONE,
    VALIDATION_ERROR,       ///< Отсутствует или некорректно поле запроса
    DUPLICATE_ACCOUNT,      ///< email или login name уже заняты
    ACCOUNT_NOT_FOUND,
    INVALID_CREDENTIALS,    ///< Неверный пароль
    INVALID_TOKEN,          ///< Подпись или структура токена неверны
    EXPIRED_TOKEN,
    CRYPTO_FAILURE,
    STORE_UNAVAILABLE,
    INTERNAL_ERROR
};

inline std::string toString(AuthErrorKind kind) {
    switch (kind) {
        case AuthErrorKind::NONE:                return "none";
        case AuthErrorKind::VALIDATION_ERROR:    return "validation_error";
        case AuthErrorKind::DUPLICATE_ACCOUNT:   return "duplicate_account";
        case AuthErrorKind::ACCOUNT_NOT_FOUND:   return "account_not_found";
        case AuthErrorKind::INVALID_CREDENTIALS: return "invalid_credentials";
        case AuthErrorKind::INVALID_TOKEN:       return "invalid_token";
        case AuthErrorKind::EXPIRED_TOKEN:       return "expired_token";
        case AuthErrorKind::CRYPTO_FAILURE:      return "crypto_failure";
        case AuthErrorKind::STORE_UNAVAILABLE:   return "store_unavailable";
        case AuthErrorKind::INTERNAL_ERROR:      return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Является ли ошибка внутренним сбоем сервера
 */
inline bool isInternal(AuthErrorKind kind) {
    return kind == AuthErrorKind::CRYPTO_FAILURE
        || kind == AuthErrorKind::STORE_UNAVAILABLE
        || kind == AuthErrorKind::INTERNAL_ERROR;
}

} // namespace credentials::domain
