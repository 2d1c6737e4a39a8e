#pragma once

#include "domain/AccountView.hpp"
#include "domain/ChangePasswordRequest.hpp"
#include "domain/LoginRequest.hpp"
#include "domain/RegisterRequest.hpp"
#include "domain/TokenSubject.hpp"
#include "domain/enums/AuthErrorKind.hpp"
#include <optional>
#include <string>

namespace credentials::ports::input {

/**
 * @brief Результат регистрации или логина
 *
 * При success == true заполнены token и account.
 */
struct AuthResult {
    bool success = false;
    domain::AuthErrorKind error = domain::AuthErrorKind::NONE;
    std::string message;
    std::string token;
    std::optional<domain::AccountView> account;
};

/**
 * @brief Результат операции без полезной нагрузки (смена пароля)
 */
struct OperationResult {
    bool success = false;
    domain::AuthErrorKind error = domain::AuthErrorKind::NONE;
    std::string message;
};

/**
 * @brief Результат чтения профиля
 */
struct ProfileResult {
    bool success = false;
    domain::AuthErrorKind error = domain::AuthErrorKind::NONE;
    std::string message;
    std::optional<domain::AccountView> account;
};

/**
 * @brief Результат проверки session token
 */
struct VerifyTokenResult {
    bool valid = false;
    domain::AuthErrorKind error = domain::AuthErrorKind::NONE;
    std::string message;
    domain::TokenSubject subject;
};

/**
 * @brief Интерфейс сервиса учётных данных
 *
 * Input Port для HTTP-слоя: одна операция на каждый flow.
 */
class ICredentialService {
public:
    virtual ~ICredentialService() = default;

    /**
     * @brief Регистрация нового аккаунта
     *
     * Валидирует поля, проверяет уникальность email и login name,
     * хэширует пароль, создаёт аккаунт и выпускает session token.
     *
     * Токен выпускается после create(): если подпись не удалась,
     * возвращается CRYPTO_FAILURE, а созданный аккаунт остаётся
     * в хранилище. Повторная регистрация даст DUPLICATE_ACCOUNT,
     * войти можно через login().
     */
    virtual AuthResult registerAccount(const domain::RegisterRequest& request) = 0;

    /**
     * @brief Вход по email или login name
     */
    virtual AuthResult login(const domain::LoginRequest& request) = 0;

    /**
     * @brief Смена пароля аутентифицированного аккаунта
     *
     * Новый токен не выпускается, ранее выданные токены действуют
     * до истечения срока.
     *
     * @param subject Личность из проверенного токена
     */
    virtual OperationResult changePassword(
        const domain::TokenSubject& subject,
        const domain::ChangePasswordRequest& request
    ) = 0;

    /**
     * @brief Проверка session token (без обращения к хранилищу)
     */
    virtual VerifyTokenResult verifyToken(const std::string& token) = 0;

    /**
     * @brief Профиль аутентифицированного аккаунта
     */
    virtual ProfileResult getProfile(const domain::TokenSubject& subject) = 0;
};

} // namespace credentials::ports::input
