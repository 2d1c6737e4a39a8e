#pragma once

#include "ports/input/ICredentialService.hpp"
#include "ports/output/IAccountRepository.hpp"
#include "ports/output/IPasswordHasher.hpp"
#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IClock.hpp"
#include "application/RequestValidator.hpp"
#include <memory>
#include <mutex>
#include <string>

namespace credentials::application {

/**
 * @brief Сервис учётных данных: регистрация, логин, смена пароля
 *
 * Хэширование выполняется через асинхронный IPasswordHasher, поток
 * обработки запроса только ждёт результат. Уникальность аккаунта
 * гарантирует хранилище: DuplicateKeyException из create()
 * переводится в DUPLICATE_ACCOUNT.
 *
 * Инфраструктурные исключения не выходят за пределы сервиса:
 * они логируются и возвращаются как "Internal server error".
 */
class CredentialService : public ports::input::ICredentialService {
public:
    static constexpr const char* INVALID_CREDENTIALS_MESSAGE = "Invalid credentials";
    static constexpr const char* INTERNAL_ERROR_MESSAGE = "Internal server error";

    CredentialService(
        std::shared_ptr<ports::output::IAccountRepository> accountRepo,
        std::shared_ptr<ports::output::IPasswordHasher> hasher,
        std::shared_ptr<ports::output::ITokenProvider> tokenProvider,
        std::shared_ptr<ports::output::IClock> clock
    );

    ports::input::AuthResult registerAccount(const domain::RegisterRequest& request) override;

    ports::input::AuthResult login(const domain::LoginRequest& request) override;

    ports::input::OperationResult changePassword(
        const domain::TokenSubject& subject,
        const domain::ChangePasswordRequest& request
    ) override;

    ports::input::VerifyTokenResult verifyToken(const std::string& token) override;

    ports::input::ProfileResult getProfile(const domain::TokenSubject& subject) override;

private:
    std::shared_ptr<ports::output::IAccountRepository> accountRepo_;
    std::shared_ptr<ports::output::IPasswordHasher> hasher_;
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider_;
    RequestValidator validator_;

    std::once_flag dummyVerifierFlag_;
    std::string dummyVerifier_;

    /**
     * @brief Верификатор, с которым сверяется пароль при неизвестном аккаунте
     *
     * Вычисляется один раз при первом обращении. Вход в несуществующий
     * аккаунт стоит столько же, сколько вход с неверным паролем.
     */
    const std::string& dummyVerifier();

    /**
     * @brief Перевести текущее исключение в категорию ошибки
     *
     * Вызывается только внутри catch-блока.
     */
    static domain::AuthErrorKind classifyCurrentException(const char* operation);
};

} // namespace credentials::application
