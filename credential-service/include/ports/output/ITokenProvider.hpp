#pragma once

#include "domain/SessionTokenClaims.hpp"
#include "domain/enums/TokenStatus.hpp"
#include <string>

namespace credentials::ports::output {

/**
 * @brief Результат проверки токена
 *
 * claims заполнены только при status == VALID.
 */
struct TokenVerification {
    domain::TokenStatus status = domain::TokenStatus::INVALID;
    domain::SessionTokenClaims claims;
};

/**
 * @brief Интерфейс выпуска и проверки подписанных session token
 */
class ITokenProvider {
public:
    virtual ~ITokenProvider() = default;

    /**
     * @brief Выпустить токен на 24 часа
     * @param subjectId ID аккаунта
     * @param subjectName Login name
     * @throws domain::CryptoFailureException при сбое подписи
     */
    virtual std::string issueToken(const std::string& subjectId, const std::string& subjectName) = 0;

    /**
     * @brief Проверить подпись, структуру и срок действия токена
     */
    virtual TokenVerification verifyToken(const std::string& token) = 0;
};

} // namespace credentials::ports::output
