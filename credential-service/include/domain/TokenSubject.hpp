#pragma once

#include <string>

namespace credentials::domain {

/**
 * @brief Личность, подтверждённая проверкой session token
 *
 * Передаётся в операции, требующие аутентификации (смена пароля,
 * профиль). Берётся только из проверенного токена, не из тела запроса.
 */
struct TokenSubject {
    std::string subjectId;      ///< accountId (sub claim)
    std::string subjectName;    ///< loginName (name claim)
};

} // namespace credentials::domain
