#pragma once

#include <string>

namespace credentials::domain {

/**
 * @brief Запрос на смену пароля
 *
 * Аккаунт определяется только по проверенному токену (TokenSubject),
 * поэтому идентификатора аккаунта здесь нет.
 */
struct ChangePasswordRequest {
    std::string oldPassword;
    std::string newPassword;
};

} // namespace credentials::domain
