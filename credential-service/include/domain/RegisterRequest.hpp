#pragma once

#include <string>

namespace credentials::domain {

/**
 * @brief Запрос на регистрацию
 *
 * POST /api/v1/auth/register
 * Все поля обязательны.
 */
struct RegisterRequest {
    std::string loginName;
    std::string email;
    std::string password;
    std::string phoneNumber;
    std::string dateOfBirth;    ///< YYYY-MM-DD
    std::string gender;
    std::string address;
};

} // namespace credentials::domain
