#pragma once

#include <string>

namespace credentials::domain {

/**
 * @brief Запрос на вход
 *
 * identifier: email (если содержит '@') или login name.
 */
struct LoginRequest {
    std::string identifier;
    std::string password;
};

} // namespace credentials::domain
