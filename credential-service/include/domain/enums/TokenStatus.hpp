#pragma once

#include <string>

namespace credentials::domain {

/**
 * @brief Результат проверки session token
 */
enum class TokenStatus {
    VALID,
    INVALID,    ///< Неверная подпись, алгоритм или структура
    EXPIRED
};

inline std::string toString(TokenStatus status) {
    switch (status) {
        case TokenStatus::VALID:   return "valid";
        case TokenStatus::INVALID: return "invalid";
        case TokenStatus::EXPIRED: return "expired";
    }
    return "unknown";
}

} // namespace credentials::domain
