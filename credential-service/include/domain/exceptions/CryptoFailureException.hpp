#pragma once

#include <stdexcept>
#include <string>

namespace credentials::domain {

/**
 * @brief Невосстановимая ошибка криптографического примитива (RNG, KDF, HMAC)
 */
class CryptoFailureException : public std::runtime_error {
public:
    explicit CryptoFailureException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace credentials::domain
