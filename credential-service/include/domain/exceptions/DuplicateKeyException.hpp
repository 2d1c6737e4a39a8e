#pragma once

#include <stdexcept>
#include <string>

namespace credentials::domain {

/**
 * @brief Нарушено ограничение уникальности в хранилище аккаунтов
 */
class DuplicateKeyException : public std::runtime_error {
public:
    explicit DuplicateKeyException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace credentials::domain
