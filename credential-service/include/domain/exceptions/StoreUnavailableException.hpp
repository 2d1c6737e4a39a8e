#pragma once

#include <stdexcept>
#include <string>

namespace credentials::domain {

/**
 * @brief Хранилище аккаунтов недоступно или запрос к нему завершился ошибкой
 */
class StoreUnavailableException : public std::runtime_error {
public:
    explicit StoreUnavailableException(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace credentials::domain
