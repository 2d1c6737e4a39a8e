#pragma once

#include <stdexcept>
#include <string>

/**
 * @file CommandException.hpp
 * @brief Исключение для команд и пула исполнителей
 */

/**
 * @brief Выбрасывается, если команду нельзя принять или выполнить
 *
 * Например: пул уже остановлен или очередь заполнена.
 */
class CommandException : public std::runtime_error {
public:
    explicit CommandException(const std::string& message)
        : std::runtime_error(message) {}
};
