#pragma once

/**
 * @file ICommand.hpp
 * @brief Интерфейс команды по паттерну Command
 */

/**
 * @brief Единица работы для WorkerPool
 *
 * Команда инкапсулирует операцию (например, вычисление хэша пароля),
 * которую можно поставить в очередь и выполнить в рабочем потоке,
 * не занимая поток обработки HTTP-запроса.
 */
class ICommand {
public:
    virtual ~ICommand() = default;

    /**
     * @brief Выполнить команду
     * @throws std::runtime_error если команду невозможно выполнить
     */
    virtual void execute() = 0;
};
