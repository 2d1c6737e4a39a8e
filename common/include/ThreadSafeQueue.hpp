#pragma once

#include "ICommand.hpp"
#include <queue>
#include <mutex>
#include <condition_variable>
#include <memory>
#include <cstddef>

/**
 * @file ThreadSafeQueue.hpp
 * @brief Потокобезопасная очередь команд с ограничением размера
 * @details
 * Thread-safe очередь с блокирующей операцией pop().
 * Ёмкость 0 означает очередь без ограничения.
 * После shutdown() новые команды не принимаются, но уже поставленные
 * команды продолжают выдаваться через pop() до опустошения очереди.
 */
class ThreadSafeQueue {
private:
    std::queue<std::shared_ptr<ICommand>> queue_;  ///< Внутренняя очередь
    mutable std::mutex mutex_;                     ///< Мьютекс для синхронизации
    std::condition_variable condVar_;              ///< Условная переменная для ожидания
    std::size_t capacity_;                         ///< Максимальный размер (0: без ограничения)
    bool shutdown_ = false;                        ///< Флаг завершения работы очереди

public:
    explicit ThreadSafeQueue(std::size_t capacity = 0);
    ~ThreadSafeQueue();

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Попытаться добавить команду в очередь
     * @param command Команда для добавления
     * @return false, если команда пустая, очередь закрыта или заполнена
     */
    bool tryPush(std::shared_ptr<ICommand> command);

    /**
     * @brief Извлечь команду из очереди (блокирующий вызов)
     * @return команда, либо nullptr, если очередь закрыта и пуста
     */
    std::shared_ptr<ICommand> pop();

    /**
     * @brief Закрыть очередь и пробудить все ожидающие потоки
     */
    void shutdown();

    bool isShutdown() const;
    bool isEmpty() const;
    std::size_t size() const;
};
