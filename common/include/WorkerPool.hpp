#pragma once

#include "ICommand.hpp"
#include "CommandException.hpp"
#include "ThreadSafeQueue.hpp"
#include <atomic>
#include <cstddef>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

/**
 * @file WorkerPool.hpp
 * @brief Фиксированный пул рабочих потоков поверх ThreadSafeQueue
 *
 * Используется для CPU-bound операций (хэширование паролей), чтобы
 * всплеск дорогих вычислений не занимал потоки обработки запросов.
 *
 * @code
 *   WorkerPool pool(4, 1024);
 *   auto future = pool.async([] { return expensive(); });
 *   auto value = future.get();
 * @endcode
 */
class WorkerPool {
public:
    /**
     * @param threadCount Количество рабочих потоков (минимум 1)
     * @param queueCapacity Максимум ожидающих команд (0: без ограничения)
     */
    explicit WorkerPool(std::size_t threadCount, std::size_t queueCapacity = 0);

    /**
     * @brief Останавливает пул, дожидаясь выполнения уже поставленных команд
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Поставить команду в очередь
     * @throws CommandException если пул остановлен или очередь заполнена
     */
    void submit(std::shared_ptr<ICommand> command);

    /**
     * @brief Выполнить функцию в пуле и получить результат через future
     *
     * Исключение, выброшенное функцией, передаётся в future.
     *
     * @throws CommandException если пул остановлен или очередь заполнена
     */
    template <typename F>
    std::future<std::invoke_result_t<std::decay_t<F>>> async(F&& fn) {
        using R = std::invoke_result_t<std::decay_t<F>>;
        auto command = std::make_shared<PackagedCommand<R>>(std::forward<F>(fn));
        auto future = command->getFuture();
        submit(std::move(command));
        return future;
    }

    /**
     * @brief Закрыть очередь и дождаться завершения рабочих потоков
     *
     * Повторный вызов безопасен.
     */
    void shutdown();

    std::size_t threadCount() const { return workers_.size(); }
    std::size_t pendingCount() const { return queue_.size(); }
    std::size_t completedCount() const { return completed_.load(); }

private:
    /**
     * @brief Команда-обёртка над std::packaged_task
     */
    template <typename R>
    class PackagedCommand : public ICommand {
    public:
        template <typename F>
        explicit PackagedCommand(F&& fn) : task_(std::forward<F>(fn)) {}

        void execute() override { task_(); }

        std::future<R> getFuture() { return task_.get_future(); }

    private:
        std::packaged_task<R()> task_;
    };

    void workerLoop();

    ThreadSafeQueue queue_;
    std::vector<std::thread> workers_;
    std::atomic<std::size_t> completed_{0};
    std::atomic<bool> stopped_{false};
};
