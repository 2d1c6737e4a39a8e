#include "WorkerPool.hpp"
#include <iostream>

WorkerPool::WorkerPool(std::size_t threadCount, std::size_t queueCapacity)
    : queue_(queueCapacity)
{
    if (threadCount == 0) {
        threadCount = 1;
    }

    workers_.reserve(threadCount);
    for (std::size_t i = 0; i < threadCount; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }

    std::cout << "[WorkerPool] Started " << threadCount << " worker(s), queue capacity "
              << queueCapacity << std::endl;
}

WorkerPool::~WorkerPool() {
    shutdown();
}

void WorkerPool::submit(std::shared_ptr<ICommand> command) {
    if (!command) {
        throw CommandException("Cannot submit empty command");
    }
    if (queue_.isShutdown()) {
        throw CommandException("Worker pool is shut down");
    }
    if (!queue_.tryPush(std::move(command))) {
        throw CommandException("Worker pool queue is full or closed");
    }
}

void WorkerPool::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }

    queue_.shutdown();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    std::cout << "[WorkerPool] Stopped, " << completed_.load() << " command(s) completed" << std::endl;
}

void WorkerPool::workerLoop() {
    while (auto command = queue_.pop()) {
        try {
            command->execute();
        } catch (const std::exception& e) {
            std::cerr << "[WorkerPool] Command failed: " << e.what() << std::endl;
        }
        ++completed_;
    }
}
