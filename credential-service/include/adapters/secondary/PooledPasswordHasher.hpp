#pragma once

#include "ports/output/IPasswordHasher.hpp"
#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include <WorkerPool.hpp>
#include <iostream>
#include <memory>

namespace credentials::adapters::secondary {

/**
 * @brief IPasswordHasher, выполняющий PBKDF2 в WorkerPool
 *
 * Поток обработки запроса только ставит задачу и ждёт future;
 * количество одновременно выполняемых хэшей ограничено размером пула.
 * Если пул остановлен или очередь заполнена, async() выбрасывает
 * CommandException.
 */
class PooledPasswordHasher : public ports::output::IPasswordHasher {
public:
    PooledPasswordHasher(
        std::shared_ptr<Pbkdf2PasswordHasher> hasher,
        std::shared_ptr<WorkerPool> pool
    ) : hasher_(std::move(hasher))
      , pool_(std::move(pool))
    {
        std::cout << "[PooledPasswordHasher] Created, iterations=" << hasher_->getIterations()
                  << ", workers=" << pool_->threadCount() << std::endl;
    }

    std::future<std::string> hash(const std::string& password) override {
        auto hasher = hasher_;
        return pool_->async([hasher, password]() {
            return hasher->hash(password);
        });
    }

    std::future<bool> verify(const std::string& password, const std::string& verifier) override {
        auto hasher = hasher_;
        return pool_->async([hasher, password, verifier]() {
            return hasher->verify(password, verifier);
        });
    }

private:
    std::shared_ptr<Pbkdf2PasswordHasher> hasher_;
    std::shared_ptr<WorkerPool> pool_;
};

} // namespace credentials::adapters::secondary
