#pragma once

#include <cstddef>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <thread>

namespace credentials::adapters::secondary {

/**
 * @brief Настройки подсистемы учётных данных из ENV
 *
 * Читает:
 * - CREDENTIALS_TOKEN_SECRET (обязательно, минимум 32 байта)
 * - CREDENTIALS_PBKDF2_ITERATIONS (default: 210000, минимум 1000)
 * - CREDENTIALS_HASH_WORKERS (default: число ядер)
 * - CREDENTIALS_HASH_QUEUE_CAPACITY (default: 1024)
 *
 * Загружается один раз при старте. Значения по умолчанию для секрета
 * подписи нет: без него сервис не запускается.
 */
class AuthSettings {
public:
    static constexpr int DEFAULT_PBKDF2_ITERATIONS = 210000;
    static constexpr int MIN_PBKDF2_ITERATIONS = 1000;
    static constexpr std::size_t MIN_TOKEN_SECRET_LENGTH = 32;
    static constexpr std::size_t DEFAULT_HASH_QUEUE_CAPACITY = 1024;

    AuthSettings() {
        tokenSecret_ = getEnvOrThrow("CREDENTIALS_TOKEN_SECRET");
        pbkdf2Iterations_ = getEnvIntOrDefault("CREDENTIALS_PBKDF2_ITERATIONS", DEFAULT_PBKDF2_ITERATIONS);
        hashWorkers_ = static_cast<std::size_t>(
            getEnvIntOrDefault("CREDENTIALS_HASH_WORKERS", static_cast<int>(defaultWorkers())));
        hashQueueCapacity_ = static_cast<std::size_t>(
            getEnvIntOrDefault("CREDENTIALS_HASH_QUEUE_CAPACITY", static_cast<int>(DEFAULT_HASH_QUEUE_CAPACITY)));
        validate();
    }

    /**
     * @brief Явная конфигурация (тесты, встраивание)
     */
    AuthSettings(
        std::string tokenSecret,
        int pbkdf2Iterations,
        std::size_t hashWorkers = 1,
        std::size_t hashQueueCapacity = DEFAULT_HASH_QUEUE_CAPACITY
    ) : tokenSecret_(std::move(tokenSecret))
      , pbkdf2Iterations_(pbkdf2Iterations)
      , hashWorkers_(hashWorkers)
      , hashQueueCapacity_(hashQueueCapacity)
    {
        validate();
    }

    const std::string& getTokenSecret() const { return tokenSecret_; }
    int getPbkdf2Iterations() const { return pbkdf2Iterations_; }
    std::size_t getHashWorkers() const { return hashWorkers_; }
    std::size_t getHashQueueCapacity() const { return hashQueueCapacity_; }

private:
    std::string tokenSecret_;
    int pbkdf2Iterations_ = DEFAULT_PBKDF2_ITERATIONS;
    std::size_t hashWorkers_ = 1;
    std::size_t hashQueueCapacity_ = DEFAULT_HASH_QUEUE_CAPACITY;

    void validate() const {
        if (tokenSecret_.size() < MIN_TOKEN_SECRET_LENGTH) {
            throw std::runtime_error(
                "CREDENTIALS_TOKEN_SECRET must be at least "
                + std::to_string(MIN_TOKEN_SECRET_LENGTH) + " bytes");
        }
        if (pbkdf2Iterations_ < MIN_PBKDF2_ITERATIONS) {
            throw std::runtime_error(
                "CREDENTIALS_PBKDF2_ITERATIONS must be at least "
                + std::to_string(MIN_PBKDF2_ITERATIONS));
        }
        if (hashWorkers_ == 0) {
            throw std::runtime_error("CREDENTIALS_HASH_WORKERS must be positive");
        }
    }

    static std::size_t defaultWorkers() {
        auto cores = std::thread::hardware_concurrency();
        return cores == 0 ? 1 : cores;
    }

    static std::string getEnvOrThrow(const char* name) {
        const char* value = std::getenv(name);
        if (!value || *value == '\0') {
            throw std::runtime_error(std::string("Required env variable not set: ") + name);
        }
        return value;
    }

    static int getEnvIntOrDefault(const char* name, int defaultValue) {
        const char* value = std::getenv(name);
        if (!value || *value == '\0') {
            return defaultValue;
        }
        try {
            std::size_t pos = 0;
            int parsed = std::stoi(value, &pos);
            if (pos != std::string(value).size() || parsed < 0) {
                throw std::invalid_argument(value);
            }
            return parsed;
        } catch (const std::logic_error&) {
            throw std::runtime_error(std::string("Invalid integer in env variable ") + name);
        }
    }
};

} // namespace credentials::adapters::secondary
