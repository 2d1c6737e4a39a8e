#pragma once

#include <future>
#include <string>

namespace credentials::ports::output {

/**
 * @brief Интерфейс хэширования паролей
 *
 * Операции намеренно дорогие (настраиваемый work factor), поэтому
 * интерфейс асинхронный: вычисление выполняется вне потока обработки
 * запроса, вызывающий получает future.
 */
class IPasswordHasher {
public:
    virtual ~IPasswordHasher() = default;

    /**
     * @brief Вычислить верификатор пароля со случайной солью
     *
     * future выбрасывает domain::CryptoFailureException при сбое RNG/KDF.
     */
    virtual std::future<std::string> hash(const std::string& password) = 0;

    /**
     * @brief Проверить пароль по сохранённому верификатору
     *
     * Возвращает false при несовпадении или некорректном верификаторе,
     * никогда не выбрасывает исключение из-за неверного пароля.
     */
    virtual std::future<bool> verify(const std::string& password, const std::string& verifier) = 0;
};

} // namespace credentials::ports::output
