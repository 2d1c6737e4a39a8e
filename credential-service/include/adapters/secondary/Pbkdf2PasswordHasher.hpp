#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace credentials::adapters::secondary {

/**
 * @brief PBKDF2-HMAC-SHA256 хэширование паролей (OpenSSL)
 *
 * Формат верификатора:
 *   pbkdf2-sha256$<iterations>$<salt-hex>$<hash-hex>
 *
 * Число итераций хранится в верификаторе, поэтому work factor можно
 * повышать, не ломая ранее сохранённые пароли.
 *
 * Синхронный примитив: вызывается из рабочих потоков PooledPasswordHasher.
 */
class Pbkdf2PasswordHasher {
public:
    static constexpr const char* SCHEME = "pbkdf2-sha256";
    static constexpr std::size_t SALT_BYTES = 16;
    static constexpr std::size_t KEY_BYTES = 32;
    static constexpr int MAX_ITERATIONS = 10000000;

    /**
     * @param iterations Work factor для новых верификаторов
     * @throws std::invalid_argument если iterations вне [1, MAX_ITERATIONS]
     */
    explicit Pbkdf2PasswordHasher(int iterations);

    /**
     * @brief Вычислить верификатор со случайной солью
     * @throws domain::CryptoFailureException при сбое RAND_bytes или PBKDF2
     */
    std::string hash(const std::string& password) const;

    /**
     * @brief Проверить пароль (сравнение за постоянное время)
     * @return false при несовпадении или некорректном верификаторе
     */
    bool verify(const std::string& password, const std::string& verifier) const;

    int getIterations() const { return iterations_; }

private:
    int iterations_;

    static std::vector<unsigned char> derive(
        const std::string& password,
        const std::vector<unsigned char>& salt,
        int iterations,
        std::size_t keyLength);
};

} // namespace credentials::adapters::secondary
