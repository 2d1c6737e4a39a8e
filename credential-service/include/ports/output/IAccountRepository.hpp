#pragma once

#include "domain/Account.hpp"
#include <optional>
#include <string>

namespace credentials::ports::output {

/**
 * @brief Интерфейс хранилища аккаунтов
 *
 * Output Port к внешнему хранилищу. Хранилище обязано гарантировать
 * уникальность email и login name на своём уровне (например, unique index):
 * проверка в сервисе перед create() лишь предварительная.
 *
 * Все методы при недоступности хранилища выбрасывают
 * domain::StoreUnavailableException.
 */
class IAccountRepository {
public:
    virtual ~IAccountRepository() = default;

    /**
     * @brief Найти аккаунт по email
     * @param email Нормализованный email (lowercase)
     */
    virtual std::optional<domain::Account> findByEmail(const std::string& email) = 0;

    /**
     * @brief Найти аккаунт по login name
     */
    virtual std::optional<domain::Account> findByLoginName(const std::string& loginName) = 0;

    /**
     * @brief Найти аккаунт по ID
     */
    virtual std::optional<domain::Account> findById(const std::string& accountId) = 0;

    /**
     * @brief Создать аккаунт
     * @return Созданный аккаунт с назначенными ID и временными метками
     * @throws domain::DuplicateKeyException при нарушении уникальности
     */
    virtual domain::Account create(const domain::NewAccount& fields) = 0;

    /**
     * @brief Сохранить изменения существующего аккаунта (верификатор пароля)
     */
    virtual void save(const domain::Account& account) = 0;
};

} // namespace credentials::ports::output
