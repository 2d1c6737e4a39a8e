#pragma once

#include "domain/Timestamp.hpp"
#include <string>

namespace credentials::domain {

/**
 * @brief Поля нового аккаунта, передаваемые в хранилище при создании
 *
 * Идентификатор и временные метки назначает хранилище.
 * email уже нормализован (trim + lowercase), passwordHash содержит верификатор,
 * полученный от IPasswordHasher, никогда не открытый пароль.
 */
struct NewAccount {
    std::string loginName;
    std::string email;
    std::string passwordHash;
    std::string phoneNumber;
    std::string dateOfBirth;    ///< YYYY-MM-DD
    std::string gender;
    std::string address;
};

/**
 * @brief Учётная запись: единственная хранимая сущность
 *
 * Инварианты:
 * - accountId и email уникальны среди всех аккаунтов;
 * - passwordHash никогда не содержит открытый пароль;
 * - профильные поля не меняются после создания;
 * - passwordHash меняется только при регистрации и смене пароля.
 *
 * Наружу аккаунт отдаётся только через AccountView.
 */
struct Account {
    std::string accountId;      ///< Назначается хранилищем, неизменяем
    std::string loginName;      ///< Уникальное имя для входа
    std::string email;          ///< Уникальный, в нижнем регистре
    std::string passwordHash;   ///< Верификатор пароля (pbkdf2-sha256$...)
    std::string phoneNumber;
    std::string dateOfBirth;    ///< YYYY-MM-DD
    std::string gender;
    std::string address;
    Timestamp createdAt;        ///< Назначается хранилищем
    Timestamp updatedAt;        ///< Назначается хранилищем

    Account() = default;

    Account(const std::string& accountId, const NewAccount& fields)
        : accountId(accountId)
        , loginName(fields.loginName)
        , email(fields.email)
        , passwordHash(fields.passwordHash)
        , phoneNumber(fields.phoneNumber)
        , dateOfBirth(fields.dateOfBirth)
        , gender(fields.gender)
        , address(fields.address)
    {}
};

} // namespace credentials::domain
