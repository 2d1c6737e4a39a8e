#pragma once

#include "ports/output/IAccountRepository.hpp"
#include "domain/exceptions/DuplicateKeyException.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"
#include "DbSettings.hpp"
#include <pqxx/pqxx>
#include <memory>
#include <mutex>
#include <iostream>

namespace credentials::adapters::secondary {

/**
 * @brief PostgreSQL репозиторий аккаунтов
 *
 * Таблица accounts (migrations/001_create_accounts.sql): id, created_at и
 * updated_at назначает БД, уникальность email и login_name обеспечивают
 * unique index.
 */
class PostgresAccountRepository : public ports::output::IAccountRepository {
public:
    explicit PostgresAccountRepository(std::shared_ptr<DbSettings> settings)
        : settings_(std::move(settings))
    {
        std::cout << "[PostgresAccountRepository] Connecting to " << settings_->getHost()
                  << ":" << settings_->getPort() << "/" << settings_->getName() << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(settings_->getConnectionString());
            std::cout << "[PostgresAccountRepository] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresAccountRepository] Connection failed: " << e.what() << std::endl;
            throw;
        }
    }

    ~PostgresAccountRepository() {
        if (connection_ && connection_->is_open()) {
            connection_->close();
        }
    }

    std::optional<domain::Account> findByEmail(const std::string& email) override {
        return findOne("email", email);
    }

    std::optional<domain::Account> findByLoginName(const std::string& loginName) override {
        return findOne("login_name", loginName);
    }

    std::optional<domain::Account> findById(const std::string& accountId) override {
        return findOne("id", accountId);
    }

    domain::Account create(const domain::NewAccount& fields) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                std::string(R"(
                    INSERT INTO accounts (login_name, email, password_hash, phone_number,
                                          date_of_birth, gender, address)
                    VALUES ($1, $2, $3, $4, $5::date, $6, $7)
                    RETURNING )") + SELECT_COLUMNS,
                fields.loginName,
                fields.email,
                fields.passwordHash,
                fields.phoneNumber,
                fields.dateOfBirth,
                fields.gender,
                fields.address
            );

            txn.commit();
            return rowToAccount(result[0]);

        } catch (const pqxx::unique_violation& e) {
            std::cout << "[PostgresAccountRepository] create() unique violation" << std::endl;
            throw domain::DuplicateKeyException(e.what());
        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresAccountRepository] create() connection lost: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        } catch (const pqxx::sql_error& e) {
            std::cerr << "[PostgresAccountRepository] create() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        }
    }

    void save(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            auto result = txn.exec_params(
                R"(
                    UPDATE accounts
                    SET password_hash = $2, updated_at = NOW()
                    WHERE id = $1::uuid
                )",
                account.accountId,
                account.passwordHash
            );

            txn.commit();

            if (result.affected_rows() == 0) {
                std::cerr << "[PostgresAccountRepository] save() no row for " << account.accountId << std::endl;
            }

        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresAccountRepository] save() connection lost: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        } catch (const pqxx::sql_error& e) {
            std::cerr << "[PostgresAccountRepository] save() failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        }
    }

private:
    static constexpr const char* SELECT_COLUMNS =
        "id::text AS id, login_name, email, password_hash, phone_number, "
        "to_char(date_of_birth, 'YYYY-MM-DD') AS date_of_birth, gender, address, "
        "EXTRACT(EPOCH FROM created_at)::bigint AS created_at, "
        "EXTRACT(EPOCH FROM updated_at)::bigint AS updated_at";

    std::shared_ptr<DbSettings> settings_;
    std::unique_ptr<pqxx::connection> connection_;
    mutable std::mutex mutex_;

    std::optional<domain::Account> findOne(const std::string& column, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);

        try {
            pqxx::work txn(*connection_);

            // id сравнивается как текст, чтобы произвольная строка из токена
            // не приводила к ошибке приведения к uuid
            std::string key = column == "id" ? "id::text" : column;
            auto result = txn.exec_params(
                std::string("SELECT ") + SELECT_COLUMNS + " FROM accounts WHERE " + key + " = $1",
                value
            );

            txn.commit();

            if (result.empty()) return std::nullopt;

            return rowToAccount(result[0]);

        } catch (const pqxx::broken_connection& e) {
            std::cerr << "[PostgresAccountRepository] find by " << column << " connection lost: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        } catch (const pqxx::sql_error& e) {
            std::cerr << "[PostgresAccountRepository] find by " << column << " failed: " << e.what() << std::endl;
            throw domain::StoreUnavailableException(e.what());
        }
    }

    domain::Account rowToAccount(const pqxx::row& row) const {
        domain::Account account;
        account.accountId = row["id"].as<std::string>();
        account.loginName = row["login_name"].as<std::string>();
        account.email = row["email"].as<std::string>();
        account.passwordHash = row["password_hash"].as<std::string>();
        account.phoneNumber = row["phone_number"].as<std::string>();
        account.dateOfBirth = row["date_of_birth"].as<std::string>();
        account.gender = row["gender"].as<std::string>();
        account.address = row["address"].as<std::string>();
        account.createdAt = domain::Timestamp::fromUnixSeconds(row["created_at"].as<int64_t>());
        account.updatedAt = domain::Timestamp::fromUnixSeconds(row["updated_at"].as<int64_t>());
        return account;
    }
};

} // namespace credentials::adapters::secondary
