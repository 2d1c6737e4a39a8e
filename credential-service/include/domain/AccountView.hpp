#pragma once

#include "domain/Account.hpp"
#include <string>

namespace credentials::domain {

/**
 * @brief Публичная проекция аккаунта без верификатора пароля
 *
 * Единственная форма, в которой аккаунт покидает сервис.
 */
struct AccountView {
    std::string accountId;
    std::string loginName;
    std::string email;
    std::string phoneNumber;
    std::string dateOfBirth;
    std::string gender;
    std::string address;
    Timestamp createdAt;

    static AccountView from(const Account& account) {
        AccountView view;
        view.accountId = account.accountId;
        view.loginName = account.loginName;
        view.email = account.email;
        view.phoneNumber = account.phoneNumber;
        view.dateOfBirth = account.dateOfBirth;
        view.gender = account.gender;
        view.address = account.address;
        view.createdAt = account.createdAt;
        return view;
    }
};

} // namespace credentials::domain
