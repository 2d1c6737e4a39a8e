#pragma once

#include "domain/ChangePasswordRequest.hpp"
#include "domain/LoginRequest.hpp"
#include "domain/RegisterRequest.hpp"
#include "ports/output/IClock.hpp"
#include "utils/StringUtils.hpp"
#include <cctype>
#include <memory>
#include <optional>
#include <string>

namespace credentials::application {

/**
 * @brief Проверка входных данных flow на границе сервиса
 *
 * Каждый метод возвращает сообщение первого нарушенного правила
 * или nullopt, если запрос корректен. Ожидает уже обрезанные
 * (trim) значения полей, кроме паролей.
 */
class RequestValidator {
public:
    static constexpr std::size_t MIN_LOGIN_NAME_LENGTH = 3;
    static constexpr std::size_t MAX_LOGIN_NAME_LENGTH = 64;
    static constexpr std::size_t MIN_PASSWORD_LENGTH = 6;
    static constexpr std::size_t MAX_PASSWORD_LENGTH = 128;
    static constexpr std::size_t MIN_PHONE_DIGITS = 7;
    static constexpr std::size_t MAX_PHONE_DIGITS = 15;

    explicit RequestValidator(std::shared_ptr<ports::output::IClock> clock)
        : clock_(std::move(clock)) {}

    std::optional<std::string> validateRegistration(const domain::RegisterRequest& request) const {
        if (request.loginName.empty() || request.email.empty() || request.password.empty()
            || request.phoneNumber.empty() || request.dateOfBirth.empty()
            || request.gender.empty() || request.address.empty()) {
            return std::string("All fields are required: login_name, email, password, "
                               "phone_number, date_of_birth, gender, address");
        }

        if (auto error = validateLoginName(request.loginName)) return error;
        if (auto error = validateEmail(request.email)) return error;
        if (auto error = validatePassword(request.password)) return error;
        if (auto error = validatePhoneNumber(request.phoneNumber)) return error;
        if (auto error = validateDateOfBirth(request.dateOfBirth)) return error;
        return std::nullopt;
    }

    std::optional<std::string> validateLogin(const domain::LoginRequest& request) const {
        if (request.identifier.empty() || request.password.empty()) {
            return std::string("identifier and password are required");
        }
        return std::nullopt;
    }

    std::optional<std::string> validatePasswordChange(const domain::ChangePasswordRequest& request) const {
        if (request.oldPassword.empty() || request.newPassword.empty()) {
            return std::string("old_password and new_password are required");
        }
        return validatePassword(request.newPassword);
    }

    std::optional<std::string> validateEmail(const std::string& email) const {
        if (utils::containsWhitespace(email)) {
            return std::string("Email must not contain whitespace");
        }
        auto at = email.find('@');
        if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) {
            return std::string("Email must contain exactly one '@'");
        }
        if (at == 0 || at + 1 == email.size()) {
            return std::string("Email must have a local part and a domain");
        }
        return std::nullopt;
    }

    std::optional<std::string> validateLoginName(const std::string& loginName) const {
        if (loginName.size() < MIN_LOGIN_NAME_LENGTH || loginName.size() > MAX_LOGIN_NAME_LENGTH) {
            return "Login name must be between " + std::to_string(MIN_LOGIN_NAME_LENGTH)
                + " and " + std::to_string(MAX_LOGIN_NAME_LENGTH) + " characters";
        }
        if (utils::containsWhitespace(loginName)) {
            return std::string("Login name must not contain whitespace");
        }
        // '@' отличает email от login name при входе
        if (loginName.find('@') != std::string::npos) {
            return std::string("Login name must not contain '@'");
        }
        return std::nullopt;
    }

    std::optional<std::string> validatePassword(const std::string& password) const {
        if (password.size() < MIN_PASSWORD_LENGTH || password.size() > MAX_PASSWORD_LENGTH) {
            return "Password must be between " + std::to_string(MIN_PASSWORD_LENGTH)
                + " and " + std::to_string(MAX_PASSWORD_LENGTH) + " characters";
        }
        return std::nullopt;
    }

    std::optional<std::string> validatePhoneNumber(const std::string& phone) const {
        std::size_t start = (!phone.empty() && phone[0] == '+') ? 1 : 0;
        std::size_t digits = phone.size() - start;
        if (digits < MIN_PHONE_DIGITS || digits > MAX_PHONE_DIGITS) {
            return std::string("Phone number must contain 7 to 15 digits");
        }
        for (std::size_t i = start; i < phone.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(phone[i]))) {
                return std::string("Phone number must contain only digits and an optional leading '+'");
            }
        }
        return std::nullopt;
    }

    std::optional<std::string> validateDateOfBirth(const std::string& date) const {
        const std::string invalid = "Date of birth must be a valid date in YYYY-MM-DD format";
        if (date.size() != 10 || date[4] != '-' || date[7] != '-') {
            return invalid;
        }
        for (std::size_t i = 0; i < date.size(); ++i) {
            if (i == 4 || i == 7) continue;
            if (!std::isdigit(static_cast<unsigned char>(date[i]))) {
                return invalid;
            }
        }

        int year = std::stoi(date.substr(0, 4));
        int month = std::stoi(date.substr(5, 2));
        int day = std::stoi(date.substr(8, 2));
        if (year < 1900 || month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
            return invalid;
        }

        // YYYY-MM-DD сравнивается лексикографически
        if (date > clock_->now().toDateString()) {
            return std::string("Date of birth must not be in the future");
        }
        return std::nullopt;
    }

private:
    std::shared_ptr<ports::output::IClock> clock_;

    static int daysInMonth(int year, int month) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return (month == 2 && leap) ? 29 : days[month - 1];
    }
};

} // namespace credentials::application
