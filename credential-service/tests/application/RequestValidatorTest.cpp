/**
 * @file RequestValidatorTest.cpp
 * @brief Unit-тесты для RequestValidator
 */

#include <gtest/gtest.h>

#include "application/RequestValidator.hpp"
#include "mocks/FakeClock.hpp"

#include <vector>

using namespace credentials;
using namespace credentials::tests::mocks;
using application::RequestValidator;

class RequestValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        // 2023-11-14T22:13:20Z
        clock_ = std::make_shared<FakeClock>();
        validator_ = std::make_unique<RequestValidator>(clock_);
    }

    domain::RegisterRequest validRequest() {
        domain::RegisterRequest request;
        request.loginName = "john";
        request.email = "john@example.com";
        request.password = "secret123";
        request.phoneNumber = "+79001234567";
        request.dateOfBirth = "1990-05-17";
        request.gender = "male";
        request.address = "Moscow, Tverskaya 1";
        return request;
    }

    std::shared_ptr<FakeClock> clock_;
    std::unique_ptr<RequestValidator> validator_;
};

// ============================================
// REGISTRATION
// ============================================

TEST_F(RequestValidatorTest, Registration_ValidRequestPasses) {
    EXPECT_FALSE(validator_->validateRegistration(validRequest()).has_value());
}

TEST_F(RequestValidatorTest, Registration_EachMissingFieldFails) {
    std::vector<std::string domain::RegisterRequest::*> fields = {
        &domain::RegisterRequest::loginName,
        &domain::RegisterRequest::email,
        &domain::RegisterRequest::password,
        &domain::RegisterRequest::phoneNumber,
        &domain::RegisterRequest::dateOfBirth,
        &domain::RegisterRequest::gender,
        &domain::RegisterRequest::address,
    };

    for (auto field : fields) {
        auto request = validRequest();
        request.*field = "";
        EXPECT_TRUE(validator_->validateRegistration(request).has_value());
    }
}

TEST_F(RequestValidatorTest, Registration_FirstFailingRuleWins) {
    auto request = validRequest();
    request.loginName = "jo";
    request.email = "broken";

    auto error = validator_->validateRegistration(request);
    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("Login name"), std::string::npos);
}

// ============================================
// EMAIL
// ============================================

TEST_F(RequestValidatorTest, Email_Rules) {
    EXPECT_FALSE(validator_->validateEmail("a@b").has_value());
    EXPECT_FALSE(validator_->validateEmail("john.doe@mail.example.com").has_value());

    EXPECT_TRUE(validator_->validateEmail("john.example.com").has_value());
    EXPECT_TRUE(validator_->validateEmail("john@@example.com").has_value());
    EXPECT_TRUE(validator_->validateEmail("a@b@c").has_value());
    EXPECT_TRUE(validator_->validateEmail("@example.com").has_value());
    EXPECT_TRUE(validator_->validateEmail("john@").has_value());
    EXPECT_TRUE(validator_->validateEmail("jo hn@example.com").has_value());
}

// ============================================
// LOGIN NAME / PASSWORD
// ============================================

TEST_F(RequestValidatorTest, LoginName_LengthAndWhitespace) {
    EXPECT_FALSE(validator_->validateLoginName("abc").has_value());
    EXPECT_FALSE(validator_->validateLoginName(std::string(64, 'a')).has_value());

    EXPECT_TRUE(validator_->validateLoginName("ab").has_value());
    EXPECT_TRUE(validator_->validateLoginName(std::string(65, 'a')).has_value());
    EXPECT_TRUE(validator_->validateLoginName("john doe").has_value());
}

TEST_F(RequestValidatorTest, LoginName_RejectsAtSign) {
    auto error = validator_->validateLoginName("bob@home");

    ASSERT_TRUE(error.has_value());
    EXPECT_NE(error->find("'@'"), std::string::npos);
}

TEST_F(RequestValidatorTest, Password_Length) {
    EXPECT_FALSE(validator_->validatePassword("123456").has_value());
    EXPECT_FALSE(validator_->validatePassword(std::string(128, 'p')).has_value());

    EXPECT_TRUE(validator_->validatePassword("12345").has_value());
    EXPECT_TRUE(validator_->validatePassword(std::string(129, 'p')).has_value());
}

// ============================================
// PHONE
// ============================================

TEST_F(RequestValidatorTest, Phone_Rules) {
    EXPECT_FALSE(validator_->validatePhoneNumber("+79001234567").has_value());
    EXPECT_FALSE(validator_->validatePhoneNumber("1234567").has_value());
    EXPECT_FALSE(validator_->validatePhoneNumber("123456789012345").has_value());

    EXPECT_TRUE(validator_->validatePhoneNumber("123456").has_value());
    EXPECT_TRUE(validator_->validatePhoneNumber("1234567890123456").has_value());
    EXPECT_TRUE(validator_->validatePhoneNumber("+7 900 123 45 67").has_value());
    EXPECT_TRUE(validator_->validatePhoneNumber("++79001234567").has_value());
    EXPECT_TRUE(validator_->validatePhoneNumber("+").has_value());
}

// ============================================
// DATE OF BIRTH
// ============================================

TEST_F(RequestValidatorTest, DateOfBirth_Format) {
    EXPECT_FALSE(validator_->validateDateOfBirth("1990-05-17").has_value());

    EXPECT_TRUE(validator_->validateDateOfBirth("17.05.1990").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("1990-5-17").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("1990/05/17").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("199a-05-17").has_value());
}

TEST_F(RequestValidatorTest, DateOfBirth_MustBeRealCalendarDate) {
    EXPECT_FALSE(validator_->validateDateOfBirth("2000-02-29").has_value());

    EXPECT_TRUE(validator_->validateDateOfBirth("1999-02-29").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("1900-02-29").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("1990-13-01").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("1990-04-31").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("1990-00-10").has_value());
}

TEST_F(RequestValidatorTest, DateOfBirth_NotInFuture) {
    EXPECT_FALSE(validator_->validateDateOfBirth("2023-11-14").has_value());
    EXPECT_TRUE(validator_->validateDateOfBirth("2023-11-15").has_value());

    clock_->advance(86400);
    EXPECT_FALSE(validator_->validateDateOfBirth("2023-11-15").has_value());
}

// ============================================
// LOGIN / CHANGE PASSWORD
// ============================================

TEST_F(RequestValidatorTest, Login_RequiresBothFields) {
    EXPECT_FALSE(validator_->validateLogin({"john", "x"}).has_value());
    EXPECT_TRUE(validator_->validateLogin({"", "secret123"}).has_value());
    EXPECT_TRUE(validator_->validateLogin({"john", ""}).has_value());
}

TEST_F(RequestValidatorTest, PasswordChange_AppliesPolicyToNewPasswordOnly) {
    EXPECT_FALSE(validator_->validatePasswordChange({"old", "newsecret"}).has_value());
    EXPECT_TRUE(validator_->validatePasswordChange({"oldsecret", "new"}).has_value());
    EXPECT_TRUE(validator_->validatePasswordChange({"", "newsecret"}).has_value());
    EXPECT_TRUE(validator_->validatePasswordChange({"oldsecret", ""}).has_value());
}
