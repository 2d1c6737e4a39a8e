#include "application/CredentialService.hpp"
#include "domain/exceptions/CryptoFailureException.hpp"
#include "domain/exceptions/DuplicateKeyException.hpp"
#include "domain/exceptions/StoreUnavailableException.hpp"
#include "utils/StringUtils.hpp"
#include <CommandException.hpp>
#include <iostream>

namespace credentials::application {

using ports::input::AuthResult;
using ports::input::OperationResult;
using ports::input::ProfileResult;
using ports::input::VerifyTokenResult;
using domain::AuthErrorKind;

namespace {

template <typename Result>
Result failure(AuthErrorKind kind, const std::string& message) {
    Result result;
    result.error = kind;
    result.message = message;
    return result;
}

} // namespace

CredentialService::CredentialService(
    std::shared_ptr<ports::output::IAccountRepository> accountRepo,
    std::shared_ptr<ports::output::IPasswordHasher> hasher,
    std::shared_ptr<ports::output::ITokenProvider> tokenProvider,
    std::shared_ptr<ports::output::IClock> clock
) : accountRepo_(std::move(accountRepo))
  , hasher_(std::move(hasher))
  , tokenProvider_(std::move(tokenProvider))
  , validator_(std::move(clock))
{
    std::cout << "[CredentialService] Created" << std::endl;
}

AuthResult CredentialService::registerAccount(const domain::RegisterRequest& request) {
    domain::RegisterRequest normalized = request;
    normalized.loginName = utils::trim(request.loginName);
    normalized.email = utils::normalizeEmail(request.email);
    normalized.phoneNumber = utils::trim(request.phoneNumber);
    normalized.dateOfBirth = utils::trim(request.dateOfBirth);
    normalized.gender = utils::trim(request.gender);
    normalized.address = utils::trim(request.address);

    if (auto error = validator_.validateRegistration(normalized)) {
        return failure<AuthResult>(AuthErrorKind::VALIDATION_ERROR, *error);
    }

    std::cout << "[CredentialService] Register attempt: email=" << normalized.email
              << ", login=" << normalized.loginName << std::endl;

    try {
        // Предварительная проверка: окончательно уникальность гарантирует create()
        if (accountRepo_->findByEmail(normalized.email)) {
            return failure<AuthResult>(AuthErrorKind::DUPLICATE_ACCOUNT,
                                       "An account with this email already exists");
        }
        if (accountRepo_->findByLoginName(normalized.loginName)) {
            return failure<AuthResult>(AuthErrorKind::DUPLICATE_ACCOUNT,
                                       "An account with this login name already exists");
        }

        domain::NewAccount fields;
        fields.loginName = normalized.loginName;
        fields.email = normalized.email;
        fields.passwordHash = hasher_->hash(normalized.password).get();
        fields.phoneNumber = normalized.phoneNumber;
        fields.dateOfBirth = normalized.dateOfBirth;
        fields.gender = normalized.gender;
        fields.address = normalized.address;

        domain::Account account;
        try {
            account = accountRepo_->create(fields);
        } catch (const domain::DuplicateKeyException& e) {
            std::cout << "[CredentialService] Register rejected by store: " << e.what() << std::endl;
            return failure<AuthResult>(AuthErrorKind::DUPLICATE_ACCOUNT,
                                       "An account with this email or login name already exists");
        }

        AuthResult result;
        result.success = true;
        result.message = "Account created successfully";
        result.token = tokenProvider_->issueToken(account.accountId, account.loginName);
        result.account = domain::AccountView::from(account);

        std::cout << "[CredentialService] Registered account " << account.accountId << std::endl;
        return result;

    } catch (const std::exception&) {
        return failure<AuthResult>(classifyCurrentException("registerAccount"), INTERNAL_ERROR_MESSAGE);
    }
}

AuthResult CredentialService::login(const domain::LoginRequest& request) {
    domain::LoginRequest normalized = request;
    normalized.identifier = utils::trim(request.identifier);

    if (auto error = validator_.validateLogin(normalized)) {
        return failure<AuthResult>(AuthErrorKind::VALIDATION_ERROR, *error);
    }

    bool byEmail = normalized.identifier.find('@') != std::string::npos;
    if (byEmail) {
        normalized.identifier = utils::toLower(normalized.identifier);
    }

    std::cout << "[CredentialService] Login attempt: " << normalized.identifier << std::endl;

    try {
        auto account = byEmail
            ? accountRepo_->findByEmail(normalized.identifier)
            : accountRepo_->findByLoginName(normalized.identifier);

        // Оба отказа снаружи неразличимы, чтобы нельзя было перебирать аккаунты
        if (!account) {
            hasher_->verify(normalized.password, dummyVerifier()).get();
            std::cout << "[CredentialService] Login failed: account not found" << std::endl;
            return failure<AuthResult>(AuthErrorKind::ACCOUNT_NOT_FOUND, INVALID_CREDENTIALS_MESSAGE);
        }

        if (!hasher_->verify(normalized.password, account->passwordHash).get()) {
            std::cout << "[CredentialService] Login failed: wrong password for "
                      << account->accountId << std::endl;
            return failure<AuthResult>(AuthErrorKind::INVALID_CREDENTIALS, INVALID_CREDENTIALS_MESSAGE);
        }

        AuthResult result;
        result.success = true;
        result.message = "Login successful";
        result.token = tokenProvider_->issueToken(account->accountId, account->loginName);
        result.account = domain::AccountView::from(*account);

        std::cout << "[CredentialService] Login successful: " << account->accountId << std::endl;
        return result;

    } catch (const std::exception&) {
        return failure<AuthResult>(classifyCurrentException("login"), INTERNAL_ERROR_MESSAGE);
    }
}

OperationResult CredentialService::changePassword(
    const domain::TokenSubject& subject,
    const domain::ChangePasswordRequest& request
) {
    if (subject.subjectId.empty()) {
        return failure<OperationResult>(AuthErrorKind::INVALID_TOKEN, "Invalid token");
    }

    if (auto error = validator_.validatePasswordChange(request)) {
        return failure<OperationResult>(AuthErrorKind::VALIDATION_ERROR, *error);
    }

    try {
        auto account = accountRepo_->findById(subject.subjectId);
        if (!account) {
            return failure<OperationResult>(AuthErrorKind::ACCOUNT_NOT_FOUND, "Account not found");
        }

        if (!hasher_->verify(request.oldPassword, account->passwordHash).get()) {
            std::cout << "[CredentialService] Password change rejected for "
                      << account->accountId << ": old password mismatch" << std::endl;
            return failure<OperationResult>(AuthErrorKind::INVALID_CREDENTIALS,
                                            "Old password is incorrect");
        }

        account->passwordHash = hasher_->hash(request.newPassword).get();
        accountRepo_->save(*account);

        std::cout << "[CredentialService] Password changed for " << account->accountId << std::endl;

        OperationResult result;
        result.success = true;
        result.message = "Password changed successfully";
        return result;

    } catch (const std::exception&) {
        return failure<OperationResult>(classifyCurrentException("changePassword"), INTERNAL_ERROR_MESSAGE);
    }
}

VerifyTokenResult CredentialService::verifyToken(const std::string& token) {
    if (token.empty()) {
        return failure<VerifyTokenResult>(AuthErrorKind::INVALID_TOKEN, "Token is required");
    }

    try {
        auto verification = tokenProvider_->verifyToken(token);
        switch (verification.status) {
            case domain::TokenStatus::VALID: {
                VerifyTokenResult result;
                result.valid = true;
                result.message = "Valid";
                result.subject = verification.claims.subject();
                return result;
            }
            case domain::TokenStatus::EXPIRED:
                return failure<VerifyTokenResult>(AuthErrorKind::EXPIRED_TOKEN,
                                                  "Token expired, please login again");
            case domain::TokenStatus::INVALID:
                break;
        }
        return failure<VerifyTokenResult>(AuthErrorKind::INVALID_TOKEN, "Invalid token");

    } catch (const std::exception&) {
        return failure<VerifyTokenResult>(classifyCurrentException("verifyToken"), INTERNAL_ERROR_MESSAGE);
    }
}

ProfileResult CredentialService::getProfile(const domain::TokenSubject& subject) {
    if (subject.subjectId.empty()) {
        return failure<ProfileResult>(AuthErrorKind::INVALID_TOKEN, "Invalid token");
    }

    try {
        auto account = accountRepo_->findById(subject.subjectId);
        if (!account) {
            return failure<ProfileResult>(AuthErrorKind::ACCOUNT_NOT_FOUND, "Account not found");
        }

        ProfileResult result;
        result.success = true;
        result.message = "Profile retrieved";
        result.account = domain::AccountView::from(*account);
        return result;

    } catch (const std::exception&) {
        return failure<ProfileResult>(classifyCurrentException("getProfile"), INTERNAL_ERROR_MESSAGE);
    }
}

const std::string& CredentialService::dummyVerifier() {
    std::call_once(dummyVerifierFlag_, [this]() {
        dummyVerifier_ = hasher_->hash("credential-service-unknown-account").get();
    });
    return dummyVerifier_;
}

AuthErrorKind CredentialService::classifyCurrentException(const char* operation) {
    try {
        throw;
    } catch (const domain::StoreUnavailableException& e) {
        std::cerr << "[CredentialService] " << operation << "() store unavailable: " << e.what() << std::endl;
        return AuthErrorKind::STORE_UNAVAILABLE;
    } catch (const domain::CryptoFailureException& e) {
        std::cerr << "[CredentialService] " << operation << "() crypto failure: " << e.what() << std::endl;
        return AuthErrorKind::CRYPTO_FAILURE;
    } catch (const CommandException& e) {
        std::cerr << "[CredentialService] " << operation << "() hashing pool rejected task: " << e.what() << std::endl;
        return AuthErrorKind::CRYPTO_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "[CredentialService] " << operation << "() failed: " << e.what() << std::endl;
        return AuthErrorKind::INTERNAL_ERROR;
    }
}

} // namespace credentials::application
