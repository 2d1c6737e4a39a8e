/**
 * @file ConcurrentRegistrationTest.cpp
 * @brief Одновременная регистрация одного email из нескольких потоков
 */

#include <gtest/gtest.h>

#include "application/CredentialService.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "adapters/secondary/HmacJwtAdapter.hpp"
#include "adapters/secondary/PooledPasswordHasher.hpp"
#include "mocks/InMemoryAccountRepository.hpp"
#include "mocks/FakeClock.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace credentials;
using namespace credentials::tests::mocks;
using domain::AuthErrorKind;

class ConcurrentRegistrationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto settings = std::make_shared<adapters::secondary::AuthSettings>(
            "concurrent-registration-secret-0123456789", 1000);
        auto clock = std::make_shared<FakeClock>();
        accountRepo_ = std::make_shared<InMemoryAccountRepository>();
        pool_ = std::make_shared<WorkerPool>(4, 256);

        service_ = std::make_shared<application::CredentialService>(
            accountRepo_,
            std::make_shared<adapters::secondary::PooledPasswordHasher>(
                std::make_shared<adapters::secondary::Pbkdf2PasswordHasher>(1000), pool_),
            std::make_shared<adapters::secondary::HmacJwtAdapter>(settings, clock),
            clock
        );
    }

    void TearDown() override {
        pool_->shutdown();
    }

    static domain::RegisterRequest request(const std::string& loginName, const std::string& email) {
        domain::RegisterRequest r;
        r.loginName = loginName;
        r.email = email;
        r.password = "secret123";
        r.phoneNumber = "+79001234567";
        r.dateOfBirth = "1990-05-17";
        r.gender = "female";
        r.address = "Kazan, Baumana 5";
        return r;
    }

    std::shared_ptr<InMemoryAccountRepository> accountRepo_;
    std::shared_ptr<WorkerPool> pool_;
    std::shared_ptr<application::CredentialService> service_;
};

TEST_F(ConcurrentRegistrationTest, SameEmail_ExactlyOneSucceeds) {
    constexpr int THREADS = 8;
    std::atomic<int> successes{0};
    std::atomic<int> duplicates{0};
    std::atomic<int> others{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) std::this_thread::yield();
            auto result = service_->registerAccount(
                request("user" + std::to_string(i), "race@example.com"));
            if (result.success) {
                successes++;
            } else if (result.error == AuthErrorKind::DUPLICATE_ACCOUNT) {
                duplicates++;
            } else {
                others++;
            }
        });
    }
    go = true;
    for (auto& t : threads) t.join();

    EXPECT_EQ(successes.load(), 1);
    EXPECT_EQ(duplicates.load(), THREADS - 1);
    EXPECT_EQ(others.load(), 0);
    EXPECT_EQ(accountRepo_->size(), 1u);
}

TEST_F(ConcurrentRegistrationTest, DistinctEmails_AllSucceed) {
    constexpr int THREADS = 8;
    std::atomic<int> successes{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; ++i) {
        threads.emplace_back([&, i]() {
            auto result = service_->registerAccount(
                request("user" + std::to_string(i), "user" + std::to_string(i) + "@example.com"));
            if (result.success) successes++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(successes.load(), THREADS);
    EXPECT_EQ(accountRepo_->size(), static_cast<size_t>(THREADS));
}
