/**
 * @file Pbkdf2PasswordHasherTest.cpp
 * @brief Unit-тесты для Pbkdf2PasswordHasher
 */

#include <gtest/gtest.h>

#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"

#include <stdexcept>

using namespace credentials;
using adapters::secondary::Pbkdf2PasswordHasher;

class Pbkdf2PasswordHasherTest : public ::testing::Test {
protected:
    Pbkdf2PasswordHasher hasher_{1000};
};

TEST_F(Pbkdf2PasswordHasherTest, Verify_AcceptsOriginalPassword) {
    auto verifier = hasher_.hash("correct horse battery staple");
    EXPECT_TRUE(hasher_.verify("correct horse battery staple", verifier));
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_RejectsDifferentPassword) {
    auto verifier = hasher_.hash("password123");
    EXPECT_FALSE(hasher_.verify("password124", verifier));
    EXPECT_FALSE(hasher_.verify("", verifier));
}

TEST_F(Pbkdf2PasswordHasherTest, Hash_IsSaltedPerCall) {
    auto first = hasher_.hash("password123");
    auto second = hasher_.hash("password123");

    EXPECT_NE(first, second);
    EXPECT_TRUE(hasher_.verify("password123", first));
    EXPECT_TRUE(hasher_.verify("password123", second));
}

TEST_F(Pbkdf2PasswordHasherTest, Hash_NeverContainsPlaintext) {
    auto verifier = hasher_.hash("password123");
    EXPECT_EQ(verifier.find("password123"), std::string::npos);
}

TEST_F(Pbkdf2PasswordHasherTest, Hash_HasSchemeIterationsSaltAndKey) {
    auto verifier = hasher_.hash("password123");

    // pbkdf2-sha256$1000$<32 hex>$<64 hex>
    EXPECT_EQ(verifier.rfind("pbkdf2-sha256$1000$", 0), 0u);
    auto saltStart = verifier.find('$', verifier.find('$') + 1) + 1;
    auto keyStart = verifier.find('$', saltStart) + 1;
    EXPECT_EQ(keyStart - saltStart - 1, Pbkdf2PasswordHasher::SALT_BYTES * 2);
    EXPECT_EQ(verifier.size() - keyStart, Pbkdf2PasswordHasher::KEY_BYTES * 2);
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_UsesIterationsEmbeddedInVerifier) {
    Pbkdf2PasswordHasher stronger(2000);
    auto oldVerifier = hasher_.hash("password123");

    EXPECT_TRUE(stronger.verify("password123", oldVerifier));
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_MalformedVerifierReturnsFalse) {
    EXPECT_FALSE(hasher_.verify("password123", ""));
    EXPECT_FALSE(hasher_.verify("password123", "password123"));
    EXPECT_FALSE(hasher_.verify("password123", "pbkdf2-sha256$1000$abcd"));
    EXPECT_FALSE(hasher_.verify("password123", "bcrypt$1000$00$00"));
    EXPECT_FALSE(hasher_.verify("password123", "pbkdf2-sha256$abc$00$00"));
    EXPECT_FALSE(hasher_.verify("password123", "pbkdf2-sha256$0$00$00"));
    EXPECT_FALSE(hasher_.verify("password123", "pbkdf2-sha256$1000$zz$zz"));
}

TEST_F(Pbkdf2PasswordHasherTest, Verify_TamperedKeyReturnsFalse) {
    auto verifier = hasher_.hash("password123");
    verifier.back() = verifier.back() == '0' ? '1' : '0';

    EXPECT_FALSE(hasher_.verify("password123", verifier));
}

TEST_F(Pbkdf2PasswordHasherTest, Constructor_RejectsNonPositiveIterations) {
    EXPECT_THROW(Pbkdf2PasswordHasher(0), std::invalid_argument);
    EXPECT_THROW(Pbkdf2PasswordHasher(-5), std::invalid_argument);
}
