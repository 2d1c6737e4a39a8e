/**
 * @file HmacJwtAdapterTest.cpp
 * @brief Unit-тесты для HmacJwtAdapter (HS256)
 */

#include <gtest/gtest.h>

#include "adapters/secondary/HmacJwtAdapter.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include "utils/Base64Url.hpp"
#include "mocks/FakeClock.hpp"

#include <nlohmann/json.hpp>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <vector>

using namespace credentials;
using namespace credentials::tests::mocks;
using adapters::secondary::AuthSettings;
using adapters::secondary::HmacJwtAdapter;
using domain::TokenStatus;

namespace {
const std::string SECRET = "test-signing-secret-0123456789abcdef";
const std::string OTHER_SECRET = "another-signing-secret-0123456789xyz";

std::string signedToken(const std::string& payload) {
    std::string input = utils::base64UrlEncode(R"({"alg":"HS256","typ":"JWT"})")
        + "." + utils::base64UrlEncode(payload);

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    HMAC(EVP_sha256(), SECRET.data(), static_cast<int>(SECRET.size()),
         reinterpret_cast<const unsigned char*>(input.data()), input.size(), digest, &length);

    return input + "." + utils::base64UrlEncode(
        std::string(reinterpret_cast<const char*>(digest), length));
}

std::vector<std::string> splitToken(const std::string& token) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    std::size_t pos;
    while ((pos = token.find('.', start)) != std::string::npos) {
        parts.push_back(token.substr(start, pos - start));
        start = pos + 1;
    }
    parts.push_back(token.substr(start));
    return parts;
}
}

class HmacJwtAdapterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<FakeClock>();
        adapter_ = std::make_shared<HmacJwtAdapter>(
            std::make_shared<AuthSettings>(SECRET, 1000), clock_);
    }

    std::shared_ptr<FakeClock> clock_;
    std::shared_ptr<HmacJwtAdapter> adapter_;
};

// ============================================
// ISSUE / VERIFY
// ============================================

TEST_F(HmacJwtAdapterTest, IssueThenVerify_ReturnsSubject) {
    auto token = adapter_->issueToken("acc-1", "john");
    auto result = adapter_->verifyToken(token);

    ASSERT_EQ(result.status, TokenStatus::VALID);
    EXPECT_EQ(result.claims.subjectId, "acc-1");
    EXPECT_EQ(result.claims.subjectName, "john");
}

TEST_F(HmacJwtAdapterTest, Issue_PayloadHasStandardClaims) {
    auto token = adapter_->issueToken("acc-1", "john");
    auto parts = splitToken(token);
    ASSERT_EQ(parts.size(), 3u);

    auto header = nlohmann::json::parse(*utils::base64UrlDecode(parts[0]));
    EXPECT_EQ(header["alg"], "HS256");
    EXPECT_EQ(header["typ"], "JWT");

    auto payload = nlohmann::json::parse(*utils::base64UrlDecode(parts[1]));
    EXPECT_EQ(payload["sub"], "acc-1");
    EXPECT_EQ(payload["name"], "john");
    EXPECT_EQ(payload["iat"].get<int64_t>(), 1700000000);
    EXPECT_EQ(payload["exp"].get<int64_t>(), 1700000000 + 86400);
}

TEST_F(HmacJwtAdapterTest, Issue_DoesNotContainSecret) {
    auto token = adapter_->issueToken("acc-1", "john");
    EXPECT_EQ(token.find(SECRET), std::string::npos);
}

// ============================================
// EXPIRY
// ============================================

TEST_F(HmacJwtAdapterTest, Verify_ValidJustBeforeExpiry) {
    auto token = adapter_->issueToken("acc-1", "john");
    clock_->advance(86399);

    EXPECT_EQ(adapter_->verifyToken(token).status, TokenStatus::VALID);
}

TEST_F(HmacJwtAdapterTest, Verify_ExpiredAtExactExpiry) {
    auto token = adapter_->issueToken("acc-1", "john");
    clock_->advance(86400);

    EXPECT_EQ(adapter_->verifyToken(token).status, TokenStatus::EXPIRED);
}

TEST_F(HmacJwtAdapterTest, Verify_ExpiredAfterLifetime) {
    auto token = adapter_->issueToken("acc-1", "john");
    clock_->advance(2 * 86400);

    EXPECT_EQ(adapter_->verifyToken(token).status, TokenStatus::EXPIRED);
}

// ============================================
// TAMPERING
// ============================================

TEST_F(HmacJwtAdapterTest, Verify_FlippedSignatureCharacterIsInvalid) {
    auto token = adapter_->issueToken("acc-1", "john");
    auto& last = token[token.size() - 3];
    last = last == 'A' ? 'B' : 'A';

    EXPECT_EQ(adapter_->verifyToken(token).status, TokenStatus::INVALID);
}

TEST_F(HmacJwtAdapterTest, Verify_EveryAlteredByteIsInvalid) {
    auto token = adapter_->issueToken("acc-1", "john");
    for (std::size_t i = 0; i < token.size(); ++i) {
        if (token[i] == '.') continue;
        auto tampered = token;
        tampered[i] = tampered[i] == 'x' ? 'y' : 'x';
        EXPECT_EQ(adapter_->verifyToken(tampered).status, TokenStatus::INVALID) << "position " << i;
    }
}

TEST_F(HmacJwtAdapterTest, Verify_ModifiedPayloadIsInvalid) {
    auto token = adapter_->issueToken("acc-1", "john");
    auto parts = splitToken(token);

    nlohmann::json payload = nlohmann::json::parse(*utils::base64UrlDecode(parts[1]));
    payload["sub"] = "acc-2";
    auto forged = parts[0] + "." + utils::base64UrlEncode(payload.dump()) + "." + parts[2];

    EXPECT_EQ(adapter_->verifyToken(forged).status, TokenStatus::INVALID);
}

TEST_F(HmacJwtAdapterTest, Verify_TokenSignedWithOtherKeyIsInvalid) {
    HmacJwtAdapter other(std::make_shared<AuthSettings>(OTHER_SECRET, 1000), clock_);
    auto token = other.issueToken("acc-1", "john");

    EXPECT_EQ(adapter_->verifyToken(token).status, TokenStatus::INVALID);
}

TEST_F(HmacJwtAdapterTest, Verify_AlgNoneIsInvalid) {
    auto token = adapter_->issueToken("acc-1", "john");
    auto parts = splitToken(token);
    auto header = utils::base64UrlEncode(R"({"alg":"none","typ":"JWT"})");

    EXPECT_EQ(adapter_->verifyToken(header + "." + parts[1] + ".").status, TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken(header + "." + parts[1] + "." + parts[2]).status, TokenStatus::INVALID);
}

TEST_F(HmacJwtAdapterTest, Verify_MalformedTokensAreInvalid) {
    EXPECT_EQ(adapter_->verifyToken("").status, TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken("not-a-token").status, TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken("a.b").status, TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken("a.b.c.d").status, TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken("..").status, TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken("!!!.@@@.###").status, TokenStatus::INVALID);
}

TEST_F(HmacJwtAdapterTest, Verify_SignedPayloadWithBadClaimsIsInvalid) {
    EXPECT_EQ(adapter_->verifyToken(signedToken(R"({"name":"john","exp":9999999999})")).status,
              TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken(signedToken(R"({"sub":"","name":"john","exp":9999999999})")).status,
              TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken(signedToken(R"({"sub":"acc-1","name":"john","exp":"soon"})")).status,
              TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken(signedToken(R"({"sub":"acc-1","name":"john"})")).status,
              TokenStatus::INVALID);
    EXPECT_EQ(adapter_->verifyToken(signedToken("not json")).status, TokenStatus::INVALID);
}

TEST_F(HmacJwtAdapterTest, Verify_SignedPayloadWithoutIatIsAccepted) {
    auto result = adapter_->verifyToken(signedToken(R"({"sub":"acc-9","name":"kate","exp":1700000100})"));

    ASSERT_EQ(result.status, TokenStatus::VALID);
    EXPECT_EQ(result.claims.subjectId, "acc-9");
    EXPECT_EQ(result.claims.expiresAt.toUnixSeconds(), 1700000100);
}
