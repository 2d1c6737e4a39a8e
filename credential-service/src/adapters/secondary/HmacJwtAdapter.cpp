#include "adapters/secondary/HmacJwtAdapter.hpp"
#include "domain/exceptions/CryptoFailureException.hpp"
#include "utils/Base64Url.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <iostream>

namespace credentials::adapters::secondary {

namespace {
constexpr const char* ALGORITHM = "HS256";
}

HmacJwtAdapter::HmacJwtAdapter(
    std::shared_ptr<AuthSettings> settings,
    std::shared_ptr<ports::output::IClock> clock
) : signingKey_(settings->getTokenSecret())
  , clock_(std::move(clock))
{
    std::cout << "[HmacJwtAdapter] Created, algorithm=" << ALGORITHM << std::endl;
}

std::string HmacJwtAdapter::issueToken(const std::string& subjectId, const std::string& subjectName) {
    domain::SessionTokenClaims claims(subjectId, subjectName, clock_->now());

    nlohmann::json header;
    header["alg"] = ALGORITHM;
    header["typ"] = "JWT";

    nlohmann::json payload;
    payload["sub"] = claims.subjectId;
    payload["name"] = claims.subjectName;
    payload["iat"] = claims.issuedAt.toUnixSeconds();
    payload["exp"] = claims.expiresAt.toUnixSeconds();

    std::string signingInput = utils::base64UrlEncode(header.dump())
        + "." + utils::base64UrlEncode(payload.dump());

    return signingInput + "." + utils::base64UrlEncode(sign(signingInput));
}

ports::output::TokenVerification HmacJwtAdapter::verifyToken(const std::string& token) {
    ports::output::TokenVerification result;

    auto first = token.find('.');
    if (first == std::string::npos) return result;
    auto second = token.find('.', first + 1);
    if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
        return result;
    }

    std::string headerSegment = token.substr(0, first);
    std::string payloadSegment = token.substr(first + 1, second - first - 1);
    std::string signatureSegment = token.substr(second + 1);
    if (headerSegment.empty() || payloadSegment.empty() || signatureSegment.empty()) {
        return result;
    }

    // Алгоритм фиксирован: "none" и любые другие значения отвергаются
    auto header = decodeSegment(headerSegment);
    if (!header || !header->is_object() || !(*header)["alg"].is_string()
        || (*header)["alg"].get<std::string>() != ALGORITHM) {
        return result;
    }

    std::string expected = utils::base64UrlEncode(sign(token.substr(0, second)));
    if (expected.size() != signatureSegment.size()
        || CRYPTO_memcmp(expected.data(), signatureSegment.data(), expected.size()) != 0) {
        return result;
    }

    auto payload = decodeSegment(payloadSegment);
    if (!payload || !payload->is_object()) return result;

    const auto& sub = (*payload)["sub"];
    const auto& name = (*payload)["name"];
    const auto& exp = (*payload)["exp"];
    if (!sub.is_string() || !name.is_string() || !exp.is_number_integer()) {
        return result;
    }
    if (sub.get<std::string>().empty()) return result;

    result.claims.subjectId = sub.get<std::string>();
    result.claims.subjectName = name.get<std::string>();
    result.claims.expiresAt = domain::Timestamp::fromUnixSeconds(exp.get<int64_t>());
    const auto& iat = (*payload)["iat"];
    result.claims.issuedAt = iat.is_number_integer()
        ? domain::Timestamp::fromUnixSeconds(iat.get<int64_t>())
        : result.claims.expiresAt.addSeconds(-domain::SessionTokenClaims::LIFETIME_SECONDS);

    result.status = result.claims.isExpiredAt(clock_->now())
        ? domain::TokenStatus::EXPIRED
        : domain::TokenStatus::VALID;
    return result;
}

std::string HmacJwtAdapter::sign(const std::string& signingInput) const {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLength = 0;

    auto* mac = HMAC(EVP_sha256(),
                     signingKey_.data(), static_cast<int>(signingKey_.size()),
                     reinterpret_cast<const unsigned char*>(signingInput.data()), signingInput.size(),
                     digest, &digestLength);
    if (mac == nullptr) {
        throw domain::CryptoFailureException("HMAC-SHA256 signing failed");
    }

    return std::string(reinterpret_cast<const char*>(digest), digestLength);
}

std::optional<nlohmann::json> HmacJwtAdapter::decodeSegment(const std::string& segment) {
    auto decoded = utils::base64UrlDecode(segment);
    if (!decoded) {
        return std::nullopt;
    }

    auto parsed = nlohmann::json::parse(*decoded, nullptr, false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace credentials::adapters::secondary
