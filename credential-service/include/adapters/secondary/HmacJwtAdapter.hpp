#pragma once

#include "ports/output/ITokenProvider.hpp"
#include "ports/output/IClock.hpp"
#include "adapters/secondary/AuthSettings.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace credentials::adapters::secondary {

/**
 * @brief JWT (HS256) провайдер session token
 *
 * Токен: base64url(header).base64url(payload).base64url(HMAC-SHA256)
 * header:  {"alg":"HS256","typ":"JWT"}
 * payload: {"sub": accountId, "name": loginName, "iat": ..., "exp": iat + 86400}
 *
 * Ключ подписи берётся из AuthSettings и общий на процесс: его смена
 * инвалидирует все выданные токены.
 */
class HmacJwtAdapter : public ports::output::ITokenProvider {
public:
    HmacJwtAdapter(
        std::shared_ptr<AuthSettings> settings,
        std::shared_ptr<ports::output::IClock> clock
    );

    std::string issueToken(const std::string& subjectId, const std::string& subjectName) override;

    ports::output::TokenVerification verifyToken(const std::string& token) override;

private:
    std::string signingKey_;
    std::shared_ptr<ports::output::IClock> clock_;

    std::string sign(const std::string& signingInput) const;

    static std::optional<nlohmann::json> decodeSegment(const std::string& segment);
};

} // namespace credentials::adapters::secondary
