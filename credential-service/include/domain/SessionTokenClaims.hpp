#pragma once

#include "domain/Timestamp.hpp"
#include "domain/TokenSubject.hpp"
#include <cstdint>
#include <string>

namespace credentials::domain {

/**
 * @brief Claims для Session Token
 *
 * Session token выдаётся после успешной регистрации или логина.
 * Токен stateless: на сервере не хранится и не отзывается,
 * завершается только истечением срока.
 *
 * Время жизни: 24 часа (86400 секунд)
 */
struct SessionTokenClaims {
    static constexpr int64_t LIFETIME_SECONDS = 86400;

    std::string subjectId;      ///< ID аккаунта (sub claim)
    std::string subjectName;    ///< Login name (name claim)
    Timestamp issuedAt;         ///< Время выдачи (iat claim)
    Timestamp expiresAt;        ///< Время истечения (exp claim)

    SessionTokenClaims() = default;

    /**
     * @brief Claims, выданные в момент issuedAt
     */
    SessionTokenClaims(
        const std::string& subjectId,
        const std::string& subjectName,
        const Timestamp& issuedAt
    ) : subjectId(subjectId)
      , subjectName(subjectName)
      , issuedAt(Timestamp::fromUnixSeconds(issuedAt.toUnixSeconds()))
      , expiresAt(Timestamp::fromUnixSeconds(issuedAt.toUnixSeconds() + LIFETIME_SECONDS))
    {}

    /**
     * @brief Истёк ли токен на момент now
     */
    bool isExpiredAt(const Timestamp& now) const {
        return now.toUnixSeconds() >= expiresAt.toUnixSeconds();
    }

    TokenSubject subject() const {
        return TokenSubject{subjectId, subjectName};
    }
};

} // namespace credentials::domain
