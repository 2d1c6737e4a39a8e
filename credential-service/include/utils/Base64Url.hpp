#pragma once

#include <optional>
#include <string>

namespace credentials::utils {

/**
 * @brief Base64url без паддинга (RFC 4648 §5), как в сегментах JWT
 */
inline std::string base64UrlEncode(const std::string& input) {
    static const char* chars =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    std::string result;
    result.reserve((input.size() * 4 + 2) / 3);
    int val = 0, valb = -6;
    for (unsigned char c : input) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            result.push_back(chars[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) {
        result.push_back(chars[(val << -valb) & 0x3F]);
    }
    return result;
}

/**
 * @brief Строгое декодирование base64url
 *
 * @return nullopt при недопустимом символе, паддинге или длине
 */
inline std::optional<std::string> base64UrlDecode(const std::string& input) {
    auto decodeChar = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '-') return 62;
        if (c == '_') return 63;
        return -1;
    };

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve(input.size() * 3 / 4);
    int val = 0, valb = -8;
    for (char c : input) {
        int decoded = decodeChar(c);
        if (decoded < 0) {
            return std::nullopt;
        }
        val = ((val << 6) + decoded) & 0xFFFFFF;
        valb += 6;
        if (valb >= 0) {
            result.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    return result;
}

} // namespace credentials::utils
