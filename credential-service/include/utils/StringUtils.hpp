#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace credentials::utils {

/**
 * @brief Убрать пробельные символы по краям
 */
inline std::string trim(const std::string& value) {
    auto isSpace = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), isSpace);
    auto end = std::find_if_not(value.rbegin(), value.rend(), isSpace).base();
    return begin < end ? std::string(begin, end) : std::string();
}

inline std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

/**
 * @brief Нормализация email: trim + lowercase
 */
inline std::string normalizeEmail(const std::string& email) {
    return toLower(trim(email));
}

inline bool containsWhitespace(const std::string& value) {
    return std::any_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace credentials::utils
