#include "adapters/secondary/Pbkdf2PasswordHasher.hpp"
#include "domain/exceptions/CryptoFailureException.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace credentials::adapters::secondary {

namespace {

std::string bytesToHex(const std::vector<unsigned char>& data) {
    std::ostringstream oss;
    for (unsigned char byte : data) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

bool hexToBytes(const std::string& hex, std::vector<unsigned char>& out) {
    if (hex.empty() || hex.size() % 2 != 0) {
        return false;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    out.clear();
    out.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = nibble(hex[i]);
        int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return false;
        }
        out.push_back(static_cast<unsigned char>((high << 4) | low));
    }
    return true;
}

bool parseIterations(const std::string& text, int& iterations) {
    if (text.empty() || text.size() > 8) {
        return false;
    }
    int value = 0;
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    if (value < 1 || value > Pbkdf2PasswordHasher::MAX_ITERATIONS) {
        return false;
    }
    iterations = value;
    return true;
}

std::vector<std::string> split(const std::string& value, char delimiter) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = value.find(delimiter, start);
        if (pos == std::string::npos) {
            parts.push_back(value.substr(start));
            return parts;
        }
        parts.push_back(value.substr(start, pos - start));
        start = pos + 1;
    }
}

} // namespace

Pbkdf2PasswordHasher::Pbkdf2PasswordHasher(int iterations)
    : iterations_(iterations)
{
    if (iterations < 1 || iterations > MAX_ITERATIONS) {
        throw std::invalid_argument("PBKDF2 iterations out of range: " + std::to_string(iterations));
    }
}

std::string Pbkdf2PasswordHasher::hash(const std::string& password) const {
    std::vector<unsigned char> salt(SALT_BYTES);
    if (RAND_bytes(salt.data(), static_cast<int>(salt.size())) != 1) {
        throw domain::CryptoFailureException("RAND_bytes failed to generate salt");
    }

    auto key = derive(password, salt, iterations_, KEY_BYTES);

    return std::string(SCHEME) + "$" + std::to_string(iterations_)
        + "$" + bytesToHex(salt) + "$" + bytesToHex(key);
}

bool Pbkdf2PasswordHasher::verify(const std::string& password, const std::string& verifier) const {
    auto parts = split(verifier, '$');
    if (parts.size() != 4 || parts[0] != SCHEME) {
        return false;
    }

    int iterations = 0;
    std::vector<unsigned char> salt;
    std::vector<unsigned char> expected;
    if (!parseIterations(parts[1], iterations)
        || !hexToBytes(parts[2], salt)
        || !hexToBytes(parts[3], expected)
        || expected.size() != KEY_BYTES) {
        return false;
    }

    auto computed = derive(password, salt, iterations, expected.size());
    return CRYPTO_memcmp(computed.data(), expected.data(), expected.size()) == 0;
}

std::vector<unsigned char> Pbkdf2PasswordHasher::derive(
    const std::string& password,
    const std::vector<unsigned char>& salt,
    int iterations,
    std::size_t keyLength)
{
    std::vector<unsigned char> output(keyLength);
    int ok = PKCS5_PBKDF2_HMAC(
        password.data(), static_cast<int>(password.size()),
        salt.data(), static_cast<int>(salt.size()),
        iterations, EVP_sha256(),
        static_cast<int>(output.size()), output.data());
    if (ok != 1) {
        throw domain::CryptoFailureException("PKCS5_PBKDF2_HMAC failed");
    }
    return output;
}

} // namespace credentials::adapters::secondary
