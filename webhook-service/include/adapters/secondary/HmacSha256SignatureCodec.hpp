#pragma once

#include "ports/output/ISignatureCodec.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace jobhook::adapters::secondary {

/**
 * @brief HMAC-SHA256 на OpenSSL
 *
 * Формат заголовка: "sha256=" + 64 hex символа. Регистр hex при проверке
 * не важен, сравнение digest'ов: CRYPTO_memcmp (время не зависит от
 * позиции первого расхождения).
 */
class HmacSha256SignatureCodec : public ports::output::ISignatureCodec {
public:
    static constexpr const char* PREFIX = "sha256=";
    static constexpr std::size_t HEX_LENGTH = 64;

    std::string sign(const std::string& secret, const std::string& payload) const override {
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;

        auto* ok = HMAC(EVP_sha256(),
                        secret.data(), static_cast<int>(secret.size()),
                        reinterpret_cast<const unsigned char*>(payload.data()), payload.size(),
                        digest, &digestLen);
        if (ok == nullptr) {
            throw std::runtime_error("HMAC-SHA256 computation failed");
        }
        return toHex(digest, digestLen);
    }

    bool verify(const std::string& secret,
                const std::string& payload,
                const std::string& presentedHeaderValue) const override {
        const std::string prefix(PREFIX);
        if (presentedHeaderValue.size() != prefix.size() + HEX_LENGTH ||
            presentedHeaderValue.compare(0, prefix.size(), prefix) != 0) {
            return false;
        }

        std::string presented = presentedHeaderValue.substr(prefix.size());
        if (!std::all_of(presented.begin(), presented.end(),
                         [](unsigned char c) { return std::isxdigit(c); })) {
            return false;
        }
        std::transform(presented.begin(), presented.end(), presented.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        std::string expected;
        try {
            expected = sign(secret, payload);
        } catch (const std::runtime_error&) {
            return false;
        }

        return CRYPTO_memcmp(expected.data(), presented.data(), HEX_LENGTH) == 0;
    }

private:
    static std::string toHex(const unsigned char* data, unsigned int len) {
        static const char* digits = "0123456789abcdef";
        std::string hex;
        hex.reserve(len * 2);
        for (unsigned int i = 0; i < len; ++i) {
            hex.push_back(digits[data[i] >> 4]);
            hex.push_back(digits[data[i] & 0x0f]);
        }
        return hex;
    }
};

} // namespace jobhook::adapters::secondary
