#pragma once

#include <string>

namespace jobhook::ports::output {

/**
 * @brief HMAC-SHA256 подпись сырых байтов в форме "sha256=<hex>"
 *
 * Используется в обе стороны: проверка входящих webhook'ов и подпись
 * исходящих callback'ов.
 */
class ISignatureCodec {
public:
    virtual ~ISignatureCodec() = default;

    /**
     * @brief HMAC-SHA256(secret, payload) в lowercase hex (64 символа)
     */
    virtual std::string sign(const std::string& secret, const std::string& payload) const = 0;

    /**
     * @brief Проверить значение заголовка против payload
     *
     * Никогда не бросает: любой некорректный заголовок: false.
     */
    virtual bool verify(const std::string& secret,
                        const std::string& payload,
                        const std::string& presentedHeaderValue) const = 0;

    /**
     * @brief Готовое значение заголовка "sha256=<hex>"
     */
    std::string headerValue(const std::string& secret, const std::string& payload) const {
        return "sha256=" + sign(secret, payload);
    }
};

} // namespace jobhook::ports::output
