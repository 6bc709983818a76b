#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace jobhook::utils {

/**
 * @brief Разобранный абсолютный http(s) URL
 */
struct UrlParts {
    std::string scheme;
    std::string host;
    int port = 0;
    std::string target;  ///< path + query, минимум "/"
};

/**
 * @brief Разбор URL для SimpleRequest (host, port, path)
 *
 * Поддерживаются только схемы http и https. userinfo и fragment не допускаются.
 * IPv6-адрес записывается в квадратных скобках: https://[::1]:8080/path.
 */
class UrlParser {
public:
    static std::optional<UrlParts> parse(const std::string& url) {
        auto schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) {
            return std::nullopt;
        }

        UrlParts parts;
        parts.scheme = toLower(url.substr(0, schemeEnd));
        if (parts.scheme == "http") {
            parts.port = 80;
        } else if (parts.scheme == "https") {
            parts.port = 443;
        } else {
            return std::nullopt;
        }

        auto rest = url.substr(schemeEnd + 3);
        if (rest.find_first_of(" \t\r\n#@") != std::string::npos) {
            return std::nullopt;
        }

        auto targetStart = rest.find_first_of("/?");
        std::string authority = rest.substr(0, targetStart);
        parts.target = (targetStart == std::string::npos) ? "/" : rest.substr(targetStart);
        if (parts.target.front() == '?') {
            parts.target = "/" + parts.target;
        }

        std::string portStr;
        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal: [addr] или [addr]:port, host хранится без скобок
            auto close = authority.find(']');
            if (close == std::string::npos) {
                return std::nullopt;
            }
            parts.host = authority.substr(1, close - 1);
            if (parts.host.empty() ||
                !std::all_of(parts.host.begin(), parts.host.end(), [](unsigned char c) {
                    return std::isxdigit(c) || c == ':' || c == '.';
                })) {
                return std::nullopt;
            }
            auto tail = authority.substr(close + 1);
            if (!tail.empty()) {
                if (tail.front() != ':') {
                    return std::nullopt;
                }
                portStr = tail.substr(1);
                if (!parsePort(portStr, parts.port)) {
                    return std::nullopt;
                }
            }
            return parts;
        }

        auto colon = authority.find(':');
        if (colon != std::string::npos) {
            portStr = authority.substr(colon + 1);
            if (!parsePort(portStr, parts.port)) {
                return std::nullopt;
            }
            authority = authority.substr(0, colon);
        }

        if (authority.empty()) {
            return std::nullopt;
        }
        parts.host = authority;
        return parts;
    }

    static bool isValid(const std::string& url) {
        return parse(url).has_value();
    }

private:
    static bool parsePort(const std::string& portStr, int& port) {
        if (portStr.empty() || portStr.size() > 5 ||
            !std::all_of(portStr.begin(), portStr.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return false;
        }
        port = std::stoi(portStr);
        return port >= 1 && port <= 65535;
    }

    static std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }
};

} // namespace jobhook::utils
