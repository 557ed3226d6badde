#include "signage/net/Url.hpp"

#include <algorithm>
#include <cctype>

namespace signage::net {
namespace {

unsigned short defaultPort(const std::string& scheme) {
    if (scheme == "ws" || scheme == "http") return 80;
    if (scheme == "wss" || scheme == "https") return 443;
    return 0;
}

} // namespace

std::string Url::hostHeader() const {
    const bool bracket = host.find(':') != std::string::npos;
    std::string out = bracket ? "[" + host + "]" : host;
    if (port != defaultPort(scheme)) {
        out += ":" + std::to_string(port);
    }
    return out;
}

expected<Url> parseUrl(std::string_view text) {
    const auto bad = [] { return unexpected(make_error_code(RelayErrc::invalid_url)); };

    const auto schemeEnd = text.find("://");
    if (schemeEnd == std::string_view::npos || schemeEnd == 0) {
        return bad();
    }

    Url url;
    url.scheme.assign(text.substr(0, schemeEnd));
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const auto fallbackPort = defaultPort(url.scheme);
    if (fallbackPort == 0) {
        return bad();
    }

    auto rest = text.substr(schemeEnd + 3);
    const auto authorityEnd = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authorityEnd);
    auto target = authorityEnd == std::string_view::npos ? std::string_view{} : rest.substr(authorityEnd);

    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1); // credentials are not used
    }

    std::string_view portText;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return bad();
        }
        url.host.assign(authority.substr(1, close - 1));
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return bad();
            portText = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            url.host.assign(authority.substr(0, colon));
            portText = authority.substr(colon + 1);
        } else {
            url.host.assign(authority);
        }
    }

    if (url.host.empty()) {
        return bad();
    }

    url.port = fallbackPort;
    if (!portText.empty()) {
        unsigned long value = 0;
        for (char c : portText) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return bad();
            value = value * 10 + static_cast<unsigned long>(c - '0');
            if (value > 65535) return bad();
        }
        if (value == 0) return bad();
        url.port = static_cast<unsigned short>(value);
    }

    if (const auto hash = target.find('#'); hash != std::string_view::npos) {
        target = target.substr(0, hash);
    }
    url.target = target.empty() ? "/" : std::string(target);
    if (url.target.front() == '?') {
        url.target.insert(url.target.begin(), '/');
    }
    return url;
}

} // namespace signage::net
