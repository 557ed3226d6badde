#include "signage/net/HttpClient.hpp"

#include "signage/log/Log.hpp"
#include "signage/net/Resolve.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace signage::net {
namespace {

constexpr std::string_view HEADER_END = "\r\n\r\n";
constexpr std::size_t MAX_RESPONSE_BYTES = 1 << 20;

bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
            return std::tolower(static_cast<unsigned char>(x)) ==
                   std::tolower(static_cast<unsigned char>(y));
        });
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// nullopt when absent; malformed_response when unparseable or past MAX_RESPONSE_BYTES.
expected<std::optional<std::size_t>> contentLength(std::string_view headers) {
    std::size_t pos = 0;
    while (pos < headers.size()) {
        auto eol = headers.find("\r\n", pos);
        if (eol == std::string_view::npos) eol = headers.size();
        const auto line = headers.substr(pos, eol - pos);
        pos = eol + 2;

        const auto colon = line.find(':');
        if (colon == std::string_view::npos) continue;
        if (!iequals(trim(line.substr(0, colon)), "content-length")) continue;

        const auto bad = make_error_code(RelayErrc::malformed_response);
        std::size_t value = 0;
        const auto digits = trim(line.substr(colon + 1));
        if (digits.empty()) return unexpected(bad);
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return unexpected(bad);
            value = value * 10 + static_cast<std::size_t>(c - '0');
            if (value > MAX_RESPONSE_BYTES) return unexpected(bad);
        }
        return std::optional<std::size_t>(value);
    }
    return std::optional<std::size_t>();
}

} // namespace

expected<HttpResponse> parseHttpResponse(std::string_view raw) {
    const auto headerEnd = raw.find(HEADER_END);
    if (headerEnd == std::string_view::npos || raw.substr(0, 5) != "HTTP/") {
        return unexpected(make_error_code(RelayErrc::malformed_response));
    }

    // "HTTP/1.1 200 OK"
    const auto statusStart = raw.find(' ');
    if (statusStart == std::string_view::npos || statusStart + 4 > headerEnd) {
        return unexpected(make_error_code(RelayErrc::malformed_response));
    }
    int status = 0;
    for (std::size_t i = statusStart + 1; i < statusStart + 4; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(raw[i]))) {
            return unexpected(make_error_code(RelayErrc::malformed_response));
        }
        status = status * 10 + (raw[i] - '0');
    }

    HttpResponse response;
    response.status = status;

    const auto headers = raw.substr(0, headerEnd + 2);
    auto body = raw.substr(headerEnd + HEADER_END.size());
    const auto length = contentLength(headers);
    if (!length) {
        return unexpected(length.error());
    }
    if (*length) {
        if (body.size() < **length) {
            return unexpected(make_error_code(RelayErrc::malformed_response));
        }
        body = body.substr(0, **length);
    }
    response.body.assign(body);
    return response;
}

HttpClient::HttpClient(std::chrono::milliseconds timeout)
: timeout_(timeout)
{}

expected<HttpResponse> HttpClient::postJson(const std::string& host,
                                            unsigned short port,
                                            const std::string& target,
                                            std::string_view body) {
    TcpClient tcp;
    tcp.setDefaultTimeout(timeout_);
    tcp.setConnectTimeout(timeout_);

    tcp::resolver::results_type endpoints;
    if (auto ec = resolve(tcp.io(), host, std::to_string(port), endpoints); ec) {
        return unexpected(ec);
    }
    if (auto ec = tcp.connect(endpoints); ec) {
        return unexpected(ec);
    }
    tcp.setLowLatency();

    std::string request;
    request.reserve(body.size() + 256);
    request += "POST " + target + " HTTP/1.1\r\n";
    request += "Host: " + host + (port == 80 ? std::string{} : ":" + std::to_string(port)) + "\r\n";
    request += "Content-Type: application/json\r\n";
    request += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    request += "Connection: close\r\n\r\n";
    request.append(body);

    if (auto ec = tcp.write_all(request.data(), request.size()); ec) {
        return unexpected(ec);
    }

    std::string raw;
    std::array<char, 4096> chunk{};
    for (;;) {
        std::size_t got = 0;
        const auto ec = tcp.read_some(chunk.data(), chunk.size(), got);
        raw.append(chunk.data(), got);

        if (ec == asio::error::eof) {
            break;
        }
        if (ec) {
            return unexpected(ec);
        }
        if (raw.size() > MAX_RESPONSE_BYTES) {
            return unexpected(make_error_code(RelayErrc::malformed_response));
        }
        // Stop early once a Content-Length body is complete.
        if (const auto headerEnd = raw.find(HEADER_END); headerEnd != std::string::npos) {
            const auto length = contentLength(std::string_view(raw).substr(0, headerEnd + 2));
            if (!length) {
                return unexpected(length.error());
            }
            if (*length && raw.size() >= headerEnd + HEADER_END.size() + **length) {
                break;
            }
        }
    }

    logDebug("[HttpClient] ", host, ":", port, target, " -> ", raw.size(), " bytes\n");
    return parseHttpResponse(raw);
}

} // namespace signage::net
