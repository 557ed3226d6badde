#include "signage/net/WebSocketFrame.hpp"

#include "signage/core/Base64.hpp"

#include <algorithm>
#include <cctype>

#include <openssl/sha.h>

namespace signage::net::ws {
namespace {

constexpr std::uint8_t FIN_BIT = 0x80;
constexpr std::uint8_t RSV_BITS = 0x70;
constexpr std::uint8_t OPCODE_BITS = 0x0F;
constexpr std::uint8_t MASK_BIT = 0x80;
constexpr std::uint8_t LENGTH_BITS = 0x7F;
constexpr std::uint8_t LENGTH_16 = 126;
constexpr std::uint8_t LENGTH_64 = 127;
constexpr std::string_view ACCEPT_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

bool isKnownOpcode(std::uint8_t value) {
    switch (static_cast<Opcode>(value)) {
        case Opcode::Continuation:
        case Opcode::Text:
        case Opcode::Binary:
        case Opcode::Close:
        case Opcode::Ping:
        case Opcode::Pong:
            return true;
    }
    return false;
}

bool isControl(Opcode opcode) {
    return (static_cast<std::uint8_t>(opcode) & 0x08) != 0;
}

std::string lower(std::string_view text) {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trimmed(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r')) s.remove_suffix(1);
    return s;
}

// Value of the first header named `name` (lowercase), status line skipped.
std::optional<std::string_view> headerValue(std::string_view headers, std::string_view name) {
    std::size_t pos = headers.find("\r\n");
    while (pos != std::string_view::npos && pos + 2 < headers.size()) {
        pos += 2;
        auto eol = headers.find("\r\n", pos);
        const auto line = headers.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        const auto colon = line.find(':');
        if (colon != std::string_view::npos && lower(trimmed(line.substr(0, colon))) == name) {
            return trimmed(line.substr(colon + 1));
        }
        pos = eol;
    }
    return std::nullopt;
}

} // namespace

std::vector<std::uint8_t> encodeFrame(Opcode opcode,
                                      std::string_view payload,
                                      const MaskKey& mask,
                                      bool fin) {
    std::vector<std::uint8_t> out;
    out.reserve(payload.size() + 14);

    out.push_back(static_cast<std::uint8_t>((fin ? FIN_BIT : 0) | static_cast<std::uint8_t>(opcode)));

    const std::uint64_t length = payload.size();
    if (length < LENGTH_16) {
        out.push_back(static_cast<std::uint8_t>(MASK_BIT | length));
    } else if (length <= 0xFFFF) {
        out.push_back(MASK_BIT | LENGTH_16);
        out.push_back(static_cast<std::uint8_t>((length >> 8) & 0xFF));
        out.push_back(static_cast<std::uint8_t>(length & 0xFF));
    } else {
        out.push_back(MASK_BIT | LENGTH_64);
        for (int shift = 56; shift >= 0; shift -= 8) {
            out.push_back(static_cast<std::uint8_t>((length >> shift) & 0xFF));
        }
    }

    out.insert(out.end(), mask.begin(), mask.end());
    for (std::size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]);
    }
    return out;
}

expected<std::optional<ParsedFrame>> parseFrame(const std::uint8_t* data,
                                                std::size_t size,
                                                std::size_t maxPayload) {
    if (size < 2) {
        return std::optional<ParsedFrame>{};
    }

    const std::uint8_t first = data[0];
    const std::uint8_t second = data[1];

    if ((first & RSV_BITS) != 0 || !isKnownOpcode(first & OPCODE_BITS)) {
        return unexpected(make_error_code(RelayErrc::protocol_violation));
    }

    ParsedFrame parsed;
    parsed.frame.fin = (first & FIN_BIT) != 0;
    parsed.frame.opcode = static_cast<Opcode>(first & OPCODE_BITS);

    const bool masked = (second & MASK_BIT) != 0;
    std::uint64_t length = second & LENGTH_BITS;
    std::size_t offset = 2;

    if (length == LENGTH_16) {
        if (size < offset + 2) return std::optional<ParsedFrame>{};
        length = (static_cast<std::uint64_t>(data[2]) << 8) | data[3];
        offset += 2;
    } else if (length == LENGTH_64) {
        if (size < offset + 8) return std::optional<ParsedFrame>{};
        length = 0;
        for (std::size_t i = 0; i < 8; ++i) {
            length = (length << 8) | data[2 + i];
        }
        offset += 8;
    }

    if (isControl(parsed.frame.opcode) && (!parsed.frame.fin || length > MAX_CONTROL_PAYLOAD)) {
        return unexpected(make_error_code(RelayErrc::protocol_violation));
    }
    if (length > maxPayload) {
        return unexpected(make_error_code(RelayErrc::message_too_large));
    }

    MaskKey mask{};
    if (masked) {
        if (size < offset + 4) return std::optional<ParsedFrame>{};
        std::copy(data + offset, data + offset + 4, mask.begin());
        offset += 4;
    }

    if (size - offset < length) {
        return std::optional<ParsedFrame>{};
    }

    const auto count = static_cast<std::size_t>(length);
    parsed.frame.payload.assign(reinterpret_cast<const char*>(data + offset), count);
    if (masked) {
        for (std::size_t i = 0; i < count; ++i) {
            parsed.frame.payload[i] = static_cast<char>(
                static_cast<std::uint8_t>(parsed.frame.payload[i]) ^ mask[i % 4]);
        }
    }
    parsed.consumed = offset + count;
    return std::optional<ParsedFrame>{std::move(parsed)};
}

std::string closePayload(std::uint16_t code) {
    std::string out(2, '\0');
    out[0] = static_cast<char>((code >> 8) & 0xFF);
    out[1] = static_cast<char>(code & 0xFF);
    return out;
}

std::string makeHandshakeKey(std::mt19937& rng) {
    std::array<std::uint8_t, 16> nonce{};
    std::uniform_int_distribution<int> byte(0, 255);
    for (auto& b : nonce) {
        b = static_cast<std::uint8_t>(byte(rng));
    }
    return core::base64Encode(nonce.data(), nonce.size());
}

MaskKey makeMask(std::mt19937& rng) {
    MaskKey mask{};
    std::uniform_int_distribution<int> byte(0, 255);
    for (auto& b : mask) {
        b = static_cast<std::uint8_t>(byte(rng));
    }
    return mask;
}

std::string makeHandshakeRequest(const Url& url, std::string_view key) {
    std::string request;
    request += "GET " + url.target + " HTTP/1.1\r\n";
    request += "Host: " + url.hostHeader() + "\r\n";
    request += "Upgrade: websocket\r\n";
    request += "Connection: Upgrade\r\n";
    request += "Sec-WebSocket-Key: ";
    request.append(key);
    request += "\r\n";
    request += "Sec-WebSocket-Version: 13\r\n";
    request += "User-Agent: signage-relay\r\n\r\n";
    return request;
}

std::string computeAcceptKey(std::string_view key) {
    std::string material(key);
    material += ACCEPT_GUID;
    std::array<std::uint8_t, SHA_DIGEST_LENGTH> digest{};
    ::SHA1(reinterpret_cast<const unsigned char*>(material.data()), material.size(), digest.data());
    return core::base64Encode(digest.data(), digest.size());
}

expected<void> checkHandshakeResponse(std::string_view headers, std::string_view key) {
    const auto lineEnd = headers.find("\r\n");
    const auto statusLine = headers.substr(0, lineEnd);
    if (statusLine.substr(0, 5) != "HTTP/") {
        return unexpected(make_error_code(RelayErrc::handshake_failed));
    }
    const auto space = statusLine.find(' ');
    if (space == std::string_view::npos || statusLine.substr(space + 1, 3) != "101") {
        return unexpected(make_error_code(RelayErrc::handshake_failed));
    }

    const auto upgrade = headerValue(headers, "upgrade");
    if (!upgrade || lower(*upgrade).find("websocket") == std::string::npos) {
        return unexpected(make_error_code(RelayErrc::handshake_failed));
    }
    const auto connection = headerValue(headers, "connection");
    if (!connection || lower(*connection).find("upgrade") == std::string::npos) {
        return unexpected(make_error_code(RelayErrc::handshake_failed));
    }
    const auto accept = headerValue(headers, "sec-websocket-accept");
    if (!accept || *accept != computeAcceptKey(key)) {
        return unexpected(make_error_code(RelayErrc::handshake_failed));
    }
    return {};
}

} // namespace signage::net::ws
