#include "signage/net/Url.hpp"
#include "signage/net/WebSocketFrame.hpp"

#include "TestSupport.hpp"

using namespace signage;
using namespace signage::net;

static std::vector<std::uint8_t> serverFrame(std::uint8_t firstByte, const std::string& payload) {
    std::vector<std::uint8_t> out{firstByte};
    if (payload.size() < 126) {
        out.push_back(static_cast<std::uint8_t>(payload.size()));
    } else {
        out.push_back(126);
        out.push_back(static_cast<std::uint8_t>(payload.size() >> 8));
        out.push_back(static_cast<std::uint8_t>(payload.size() & 0xFF));
    }
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

static void testEncodeSmall() {
    const ws::MaskKey mask{0x37, 0xfa, 0x21, 0x3d};
    const auto bytes = ws::encodeFrame(ws::Opcode::Text, "Hello", mask);
    // RFC 6455 section 5.7, masked "Hello".
    const std::vector<std::uint8_t> rfc{0x81, 0x85, 0x37, 0xfa, 0x21, 0x3d, 0x7f, 0x9f, 0x4d, 0x51, 0x58};
    ASSERT_TRUE(bytes == rfc, "masked Hello matches the RFC example");

    auto parsed = ws::parseFrame(bytes.data(), bytes.size(), 1024);
    ASSERT_TRUE(parsed && *parsed, "own frame parses");
    if (parsed && *parsed) {
        ASSERT_STR_EQ((*parsed)->frame.payload, "Hello", "unmasked payload");
        ASSERT_EQ((*parsed)->consumed, bytes.size(), "whole frame consumed");
        ASSERT_TRUE((*parsed)->frame.fin, "fin set");
    }
}

static void testExtendedLengths() {
    const ws::MaskKey mask{1, 2, 3, 4};

    const std::string medium(300, 'm');
    const auto mediumBytes = ws::encodeFrame(ws::Opcode::Binary, medium, mask);
    ASSERT_EQ(mediumBytes[1], static_cast<std::uint8_t>(0x80 | 126), "16-bit length marker");
    ASSERT_EQ(mediumBytes.size(), static_cast<std::size_t>(2 + 2 + 4 + 300), "16-bit header size");

    const std::string large(70000, 'L');
    const auto largeBytes = ws::encodeFrame(ws::Opcode::Binary, large, mask);
    ASSERT_EQ(largeBytes[1], static_cast<std::uint8_t>(0x80 | 127), "64-bit length marker");
    ASSERT_EQ(largeBytes.size(), static_cast<std::size_t>(2 + 8 + 4 + 70000), "64-bit header size");

    auto parsed = ws::parseFrame(largeBytes.data(), largeBytes.size(), 1 << 20);
    ASSERT_TRUE(parsed && *parsed && (*parsed)->frame.payload == large, "64-bit frame round trip");

    auto tooLarge = ws::parseFrame(largeBytes.data(), largeBytes.size(), 65536);
    ASSERT_TRUE(!tooLarge && tooLarge.error() == RelayErrc::message_too_large, "size guard");
}

static void testPartialInput() {
    const auto bytes = serverFrame(0x81, R"({"type":"ping"})");
    for (std::size_t cut = 0; cut < bytes.size(); ++cut) {
        auto parsed = ws::parseFrame(bytes.data(), cut, 1024);
        ASSERT_TRUE(parsed.has_value() && !parsed->has_value(), "truncated input asks for more");
    }

    std::vector<std::uint8_t> two = bytes;
    const auto second = serverFrame(0x8A, "");
    two.insert(two.end(), second.begin(), second.end());
    auto first = ws::parseFrame(two.data(), two.size(), 1024);
    ASSERT_TRUE(first && *first, "first of two frames");
    if (first && *first) {
        ASSERT_EQ((*first)->consumed, bytes.size(), "stops at the frame boundary");
        auto next = ws::parseFrame(two.data() + (*first)->consumed, two.size() - (*first)->consumed, 1024);
        ASSERT_TRUE(next && *next && (*next)->frame.opcode == ws::Opcode::Pong, "second frame is a pong");
    }
}

static void testProtocolViolations() {
    const auto reserved = serverFrame(0x81 | 0x40, "x");
    auto r1 = ws::parseFrame(reserved.data(), reserved.size(), 1024);
    ASSERT_TRUE(!r1 && r1.error() == RelayErrc::protocol_violation, "reserved bit rejected");

    const auto unknown = serverFrame(0x83, "x");
    auto r2 = ws::parseFrame(unknown.data(), unknown.size(), 1024);
    ASSERT_TRUE(!r2 && r2.error() == RelayErrc::protocol_violation, "unknown opcode rejected");

    const auto fragmentedPing = serverFrame(0x09, "x");
    auto r3 = ws::parseFrame(fragmentedPing.data(), fragmentedPing.size(), 1024);
    ASSERT_TRUE(!r3 && r3.error() == RelayErrc::protocol_violation, "fragmented control frame rejected");

    const auto longPing = serverFrame(0x89, std::string(126, 'p'));
    auto r4 = ws::parseFrame(longPing.data(), longPing.size(), 1024);
    ASSERT_TRUE(!r4 && r4.error() == RelayErrc::protocol_violation, "oversized control frame rejected");
}

static void testFragmentFlags() {
    const auto head = serverFrame(0x01, "par");
    const auto tail = serverFrame(0x80, "tial");
    auto a = ws::parseFrame(head.data(), head.size(), 1024);
    auto b = ws::parseFrame(tail.data(), tail.size(), 1024);
    ASSERT_TRUE(a && *a && !(*a)->frame.fin && (*a)->frame.opcode == ws::Opcode::Text, "first fragment");
    ASSERT_TRUE(b && *b && (*b)->frame.fin && (*b)->frame.opcode == ws::Opcode::Continuation, "final fragment");
}

static void testClosePayload() {
    const auto body = ws::closePayload();
    ASSERT_EQ(body.size(), static_cast<std::size_t>(2), "close body is two bytes");
    ASSERT_EQ(static_cast<std::uint8_t>(body[0]), static_cast<std::uint8_t>(0x03), "1000 high byte");
    ASSERT_EQ(static_cast<std::uint8_t>(body[1]), static_cast<std::uint8_t>(0xE8), "1000 low byte");
}

static void testHandshake() {
    std::mt19937 rng(5);
    const std::string key = ws::makeHandshakeKey(rng);
    ASSERT_EQ(key.size(), static_cast<std::size_t>(24), "key is 16 bytes of base64");

    auto url = parseUrl("wss://relay.example.com/prod?token=abc");
    ASSERT_TRUE(url.has_value(), "wss url parses");
    if (url) {
        const std::string request = ws::makeHandshakeRequest(*url, key);
        ASSERT_TRUE(request.rfind("GET /prod?token=abc HTTP/1.1\r\n", 0) == 0, "request line");
        ASSERT_TRUE(request.find("\r\nHost: relay.example.com\r\n") != std::string::npos, "host header");
        ASSERT_TRUE(request.find("\r\nSec-WebSocket-Key: " + key + "\r\n") != std::string::npos, "key header");
        ASSERT_TRUE(request.find("\r\nSec-WebSocket-Version: 13\r\n") != std::string::npos, "version header");
        ASSERT_TRUE(request.size() >= 4 && request.compare(request.size() - 4, 4, "\r\n\r\n") == 0,
                    "ends with a blank line");
    }

    // RFC 6455 section 1.3 sample nonce and its accept value.
    const std::string nonce = "dGhlIHNhbXBsZSBub25jZQ==";
    ASSERT_STR_EQ(ws::computeAcceptKey(nonce), "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=", "accept key derivation");

    const std::string good = "HTTP/1.1 101 Switching Protocols\r\nUpgrade: WebSocket\r\n"
                             "Connection: keep-alive, Upgrade\r\n"
                             "sec-websocket-accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n";
    ASSERT_TRUE(ws::checkHandshakeResponse(good, nonce).has_value(), "101 with matching accept value");

    const char* rejected[] = {
        "HTTP/1.1 403 Forbidden\r\nContent-Length: 0\r\n\r\n",
        "HTTP/1.1 101 Switching Protocols\r\n\r\n",
        "HTTP/1.1 101 Switching Protocols\r\nConnection: Upgrade\r\n"
            "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\n"
            "Sec-WebSocket-Accept: s3pPLMBiTxaQ9kYGzzhZRbK+xOo=\r\n\r\n",
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n\r\n",
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
            "Sec-WebSocket-Accept: unused\r\n\r\n",
        "HTTP/1.1 101 Switching Protocols\r\nUpgrade: websocket\r\nConnection: Upgrade\r\n"
            "Sec-WebSocket-Accept: S3PPLMBITXAQ9KYGZZHZRBK+XOO=\r\n\r\n",
        "garbage\r\n\r\n",
    };
    for (const char* reply : rejected) {
        auto checked = ws::checkHandshakeResponse(reply, nonce);
        ASSERT_TRUE(!checked && checked.error() == RelayErrc::handshake_failed, reply);
    }
    ASSERT_TRUE(!ws::checkHandshakeResponse(good, key), "accept value bound to the request key");
}

static void testUrlParsing() {
    auto plain = parseUrl("ws://localhost:8080/relay");
    ASSERT_TRUE(plain && plain->host == "localhost" && plain->port == 8080 && plain->target == "/relay",
                "ws with port and path");
    ASSERT_TRUE(plain && !plain->secure(), "ws is not secure");
    ASSERT_TRUE(plain && plain->hostHeader() == "localhost:8080", "host header keeps a non-default port");

    auto secure = parseUrl("WSS://abc.execute-api.us-east-1.amazonaws.com/prod");
    ASSERT_TRUE(secure && secure->scheme == "wss" && secure->port == 443 && secure->secure(),
                "wss defaults to 443");
    ASSERT_TRUE(secure && secure->hostHeader() == "abc.execute-api.us-east-1.amazonaws.com",
                "default port omitted from host header");

    auto bare = parseUrl("ws://10.0.0.5");
    ASSERT_TRUE(bare && bare->port == 80 && bare->target == "/", "bare host gets / and port 80");

    auto v6 = parseUrl("ws://[::1]:9000/x#frag");
    ASSERT_TRUE(v6 && v6->host == "::1" && v6->port == 9000 && v6->target == "/x", "bracketed IPv6");
    ASSERT_TRUE(v6 && v6->hostHeader() == "[::1]:9000", "IPv6 host header is bracketed");

    auto creds = parseUrl("ws://user:pw@host/q");
    ASSERT_TRUE(creds && creds->host == "host", "credentials stripped");

    auto query = parseUrl("ws://host?x=1");
    ASSERT_TRUE(query && query->target == "/?x=1", "query without path");

    const char* bad[] = {"", "relay.example.com", "ftp://host/", "ws://", "ws://:80/", "ws://host:0/",
                         "ws://host:70000/", "ws://host:12a/", "ws://[::1/"};
    for (const char* text : bad) {
        auto parsed = parseUrl(text);
        ASSERT_TRUE(!parsed && parsed.error() == RelayErrc::invalid_url, text);
    }
}

int main() {
    testEncodeSmall();
    testExtendedLengths();
    testPartialInput();
    testProtocolViolations();
    testFragmentFlags();
    testClosePayload();
    testHandshake();
    testUrlParsing();
    return test::report("WebSocketFrame");
}
