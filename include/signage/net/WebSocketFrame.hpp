#pragma once

#include "signage/core/Expected.hpp"
#include "signage/net/Url.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

namespace signage::net::ws {

enum class Opcode : std::uint8_t {
    Continuation = 0x0,
    Text = 0x1,
    Binary = 0x2,
    Close = 0x8,
    Ping = 0x9,
    Pong = 0xA
};

constexpr std::size_t MAX_CONTROL_PAYLOAD = 125;
constexpr std::uint16_t CLOSE_NORMAL = 1000;

using MaskKey = std::array<std::uint8_t, 4>;

struct Frame {
    bool fin = true;
    Opcode opcode = Opcode::Text;
    std::string payload;
};

struct ParsedFrame {
    Frame frame;
    std::size_t consumed = 0;   // bytes of input used by this frame
};

/**
 * @brief Serialise one client-to-server frame (always masked, RFC 6455 5.3).
 */
std::vector<std::uint8_t> encodeFrame(Opcode opcode,
                                      std::string_view payload,
                                      const MaskKey& mask,
                                      bool fin = true);

/**
 * @brief Try to parse one frame from the front of `data`.
 *
 * Returns an empty optional when more bytes are needed. Fails with
 * RelayErrc::protocol_violation for reserved bits, unknown opcodes or bad
 * control frames, and RelayErrc::message_too_large past `maxPayload`.
 * Masked (server-side) frames are unmasked transparently.
 */
expected<std::optional<ParsedFrame>> parseFrame(const std::uint8_t* data,
                                                std::size_t size,
                                                std::size_t maxPayload);

/// Close frame body: 2-byte big-endian status code.
std::string closePayload(std::uint16_t code = CLOSE_NORMAL);

/// 16 random bytes, base64 encoded, for Sec-WebSocket-Key.
std::string makeHandshakeKey(std::mt19937& rng);

MaskKey makeMask(std::mt19937& rng);

std::string makeHandshakeRequest(const Url& url, std::string_view key);

/// base64(SHA-1(key + GUID)), the Sec-WebSocket-Accept a server must return for `key`.
std::string computeAcceptKey(std::string_view key);

/**
 * @brief Validate the server's reply header block.
 *
 * Requires status 101, `Upgrade: websocket`, `Connection: Upgrade` and a
 * Sec-WebSocket-Accept matching `key`; fails with
 * RelayErrc::handshake_failed otherwise.
 */
expected<void> checkHandshakeResponse(std::string_view headers, std::string_view key);

} // namespace signage::net::ws
