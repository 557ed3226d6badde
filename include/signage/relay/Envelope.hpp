#pragma once

#include "signage/core/Expected.hpp"
#include "signage/core/Frame.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace signage::relay {

enum class MessageType {
    Connect,
    Disconnect,
    Ping,
    Pong,
    Frame,
    Unknown   // well-formed envelope with a type this client does not handle
};

const char* toString(MessageType type);
MessageType messageTypeFromString(std::string_view text);

/**
 * @brief The typed wire message exchanged over the persistent channel.
 *
 * `{ "type": ..., "payload": <type-specific>, "timestamp": <unix ms> }`
 */
struct Envelope {
    MessageType type = MessageType::Unknown;
    nlohmann::json payload = nlohmann::json::object();
    std::int64_t timestamp = 0;

    /// Original type string, kept so unknown types can be logged.
    std::string rawType;

    std::string serialize() const;
};

/**
 * @brief Parse one text message.
 *
 * Fails with RelayErrc::malformed_envelope when the text is not a JSON object
 * or has no string `type`. Missing payload/timestamp default to `{}`/0; a timestamp outside
 * the int64 range also reads as 0.
 */
expected<Envelope> parseEnvelope(std::string_view text);

struct FramePayload {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::string data;                       // base64 RGB bytes
    std::optional<std::string> terminalId;  // routing hint, not interpreted here
};

struct ConnectPayload {
    std::string endpointKind;               // "web" or a device kind such as "pixoo64"
    std::optional<std::string> terminalId;
};

/// Extract `{ frame: { width, height, data }, terminalId? }`; RelayErrc::malformed_payload otherwise.
expected<FramePayload> decodeFramePayload(const Envelope& envelope);

/// Decode the payload straight into a Frame, validating the declared size.
expected<core::Frame> decodeFrame(const Envelope& envelope);

expected<ConnectPayload> decodeConnectPayload(const Envelope& envelope);

Envelope makeConnect(const ConnectPayload& payload, std::int64_t timestamp);
Envelope makePong(std::int64_t timestamp);
Envelope makePing(std::int64_t timestamp);
Envelope makeDisconnect(std::int64_t timestamp);
Envelope makeFrame(const core::Frame& frame,
                   std::int64_t timestamp,
                   const std::optional<std::string>& terminalId = std::nullopt);

/// Wall-clock unix time in milliseconds.
std::int64_t nowMillis();

} // namespace signage::relay
