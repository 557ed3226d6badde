#include "signage/relay/Envelope.hpp"

#include "signage/pixoo/PixooCodec.hpp"

#include <chrono>
#include <cmath>
#include <limits>

namespace signage::relay {

using nlohmann::json;

const char* toString(MessageType type) {
    switch (type) {
        case MessageType::Connect:    return "connect";
        case MessageType::Disconnect: return "disconnect";
        case MessageType::Ping:       return "ping";
        case MessageType::Pong:       return "pong";
        case MessageType::Frame:      return "frame";
        case MessageType::Unknown:    return "unknown";
    }
    return "unknown";
}

MessageType messageTypeFromString(std::string_view text) {
    if (text == "connect")    return MessageType::Connect;
    if (text == "disconnect") return MessageType::Disconnect;
    if (text == "ping")       return MessageType::Ping;
    if (text == "pong")       return MessageType::Pong;
    if (text == "frame")      return MessageType::Frame;
    return MessageType::Unknown;
}

std::string Envelope::serialize() const {
    json out{
        {"type", type == MessageType::Unknown ? rawType : std::string(toString(type))},
        {"payload", payload},
        {"timestamp", timestamp},
    };
    return out.dump();
}

namespace {

// Timestamps outside the int64 range are treated as absent.
std::optional<std::int64_t> readTimestamp(const json& value) {
    constexpr double LIMIT = 9223372036854775808.0; // 2^63
    if (value.is_number_unsigned()) {
        const auto raw = value.get<std::uint64_t>();
        if (raw > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        if (!std::isfinite(raw) || raw < -LIMIT || raw >= LIMIT) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(raw);
    }
    return std::nullopt;
}

} // namespace

expected<Envelope> parseEnvelope(std::string_view text) {
    const auto document = json::parse(text, nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        return unexpected(make_error_code(RelayErrc::malformed_envelope));
    }

    const auto type = document.find("type");
    if (type == document.end() || !type->is_string()) {
        return unexpected(make_error_code(RelayErrc::malformed_envelope));
    }

    Envelope envelope;
    envelope.rawType = type->get<std::string>();
    envelope.type = messageTypeFromString(envelope.rawType);

    if (const auto payload = document.find("payload"); payload != document.end()) {
        envelope.payload = *payload;
    }
    if (const auto ts = document.find("timestamp"); ts != document.end()) {
        envelope.timestamp = readTimestamp(*ts).value_or(0);
    }
    return envelope;
}

namespace {

std::optional<std::uint32_t> readDimension(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_number_integer()) {
        return std::nullopt;
    }
    const auto value = it->get<long long>();
    if (value <= 0 || value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

std::optional<std::string> readOptionalString(const json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

expected<FramePayload> decodeFramePayload(const Envelope& envelope) {
    if (envelope.type != MessageType::Frame || !envelope.payload.is_object()) {
        return unexpected(make_error_code(RelayErrc::malformed_payload));
    }
    const auto frame = envelope.payload.find("frame");
    if (frame == envelope.payload.end() || !frame->is_object()) {
        return unexpected(make_error_code(RelayErrc::malformed_payload));
    }

    const auto width = readDimension(*frame, "width");
    const auto height = readDimension(*frame, "height");
    const auto data = readOptionalString(*frame, "data");
    if (!width || !height || !data) {
        return unexpected(make_error_code(RelayErrc::malformed_payload));
    }

    FramePayload payload;
    payload.width = *width;
    payload.height = *height;
    payload.data = *data;
    payload.terminalId = readOptionalString(envelope.payload, "terminalId");
    return payload;
}

expected<core::Frame> decodeFrame(const Envelope& envelope) {
    auto payload = decodeFramePayload(envelope);
    if (!payload) {
        return unexpected(payload.error());
    }
    return pixoo::decode(payload->data, payload->width, payload->height);
}

expected<ConnectPayload> decodeConnectPayload(const Envelope& envelope) {
    if (envelope.type != MessageType::Connect || !envelope.payload.is_object()) {
        return unexpected(make_error_code(RelayErrc::malformed_payload));
    }
    auto kind = readOptionalString(envelope.payload, "type");
    if (!kind) {
        return unexpected(make_error_code(RelayErrc::malformed_payload));
    }
    return ConnectPayload{*kind, readOptionalString(envelope.payload, "terminalId")};
}

Envelope makeConnect(const ConnectPayload& payload, std::int64_t timestamp) {
    Envelope envelope;
    envelope.type = MessageType::Connect;
    envelope.payload = json{{"type", payload.endpointKind}};
    if (payload.terminalId) {
        envelope.payload["terminalId"] = *payload.terminalId;
    }
    envelope.timestamp = timestamp;
    return envelope;
}

Envelope makePong(std::int64_t timestamp) {
    Envelope envelope;
    envelope.type = MessageType::Pong;
    envelope.timestamp = timestamp;
    return envelope;
}

Envelope makePing(std::int64_t timestamp) {
    Envelope envelope;
    envelope.type = MessageType::Ping;
    envelope.timestamp = timestamp;
    return envelope;
}

Envelope makeDisconnect(std::int64_t timestamp) {
    Envelope envelope;
    envelope.type = MessageType::Disconnect;
    envelope.timestamp = timestamp;
    return envelope;
}

Envelope makeFrame(const core::Frame& frame,
                   std::int64_t timestamp,
                   const std::optional<std::string>& terminalId) {
    Envelope envelope;
    envelope.type = MessageType::Frame;
    envelope.payload = json{
        {"frame", {
            {"width", frame.width},
            {"height", frame.height},
            {"data", pixoo::encode(frame)},
        }},
    };
    if (terminalId) {
        envelope.payload["terminalId"] = *terminalId;
    }
    envelope.timestamp = timestamp;
    return envelope;
}

std::int64_t nowMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace signage::relay
