#include "signage/core/Expected.hpp"

namespace signage {

namespace {

class RelayCategory final : public std::error_category {
public:
    const char* name() const noexcept override { return "signage.relay"; }

    std::string message(int value) const override {
        switch (static_cast<RelayErrc>(value)) {
            case RelayErrc::malformed_envelope:  return "malformed envelope";
            case RelayErrc::malformed_payload:   return "malformed payload";
            case RelayErrc::invalid_base64:      return "invalid base64";
            case RelayErrc::frame_size_mismatch: return "frame data does not match declared size";
            case RelayErrc::invalid_url:         return "invalid url";
            case RelayErrc::handshake_failed:    return "websocket handshake failed";
            case RelayErrc::protocol_violation:  return "websocket protocol violation";
            case RelayErrc::message_too_large:   return "message too large";
            case RelayErrc::http_status:         return "unexpected http status";
            case RelayErrc::malformed_response:  return "malformed http response";
            case RelayErrc::device_error:        return "device reported an error";
        }
        return "unknown relay error";
    }
};

} // namespace

const std::error_category& relay_category() noexcept {
    static RelayCategory category;
    return category;
}

} // namespace signage
