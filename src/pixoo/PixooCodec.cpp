#include "signage/pixoo/PixooCodec.hpp"

#include "signage/core/Base64.hpp"

namespace signage::pixoo {

nlohmann::json PixooCommand::toJson() const {
    return nlohmann::json{
        {"Command", command},
        {"PicNum", picNum},
        {"PicWidth", picWidth},
        {"PicOffset", picOffset},
        {"PicID", picId},
        {"PicSpeed", picSpeed},
        {"PicData", picData},
    };
}

std::string encode(const core::Frame& frame) {
    return core::base64Encode(frame.pixels);
}

expected<core::Frame> decode(std::string_view base64, std::uint32_t width, std::uint32_t height) {
    auto bytes = core::base64Decode(base64);
    if (!bytes) {
        return unexpected(bytes.error());
    }

    core::Frame frame;
    frame.width = width;
    frame.height = height;
    if (bytes->size() != frame.expectedByteCount()) {
        return unexpected(make_error_code(RelayErrc::frame_size_mismatch));
    }
    frame.pixels = std::move(*bytes);
    return frame;
}

PixooCommand buildCommand(const core::Frame& frame, const CommandOptions& options) {
    PixooCommand command;
    command.picWidth = static_cast<int>(frame.width);
    command.picId = options.picId;
    command.picSpeed = options.speed;
    command.picData = encode(frame);
    return command;
}

nlohmann::json buildChannelSelect(int index) {
    return nlohmann::json{{"Command", "Channel/SetIndex"}, {"SelectIndex", index}};
}

nlohmann::json buildChannelQuery() {
    return nlohmann::json{{"Command", "Channel/GetIndex"}};
}

expected<void> checkDeviceReply(std::string_view body) {
    const auto reply = nlohmann::json::parse(body, nullptr, false);
    if (reply.is_discarded() || !reply.is_object()) {
        return unexpected(make_error_code(RelayErrc::malformed_response));
    }
    const auto it = reply.find("error_code");
    if (it == reply.end() || !it->is_number_integer() || it->get<long long>() != 0) {
        return unexpected(make_error_code(RelayErrc::device_error));
    }
    return {};
}

} // namespace signage::pixoo
