#pragma once

#include "signage/core/Expected.hpp"
#include "signage/core/Frame.hpp"
#include "signage/pixoo/PixooConfig.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace signage::pixoo {

/**
 * @brief A `Draw/SendHttpGif` request for the device's local HTTP endpoint.
 *
 * PicID only distinguishes frame generations on the device; any number works.
 */
struct PixooCommand {
    std::string command = "Draw/SendHttpGif";
    int picNum = 1;
    int picWidth = 0;
    int picOffset = 0;
    int picId = config::PIXOO_DEFAULT_PIC_ID;
    int picSpeed = config::PIXOO_DEFAULT_SPEED_MS;
    std::string picData;

    nlohmann::json toJson() const;
};

struct CommandOptions {
    int picId = config::PIXOO_DEFAULT_PIC_ID;
    int speed = config::PIXOO_DEFAULT_SPEED_MS;
};

/// Base64 of the frame's raw pixel bytes (4 * ceil(n / 3) characters).
std::string encode(const core::Frame& frame);

/**
 * @brief Inverse of encode().
 *
 * Fails with RelayErrc::invalid_base64 for bad text and
 * RelayErrc::frame_size_mismatch when the decoded length is not width*height*3.
 */
expected<core::Frame> decode(std::string_view base64,
                             std::uint32_t width,
                             std::uint32_t height);

PixooCommand buildCommand(const core::Frame& frame, const CommandOptions& options = {});

/// `Channel/SetIndex`, used once at start-up to select the custom channel.
nlohmann::json buildChannelSelect(int index = config::PIXOO_CUSTOM_CHANNEL);

/// `Channel/GetIndex`, a harmless query used to probe for devices.
nlohmann::json buildChannelQuery();

/**
 * @brief Check a device reply body for `"error_code": 0`.
 *
 * Returns RelayErrc::malformed_response for non-JSON bodies and
 * RelayErrc::device_error when the code is present but non-zero or missing.
 */
expected<void> checkDeviceReply(std::string_view body);

} // namespace signage::pixoo
