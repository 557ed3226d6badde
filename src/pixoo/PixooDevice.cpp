/**
 * @brief Pushes frames to a Pixoo64 over its local HTTP endpoint.
 */
#include "signage/pixoo/PixooDevice.hpp"

#include "signage/log/Log.hpp"

#include <chrono>

namespace signage::pixoo {

using signage::unexpected;

int clockPicId() {
    using namespace std::chrono;
    const auto now = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
    return static_cast<int>(now % config::PIXOO_PIC_ID_MODULUS);
}

PixooDevice::PixooDevice(std::string address, unsigned short devicePort)
: host(std::move(address))
, port(devicePort)
, picIds(clockPicId)
{
    setPushAttempts(config::PIXOO_PUSH_ATTEMPTS);
    setRetryDelay(config::PIXOO_RETRY_DELAY);
}

PixooDevice::~PixooDevice() {
    // The worker calls pushFrame(); stop it before our members go away.
    stop();
}

void PixooDevice::setTimeout(std::chrono::milliseconds timeout) {
    timeoutMillis.store(timeout.count() < 1 ? 1 : timeout.count());
}

expected<net::HttpResponse> PixooDevice::post(const std::string& body) {
    net::HttpClient http(std::chrono::milliseconds{timeoutMillis.load()});
    auto response = http.postJson(host, port, config::PIXOO_POST_PATH, body);
    if (!response) {
        return response;
    }
    if (!response->ok()) {
        logError("[PixooDevice] ", host, " answered HTTP ", response->status, "\n");
        return unexpected(make_error_code(RelayErrc::http_status));
    }
    return response;
}

expected<nlohmann::json> PixooDevice::sendCommand(const nlohmann::json& command) {
    auto response = post(command.dump());
    if (!response) {
        return unexpected(response.error());
    }
    auto reply = nlohmann::json::parse(response->body, nullptr, false);
    if (reply.is_discarded()) {
        return unexpected(make_error_code(RelayErrc::malformed_response));
    }
    return reply;
}

expected<void> PixooDevice::initialize() {
    auto response = post(buildChannelSelect().dump());
    if (!response) {
        logError("[PixooDevice] initialise failed: ", response.error().message(),
                 " (", host, ":", port, ")\n");
        return unexpected(response.error());
    }
    if (auto checked = checkDeviceReply(response->body); !checked) {
        logError("[PixooDevice] initialise rejected: ", response->body, "\n");
        return checked;
    }
    logInfo("[PixooDevice] ", host, " switched to custom channel\n");
    return {};
}

expected<void> PixooDevice::pushFrame(const core::Frame& frame) {
    if (!frame.isConsistent()) {
        return unexpected(make_error_code(RelayErrc::frame_size_mismatch));
    }

    CommandOptions options;
    options.picId = picIds ? picIds() : config::PIXOO_DEFAULT_PIC_ID;
    options.speed = speed.load();
    const auto body = buildCommand(frame, options).toJson().dump();

    auto response = post(body);
    if (!response) {
        return unexpected(response.error());
    }
    if (auto checked = checkDeviceReply(response->body); !checked) {
        logError("[PixooDevice] device error: ", response->body, "\n");
        return checked;
    }

    logDebug("[PixooDevice] pushed ", frame.width, "x", frame.height,
             " PicID=", options.picId, "\n");
    return {};
}

} // namespace signage::pixoo
