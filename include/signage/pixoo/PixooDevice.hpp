#pragma once
#include "signage/core/Expected.hpp"
#include "signage/core/FrameDeviceBase.hpp"
#include "signage/net/HttpClient.hpp"
#include "signage/pixoo/PixooCodec.hpp"
#include "signage/pixoo/PixooConfig.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <string>

namespace signage::pixoo {

using signage::expected;

/**
 * @brief Frame sink that drives a Pixoo64 over its local HTTP API.
 *
 * The worker thread, latest-frame slot and bounded retry come from
 * `FrameDeviceBase`. This class only knows how to turn a frame into a
 * `Draw/SendHttpGif` POST and how to read the device's `error_code` reply.
 *
 * Responsibilities:
 * - Switch the device to the custom channel on request (initialize()).
 * - Push each frame with a PicID derived from the wall clock so a restarted
 *   relay never collides with a cached picture on the device.
 * - Treat transport errors, non-2xx statuses and non-zero `error_code`
 *   replies as push failures.
 */
class PixooDevice : public core::FrameDeviceBase {
public:
    using PicIdSource = std::function<int()>;

    explicit PixooDevice(std::string address,
                         unsigned short port = config::PIXOO_HTTP_PORT);
    ~PixooDevice() override;

    PixooDevice(const PixooDevice&) = delete;
    PixooDevice& operator=(const PixooDevice&) = delete;

    /// Select the API-driven custom channel. Blocking; call before start().
    expected<void> initialize();

    /// POST an arbitrary command and return the parsed reply. Blocking.
    expected<nlohmann::json> sendCommand(const nlohmann::json& command);

    void setTimeout(std::chrono::milliseconds timeout);
    void setPicIdSource(PicIdSource source) { picIds = std::move(source); }
    void setSpeed(int speedMs) { speed.store(speedMs); }

    const std::string& address() const { return host; }

protected:
    expected<void> pushFrame(const core::Frame& frame) override;
    const char* deviceName() const override { return "PixooDevice"; }

private:
    expected<net::HttpResponse> post(const std::string& body);

    std::string host;
    unsigned short port;
    std::atomic<long long> timeoutMillis{config::PIXOO_PUSH_TIMEOUT.count()};
    std::atomic<int> speed{config::PIXOO_DEFAULT_SPEED_MS};
    PicIdSource picIds;
};

/// PicID from the wall clock, modulo 100000.
int clockPicId();

} // namespace signage::pixoo
