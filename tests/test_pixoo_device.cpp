#include "signage/pixoo/PixooDevice.hpp"

#include "TestSupport.hpp"

using namespace signage;
using namespace signage::pixoo;
using namespace std::chrono_literals;

namespace {

nlohmann::json parsed(const std::string& body) {
    auto json = nlohmann::json::parse(body, nullptr, false);
    return json.is_object() ? json : nlohmann::json::object();
}

core::Frame numberedFrame(std::uint8_t tag) {
    return core::createSolidFrame(64, 64, core::Rgb{tag, tag, tag});
}

} // namespace

static void testPushFrame() {
    test::DummyHttpServer server;
    PixooDevice device("127.0.0.1", server.port());
    device.setPicIdSource([] { return 77; });
    device.start();

    const core::Frame frame = numberedFrame(9);
    device.publish(frame);
    ASSERT_TRUE(device.waitUntilIdle(3s), "push completes");

    const auto stats = device.stats();
    ASSERT_EQ(stats.pushed, static_cast<std::uint64_t>(1), "one frame pushed");
    ASSERT_EQ(stats.failed, static_cast<std::uint64_t>(0), "no failures");

    const auto bodies = server.bodies();
    ASSERT_EQ(bodies.size(), static_cast<std::size_t>(1), "one POST");
    if (!bodies.empty()) {
        const auto command = parsed(bodies.front());
        ASSERT_STR_EQ(command.value("Command", ""), "Draw/SendHttpGif", "draw command");
        ASSERT_EQ(command.value("PicID", -1), 77, "PicID from the injected source");
        ASSERT_EQ(command.value("PicWidth", -1), 64, "PicWidth");
        ASSERT_STR_EQ(command.value("PicData", ""), encode(frame), "PicData is the frame");
    }
    device.stop();
}

static void testInitializeSelectsCustomChannel() {
    test::DummyHttpServer server;
    PixooDevice device("127.0.0.1", server.port());
    ASSERT_TRUE(device.initialize().has_value(), "initialize succeeds");

    const auto bodies = server.bodies();
    ASSERT_EQ(bodies.size(), static_cast<std::size_t>(1), "one POST");
    if (!bodies.empty()) {
        const auto command = parsed(bodies.front());
        ASSERT_STR_EQ(command.value("Command", ""), "Channel/SetIndex", "channel select");
        ASSERT_EQ(command.value("SelectIndex", -1), 3, "custom channel");
    }

    auto reply = device.sendCommand(buildChannelQuery());
    ASSERT_TRUE(reply && reply->value("error_code", -1) == 0, "sendCommand returns the parsed reply");
}

static void testDeviceErrorRetriedThenDropped() {
    test::DummyHttpServer server([](const std::string&) {
        return test::DummyHttpServer::Reply{200, "{\"error_code\":1}"};
    });
    PixooDevice device("127.0.0.1", server.port());
    device.setRetryDelay(10ms);
    device.start();
    device.publish(numberedFrame(1));
    ASSERT_TRUE(device.waitUntilIdle(3s), "worker settles");

    ASSERT_EQ(server.requestCount(), static_cast<std::size_t>(2), "bounded retry: two attempts");
    ASSERT_EQ(device.stats().failed, static_cast<std::uint64_t>(1), "frame counted as failed");
    ASSERT_EQ(device.stats().pushed, static_cast<std::uint64_t>(0), "nothing pushed");

    auto init = device.initialize();
    ASSERT_TRUE(!init && init.error() == RelayErrc::device_error, "non-zero error_code is a device error");
    device.stop();
}

static void testHttpErrorIsFailure() {
    test::DummyHttpServer server([](const std::string&) {
        return test::DummyHttpServer::Reply{500, "{}"};
    });
    PixooDevice device("127.0.0.1", server.port());
    auto init = device.initialize();
    ASSERT_TRUE(!init && init.error() == RelayErrc::http_status, "HTTP 500 fails");
}

static void testUnreachableDeviceDoesNotBlockPublish() {
    unsigned short deadPort = 0;
    {
        test::DummyHttpServer server;
        deadPort = server.port();
    }
    PixooDevice device("127.0.0.1", deadPort);
    device.setTimeout(200ms);
    device.setRetryDelay(10ms);
    device.start();

    const auto begin = std::chrono::steady_clock::now();
    for (std::uint8_t i = 0; i < 5; ++i) {
        device.publish(numberedFrame(i));
    }
    const auto elapsed = std::chrono::steady_clock::now() - begin;
    ASSERT_TRUE(elapsed < 100ms, "publish never waits on the device");

    ASSERT_TRUE(device.waitUntilIdle(5s), "worker settles");
    ASSERT_TRUE(device.stats().failed >= 1, "push failures recorded");
    device.stop();
}

static void testLatestFrameWins() {
    std::atomic<int> inFlight{0};
    test::DummyHttpServer server([&](const std::string&) {
        ++inFlight;
        std::this_thread::sleep_for(300ms);
        return test::DummyHttpServer::Reply{};
    });
    PixooDevice device("127.0.0.1", server.port());
    device.start();

    device.publish(numberedFrame(1));
    ASSERT_TRUE(test::waitFor([&] { return inFlight.load() == 1; }), "first push in flight");

    // Three frames while the device is busy: only the newest survives.
    device.publish(numberedFrame(2));
    device.publish(numberedFrame(3));
    device.publish(numberedFrame(4));
    ASSERT_TRUE(device.waitUntilIdle(5s), "worker drains");

    const auto stats = device.stats();
    ASSERT_EQ(stats.published, static_cast<std::uint64_t>(4), "four frames published");
    ASSERT_EQ(stats.superseded, static_cast<std::uint64_t>(2), "two frames superseded");
    ASSERT_EQ(stats.pushed, static_cast<std::uint64_t>(2), "first and newest pushed");

    const auto bodies = server.bodies();
    ASSERT_EQ(bodies.size(), static_cast<std::size_t>(2), "two POSTs reached the device");
    if (bodies.size() == 2) {
        ASSERT_STR_EQ(parsed(bodies[1]).value("PicData", ""), encode(numberedFrame(4)), "newest frame delivered");
    }
    device.stop();
}

static void testClockPicId() {
    const int id = clockPicId();
    ASSERT_TRUE(id >= 0 && id < 100000, "PicID within the modulus");
}

int main() {
    testPushFrame();
    testInitializeSelectsCustomChannel();
    testDeviceErrorRetriedThenDropped();
    testHttpErrorIsFailure();
    testUnreachableDeviceDoesNotBlockPublish();
    testLatestFrameWins();
    testClockPicId();
    return test::report("PixooDevice");
}
