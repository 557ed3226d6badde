#include "signage/core/Base64.hpp"
#include "signage/pixoo/PixooCodec.hpp"

#include "TestSupport.hpp"

#include <random>

using namespace signage;
using namespace signage::pixoo;

static void testRedGreenPair() {
    core::Frame frame;
    frame.width = 2;
    frame.height = 1;
    frame.pixels = {255, 0, 0, 0, 255, 0};

    const std::string text = encode(frame);
    ASSERT_STR_EQ(text, "/wAAAP8A", "two-pixel frame encodes to known base64");

    auto decoded = decode(text, 2, 1);
    ASSERT_TRUE(decoded.has_value(), "decode known base64");
    if (decoded) {
        ASSERT_TRUE(decoded->pixels == frame.pixels, "decoded bytes match");
        ASSERT_TRUE(core::getPixel(*decoded, 1, 0) == (core::Rgb{0, 255, 0}), "second pixel is green");
    }
}

static void testEncodedLength() {
    for (std::size_t n : {0u, 1u, 2u, 3u, 4u, 5u, 6u, 7u, 64u * 64u * 3u}) {
        std::vector<std::uint8_t> bytes(n, 0xAB);
        const auto text = core::base64Encode(bytes);
        ASSERT_EQ(text.size(), 4 * ((n + 2) / 3), "length is 4*ceil(n/3)");
        ASSERT_TRUE(text.find('\n') == std::string::npos, "no line breaks");
    }
}

static void testRoundTripRandomFrame() {
    std::mt19937 rng(1234);
    core::Frame frame = core::createSolidFrame(64, 64);
    for (auto& byte : frame.pixels) {
        byte = static_cast<std::uint8_t>(rng() & 0xFF);
    }
    auto decoded = decode(encode(frame), 64, 64);
    ASSERT_TRUE(decoded.has_value(), "decode 64x64");
    ASSERT_TRUE(decoded && decoded->pixels == frame.pixels, "64x64 round trip is exact");
}

static void testDecodeRejects() {
    auto wrongSize = decode("/wAAAP8A", 4, 4);
    ASSERT_TRUE(!wrongSize, "size mismatch rejected");
    ASSERT_TRUE(!wrongSize && wrongSize.error() == RelayErrc::frame_size_mismatch, "frame_size_mismatch");

    auto garbage = decode("not*base64!", 1, 1);
    ASSERT_TRUE(!garbage && garbage.error() == RelayErrc::invalid_base64, "invalid characters rejected");

    ASSERT_TRUE(!core::base64Decode("A"), "dangling single symbol");
    ASSERT_TRUE(!core::base64Decode("A=AA"), "padding in the middle");
    ASSERT_TRUE(!core::base64Decode("AA=A"), "data after padding");
    ASSERT_TRUE(core::base64Decode("/wAAAP8").has_value(), "unpadded input accepted");
    ASSERT_TRUE(!core::base64Decode("\\/wAAAP8A"), "backslash is not a base64 symbol");
    ASSERT_TRUE(core::base64Decode("").has_value(), "empty input is an empty buffer");
}

static void testCommandJson() {
    core::Frame frame = core::createSolidFrame(64, 64, core::Rgb{1, 2, 3});
    const PixooCommand command = buildCommand(frame, CommandOptions{4242, 500});
    const nlohmann::json json = command.toJson();

    ASSERT_EQ(json.size(), static_cast<std::size_t>(7), "exactly seven keys");
    ASSERT_STR_EQ(json.value("Command", ""), "Draw/SendHttpGif", "Command");
    ASSERT_EQ(json.value("PicNum", -1), 1, "PicNum");
    ASSERT_EQ(json.value("PicWidth", -1), 64, "PicWidth");
    ASSERT_EQ(json.value("PicOffset", -1), 0, "PicOffset");
    ASSERT_EQ(json.value("PicID", -1), 4242, "PicID");
    ASSERT_EQ(json.value("PicSpeed", -1), 500, "PicSpeed");
    ASSERT_STR_EQ(json.value("PicData", ""), encode(frame), "PicData is the encoded frame");

    const nlohmann::json defaults = buildCommand(frame).toJson();
    ASSERT_EQ(defaults.value("PicID", -1), 1, "default PicID");
    ASSERT_EQ(defaults.value("PicSpeed", -1), 1000, "default PicSpeed");
}

static void testChannelCommands() {
    const auto select = buildChannelSelect();
    ASSERT_STR_EQ(select.value("Command", ""), "Channel/SetIndex", "select command");
    ASSERT_EQ(select.value("SelectIndex", -1), 3, "custom channel index");

    const auto query = buildChannelQuery();
    ASSERT_STR_EQ(query.value("Command", ""), "Channel/GetIndex", "query command");
}

static void testDeviceReply() {
    ASSERT_TRUE(checkDeviceReply("{\"error_code\":0}").has_value(), "zero error_code accepted");

    auto rejected = checkDeviceReply("{\"error_code\":1}");
    ASSERT_TRUE(!rejected && rejected.error() == RelayErrc::device_error, "non-zero error_code");

    auto missing = checkDeviceReply("{}");
    ASSERT_TRUE(!missing && missing.error() == RelayErrc::device_error, "missing error_code");

    auto html = checkDeviceReply("<html></html>");
    ASSERT_TRUE(!html && html.error() == RelayErrc::malformed_response, "non-JSON reply");
}

int main() {
    testRedGreenPair();
    testEncodedLength();
    testRoundTripRandomFrame();
    testDecodeRejects();
    testCommandJson();
    testChannelCommands();
    testDeviceReply();
    return test::report("PixooCodec");
}
