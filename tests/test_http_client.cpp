#include "signage/core/Expected.hpp"
#include "signage/net/HttpClient.hpp"

#include "TestSupport.hpp"

using namespace signage;
using namespace signage::net;
using namespace std::chrono_literals;

static void testParseResponse() {
    auto ok = parseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 15\r\n\r\n{\"error_code\":0}");
    ASSERT_TRUE(ok.has_value(), "response parses");
    if (ok) {
        ASSERT_EQ(ok->status, 200, "status");
        ASSERT_STR_EQ(ok->body, "{\"error_code\":0", "body cut at Content-Length");
        ASSERT_TRUE(ok->ok(), "2xx is ok");
    }

    auto noLength = parseHttpResponse("HTTP/1.0 404 Not Found\r\nServer: x\r\n\r\nmissing");
    ASSERT_TRUE(noLength && noLength->status == 404 && noLength->body == "missing", "body runs to the end");
    ASSERT_TRUE(noLength && !noLength->ok(), "404 is not ok");

    auto lower = parseHttpResponse("HTTP/1.1 200 OK\r\ncontent-length: 2\r\n\r\nhi");
    ASSERT_TRUE(lower && lower->body == "hi", "header names are case insensitive");

    const char* bad[] = {
        "",
        "HTTP/1.1 200 OK\r\nContent-Length: 2\r\n",
        "SMTP 220 ready\r\n\r\n",
        "HTTP/1.1 2x0 OK\r\n\r\n",
        "HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nshort",
        "HTTP/1.1 200 OK\r\nContent-Length: 18446744073709551621\r\n\r\nhello",
        "HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\n\r\nhi",
        "HTTP/1.1 200 OK\r\nContent-Length: 2000000\r\n\r\nhi",
        "HTTP/1.1 200 OK\r\nContent-Length: 1x\r\n\r\nhi",
    };
    for (const char* raw : bad) {
        auto parsed = parseHttpResponse(raw);
        ASSERT_TRUE(!parsed && parsed.error() == RelayErrc::malformed_response, raw);
    }
}

static void testPostJson() {
    test::DummyHttpServer server([](const std::string& body) {
        return test::DummyHttpServer::Reply{200, "{\"echo\":" + body + "}"};
    });
    HttpClient http(1000ms);
    auto response = http.postJson("127.0.0.1", server.port(), "/post", "{\"Command\":\"Channel/GetIndex\"}");
    ASSERT_TRUE(response.has_value(), "POST succeeds");
    if (response) {
        ASSERT_EQ(response->status, 200, "status 200");
        ASSERT_STR_EQ(response->body, "{\"echo\":{\"Command\":\"Channel/GetIndex\"}}", "reply body");
    }
    const auto bodies = server.bodies();
    ASSERT_TRUE(bodies.size() == 1 && bodies.front() == "{\"Command\":\"Channel/GetIndex\"}", "request body sent");
}

static void testConnectionRefused() {
    unsigned short deadPort = 0;
    {
        test::DummyHttpServer gone;
        deadPort = gone.port();
    }
    HttpClient http(300ms);
    auto response = http.postJson("127.0.0.1", deadPort, "/post", "{}");
    ASSERT_TRUE(!response, "closed port fails");
}

static void testErrorCategory() {
    const std::error_code ec = make_error_code(RelayErrc::frame_size_mismatch);
    ASSERT_STR_EQ(ec.category().name(), "signage.relay", "category name");
    ASSERT_TRUE(!ec.message().empty(), "message text");
    ASSERT_TRUE(ec == RelayErrc::frame_size_mismatch, "enum compares to error_code");
    ASSERT_TRUE(ec != RelayErrc::invalid_base64, "distinct codes differ");
}

static void testLogHandlers() {
    std::vector<std::string> infos;
    std::vector<std::string> errors;
    setLogHandlers([&](std::string_view m) { infos.emplace_back(m); },
                   [&](std::string_view m) { errors.emplace_back(m); });

    logInfo("[Test] ", 42, " frames\n");
    logError("[Test] failed: ", "reason", "\n");
    setVerbose(false);
    logDebug("[Test] hidden ", 1, "\n");
    setVerbose(true);
    logDebug("[Test] shown ", 2, "\n");
    setVerbose(false);

    resetLogHandlers();

    ASSERT_EQ(infos.size(), static_cast<std::size_t>(2), "info and visible debug captured");
    if (infos.size() == 2) {
        ASSERT_STR_EQ(infos[0], "[Test] 42 frames\n", "variadic formatting");
        ASSERT_STR_EQ(infos[1], "[Test] shown 2\n", "debug goes to the info handler");
    }
    ASSERT_EQ(errors.size(), static_cast<std::size_t>(1), "error captured");
    if (!errors.empty()) {
        ASSERT_STR_EQ(errors[0], "[Test] failed: reason\n", "error text");
    }
}

int main() {
    testParseResponse();
    testPostJson();
    testConnectionRefused();
    testErrorCategory();
    testLogHandlers();
    return test::report("HttpClient");
}
