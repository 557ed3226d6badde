#pragma once

#include "signage/core/Expected.hpp"
#include "signage/net/TcpClient.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace signage::net {

struct HttpResponse {
    int status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

/**
 * @brief Parse a complete HTTP/1.x response (status line, headers, body).
 *
 * Honours Content-Length when present, otherwise everything after the
 * header block is the body. An incomplete header block or body fails with
 * RelayErrc::malformed_response. Chunked transfer encoding is not decoded.
 */
expected<HttpResponse> parseHttpResponse(std::string_view raw);

/**
 * @brief Minimal blocking HTTP/1.1 client for device-local JSON endpoints.
 *
 * One request per connection (`Connection: close`); the response is read
 * until the server closes or Content-Length bytes have arrived. Blocks the
 * calling thread; never call it from the NetService I/O thread.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::milliseconds timeout = TcpClient::DEFAULT_TIMEOUT);

    expected<HttpResponse> postJson(const std::string& host,
                                    unsigned short port,
                                    const std::string& target,
                                    std::string_view body);

    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace signage::net
