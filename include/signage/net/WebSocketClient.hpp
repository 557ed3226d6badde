#pragma once

#include "signage/net/NetConfig.hpp"
#include "signage/net/Url.hpp"
#include "signage/net/WebSocketFrame.hpp"

#include <array>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

namespace signage::net {

/**
 * @brief Asynchronous RFC 6455 client for one connection (`ws://` or `wss://`).
 *
 * Opening runs resolve -> TCP connect -> TLS handshake (wss only) -> HTTP
 * Upgrade under a single deadline. Afterwards a read loop reassembles
 * fragmented messages, answers protocol-level pings, and reports text and
 * binary messages.
 *
 * Threading:
 * - Every operation and every callback runs on the strand passed to create().
 * - Callbacks fire at most once per event; onClose fires at most once and is
 *   the last callback.
 * - close() detaches the callbacks first. When it is invoked on the strand
 *   (as the relay does) nothing fires after it returns.
 *
 * Instances are single-use: create a new one for every connection attempt.
 */
class WebSocketClient : public std::enable_shared_from_this<WebSocketClient> {
public:
    struct Handlers {
        std::function<void()> onOpen;
        std::function<void(std::string)> onMessage;
        std::function<void(std::error_code)> onClose;
    };

    struct Options {
        std::chrono::milliseconds openTimeout{10000};
        std::size_t maxMessageBytes = 1u << 20;
    };

    static std::shared_ptr<WebSocketClient> create(Strand strand, Url url, Options options);
    static std::shared_ptr<WebSocketClient> create(Strand strand, Url url) {
        return create(std::move(strand), std::move(url), Options{});
    }

    ~WebSocketClient();

    WebSocketClient(const WebSocketClient&) = delete;
    WebSocketClient& operator=(const WebSocketClient&) = delete;

    void start(Handlers handlers);
    void sendText(std::string text);
    void close();

private:
    using TlsStream = asio::ssl::stream<tcp::socket>;

    WebSocketClient(Strand strand, Url url, Options options);

    template <typename Fn>
    void withStream(Fn&& fn) {
        if (tls_) {
            fn(*tls_);
        } else {
            fn(socket_);
        }
    }

    tcp::socket& lowestLayer() { return tls_ ? tls_->next_layer() : socket_; }

    void doStart(Handlers handlers);
    void onResolved(const std::error_code& ec, const tcp::resolver::results_type& results);
    void onConnected(const std::error_code& ec);
    void sendUpgradeRequest();
    void readUpgradeResponse();
    void onUpgradeData(const std::error_code& ec, std::size_t bytes);
    void readLoop();
    void onRead(const std::error_code& ec, std::size_t bytes);
    void processInbox();
    void handleFrame(ws::Frame frame);
    void deliver(std::string message);
    void queueFrame(ws::Opcode opcode, std::string_view payload);
    void writeNext();
    void onWrite(const std::error_code& ec);
    void fail(const std::error_code& ec);
    void doClose();
    void shutdownSocket();

    enum class Phase { Idle, Opening, Open, Closed };

    Strand strand_;
    Url url_;
    Options options_;
    tcp::resolver resolver_;
    tcp::socket socket_;
    std::shared_ptr<asio::ssl::context> tlsContext_;
    std::unique_ptr<TlsStream> tls_;
    asio::steady_timer openTimer_;
    std::mt19937 rng_;

    Handlers handlers_;
    Phase phase_ = Phase::Idle;

    std::array<std::uint8_t, 8192> chunk_{};
    std::vector<std::uint8_t> inbox_;
    std::string upgradeRequest_;
    std::string handshakeKey_;

    bool fragmentActive_ = false;
    ws::Opcode fragmentOpcode_ = ws::Opcode::Text;
    std::string fragment_;

    std::deque<std::vector<std::uint8_t>> outbox_;
    bool writing_ = false;
    bool closeAfterFlush_ = false;
};

} // namespace signage::net
