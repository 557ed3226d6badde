#pragma once

#include "signage/net/NetConfig.hpp"
#include "signage/net/Url.hpp"
#include "signage/net/WebSocketClient.hpp"
#include "signage/relay/Transport.hpp"

#include <memory>

namespace signage::relay {

/// RelayTransport over one WebSocketClient connection.
class WebSocketTransport : public RelayTransport {
public:
    explicit WebSocketTransport(std::shared_ptr<net::WebSocketClient> client);
    ~WebSocketTransport() override;

    void send(std::string text) override;
    void close() override;

private:
    std::shared_ptr<net::WebSocketClient> client_;
};

/**
 * @brief Opens WebSocket connections to a fixed relay URL.
 *
 * The strand must be the one the owning RelayClient runs on; events are
 * delivered there. open() only posts the start, so no event can fire before
 * it returns.
 */
class WebSocketConnector : public TransportConnector {
public:
    WebSocketConnector(net::Strand strand, net::Url url, net::WebSocketClient::Options options = {});

    std::unique_ptr<RelayTransport> open(TransportEvents events) override;

    const net::Url& url() const { return url_; }

private:
    net::Strand strand_;
    net::Url url_;
    net::WebSocketClient::Options options_;
};

} // namespace signage::relay
