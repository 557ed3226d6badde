#include "signage/relay/WebSocketTransport.hpp"

#include "signage/log/Log.hpp"

namespace signage::relay {

namespace asio = net::asio;

WebSocketTransport::WebSocketTransport(std::shared_ptr<net::WebSocketClient> client)
: client_(std::move(client))
{}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::send(std::string text) {
    if (client_) {
        client_->sendText(std::move(text));
    }
}

void WebSocketTransport::close() {
    if (!client_) {
        return;
    }
    auto client = std::move(client_);
    client->close();
}

WebSocketConnector::WebSocketConnector(net::Strand strand,
                                       net::Url url,
                                       net::WebSocketClient::Options options)
: strand_(std::move(strand))
, url_(std::move(url))
, options_(options)
{}

std::unique_ptr<RelayTransport> WebSocketConnector::open(TransportEvents events) {
    auto client = net::WebSocketClient::create(strand_, url_, options_);

    net::WebSocketClient::Handlers handlers;
    handlers.onOpen = std::move(events.onOpen);
    handlers.onMessage = std::move(events.onMessage);
    handlers.onClose = std::move(events.onClose);

    asio::post(strand_, [client, handlers = std::move(handlers)]() mutable {
        client->start(std::move(handlers));
    });

    logDebug("[WebSocketConnector] connecting to ", url_.scheme, "://", url_.hostHeader(), url_.target, "\n");
    return std::make_unique<WebSocketTransport>(std::move(client));
}

} // namespace signage::relay
