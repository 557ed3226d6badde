/**
 * @brief Implements the asynchronous WebSocket client used by the relay channel.
 */
#include "signage/net/WebSocketClient.hpp"

#include "signage/log/Log.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <algorithm>

namespace signage::net {

namespace {

constexpr std::string_view HEADER_END = "\r\n\r\n";
constexpr std::size_t MAX_UPGRADE_RESPONSE = 16 * 1024;

std::shared_ptr<asio::ssl::context> clientTlsContext() {
    static const std::shared_ptr<asio::ssl::context> context = [] {
        auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
        std::error_code ec;
        ctx->set_default_verify_paths(ec);
        if (ec) {
            logError("[WebSocketClient] could not load system CA certificates: ", ec.message(), "\n");
        }
        ctx->set_verify_mode(asio::ssl::verify_peer);
        return ctx;
    }();
    return context;
}

} // namespace

std::shared_ptr<WebSocketClient> WebSocketClient::create(Strand strand, Url url, Options options) {
    return std::shared_ptr<WebSocketClient>(
        new WebSocketClient(std::move(strand), std::move(url), options));
}

WebSocketClient::WebSocketClient(Strand strand, Url url, Options options)
: strand_(std::move(strand))
, url_(std::move(url))
, options_(options)
, resolver_(strand_)
, socket_(strand_)
, openTimer_(strand_)
, rng_(std::random_device{}())
{
    if (url_.secure()) {
        tlsContext_ = clientTlsContext();
        tls_ = std::make_unique<TlsStream>(strand_, *tlsContext_);
    }
}

WebSocketClient::~WebSocketClient() {
    std::error_code ec;
    lowestLayer().close(ec);
}

void WebSocketClient::start(Handlers handlers) {
    asio::dispatch(strand_, [self = shared_from_this(), handlers = std::move(handlers)]() mutable {
        self->doStart(std::move(handlers));
    });
}

void WebSocketClient::sendText(std::string text) {
    asio::dispatch(strand_, [self = shared_from_this(), text = std::move(text)] {
        if (self->phase_ != Phase::Open) {
            logDebug("[WebSocketClient] dropping message, connection not open\n");
            return;
        }
        self->queueFrame(ws::Opcode::Text, text);
    });
}

void WebSocketClient::close() {
    asio::dispatch(strand_, [self = shared_from_this()] { self->doClose(); });
}

void WebSocketClient::doStart(Handlers handlers) {
    if (phase_ != Phase::Idle) {
        return;
    }
    handlers_ = std::move(handlers);
    phase_ = Phase::Opening;

    openTimer_.expires_after(options_.openTimeout);
    openTimer_.async_wait([self = shared_from_this()](const std::error_code& ec) {
        if (ec == asio::error::operation_aborted || self->phase_ != Phase::Opening) {
            return;
        }
        self->fail(asio::error::timed_out);
    });

    if (tls_ && !SSL_set_tlsext_host_name(tls_->native_handle(), url_.host.c_str())) {
        fail(std::error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        return;
    }
    if (tls_) {
        tls_->set_verify_callback(asio::ssl::host_name_verification(url_.host));
    }

    resolver_.async_resolve(url_.host, std::to_string(url_.port),
        [self = shared_from_this()](const std::error_code& ec, tcp::resolver::results_type results) {
            self->onResolved(ec, results);
        });
}

void WebSocketClient::onResolved(const std::error_code& ec, const tcp::resolver::results_type& results) {
    if (phase_ != Phase::Opening) return;
    if (ec) {
        fail(ec);
        return;
    }
    asio::async_connect(lowestLayer(), results,
        [self = shared_from_this()](const std::error_code& connectEc, const tcp::endpoint&) {
            self->onConnected(connectEc);
        });
}

void WebSocketClient::onConnected(const std::error_code& ec) {
    if (phase_ != Phase::Opening) return;
    if (ec) {
        fail(ec);
        return;
    }

    std::error_code optionEc;
    lowestLayer().set_option(tcp::no_delay(true), optionEc);

    if (!tls_) {
        sendUpgradeRequest();
        return;
    }
    tls_->async_handshake(asio::ssl::stream_base::client,
        [self = shared_from_this()](const std::error_code& handshakeEc) {
            if (self->phase_ != Phase::Opening) return;
            if (handshakeEc) {
                self->fail(handshakeEc);
                return;
            }
            self->sendUpgradeRequest();
        });
}

void WebSocketClient::sendUpgradeRequest() {
    handshakeKey_ = ws::makeHandshakeKey(rng_);
    upgradeRequest_ = ws::makeHandshakeRequest(url_, handshakeKey_);
    withStream([this](auto& stream) {
        asio::async_write(stream, asio::buffer(upgradeRequest_),
            [self = shared_from_this()](const std::error_code& ec, std::size_t) {
                if (self->phase_ != Phase::Opening) return;
                if (ec) {
                    self->fail(ec);
                    return;
                }
                self->readUpgradeResponse();
            });
    });
}

void WebSocketClient::readUpgradeResponse() {
    withStream([this](auto& stream) {
        stream.async_read_some(asio::buffer(chunk_),
            [self = shared_from_this()](const std::error_code& ec, std::size_t bytes) {
                self->onUpgradeData(ec, bytes);
            });
    });
}

void WebSocketClient::onUpgradeData(const std::error_code& ec, std::size_t bytes) {
    if (phase_ != Phase::Opening) return;
    if (ec) {
        fail(ec);
        return;
    }
    inbox_.insert(inbox_.end(), chunk_.begin(), chunk_.begin() + static_cast<std::ptrdiff_t>(bytes));

    const std::string_view received(reinterpret_cast<const char*>(inbox_.data()), inbox_.size());
    const auto headerEnd = received.find(HEADER_END);
    if (headerEnd == std::string_view::npos) {
        if (inbox_.size() > MAX_UPGRADE_RESPONSE) {
            fail(make_error_code(RelayErrc::handshake_failed));
            return;
        }
        readUpgradeResponse();
        return;
    }

    if (auto checked = ws::checkHandshakeResponse(received.substr(0, headerEnd + 2), handshakeKey_);
        !checked) {
        logError("[WebSocketClient] upgrade rejected by ", url_.host, ": ",
                 received.substr(0, received.find("\r\n")), "\n");
        fail(checked.error());
        return;
    }

    // Anything after the header block is already frame data.
    inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(headerEnd + HEADER_END.size()));
    upgradeRequest_.clear();
    openTimer_.cancel();
    phase_ = Phase::Open;

    logDebug("[WebSocketClient] open ", url_.scheme, "://", url_.hostHeader(), url_.target, "\n");

    if (auto onOpen = handlers_.onOpen) {
        onOpen();
    }
    if (phase_ != Phase::Open) {
        return; // closed from inside onOpen
    }
    processInbox();
    if (phase_ == Phase::Open) {
        readLoop();
    }
}

void WebSocketClient::readLoop() {
    withStream([this](auto& stream) {
        stream.async_read_some(asio::buffer(chunk_),
            [self = shared_from_this()](const std::error_code& ec, std::size_t bytes) {
                self->onRead(ec, bytes);
            });
    });
}

void WebSocketClient::onRead(const std::error_code& ec, std::size_t bytes) {
    if (phase_ != Phase::Open) return;
    if (ec) {
        fail(ec);
        return;
    }
    inbox_.insert(inbox_.end(), chunk_.begin(), chunk_.begin() + static_cast<std::ptrdiff_t>(bytes));
    processInbox();
    if (phase_ == Phase::Open) {
        readLoop();
    }
}

void WebSocketClient::processInbox() {
    std::size_t offset = 0;
    while (phase_ == Phase::Open) {
        auto parsed = ws::parseFrame(inbox_.data() + offset, inbox_.size() - offset,
                                     options_.maxMessageBytes);
        if (!parsed) {
            fail(parsed.error());
            return;
        }
        if (!*parsed) {
            break; // need more bytes
        }
        offset += (*parsed)->consumed;
        handleFrame(std::move((*parsed)->frame));
    }
    if (phase_ == Phase::Open) {
        inbox_.erase(inbox_.begin(), inbox_.begin() + static_cast<std::ptrdiff_t>(offset));
    }
}

void WebSocketClient::handleFrame(ws::Frame frame) {
    switch (frame.opcode) {
        case ws::Opcode::Text:
        case ws::Opcode::Binary:
            if (fragmentActive_) {
                fail(make_error_code(RelayErrc::protocol_violation));
                return;
            }
            if (frame.fin) {
                deliver(std::move(frame.payload));
                return;
            }
            fragmentActive_ = true;
            fragmentOpcode_ = frame.opcode;
            fragment_ = std::move(frame.payload);
            return;

        case ws::Opcode::Continuation:
            if (!fragmentActive_) {
                fail(make_error_code(RelayErrc::protocol_violation));
                return;
            }
            if (fragment_.size() + frame.payload.size() > options_.maxMessageBytes) {
                fail(make_error_code(RelayErrc::message_too_large));
                return;
            }
            fragment_ += frame.payload;
            if (frame.fin) {
                fragmentActive_ = false;
                deliver(std::move(fragment_));
                fragment_.clear();
            }
            return;

        case ws::Opcode::Ping:
            queueFrame(ws::Opcode::Pong, frame.payload);
            return;

        case ws::Opcode::Pong:
            return;

        case ws::Opcode::Close:
            logDebug("[WebSocketClient] close frame from server\n");
            queueFrame(ws::Opcode::Close, ws::closePayload());
            fail(asio::error::eof);
            return;
    }
}

void WebSocketClient::deliver(std::string message) {
    // Copy: the handler may close this client, which clears handlers_.
    if (auto onMessage = handlers_.onMessage) {
        onMessage(std::move(message));
    }
}

void WebSocketClient::queueFrame(ws::Opcode opcode, std::string_view payload) {
    outbox_.push_back(ws::encodeFrame(opcode, payload, ws::makeMask(rng_)));
    if (!writing_) {
        writeNext();
    }
}

void WebSocketClient::writeNext() {
    writing_ = true;
    withStream([this](auto& stream) {
        asio::async_write(stream, asio::buffer(outbox_.front()),
            [self = shared_from_this()](const std::error_code& ec, std::size_t) {
                self->onWrite(ec);
            });
    });
}

void WebSocketClient::onWrite(const std::error_code& ec) {
    writing_ = false;
    if (ec) {
        outbox_.clear();
        if (phase_ == Phase::Closed) {
            shutdownSocket();
        } else {
            fail(ec);
        }
        return;
    }
    outbox_.pop_front();
    if (!outbox_.empty()) {
        writeNext();
        return;
    }
    if (closeAfterFlush_) {
        shutdownSocket();
    }
}

void WebSocketClient::fail(const std::error_code& ec) {
    if (phase_ == Phase::Closed) {
        return;
    }
    phase_ = Phase::Closed;
    openTimer_.cancel();
    resolver_.cancel();

    // Let a queued close frame go out before the socket is torn down.
    if (writing_) {
        closeAfterFlush_ = true;
    } else {
        shutdownSocket();
    }

    auto onClose = std::move(handlers_.onClose);
    handlers_ = {};
    if (onClose) {
        onClose(ec);
    }
}

void WebSocketClient::doClose() {
    if (phase_ == Phase::Closed) {
        return;
    }
    const bool wasOpen = phase_ == Phase::Open;
    phase_ = Phase::Closed;
    handlers_ = {};
    openTimer_.cancel();
    resolver_.cancel();

    if (!wasOpen) {
        shutdownSocket();
        return;
    }

    // Polite close: send a close frame, then drop the socket once it is written.
    closeAfterFlush_ = true;
    outbox_.push_back(ws::encodeFrame(ws::Opcode::Close, ws::closePayload(), ws::makeMask(rng_)));
    if (!writing_) {
        writeNext();
    }
}

void WebSocketClient::shutdownSocket() {
    std::error_code ec;
    auto& socket = lowestLayer();
    socket.cancel(ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

} // namespace signage::net
