#include "signage/relay/RelayClient.hpp"

#include "signage/log/Log.hpp"

namespace signage::relay {

const char* toString(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::Disconnected: return "disconnected";
        case ConnectionStatus::Connecting:   return "connecting";
        case ConnectionStatus::Connected:    return "connected";
    }
    return "unknown";
}

RelayClient::RelayClient(RelayClientOptions options,
                         TransportConnector& connector,
                         TimerScheduler& scheduler,
                         core::FrameSink& sink,
                         UniformSource random,
                         Clock clock)
: options_(std::move(options))
, connector_(connector)
, scheduler_(scheduler)
, sink_(sink)
, clock_(std::move(clock))
, backoff_(options_.backoff, std::move(random))
{}

RelayClient::~RelayClient() {
    // Handlers belong to the owner, who is going away too.
    onStatus_ = nullptr;
    onExhausted_ = nullptr;
    shutdown();
}

void RelayClient::connect() {
    intentionalClose_ = false;
    if (exhausted_.exchange(false)) {
        backoff_.reset();
    }

    if (status_ != ConnectionStatus::Disconnected) {
        logDebug("[", options_.name, "] connect ignored, already ", toString(status_.load()), "\n");
        return;
    }
    cancelReconnect();
    openTransport();
}

void RelayClient::shutdown() {
    intentionalClose_ = true;
    ++generation_;
    cancelReconnect();
    if (transport_) {
        logInfo("[", options_.name, "] closing connection\n");
    }
    releaseTransport();
    setStatus(ConnectionStatus::Disconnected);
}

void RelayClient::resume() {
    if (intentionalClose_ || status_ != ConnectionStatus::Disconnected) {
        return;
    }
    logInfo("[", options_.name, "] resuming, backoff reset\n");
    cancelReconnect();
    backoff_.reset();
    exhausted_ = false;
    openTransport();
}

void RelayClient::openTransport() {
    const std::uint64_t generation = ++generation_;
    setStatus(ConnectionStatus::Connecting);
    logDebug("[", options_.name, "] opening connection (attempt ", backoff_.attempt(), ")\n");

    TransportEvents events;
    events.onOpen = [this, generation]() { handleOpen(generation); };
    events.onMessage = [this, generation](std::string text) { handleMessage(generation, text); };
    events.onClose = [this, generation](std::error_code ec) { handleClose(generation, ec); };

    auto transport = connector_.open(std::move(events));
    if (!transport) {
        handleClose(generation, make_error_code(std::errc::not_connected));
        return;
    }
    transport_ = std::move(transport);
}

void RelayClient::handleOpen(std::uint64_t generation) {
    if (generation != generation_ || status_ != ConnectionStatus::Connecting) {
        return;
    }
    setStatus(ConnectionStatus::Connected);
    backoff_.reset();
    logInfo("[", options_.name, "] connected as '", options_.endpointKind, "'\n");

    ConnectPayload payload;
    payload.endpointKind = options_.endpointKind;
    payload.terminalId = options_.terminalId;
    send(makeConnect(payload, clock_()));
}

void RelayClient::handleMessage(std::uint64_t generation, const std::string& text) {
    if (generation != generation_ || status_ != ConnectionStatus::Connected) {
        return;
    }

    auto envelope = parseEnvelope(text);
    if (!envelope) {
        ++messagesDropped_;
        logError("[", options_.name, "] dropping message: ", envelope.error().message(), "\n");
        return;
    }

    switch (envelope->type) {
        case MessageType::Frame: {
            auto frame = decodeFrame(*envelope);
            if (!frame) {
                ++messagesDropped_;
                logError("[", options_.name, "] dropping frame: ", frame.error().message(), "\n");
                return;
            }
            ++framesReceived_;
            logDebug("[", options_.name, "] frame ", frame->width, "x", frame->height, "\n");
            sink_.publish(std::move(*frame));
            break;
        }
        case MessageType::Ping:
            send(makePong(clock_()));
            break;
        case MessageType::Unknown:
            logDebug("[", options_.name, "] ignoring message type '", envelope->rawType, "'\n");
            break;
        default:
            break;
    }
}

void RelayClient::handleClose(std::uint64_t generation, std::error_code ec) {
    if (generation != generation_ || status_ == ConnectionStatus::Disconnected) {
        return;
    }

    // Nothing from this transport may reach us after this point.
    ++generation_;
    releaseTransport();
    setStatus(ConnectionStatus::Disconnected);

    if (intentionalClose_) {
        return;
    }

    if (ec) {
        logError("[", options_.name, "] connection lost: ", ec.message(), "\n");
    } else {
        logInfo("[", options_.name, "] connection closed by peer\n");
    }

    const BackoffState state = backoff_.next();
    if (state.exhausted) {
        exhausted_ = true;
        logError("[", options_.name, "] giving up after ", state.attempt, " reconnect attempts\n");
        if (onExhausted_) {
            auto handler = onExhausted_;
            handler(state.attempt);
        }
        return;
    }

    logInfo("[", options_.name, "] reconnecting in ", state.nextDelay.count(),
            "ms (attempt ", state.attempt + 1, "/", backoff_.options().maxAttempts, ")\n");
    scheduleReconnect(state.nextDelay);
}

void RelayClient::scheduleReconnect(std::chrono::milliseconds delay) {
    cancelReconnect();
    pendingReconnect_ = scheduler_.schedule(delay, [this]() {
        pendingReconnect_.reset();
        // A timer-fired reconnect never undoes shutdown().
        if (intentionalClose_ || status_ != ConnectionStatus::Disconnected) {
            return;
        }
        openTransport();
    });
}

void RelayClient::cancelReconnect() {
    if (pendingReconnect_) {
        scheduler_.cancel(*pendingReconnect_);
        pendingReconnect_.reset();
    }
}

void RelayClient::releaseTransport() {
    if (!transport_) {
        return;
    }
    // Move out first: close() may re-enter through a synchronous callback.
    auto transport = std::move(transport_);
    transport->close();
}

void RelayClient::send(const Envelope& envelope) {
    if (!transport_) {
        return;
    }
    transport_->send(envelope.serialize());
}

void RelayClient::setStatus(ConnectionStatus next) {
    const ConnectionStatus previous = status_.exchange(next);
    if (previous == next) {
        return;
    }
    logDebug("[", options_.name, "] ", toString(previous), " -> ", toString(next), "\n");
    if (onStatus_) {
        auto handler = onStatus_;
        handler(next);
    }
}

} // namespace signage::relay
