#pragma once

#include "signage/core/FrameSink.hpp"
#include "signage/relay/Backoff.hpp"
#include "signage/relay/Envelope.hpp"
#include "signage/relay/TimerScheduler.hpp"
#include "signage/relay/Transport.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace signage::relay {

enum class ConnectionStatus {
    Disconnected,
    Connecting,
    Connected
};

const char* toString(ConnectionStatus status);

struct RelayClientOptions {
    std::string endpointKind = "web";
    std::optional<std::string> terminalId;
    BackoffOptions backoff{};
    std::string name = "RelayClient";   // log prefix
};

/**
 * @brief Keeps one endpoint attached to the relay.
 *
 * Owns at most one transport and at most one pending reconnect timer. Frames
 * received while connected are decoded and handed to the sink, pings are
 * answered, and an unintentional close schedules a reconnect with exponential
 * backoff until the attempts run out.
 *
 * Every member function, and every transport and timer callback, must run on
 * the same sequence of events (in production, one asio strand). status() and
 * isExhausted() may be read from any thread.
 */
class RelayClient {
public:
    using StatusHandler = std::function<void(ConnectionStatus)>;
    using ExhaustedHandler = std::function<void(unsigned attempts)>;
    using Clock = std::function<std::int64_t()>;

    RelayClient(RelayClientOptions options,
                TransportConnector& connector,
                TimerScheduler& scheduler,
                core::FrameSink& sink,
                UniformSource random = makeDefaultSource(),
                Clock clock = nowMillis);
    ~RelayClient();

    RelayClient(const RelayClient&) = delete;
    RelayClient& operator=(const RelayClient&) = delete;

    /// Open a connection if none is open or opening. Also undoes a previous shutdown().
    void connect();

    /// Close for good: no reconnect is attempted until connect() or resume().
    void shutdown();

    /// Reconnect now with a fresh backoff, e.g. when the host wakes up.
    void resume();

    ConnectionStatus status() const { return status_.load(); }
    bool isExhausted() const { return exhausted_.load(); }
    bool isShutdown() const { return intentionalClose_; }
    bool hasPendingReconnect() const { return pendingReconnect_.has_value(); }
    unsigned attempt() const { return backoff_.attempt(); }

    void setStatusHandler(StatusHandler handler) { onStatus_ = std::move(handler); }
    void setExhaustedHandler(ExhaustedHandler handler) { onExhausted_ = std::move(handler); }

    std::uint64_t framesReceived() const { return framesReceived_; }
    std::uint64_t messagesDropped() const { return messagesDropped_; }

private:
    void openTransport();
    void handleOpen(std::uint64_t generation);
    void handleMessage(std::uint64_t generation, const std::string& text);
    void handleClose(std::uint64_t generation, std::error_code ec);
    void scheduleReconnect(std::chrono::milliseconds delay);
    void cancelReconnect();
    void releaseTransport();
    void send(const Envelope& envelope);
    void setStatus(ConnectionStatus next);

    RelayClientOptions options_;
    TransportConnector& connector_;
    TimerScheduler& scheduler_;
    core::FrameSink& sink_;
    Clock clock_;
    BackoffController backoff_;

    std::unique_ptr<RelayTransport> transport_;
    std::optional<TimerId> pendingReconnect_;
    std::uint64_t generation_ = 0;
    bool intentionalClose_ = false;

    std::atomic<ConnectionStatus> status_{ConnectionStatus::Disconnected};
    std::atomic<bool> exhausted_{false};

    StatusHandler onStatus_;
    ExhaustedHandler onExhausted_;

    std::uint64_t framesReceived_ = 0;
    std::uint64_t messagesDropped_ = 0;
};

} // namespace signage::relay
