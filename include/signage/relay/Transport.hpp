#pragma once

#include <functional>
#include <memory>
#include <string>
#include <system_error>

namespace signage::relay {

/**
 * @brief Callbacks a transport raises for one connection.
 *
 * onOpen fires at most once. onClose fires at most once, is the last
 * callback, and covers every way a connection ends, including a failed open.
 */
struct TransportEvents {
    std::function<void()> onOpen;
    std::function<void(std::string)> onMessage;
    std::function<void(std::error_code)> onClose;
};

/**
 * @brief One live persistent connection.
 *
 * close() detaches the events: once it returns, no callback of this
 * connection will run. Destroying the object closes it.
 */
class RelayTransport {
public:
    virtual ~RelayTransport() = default;
    virtual void send(std::string text) = 0;
    virtual void close() = 0;
};

/**
 * @brief Opens connections for a relay client.
 *
 * open() starts connecting and returns immediately; the outcome arrives
 * through `events`, never from inside open() itself. A null return means the attempt could not even start
 * and is treated like an immediate close.
 */
class TransportConnector {
public:
    virtual ~TransportConnector() = default;
    virtual std::unique_ptr<RelayTransport> open(TransportEvents events) = 0;
};

} // namespace signage::relay
