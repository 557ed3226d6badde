#pragma once
#include "signage/net/NetConfig.hpp"
#include "signage/net/Deadline.hpp"
#include "signage/net/NetService.hpp"
#include "signage/log/Log.hpp"

#include <chrono>
#include <memory>

namespace signage::net {
using duration = std::chrono::milliseconds;

/**
 * @brief Blocking TCP client with per-operation deadlines.
 *
 * Used by the device sinks, which run on their own worker threads and can
 * afford to block. The relay's persistent channel is fully asynchronous and
 * does not go through this class.
 *
 * Highlights:
 * - `connect(...)` tries each resolved endpoint with a per-attempt timeout.
 * - `read_some(...)`, `read_exact(...)` and `write_all(...)` block the caller
 *   while enforcing deadlines.
 * - All socket work is serialised by a strand executor.
 *
 * The owning `asio::io_context` must be running on another thread.
 */
class TcpClient {
public:
    static constexpr duration DEFAULT_TIMEOUT{1000};

    TcpClient()
    : io_(shared_io_context())
    , strand_(asio::make_strand(*io_))
    , socket_(strand_)
    {}

    ~TcpClient() { close(); }

    TcpClient(const TcpClient&) = delete;
    TcpClient& operator=(const TcpClient&) = delete;

    void setDefaultTimeout(duration timeout) { defaultTimeout_ = sanitize(timeout); }
    duration defaultTimeout() const { return defaultTimeout_; }

    void setConnectTimeout(duration timeout) { connectTimeout_ = sanitize(timeout); }
    duration connectTimeout() const { return connectTimeout_; }

    asio::io_context& io() { return *io_; }

    // Each attempt resets the socket before connecting.
    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        socket_ = tcp::socket(strand_);
        return connect_one(endpoint, timeout);
    }

    std::error_code connect(const tcp::endpoint& endpoint) {
        return connect(endpoint, connectTimeout_);
    }

    // Connect from resolver results; returns the last error if every endpoint fails.
    std::error_code connect(const tcp::resolver::results_type& results, duration timeout) {
        std::error_code last = asio::error::host_not_found;
        for (const auto& entry : results) {
            auto ec = connect(entry.endpoint(), timeout);
            if (!ec) return ec;
            last = ec;
        }
        return last;
    }

    std::error_code connect(const tcp::resolver::results_type& results) {
        return connect(results, connectTimeout_);
    }

    /// Read whatever is available (at least one byte) into `buf`.
    std::error_code read_some(void* buf, std::size_t n, duration timeout,
                              std::size_t& bytesTransferred) {
        // The completion may run after a timeout returns, so the count lives on the heap.
        auto transferred = std::make_shared<std::size_t>(0);
        auto ec = with_deadline(socket_.get_executor(), sanitize(timeout),
            [&](auto completion){
                socket_.async_read_some(asio::buffer(buf, n),
                    [transferred, completion](const std::error_code& op_ec, std::size_t count){
                        *transferred = count;
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
        bytesTransferred = *transferred;
        return ec;
    }

    std::error_code read_some(void* buf, std::size_t n, std::size_t& bytesTransferred) {
        return read_some(buf, n, defaultTimeout_, bytesTransferred);
    }

    std::error_code read_exact(void* buf, std::size_t n, duration timeout) {
        return with_deadline(socket_.get_executor(), sanitize(timeout),
            [&](auto completion){
                asio::async_read(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
    }

    std::error_code write_all(const void* buf, std::size_t n, duration timeout) {
        return with_deadline(socket_.get_executor(), sanitize(timeout),
            [&](auto completion){
                asio::async_write(socket_, asio::buffer(buf, n),
                    [completion](const std::error_code& op_ec, std::size_t){
                        completion(op_ec);
                    });
            },
            [this]{ cancel(); }
        );
    }

    std::error_code read_exact(void* buf, std::size_t n) {
        return read_exact(buf, n, defaultTimeout_);
    }

    std::error_code write_all(const void* buf, std::size_t n) {
        return write_all(buf, n, defaultTimeout_);
    }

    void setLowLatency() {
        std::error_code ec;
        socket_.set_option(tcp::no_delay(true), ec);
    }

    bool is_open() const { return socket_.is_open(); }

    // Best-effort cancellation of pending ops on the socket.
    void cancel() {
        std::error_code ec;
        socket_.cancel(ec);
    }

    void close() {
        if (!socket_.is_open()) return;
        std::error_code ec;
        // cancel -> shutdown -> close
        socket_.cancel(ec);
        socket_.shutdown(tcp::socket::shutdown_both, ec);
        socket_.close(ec);
    }

private:
    std::error_code connect_one(const tcp::endpoint& ep, duration timeout) {
        return with_deadline(socket_.get_executor(), sanitize(timeout),
            [&](auto completion){ socket_.async_connect(ep, completion); },
            [this]{ cancel(); }
        );
    }

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    std::shared_ptr<asio::io_context> io_;
    Strand strand_;
    tcp::socket socket_;
    duration defaultTimeout_ = DEFAULT_TIMEOUT;
    duration connectTimeout_ = DEFAULT_TIMEOUT;
};

} // namespace signage::net
