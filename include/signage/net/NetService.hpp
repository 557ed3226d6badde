#pragma once
#include "signage/net/NetConfig.hpp"
#include <thread>
#include <memory>

namespace signage::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * All socket, TLS and timer work in the relay is posted to this one loop.
 * Relay clients additionally serialise on a strand created by `makeStrand()`
 * so their state machine never runs concurrently with itself.
 *
 * Lifetime notes:
 * - Destroy network clients before `NetService` so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 * - Blocking helpers (`with_deadline`, `TcpClient`) must never be called from
 *   the I/O thread itself; they wait for it.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

    Strand makeStrand() { return asio::make_strand(*io_); }

    bool runningInThisThread() const { return std::this_thread::get_id() == t_.get_id(); }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();
asio::io_context& io_context();

} // namespace signage::net
