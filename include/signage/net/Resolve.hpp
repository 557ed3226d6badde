#pragma once
#include "signage/net/NetConfig.hpp"
#include <string>

namespace signage::net {

/**
 * resolve
 *
 * Synchronous DNS lookup helper. Given `host` and `service` (e.g.
 * "192.168.1.50", "80") it fills `out` with candidate endpoints for the
 * TcpClient connect overload that accepts resolver results. Numeric hosts
 * never touch DNS.
 */
inline std::error_code resolve(
    asio::io_context& io,
    const std::string& host,
    const std::string& service,
    tcp::resolver::results_type& out)
{
    std::error_code ec;
    tcp::resolver r(io);
    out = r.resolve(host, service, ec);
    return ec;
}

} // namespace signage::net
