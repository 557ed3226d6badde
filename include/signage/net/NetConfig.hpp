#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <system_error>   // std::error_code

namespace signage::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `signage::net::asio` as the standalone Asio namespace.
 * - `signage::net::tcp` as the protocol alias.
 * - `signage::net::Strand` as the executor every relay component serialises on.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using Strand = asio::strand<asio::io_context::executor_type>;
} // namespace signage::net
