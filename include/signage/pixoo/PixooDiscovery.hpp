#pragma once

#include "signage/core/Expected.hpp"
#include "signage/pixoo/PixooConfig.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace signage::pixoo {

struct DiscoveryOptions {
    unsigned short port = config::PIXOO_HTTP_PORT;
    std::chrono::milliseconds timeout = config::PIXOO_PROBE_TIMEOUT;
    unsigned firstHost = config::DISCOVERY_FIRST_HOST;
    unsigned lastHost = config::DISCOVERY_LAST_HOST;
    std::size_t batchSize = config::DISCOVERY_BATCH_SIZE;
};

/// Returns true when the address answers like a Pixoo. Called concurrently.
using ProbeFunction = std::function<bool(const std::string& address)>;

/// (hosts probed so far, hosts in range), reported after every batch.
using ProgressFunction = std::function<void(unsigned, unsigned)>;

/// First non-loopback IPv4 address of this host, dotted-quad.
std::optional<std::string> localIpv4Address();

/// "192.168.1.37" -> "192.168.1". nullopt unless the input is a dotted-quad.
std::optional<std::string> subnetPrefix(std::string_view address);

/**
 * @brief POST `Channel/GetIndex` and check for `error_code == 0`.
 *
 * Blocking, bounded by options.timeout. Any failure means "not a Pixoo".
 */
bool probePixoo(const std::string& address, const DiscoveryOptions& options = {});

/**
 * @brief Probe `<prefix>.firstHost` .. `<prefix>.lastHost` in parallel batches.
 *
 * Each batch runs on its own threads and completes before the next starts.
 * Matches are returned in ascending host order.
 */
std::vector<std::string> scanSubnet(const std::string& prefix,
                                    const ProbeFunction& probe,
                                    const DiscoveryOptions& options = {},
                                    const ProgressFunction& progress = {});

/// Scan the local /24 for Pixoo devices. Fails when no IPv4 interface is up.
expected<std::vector<std::string>> discoverDevices(const DiscoveryOptions& options = {},
                                                   const ProgressFunction& progress = {});

} // namespace signage::pixoo
