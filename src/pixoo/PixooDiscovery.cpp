#include "signage/pixoo/PixooDiscovery.hpp"

#include "signage/log/Log.hpp"
#include "signage/net/HttpClient.hpp"
#include "signage/pixoo/PixooCodec.hpp"

#include <algorithm>
#include <thread>

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>

namespace signage::pixoo {

std::optional<std::string> localIpv4Address() {
    ifaddrs* list = nullptr;
    if (::getifaddrs(&list) != 0) {
        logError("[PixooDiscovery] getifaddrs failed\n");
        return std::nullopt;
    }

    std::optional<std::string> found;
    for (ifaddrs* it = list; it != nullptr; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (it->ifa_flags & IFF_LOOPBACK) continue;
        if (!(it->ifa_flags & IFF_UP)) continue;

        char text[INET_ADDRSTRLEN] = {};
        const auto* addr = reinterpret_cast<const sockaddr_in*>(it->ifa_addr);
        if (::inet_ntop(AF_INET, &addr->sin_addr, text, sizeof(text))) {
            found = text;
            break;
        }
    }
    ::freeifaddrs(list);
    return found;
}

std::optional<std::string> subnetPrefix(std::string_view address) {
    int octets = 0;
    std::size_t digits = 0;
    unsigned value = 0;
    for (char c : address) {
        if (c == '.') {
            if (digits == 0) return std::nullopt;
            ++octets;
            digits = 0;
            value = 0;
        } else if (c >= '0' && c <= '9') {
            value = value * 10 + static_cast<unsigned>(c - '0');
            if (++digits > 3 || value > 255) return std::nullopt;
        } else {
            return std::nullopt;
        }
    }
    if (octets != 3 || digits == 0) {
        return std::nullopt;
    }
    return std::string(address.substr(0, address.rfind('.')));
}

bool probePixoo(const std::string& address, const DiscoveryOptions& options) {
    net::HttpClient http(options.timeout);
    auto response = http.postJson(address, options.port, config::PIXOO_POST_PATH,
                                  buildChannelQuery().dump());
    if (!response || !response->ok()) {
        return false;
    }
    return checkDeviceReply(response->body).has_value();
}

std::vector<std::string> scanSubnet(const std::string& prefix,
                                    const ProbeFunction& probe,
                                    const DiscoveryOptions& options,
                                    const ProgressFunction& progress) {
    std::vector<std::string> devices;
    if (options.firstHost > options.lastHost || !probe) {
        return devices;
    }

    const unsigned total = options.lastHost - options.firstHost + 1;
    const std::size_t batchSize = std::max<std::size_t>(options.batchSize, 1);

    for (unsigned start = options.firstHost; start <= options.lastHost; ) {
        const unsigned end = static_cast<unsigned>(
            std::min<std::size_t>(options.lastHost, start + batchSize - 1));

        std::vector<std::string> addresses;
        for (unsigned host = start; host <= end; ++host) {
            addresses.push_back(prefix + "." + std::to_string(host));
        }

        // One slot per address so each thread writes only its own element.
        std::vector<char> hits(addresses.size(), 0);
        std::vector<std::thread> workers;
        workers.reserve(addresses.size());
        for (std::size_t i = 0; i < addresses.size(); ++i) {
            workers.emplace_back([&, i] { hits[i] = probe(addresses[i]) ? 1 : 0; });
        }
        for (auto& worker : workers) {
            worker.join();
        }

        for (std::size_t i = 0; i < addresses.size(); ++i) {
            if (hits[i]) {
                logInfo("[PixooDiscovery] found Pixoo at ", addresses[i], "\n");
                devices.push_back(addresses[i]);
            }
        }

        if (progress) {
            progress(end - options.firstHost + 1, total);
        }
        start = end + 1;
    }
    return devices;
}

expected<std::vector<std::string>> discoverDevices(const DiscoveryOptions& options,
                                                   const ProgressFunction& progress) {
    const auto local = localIpv4Address();
    const auto prefix = local ? subnetPrefix(*local) : std::nullopt;
    if (!prefix) {
        logError("[PixooDiscovery] could not determine the local network\n");
        return unexpected(std::make_error_code(std::errc::network_unreachable));
    }

    logInfo("[PixooDiscovery] scanning ", *prefix, ".", options.firstHost, "-",
            options.lastHost, " (local address ", *local, ")\n");
    return scanSubnet(*prefix,
                      [&options](const std::string& address) { return probePixoo(address, options); },
                      options, progress);
}

} // namespace signage::pixoo
