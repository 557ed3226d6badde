#include "signage/core/TerminalSink.hpp"
#include "signage/log/Log.hpp"
#include "signage/net/NetService.hpp"
#include "signage/net/Url.hpp"
#include "signage/pixoo/PixooDevice.hpp"
#include "signage/pixoo/PixooDiscovery.hpp"
#include "signage/relay/RelayClient.hpp"
#include "signage/relay/RelayConfig.hpp"
#include "signage/relay/TimerScheduler.hpp"
#include "signage/relay/WebSocketTransport.hpp"

#include <atomic>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>

using namespace signage;

namespace {

std::optional<std::string> resolvePixooAddress(const relay::RelayConfig& config) {
    const std::string configPath = relay::defaultConfigPath();

    if (config.sink == relay::SinkMode::Scan) {
        auto found = pixoo::discoverDevices({}, [](unsigned done, unsigned total) {
            logInfo("Scanning... ", done, "/", total, "\n");
        });
        if (!found) {
            logError("Scan failed: ", found.error().message(), "\n");
            return std::nullopt;
        }
        if (found->empty()) {
            logError("No Pixoo found on the local network\n");
            return std::nullopt;
        }
        if (auto saved = relay::savePixooAddress(configPath, found->front()); saved) {
            logInfo("Saved ", found->front(), " to ", configPath, "\n");
        }
        return found->front();
    }

    if (config.pixooAddress) {
        return config.pixooAddress;
    }
    if (auto saved = relay::loadSavedPixooAddress(configPath)) {
        logInfo("Using saved Pixoo address ", *saved, "\n");
        return saved;
    }
    logError("No Pixoo address: pass --pixoo <ip>, --scan or --emulator\n");
    return std::nullopt;
}

} // namespace

int main(int argc, char** argv) {
    auto parsed = relay::parseArguments(argc, argv);
    if (!parsed) {
        std::cerr << "signage-relay: " << parsed.error() << "\n\n" << relay::usage("signage-relay");
        return 1;
    }
    const relay::RelayConfig config = *parsed;
    if (config.showHelp) {
        std::cout << relay::usage("signage-relay");
        return 0;
    }
    setVerbose(config.verbose);

    auto url = net::parseUrl(config.relayUrl);
    if (!url || (url->scheme != "ws" && url->scheme != "wss")) {
        logError("Invalid relay URL '", config.relayUrl, "' (expected ws:// or wss://)\n");
        return 1;
    }

    // The emulator owns stdout, so move info logging out of its way.
    if (config.sink == relay::SinkMode::Emulator) {
        setInfoLogHandler([](std::string_view message) {
            std::cerr << message;
            std::cerr.flush();
        });
    }

    std::unique_ptr<core::FrameDeviceBase> sink;
    if (config.sink == relay::SinkMode::Emulator) {
        sink = std::make_unique<core::TerminalSink>(std::cout);
    } else {
        auto address = resolvePixooAddress(config);
        if (!address) {
            return 1;
        }
        auto device = std::make_unique<pixoo::PixooDevice>(*address);
        if (auto ready = device->initialize(); !ready) {
            // Frames are still pushed; the device may come up later.
            logError("Pixoo at ", *address, " did not accept the channel switch\n");
        }
        sink = std::move(device);
    }

    logInfo("Starting Signage Relay...\n");
    logInfo("  Relay:    ", config.relayUrl, "\n");
    logInfo("  Endpoint: ", config.endpointKind, "\n");
    if (config.terminalId) {
        logInfo("  Terminal: ", *config.terminalId, "\n");
    }

    sink->start();

    net::NetService& service = net::ensureNetService();
    net::Strand strand = service.makeStrand();

    relay::RelayClientOptions options;
    options.endpointKind = config.endpointKind;
    options.terminalId = config.terminalId;
    options.backoff.maxAttempts = config.maxAttempts;
    options.backoff.jitter = config.jitter;

    auto scheduler = std::make_unique<relay::AsioTimerScheduler>(strand);
    relay::WebSocketConnector connector(strand, *url);
    auto client = std::make_unique<relay::RelayClient>(options, connector, *scheduler, *sink);

    std::promise<int> exitCode;
    std::atomic<bool> finished{false};
    auto finish = [&](int code) {
        if (!finished.exchange(true)) {
            exitCode.set_value(code);
        }
    };

    client->setExhaustedHandler([&](unsigned attempts) {
        logError("Giving up after ", attempts, " reconnect attempts\n");
        finish(1);
    });

    net::asio::signal_set signals(*service.io(), SIGINT, SIGTERM);
    signals.async_wait([&](const std::error_code& ec, int signalNumber) {
        if (ec) {
            return;
        }
        logInfo("Received signal ", signalNumber, ", shutting down\n");
        net::asio::post(strand, [&] {
            if (client) {
                client->shutdown();
            }
            finish(0);
        });
    });

    net::asio::post(strand, [&] { client->connect(); });

    const int code = exitCode.get_future().get();

    // Relay objects live on the I/O thread; tear them down there.
    std::promise<void> tornDown;
    net::asio::post(strand, [&] {
        std::error_code ignored;
        signals.cancel(ignored);
        client.reset();
        scheduler.reset();
        tornDown.set_value();
    });
    tornDown.get_future().wait();

    sink->stop();
    logInfo("Done.\n");
    return code;
}
