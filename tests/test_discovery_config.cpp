#include "signage/pixoo/PixooDiscovery.hpp"
#include "signage/relay/RelayConfig.hpp"

#include "TestSupport.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>

using namespace signage;
using namespace std::chrono_literals;

static void testSubnetPrefix() {
    ASSERT_TRUE(pixoo::subnetPrefix("192.168.1.37") == std::optional<std::string>("192.168.1"), "dotted quad");
    ASSERT_TRUE(pixoo::subnetPrefix("10.0.0.1") == std::optional<std::string>("10.0.0"), "short octets");
    ASSERT_TRUE(!pixoo::subnetPrefix("192.168.1"), "three octets");
    ASSERT_TRUE(!pixoo::subnetPrefix("192.168.1.256"), "octet out of range");
    ASSERT_TRUE(!pixoo::subnetPrefix("192.168..1"), "empty octet");
    ASSERT_TRUE(!pixoo::subnetPrefix("fe80::1"), "IPv6 is not a /24");
    ASSERT_TRUE(!pixoo::subnetPrefix(""), "empty");
}

static void testScanBatches() {
    std::mutex mutex;
    std::set<std::string> probed;
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::vector<std::pair<unsigned, unsigned>> progress;

    auto probe = [&](const std::string& address) {
        const int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {}
        std::this_thread::sleep_for(2ms);
        {
            std::lock_guard<std::mutex> lock(mutex);
            probed.insert(address);
        }
        --active;
        return address == "10.1.2.200" || address == "10.1.2.7";
    };

    const auto found = pixoo::scanSubnet("10.1.2", probe, {}, [&](unsigned done, unsigned total) {
        progress.emplace_back(done, total);
    });

    ASSERT_EQ(probed.size(), static_cast<std::size_t>(254), "every host .1-.254 probed once");
    ASSERT_TRUE(probed.count("10.1.2.0") == 0 && probed.count("10.1.2.255") == 0, "network and broadcast skipped");
    ASSERT_TRUE(peak.load() <= 50, "at most one batch of 50 in flight");
    ASSERT_EQ(found.size(), static_cast<std::size_t>(2), "two devices found");
    if (found.size() == 2) {
        ASSERT_STR_EQ(found[0], "10.1.2.7", "ascending host order");
        ASSERT_STR_EQ(found[1], "10.1.2.200", "second device");
    }
    ASSERT_EQ(progress.size(), static_cast<std::size_t>(6), "one progress report per batch");
    if (!progress.empty()) {
        ASSERT_EQ(progress.front().first, 50u, "first batch covers 50 hosts");
        ASSERT_EQ(progress.back().first, 254u, "last report is complete");
        ASSERT_EQ(progress.back().second, 254u, "total is 254");
    }
}

static void testProbeAgainstDummyDevice() {
    test::DummyHttpServer pixoo;
    pixoo::DiscoveryOptions options;
    options.port = pixoo.port();
    ASSERT_TRUE(pixoo::probePixoo("127.0.0.1", options), "error_code 0 reply is a Pixoo");

    const auto bodies = pixoo.bodies();
    ASSERT_TRUE(!bodies.empty() && bodies.front().find("Channel/GetIndex") != std::string::npos,
                "probe sends Channel/GetIndex");

    test::DummyHttpServer other([](const std::string&) {
        return test::DummyHttpServer::Reply{200, "<html>router</html>"};
    });
    options.port = other.port();
    ASSERT_TRUE(!pixoo::probePixoo("127.0.0.1", options), "non-Pixoo HTTP server rejected");

    unsigned short deadPort = 0;
    {
        test::DummyHttpServer gone;
        deadPort = gone.port();
    }
    options.port = deadPort;
    options.timeout = 200ms;
    ASSERT_TRUE(!pixoo::probePixoo("127.0.0.1", options), "closed port rejected");
}

static void testParseArguments() {
    {
        const char* argv[] = {"signage-relay", "--ws", "wss://relay/prod", "--pixoo", "192.168.1.9",
                              "--terminal", "lobby"};
        auto config = relay::parseArguments(7, argv);
        ASSERT_TRUE(config.has_value(), "full pixoo command line");
        if (config) {
            ASSERT_STR_EQ(config->relayUrl, "wss://relay/prod", "relay url");
            ASSERT_TRUE(config->sink == relay::SinkMode::Pixoo, "pixoo sink");
            ASSERT_TRUE(config->pixooAddress && *config->pixooAddress == "192.168.1.9", "pixoo address");
            ASSERT_TRUE(config->terminalId && *config->terminalId == "lobby", "terminal id");
            ASSERT_STR_EQ(config->endpointKind, "pixoo64", "pixoo registers as pixoo64");
            ASSERT_EQ(config->maxAttempts, 10u, "default attempts");
            ASSERT_TRUE(config->jitter && !config->verbose, "default flags");
        }
    }
    {
        const char* argv[] = {"signage-relay", "--emulator", "--ws", "ws://localhost:3001",
                              "--max-attempts", "3", "--no-jitter", "--verbose"};
        auto config = relay::parseArguments(8, argv);
        ASSERT_TRUE(config.has_value(), "emulator command line");
        if (config) {
            ASSERT_TRUE(config->sink == relay::SinkMode::Emulator, "emulator sink");
            ASSERT_STR_EQ(config->endpointKind, "web", "emulator registers as web");
            ASSERT_EQ(config->maxAttempts, 3u, "attempts");
            ASSERT_TRUE(!config->jitter && config->verbose, "flags");
        }
    }
    {
        const char* argv[] = {"signage-relay", "--ws", "ws://x", "--scan", "--kind", "pixoo16"};
        auto config = relay::parseArguments(6, argv);
        ASSERT_TRUE(config && config->sink == relay::SinkMode::Scan, "scan sink");
        ASSERT_TRUE(config && config->endpointKind == "pixoo16", "explicit kind kept");
    }
    {
        const char* argv[] = {"signage-relay", "--help"};
        auto config = relay::parseArguments(2, argv);
        ASSERT_TRUE(config && config->showHelp, "help needs no other options");
    }

    const std::vector<std::vector<const char*>> bad = {
        {"signage-relay"},
        {"signage-relay", "--pixoo", "1.2.3.4"},
        {"signage-relay", "--ws"},
        {"signage-relay", "--ws", "ws://x", "--bogus"},
        {"signage-relay", "--ws", "ws://x", "--max-attempts", "zero"},
        {"signage-relay", "--ws", "ws://x", "--max-attempts", "0"},
        {"signage-relay", "--ws", "ws://x", "--scan", "--emulator"},
        {"signage-relay", "--ws", "ws://x", "--terminal"},
        {"signage-relay", "--ws", "ws://x", "stray"},
        {"signage-relay", "--ws", "ws://x", "--max-attempts", "-2"},
        {"signage-relay", "--ws", "ws://x", "--max-attempts", "7x"},
        {"signage-relay", "--ws=", "--emulator"},
    };
    for (const auto& args : bad) {
        auto config = relay::parseArguments(static_cast<int>(args.size()), args.data());
        ASSERT_TRUE(!config, "usage error rejected");
        ASSERT_TRUE(!config && !config.error().empty(), "usage error explained");
    }

    {
        // Parsed twice to check that the option scanner restarts cleanly.
        const char* const argv[] = {"signage-relay", "--verbose", "--ws=ws://relay:3001/x",
                                    "--max-attempts=4", "--emulator"};
        for (int round = 0; round < 2; ++round) {
            auto config = relay::parseArguments(5, argv);
            ASSERT_TRUE(config.has_value(), "--opt=value form accepted");
            if (config) {
                ASSERT_STR_EQ(config->relayUrl, "ws://relay:3001/x", "inline url");
                ASSERT_EQ(config->maxAttempts, 4u, "inline attempts");
                ASSERT_TRUE(config->verbose, "verbose before --ws");
                ASSERT_TRUE(config->sink == relay::SinkMode::Emulator, "emulator sink");
            }
        }
        ASSERT_STR_EQ(argv[1], "--verbose", "caller argv left untouched");
    }

    const std::string text = relay::usage("signage-relay");
    ASSERT_TRUE(text.find("--ws <url>") != std::string::npos, "usage lists --ws");
}

static void testSavedConfig() {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / ("signage-config-test-" + std::to_string(::getpid()));
    const std::string path = (dir / "nested" / "config.json").string();
    std::error_code ec;
    fs::remove_all(dir, ec);

    ASSERT_TRUE(!relay::loadSavedPixooAddress(path), "missing file yields nothing");

    ASSERT_TRUE(relay::savePixooAddress(path, "192.168.1.50").has_value(), "save creates directories");
    ASSERT_TRUE(relay::loadSavedPixooAddress(path) == std::optional<std::string>("192.168.1.50"),
                "saved address loads back");

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"pixooIp":"10.0.0.2","theme":"dark"})";
    }
    ASSERT_TRUE(relay::savePixooAddress(path, "10.0.0.3").has_value(), "overwrite address");
    {
        std::ifstream in(path);
        std::stringstream contents;
        contents << in.rdbuf();
        const auto doc = nlohmann::json::parse(contents.str(), nullptr, false);
        ASSERT_TRUE(doc.is_object() && doc.value("theme", "") == "dark", "other keys preserved");
        ASSERT_TRUE(doc.is_object() && doc.value("pixooIp", "") == "10.0.0.3", "address replaced");
    }

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ this is not json";
    }
    ASSERT_TRUE(!relay::loadSavedPixooAddress(path), "malformed file tolerated");

    {
        std::ofstream out(path, std::ios::trunc);
        out << R"({"pixooIp":42})";
    }
    ASSERT_TRUE(!relay::loadSavedPixooAddress(path), "non-string address ignored");

    fs::remove_all(dir, ec);

    ASSERT_TRUE(relay::defaultConfigPath().find(".signage") != std::string::npos, "default path under .signage");
}

int main() {
    testSubnetPrefix();
    testScanBatches();
    testProbeAgainstDummyDevice();
    testParseArguments();
    testSavedConfig();
    return test::report("DiscoveryConfig");
}
