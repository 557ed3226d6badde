#include "signage/relay/RelayConfig.hpp"

#include "signage/log/Log.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

#include <getopt.h>

namespace signage::relay {

namespace {

nlohmann::json readConfigDocument(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return nlohmann::json::object();
    }
    std::stringstream contents;
    contents << in.rdbuf();
    auto doc = nlohmann::json::parse(contents.str(), nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        logDebug("[RelayConfig] ignoring malformed config at ", path, "\n");
        return nlohmann::json::object();
    }
    return doc;
}

} // namespace

expected<RelayConfig, std::string> parseArguments(int argc, const char* const* argv) {
    enum LongOnly {
        OPT_WS = 256,
        OPT_PIXOO,
        OPT_SCAN,
        OPT_EMULATOR,
        OPT_TERMINAL,
        OPT_KIND,
        OPT_MAX_ATTEMPTS,
        OPT_NO_JITTER,
    };
    static const option longOptions[] = {
        {"help",         no_argument,       nullptr, 'h'},
        {"verbose",      no_argument,       nullptr, 'v'},
        {"ws",           required_argument, nullptr, OPT_WS},
        {"pixoo",        required_argument, nullptr, OPT_PIXOO},
        {"scan",         no_argument,       nullptr, OPT_SCAN},
        {"emulator",     no_argument,       nullptr, OPT_EMULATOR},
        {"terminal",     required_argument, nullptr, OPT_TERMINAL},
        {"kind",         required_argument, nullptr, OPT_KIND},
        {"max-attempts", required_argument, nullptr, OPT_MAX_ATTEMPTS},
        {"no-jitter",    no_argument,       nullptr, OPT_NO_JITTER},
        {nullptr,        0,                 nullptr, 0},
    };

    // getopt_long may permute argv, so it works on a private copy.
    std::vector<std::string> storage(argv, argv + argc);
    std::vector<char*> args;
    args.reserve(storage.size() + 1);
    for (auto& arg : storage) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    RelayConfig config;
    int sinkFlags = 0;

    optind = 0; // full rescan, also on repeated calls
    opterr = 0;
    int opt = 0;
    while ((opt = ::getopt_long(argc, args.data(), ":hv", longOptions, nullptr)) != -1) {
        const std::string value = optarg ? optarg : "";
        switch (opt) {
            case 'h':
                config.showHelp = true;
                return config;
            case 'v':
                config.verbose = true;
                break;
            case OPT_WS:
                if (value.empty()) return unexpected("--ws needs a URL");
                config.relayUrl = value;
                break;
            case OPT_PIXOO:
                if (value.empty()) return unexpected("--pixoo needs an address");
                config.sink = SinkMode::Pixoo;
                config.pixooAddress = value;
                ++sinkFlags;
                break;
            case OPT_SCAN:
                config.sink = SinkMode::Scan;
                ++sinkFlags;
                break;
            case OPT_EMULATOR:
                config.sink = SinkMode::Emulator;
                ++sinkFlags;
                break;
            case OPT_TERMINAL:
                if (value.empty()) return unexpected("--terminal needs an id");
                config.terminalId = value;
                break;
            case OPT_KIND:
                if (value.empty()) return unexpected("--kind needs a device kind");
                config.endpointKind = value;
                break;
            case OPT_MAX_ATTEMPTS: {
                char* end = nullptr;
                errno = 0;
                const unsigned long parsed = std::strtoul(value.c_str(), &end, 10);
                if (value.empty() || value.front() == '-' || *end != '\0' || errno == ERANGE
                    || parsed == 0 || parsed > 1000000UL) {
                    return unexpected("--max-attempts needs a positive number");
                }
                config.maxAttempts = static_cast<unsigned>(parsed);
                break;
            }
            case OPT_NO_JITTER:
                config.jitter = false;
                break;
            case ':':
                return unexpected(std::string(args[optind - 1]) + " needs a value");
            default:
                return unexpected("unknown option '" + std::string(args[optind - 1]) + "'");
        }
    }
    if (optind < argc) {
        return unexpected("unexpected argument '" + std::string(args[optind]) + "'");
    }

    if (config.relayUrl.empty()) {
        return unexpected("--ws is required");
    }
    if (sinkFlags > 1) {
        return unexpected("--pixoo, --scan and --emulator are mutually exclusive");
    }
    if (config.endpointKind.empty()) {
        config.endpointKind = config.sink == SinkMode::Emulator ? defaults::WEB_ENDPOINT_KIND
                                                                : defaults::PIXOO_ENDPOINT_KIND;
    }
    return config;
}

std::string usage(std::string_view program) {
    std::ostringstream out;
    out << "Usage: " << program << " --ws <url> [--pixoo <ip> | --scan | --emulator]\n"
        << "       [--terminal <id>] [--kind <device-kind>] [--max-attempts <n>]\n"
        << "       [--no-jitter] [--verbose]\n\n"
        << "  --ws <url>           relay endpoint (ws:// or wss://)\n"
        << "  --pixoo <ip>         Pixoo address; defaults to the saved one\n"
        << "  --scan               find a Pixoo on the local network and save it\n"
        << "  --emulator           draw frames in this terminal instead\n"
        << "  --terminal <id>      terminal id to register as\n"
        << "  --kind <kind>        endpoint kind announced on connect\n"
        << "  --max-attempts <n>   reconnect attempts before giving up (default "
        << defaults::MAX_RECONNECT_ATTEMPTS << ")\n"
        << "  --no-jitter          use exact backoff delays\n"
        << "  --verbose            debug logging\n";
    return out.str();
}

std::string defaultConfigPath() {
    std::filesystem::path base;
    if (const char* home = std::getenv("HOME"); home && *home) {
        base = home;
    }
    return (base / defaults::CONFIG_DIR_NAME / defaults::CONFIG_FILE_NAME).string();
}

std::optional<std::string> loadSavedPixooAddress(const std::string& path) {
    const auto doc = readConfigDocument(path);
    auto it = doc.find(defaults::CONFIG_PIXOO_KEY);
    if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

expected<void> savePixooAddress(const std::string& path, const std::string& address) {
    auto doc = readConfigDocument(path);
    doc[defaults::CONFIG_PIXOO_KEY] = address;

    std::error_code ec;
    const auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            logError("[RelayConfig] cannot create ", dir.string(), ": ", ec.message(), "\n");
            return unexpected(ec);
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        ec = std::error_code(errno ? errno : EIO, std::generic_category());
        logError("[RelayConfig] cannot write ", path, ": ", ec.message(), "\n");
        return unexpected(ec);
    }
    out << doc.dump(2) << '\n';
    if (!out.flush()) {
        return unexpected(std::make_error_code(std::errc::io_error));
    }
    return {};
}

} // namespace signage::relay
